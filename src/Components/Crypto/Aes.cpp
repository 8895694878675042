//----------------------------------------------------------------------------------------------------------------------
// File: Aes.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Aes.hpp"
#include "CipherUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Aes128Gcm = "AES-128-GCM";
constexpr std::string_view Aes256Gcm = "AES-256-GCM";
constexpr std::string_view Aes128Cbc = "AES-128-CBC";
constexpr std::string_view Aes192Cbc = "AES-192-CBC";
constexpr std::string_view Aes256Cbc = "AES-256-CBC";

[[nodiscard]] Crypto::Result<Security::WriteableView> GcmEncrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag);

[[nodiscard]] Crypto::Result<Security::WriteableView> GcmDecrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag);

[[nodiscard]] Crypto::Result<Security::WriteableView> CbcEncrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer,
    std::size_t plaintextSize);

[[nodiscard]] Crypto::Result<Security::WriteableView> CbcDecrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer);


//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes128GcmEncryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag)
{
    return local::GcmEncrypt(local::Aes128Gcm, Key128Size, key, iv, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes256GcmEncryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag)
{
    return local::GcmEncrypt(local::Aes256Gcm, Key256Size, key, iv, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes128GcmDecryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag)
{
    return local::GcmDecrypt(local::Aes128Gcm, Key128Size, key, iv, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes256GcmDecryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag)
{
    return local::GcmDecrypt(local::Aes256Gcm, Key256Size, key, iv, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes128CbcEncrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer, std::size_t plaintextSize)
{
    return local::CbcEncrypt(local::Aes128Cbc, Key128Size, key, iv, buffer, plaintextSize);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes192CbcEncrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer, std::size_t plaintextSize)
{
    return local::CbcEncrypt(local::Aes192Cbc, Key192Size, key, iv, buffer, plaintextSize);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes256CbcEncrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer, std::size_t plaintextSize)
{
    return local::CbcEncrypt(local::Aes256Cbc, Key256Size, key, iv, buffer, plaintextSize);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes128CbcDecrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer)
{
    return local::CbcDecrypt(local::Aes128Cbc, Key128Size, key, iv, buffer);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes192CbcDecrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer)
{
    return local::CbcDecrypt(local::Aes192Cbc, Key192Size, key, iv, buffer);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aes::Aes256CbcDecrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer)
{
    return local::CbcDecrypt(local::Aes256Cbc, Key256Size, key, iv, buffer);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> local::GcmEncrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag)
{
    if (key.size() != keySize) { return Crypto::Error::InvalidSymmetricKeySize; }
    if (iv.size() != Crypto::Aes::GcmIvSize) { return Crypto::Error::InvalidIvSize; }
    if (tag.size() != Crypto::Aes::GcmTagSize) { return Crypto::Error::InvalidTagSize; }
    return Crypto::Aead::SealInPlaceDetached(cipher, key, iv, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> local::GcmDecrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag)
{
    if (key.size() != keySize) { return Crypto::Error::InvalidSymmetricKeySize; }
    if (iv.size() != Crypto::Aes::GcmIvSize) { return Crypto::Error::InvalidIvSize; }
    if (tag.size() != Crypto::Aes::GcmTagSize) { return Crypto::Error::InvalidTagSize; }
    return Crypto::Aead::OpenInPlaceDetached(cipher, key, iv, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> local::CbcEncrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer,
    std::size_t plaintextSize)
{
    using namespace Crypto::Aes;
    if (key.size() != keySize) { return Crypto::Error::InvalidSymmetricKeySize; }
    if (iv.size() != CbcIvSize) { return Crypto::Error::InvalidIvSize; }
    if (plaintextSize > buffer.size()) { return Crypto::Error::InvalidBufferSize; }

    // PKCS#7 always appends at least one byte, a block aligned plaintext gains a full block of padding. 
    if (plaintextSize / BlockSize >= buffer.size() / BlockSize) { return Crypto::Error::InvalidBufferSize; }

    return Crypto::Block::EncryptInPlace(cipher, key, iv, buffer, plaintextSize);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> local::CbcDecrypt(
    std::string_view cipher,
    std::size_t keySize,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer)
{
    using namespace Crypto::Aes;
    if (key.size() != keySize) { return Crypto::Error::InvalidSymmetricKeySize; }
    if (iv.size() != CbcIvSize) { return Crypto::Error::InvalidIvSize; }
    if (buffer.empty() || buffer.size() % BlockSize != 0) { return Crypto::Error::InvalidBufferSize; }
    return Crypto::Block::DecryptInPlace(cipher, key, iv, buffer);
}

//----------------------------------------------------------------------------------------------------------------------
