//----------------------------------------------------------------------------------------------------------------------
// File: ChaChaPoly.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "ChaChaPoly.hpp"
#include "CipherUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Cipher = "ChaCha20-Poly1305";

[[nodiscard]] std::optional<Crypto::Error> ValidateParameters(
    Security::ReadableView key, Security::ReadableView nonce, Security::ReadableView tag);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::ChaChaPoly::EncryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag)
{
    if (auto const optError = local::ValidateParameters(key, nonce, tag); optError) { return *optError; }
    return Aead::SealInPlaceDetached(local::Cipher, key, nonce, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::ChaChaPoly::DecryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag)
{
    if (auto const optError = local::ValidateParameters(key, nonce, tag); optError) { return *optError; }
    return Aead::OpenInPlaceDetached(local::Cipher, key, nonce, aad, buffer, tag);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Crypto::Error> local::ValidateParameters(
    Security::ReadableView key, Security::ReadableView nonce, Security::ReadableView tag)
{
    using namespace Crypto::ChaChaPoly;
    if (key.size() != KeySize) { return Crypto::Error::InvalidSymmetricKeySize; }
    if (nonce.size() != NonceSize) { return Crypto::Error::InvalidIvSize; }
    if (tag.size() != TagSize) { return Crypto::Error::InvalidTagSize; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
