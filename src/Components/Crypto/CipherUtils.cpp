//----------------------------------------------------------------------------------------------------------------------
// File: CipherUtils.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "CipherUtils.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[nodiscard]] bool FitsCipherLength(std::size_t size);

// The final call of a stream or AEAD mode produces no output, the trailing block only needs to be a valid target. 
using TrailingBlock = std::array<std::uint8_t, Crypto::Aes::BlockSize>;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Crypto::CipherAlgorithm Crypto::FetchCipher(std::string_view name)
{
    std::string const terminated{ name };
    return CipherAlgorithm{ EVP_CIPHER_fetch(nullptr, terminated.c_str(), nullptr) };
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aead::SealInPlaceDetached(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag)
{
    if (!local::FitsCipherLength(buffer.size()) || !local::FitsCipherLength(aad.size())) {
        return Error::InvalidBufferSize;
    }

    auto const upCipher = FetchCipher(cipher);
    if (!upCipher) { return Error::Encryption; }

    local::CipherContext upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::Encryption; }

    auto const pContext = upContext.get();
    if (EVP_EncryptInit_ex2(pContext, upCipher.get(), key.data(), nonce.data(), nullptr) <= 0) {
        return Error::Encryption;
    }

    std::int32_t processed = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(pContext, nullptr, &processed, aad.data(), static_cast<std::int32_t>(aad.size())) <= 0) {
            return Error::Encryption;
        }
    }

    if (!buffer.empty()) {
        auto const size = static_cast<std::int32_t>(buffer.size());
        if (EVP_EncryptUpdate(pContext, buffer.data(), &processed, buffer.data(), size) <= 0 || processed != size) {
            return Error::Encryption;
        }
    }

    local::TrailingBlock trailing{};
    if (EVP_EncryptFinal_ex(pContext, trailing.data(), &processed) <= 0 || processed != 0) {
        return Error::Encryption;
    }

    std::array<OSSL_PARAM, 2> params = { 
        OSSL_PARAM_construct_octet_string(OSSL_CIPHER_PARAM_AEAD_TAG, tag.data(), tag.size()),
        OSSL_PARAM_construct_end()
    };

    if (EVP_CIPHER_CTX_get_params(pContext, params.data()) <= 0) {
        return Error::Encryption;
    }

    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Aead::OpenInPlaceDetached(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag)
{
    if (!local::FitsCipherLength(buffer.size()) || !local::FitsCipherLength(aad.size())) {
        return Error::InvalidBufferSize;
    }

    auto const upCipher = FetchCipher(cipher);
    if (!upCipher) { return Error::Decryption; }

    local::CipherContext upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::Decryption; }

    auto const pContext = upContext.get();
    if (EVP_DecryptInit_ex2(pContext, upCipher.get(), key.data(), nonce.data(), nullptr) <= 0) {
        return Error::Decryption;
    }

    // Note: The OpenSSL parameter interface only accepts non-const buffers, the tag is only read while setting it. 
    std::array<OSSL_PARAM, 2> params = { 
        OSSL_PARAM_construct_octet_string(
            OSSL_CIPHER_PARAM_AEAD_TAG, const_cast<std::uint8_t*>(tag.data()), tag.size()),
        OSSL_PARAM_construct_end()
    };

    if (EVP_CIPHER_CTX_set_params(pContext, params.data()) <= 0) {
        return Error::Decryption;
    }

    std::int32_t processed = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(pContext, nullptr, &processed, aad.data(), static_cast<std::int32_t>(aad.size())) <= 0) {
            return Error::Decryption;
        }
    }

    if (!buffer.empty()) {
        auto const size = static_cast<std::int32_t>(buffer.size());
        if (EVP_DecryptUpdate(pContext, buffer.data(), &processed, buffer.data(), size) <= 0 || processed != size) {
            Security::EraseMemory(buffer);
            return Error::Decryption;
        }
    }

    // The tag is verified during finalization, the plaintext now in the buffer must not outlive a failed check. 
    local::TrailingBlock trailing{};
    if (EVP_DecryptFinal_ex(pContext, trailing.data(), &processed) <= 0) {
        Security::EraseMemory(buffer);
        return Error::Authentication;
    }

    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Block::EncryptInPlace(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer,
    std::size_t plaintextSize)
{
    if (plaintextSize > buffer.size() || !local::FitsCipherLength(buffer.size())) {
        return Error::InvalidBufferSize;
    }

    auto const upCipher = FetchCipher(cipher);
    if (!upCipher) { return Error::Encryption; }

    local::CipherContext upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::Encryption; }

    auto const pContext = upContext.get();
    if (EVP_EncryptInit_ex2(pContext, upCipher.get(), key.data(), iv.data(), nullptr) <= 0) {
        return Error::Encryption;
    }

    std::int32_t encrypted = 0;
    if (plaintextSize != 0) {
        auto const size = static_cast<std::int32_t>(plaintextSize);
        if (EVP_EncryptUpdate(pContext, buffer.data(), &encrypted, buffer.data(), size) <= 0) {
            return Error::Encryption;
        }
    }

    // The cipher's padding is written behind the processed blocks, the caller reserves room for a full block. 
    std::int32_t padded = 0;
    if (EVP_EncryptFinal_ex(pContext, buffer.data() + encrypted, &padded) <= 0) {
        return Error::Encryption;
    }

    return buffer.first(static_cast<std::size_t>(encrypted) + static_cast<std::size_t>(padded));
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Crypto::Block::DecryptInPlace(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer)
{
    if (!local::FitsCipherLength(buffer.size())) { return Error::InvalidBufferSize; }

    auto const upCipher = FetchCipher(cipher);
    if (!upCipher) { return Error::Decryption; }

    local::CipherContext upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::Decryption; }

    auto const pContext = upContext.get();
    if (EVP_DecryptInit_ex2(pContext, upCipher.get(), key.data(), iv.data(), nullptr) <= 0) {
        return Error::Decryption;
    }

    std::int32_t decrypted = 0;
    auto const size = static_cast<std::int32_t>(buffer.size());
    if (EVP_DecryptUpdate(pContext, buffer.data(), &decrypted, buffer.data(), size) <= 0) {
        Security::EraseMemory(buffer);
        return Error::Decryption;
    }

    // The final block is held back until finalization, where the cipher strips and checks its padding. 
    std::int32_t remaining = 0;
    if (EVP_DecryptFinal_ex(pContext, buffer.data() + decrypted, &remaining) <= 0) {
        Security::EraseMemory(buffer);
        return Error::InvalidPadding;
    }

    return buffer.first(static_cast<std::size_t>(decrypted) + static_cast<std::size_t>(remaining));
}

//----------------------------------------------------------------------------------------------------------------------

bool local::FitsCipherLength(std::size_t size)
{
    return std::in_range<std::int32_t>(size);
}

//----------------------------------------------------------------------------------------------------------------------
