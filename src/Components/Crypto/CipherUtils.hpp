//----------------------------------------------------------------------------------------------------------------------
// File: CipherUtils.hpp
// Description: Shared OpenSSL EVP plumbing used by the algorithm specific adapters. The functions in this header
// assume the caller has already validated the key, iv, and tag sizes against the algorithm's canonical sizes. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "CryptoDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Crypto {
//----------------------------------------------------------------------------------------------------------------------

struct CipherAlgorithmDeleter
{
    void operator()(EVP_CIPHER* pCipher) const
    {
        EVP_CIPHER_free(pCipher);
    }
};

using CipherAlgorithm = std::unique_ptr<EVP_CIPHER, CipherAlgorithmDeleter>;

[[nodiscard]] CipherAlgorithm FetchCipher(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
namespace Aead {
//----------------------------------------------------------------------------------------------------------------------

// Encrypts the buffer in place and writes the authentication tag into the detached tag buffer. 
[[nodiscard]] Result<Security::WriteableView> SealInPlaceDetached(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag);

// Decrypts the buffer in place and verifies the detached tag through the cipher's own finalization. On a failed
// verification the buffer is erased before the error is returned. 
[[nodiscard]] Result<Security::WriteableView> OpenInPlaceDetached(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag);

//----------------------------------------------------------------------------------------------------------------------
} // Aead namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Block {
//----------------------------------------------------------------------------------------------------------------------

// Encrypts the leading plaintext bytes of the buffer in place and appends the cipher's PKCS#7 padding. The returned 
// view covers the ciphertext, the buffer must have room for the padded length. 
[[nodiscard]] Result<Security::WriteableView> EncryptInPlace(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer,
    std::size_t plaintextSize);

// Decrypts the buffer in place and strips the padding. The returned view covers the plaintext. A failed padding check 
// erases the buffer before the error is returned. 
[[nodiscard]] Result<Security::WriteableView> DecryptInPlace(
    std::string_view cipher,
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::WriteableView buffer);

//----------------------------------------------------------------------------------------------------------------------
} // Block namespace
} // Crypto namespace
//----------------------------------------------------------------------------------------------------------------------
