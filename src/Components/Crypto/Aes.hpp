//----------------------------------------------------------------------------------------------------------------------
// File: Aes.hpp
// Description: AES adapters for the worker layer. Every function operates in place on caller owned memory and returns
// the processed region of that memory. GCM tags are detached into a caller provided buffer and CBC uses PKCS#7 padding.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "CryptoDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Crypto::Aes {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Result<Security::WriteableView> Aes128GcmEncryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag);

[[nodiscard]] Result<Security::WriteableView> Aes256GcmEncryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag);

[[nodiscard]] Result<Security::WriteableView> Aes128GcmDecryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag);

[[nodiscard]] Result<Security::WriteableView> Aes256GcmDecryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView iv,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag);

// The plaintext occupies the first plaintextSize bytes of the buffer, the remainder must fit the padding. The returned
// view covers the ciphertext, which is always a non-zero multiple of the block size. 
[[nodiscard]] Result<Security::WriteableView> Aes128CbcEncrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer, std::size_t plaintextSize);

[[nodiscard]] Result<Security::WriteableView> Aes192CbcEncrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer, std::size_t plaintextSize);

[[nodiscard]] Result<Security::WriteableView> Aes256CbcEncrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer, std::size_t plaintextSize);

// The returned view covers the plaintext with the padding stripped. 
[[nodiscard]] Result<Security::WriteableView> Aes128CbcDecrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer);

[[nodiscard]] Result<Security::WriteableView> Aes192CbcDecrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer);

[[nodiscard]] Result<Security::WriteableView> Aes256CbcDecrypt(
    Security::ReadableView key, Security::ReadableView iv, Security::WriteableView buffer);

//----------------------------------------------------------------------------------------------------------------------
} // Crypto::Aes namespace
//----------------------------------------------------------------------------------------------------------------------
