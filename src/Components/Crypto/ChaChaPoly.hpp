//----------------------------------------------------------------------------------------------------------------------
// File: ChaChaPoly.hpp
// Description: ChaCha20-Poly1305 adapters operating in place with a detached tag. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "CryptoDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Crypto::ChaChaPoly {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Result<Security::WriteableView> EncryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::WriteableView tag);

// On an authentication failure the buffer is erased and must not be used by the caller. 
[[nodiscard]] Result<Security::WriteableView> DecryptInPlaceDetached(
    Security::ReadableView key,
    Security::ReadableView nonce,
    Security::ReadableView aad,
    Security::WriteableView buffer,
    Security::ReadableView tag);

//----------------------------------------------------------------------------------------------------------------------
} // Crypto::ChaChaPoly namespace
//----------------------------------------------------------------------------------------------------------------------
