//----------------------------------------------------------------------------------------------------------------------
// File: CryptoDefinitions.hpp
// Description: Canonical sizes and the error set of the symmetric primitive adapters. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Crypto {
//----------------------------------------------------------------------------------------------------------------------

enum class Error : std::uint32_t {
    InvalidSymmetricKeySize,
    InvalidIvSize,
    InvalidTagSize,
    InvalidBufferSize,
    InvalidPadding,
    Authentication,
    Encryption,
    Decryption
};

template<typename Value>
using Result = std::variant<Value, Error>;

[[nodiscard]] std::string_view ToString(Error error);

//----------------------------------------------------------------------------------------------------------------------
namespace Aes {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t Key128Size = 16;
constexpr std::size_t Key192Size = 24;
constexpr std::size_t Key256Size = 32;
constexpr std::size_t BlockSize = 16;
constexpr std::size_t CbcIvSize = 16;
constexpr std::size_t GcmIvSize = 12;
constexpr std::size_t GcmTagSize = 16;

//----------------------------------------------------------------------------------------------------------------------
} // Aes namespace
//----------------------------------------------------------------------------------------------------------------------
namespace ChaChaPoly {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t KeySize = 32;
constexpr std::size_t NonceSize = 12;
constexpr std::size_t TagSize = 16;

//----------------------------------------------------------------------------------------------------------------------
} // ChaChaPoly namespace
//----------------------------------------------------------------------------------------------------------------------
} // Crypto namespace
//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Crypto::ToString(Error error)
{
    switch (error) {
        case Error::InvalidSymmetricKeySize: return "invalid symmetric key size";
        case Error::InvalidIvSize: return "invalid iv size";
        case Error::InvalidTagSize: return "invalid tag size";
        case Error::InvalidBufferSize: return "invalid buffer size";
        case Error::InvalidPadding: return "invalid padding";
        case Error::Authentication: return "authentication failure";
        case Error::Encryption: return "encryption failure";
        case Error::Decryption: return "decryption failure";
    }
    return "unknown crypto error";
}

//----------------------------------------------------------------------------------------------------------------------
