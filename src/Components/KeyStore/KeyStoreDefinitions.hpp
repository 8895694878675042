//----------------------------------------------------------------------------------------------------------------------
// File: KeyStoreDefinitions.hpp
// Description: Key identifiers, key metadata, and the error set shared by every key store implementation. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/StrongType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace KeyStore {
//----------------------------------------------------------------------------------------------------------------------

using KeyId = StrongType<std::uint32_t, struct KeyIdTag>;

enum class KeyType : std::uint32_t {
    Symmetric128Bits,
    Symmetric192Bits,
    Symmetric256Bits,
    EccKeypairNistP256,
    EccKeypairNistP384,
    Ed25519
};

struct KeyPermissions
{
    bool import;
    bool exportable;
    bool overwrite;
    bool remove;

    [[nodiscard]] bool operator==(KeyPermissions const& other) const noexcept = default;
};

struct KeyInfo
{
    KeyId id;
    KeyType type;
    KeyPermissions permissions;

    [[nodiscard]] bool operator==(KeyInfo const& other) const noexcept = default;
};

enum class Error : std::uint32_t {
    InvalidKeyId,
    KeyNotFound,
    KeyAlreadyExists,
    InvalidBufferSize,
    NotAllowed,
    InvalidKeyType,
    NoKeyStore
};

template<typename Value>
using Result = std::variant<Value, Error>;

using OptionalError = std::optional<Error>;

// The largest key a symmetric worker will ever export. 
constexpr std::size_t MaxSymmetricKeySize = 32;

[[nodiscard]] constexpr bool IsSymmetric(KeyType type) noexcept;
[[nodiscard]] constexpr std::size_t GetKeySize(KeyType type) noexcept;

[[nodiscard]] std::string_view ToString(KeyType type);
[[nodiscard]] std::string_view ToString(Error error);

//----------------------------------------------------------------------------------------------------------------------
} // KeyStore namespace
//----------------------------------------------------------------------------------------------------------------------

constexpr bool KeyStore::IsSymmetric(KeyType type) noexcept
{
    switch (type) {
        case KeyType::Symmetric128Bits:
        case KeyType::Symmetric192Bits:
        case KeyType::Symmetric256Bits: return true;
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t KeyStore::GetKeySize(KeyType type) noexcept
{
    switch (type) {
        case KeyType::Symmetric128Bits: return 16;
        case KeyType::Symmetric192Bits: return 24;
        case KeyType::Symmetric256Bits: return 32;
        case KeyType::EccKeypairNistP256: return 32 + 64; // Private scalar and uncompressed public point.
        case KeyType::EccKeypairNistP384: return 48 + 96;
        case KeyType::Ed25519: return 32 + 32;
    }
    return 0;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view KeyStore::ToString(KeyType type)
{
    switch (type) {
        case KeyType::Symmetric128Bits: return "symmetric-128";
        case KeyType::Symmetric192Bits: return "symmetric-192";
        case KeyType::Symmetric256Bits: return "symmetric-256";
        case KeyType::EccKeypairNistP256: return "ecc-nist-p256";
        case KeyType::EccKeypairNistP384: return "ecc-nist-p384";
        case KeyType::Ed25519: return "ed25519";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view KeyStore::ToString(Error error)
{
    switch (error) {
        case Error::InvalidKeyId: return "invalid key id";
        case Error::KeyNotFound: return "key not found";
        case Error::KeyAlreadyExists: return "key already exists";
        case Error::InvalidBufferSize: return "invalid buffer size";
        case Error::NotAllowed: return "operation not allowed";
        case Error::InvalidKeyType: return "invalid key type";
        case Error::NoKeyStore: return "no key store";
    }
    return "unknown key store error";
}

//----------------------------------------------------------------------------------------------------------------------
