//----------------------------------------------------------------------------------------------------------------------
// File: JobTypes.hpp
// Description: The request and response protocol spoken between clients and the cryptographic workers. Requests and 
// responses only reference caller owned memory, a response always refers to the same memory (or a prefix of it) as 
// the request that produced it. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Crypto/CryptoDefinitions.hpp"
#include "Components/KeyStore/KeyStoreDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
#include "Utilities/StrongType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Jobs {
//----------------------------------------------------------------------------------------------------------------------

using ClientId = StrongType<std::uint32_t, struct ClientIdTag>;
using RequestId = StrongType<std::uint32_t, struct RequestIdTag>;

enum class ProtocolError : std::uint32_t { UnexpectedRequestType, StreamTerminated, Send };

using Error = std::variant<ProtocolError, KeyStore::Error, Crypto::Error>;

//----------------------------------------------------------------------------------------------------------------------
namespace Requests {
//----------------------------------------------------------------------------------------------------------------------

struct EncryptAesGcm
{
    ClientId clientId;
    RequestId requestId;
    KeyStore::KeyId keyId;
    Security::ReadableView iv;
    Security::ReadableView aad;
    Security::WriteableView buffer;
    Security::WriteableView tag;
};

struct EncryptAesGcmExternalKey
{
    ClientId clientId;
    RequestId requestId;
    Security::ReadableView key;
    Security::ReadableView iv;
    Security::ReadableView aad;
    Security::WriteableView buffer;
    Security::WriteableView tag;
};

struct DecryptAesGcm
{
    ClientId clientId;
    RequestId requestId;
    KeyStore::KeyId keyId;
    Security::ReadableView iv;
    Security::ReadableView aad;
    Security::WriteableView buffer;
    Security::ReadableView tag;
};

struct DecryptAesGcmExternalKey
{
    ClientId clientId;
    RequestId requestId;
    Security::ReadableView key;
    Security::ReadableView iv;
    Security::ReadableView aad;
    Security::WriteableView buffer;
    Security::ReadableView tag;
};

struct EncryptAesCbc
{
    ClientId clientId;
    RequestId requestId;
    KeyStore::KeyId keyId;
    Security::ReadableView iv;
    Security::WriteableView buffer;
    std::size_t plaintextSize;
};

struct EncryptAesCbcExternalKey
{
    ClientId clientId;
    RequestId requestId;
    Security::ReadableView key;
    Security::ReadableView iv;
    Security::WriteableView buffer;
    std::size_t plaintextSize;
};

struct DecryptAesCbc
{
    ClientId clientId;
    RequestId requestId;
    KeyStore::KeyId keyId;
    Security::ReadableView iv;
    Security::WriteableView buffer;
};

struct DecryptAesCbcExternalKey
{
    ClientId clientId;
    RequestId requestId;
    Security::ReadableView key;
    Security::ReadableView iv;
    Security::WriteableView buffer;
};

struct EncryptChaChaPoly
{
    ClientId clientId;
    RequestId requestId;
    KeyStore::KeyId keyId;
    Security::ReadableView nonce;
    Security::ReadableView aad;
    Security::WriteableView plaintext;
    Security::WriteableView tag;
};

struct EncryptChaChaPolyExternalKey
{
    ClientId clientId;
    RequestId requestId;
    Security::ReadableView key;
    Security::ReadableView nonce;
    Security::ReadableView aad;
    Security::WriteableView plaintext;
    Security::WriteableView tag;
};

struct DecryptChaChaPoly
{
    ClientId clientId;
    RequestId requestId;
    KeyStore::KeyId keyId;
    Security::ReadableView nonce;
    Security::ReadableView aad;
    Security::WriteableView ciphertext;
    Security::ReadableView tag;
};

struct DecryptChaChaPolyExternalKey
{
    ClientId clientId;
    RequestId requestId;
    Security::ReadableView key;
    Security::ReadableView nonce;
    Security::ReadableView aad;
    Security::WriteableView ciphertext;
    Security::ReadableView tag;
};

// Served by the random number worker, which shares the protocol but is not part of this core. 
struct GetRandom
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView output;
};

//----------------------------------------------------------------------------------------------------------------------
} // Requests namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Responses {
//----------------------------------------------------------------------------------------------------------------------

struct EncryptAesGcm
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView buffer;
    Security::WriteableView tag;
};

struct DecryptAesGcm
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView plaintext;
};

struct EncryptAesCbc
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView buffer;
};

struct DecryptAesCbc
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView plaintext;
};

struct EncryptChaChaPoly
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView ciphertext;
    Security::WriteableView tag;
};

struct DecryptChaChaPoly
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView plaintext;
};

struct GetRandom
{
    ClientId clientId;
    RequestId requestId;
    Security::WriteableView data;
};

struct Error
{
    ClientId clientId;
    RequestId requestId;
    Jobs::Error error;
};

//----------------------------------------------------------------------------------------------------------------------
} // Responses namespace
//----------------------------------------------------------------------------------------------------------------------

using Request = std::variant<
    Requests::EncryptAesGcm,
    Requests::EncryptAesGcmExternalKey,
    Requests::DecryptAesGcm,
    Requests::DecryptAesGcmExternalKey,
    Requests::EncryptAesCbc,
    Requests::EncryptAesCbcExternalKey,
    Requests::DecryptAesCbc,
    Requests::DecryptAesCbcExternalKey,
    Requests::EncryptChaChaPoly,
    Requests::EncryptChaChaPolyExternalKey,
    Requests::DecryptChaChaPoly,
    Requests::DecryptChaChaPolyExternalKey,
    Requests::GetRandom>;

using Response = std::variant<
    Responses::EncryptAesGcm,
    Responses::DecryptAesGcm,
    Responses::EncryptAesCbc,
    Responses::DecryptAesCbc,
    Responses::EncryptChaChaPoly,
    Responses::DecryptChaChaPoly,
    Responses::GetRandom,
    Responses::Error>;

[[nodiscard]] ClientId GetClientId(Request const& request);
[[nodiscard]] RequestId GetRequestId(Request const& request);
[[nodiscard]] std::string_view GetRequestName(Request const& request);

[[nodiscard]] ClientId GetClientId(Response const& response);
[[nodiscard]] RequestId GetRequestId(Response const& response);
[[nodiscard]] bool IsError(Response const& response);

[[nodiscard]] Responses::Error MakeError(Request const& request, Error const& error);

template<typename RequestType>
[[nodiscard]] Responses::Error MakeError(RequestType const& request, Error const& error)
{
    return Responses::Error{ request.clientId, request.requestId, error };
}

[[nodiscard]] std::string_view ToString(ProtocolError error);
[[nodiscard]] std::string ToString(Error const& error);

//----------------------------------------------------------------------------------------------------------------------
} // Jobs namespace
//----------------------------------------------------------------------------------------------------------------------
