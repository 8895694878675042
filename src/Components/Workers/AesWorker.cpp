//----------------------------------------------------------------------------------------------------------------------
// File: AesWorker.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "AesWorker.hpp"
#include "KeyResolution.hpp"
#include "WorkerUtils.hpp"
#include "Components/Crypto/Aes.hpp"
#include "Components/KeyStore/SharedStore.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <stdexcept>
#include <utility>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

Workers::AesWorker::AesWorker(
    std::shared_ptr<KeyStore::SharedStore> const& spKeyStore,
    std::shared_ptr<Jobs::RequestSource> const& spRequests,
    std::shared_ptr<Jobs::ResponseSink> const& spResponses)
    : m_logger(LogUtils::Fetch(LogUtils::Name::AesWorker))
    , m_spKeyStore(spKeyStore)
    , m_spRequests(spRequests)
    , m_spResponses(spResponses)
    , m_keyBuffer()
{
    if (!m_spKeyStore) { throw std::invalid_argument("The AES worker requires a key store!"); }
    if (!m_spRequests) { throw std::invalid_argument("The AES worker requires a request source!"); }
    if (!m_spResponses) { throw std::invalid_argument("The AES worker requires a response sink!"); }
}

//----------------------------------------------------------------------------------------------------------------------

Workers::ExecuteStatus Workers::AesWorker::Execute()
{
    auto const optRequest = m_spRequests->Next();
    if (!optRequest) {
        if (m_spRequests->Exhausted()) {
            m_logger->debug("The request source has been exhausted.");
            return ExecuteStatus::StreamTerminated;
        }
        return ExecuteStatus::Idle;
    }

    auto response = Process(*optRequest);
    LogOutcome(m_logger, *optRequest, response);

    if (!m_spResponses->Send(std::move(response))) {
        m_logger->warn(
            "Unable to send the response to request {} from client {}.",
            Jobs::GetRequestId(*optRequest).ToString(), Jobs::GetClientId(*optRequest).ToString());
        return ExecuteStatus::SendFailure;
    }

    return ExecuteStatus::Processed;
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::Process(Jobs::Request const& request)
{
    return std::visit(VariantVisitor{
        [this] (Jobs::Requests::EncryptAesGcm const& job) -> Jobs::Response { return OnEncryptGcm(job); },
        [this] (Jobs::Requests::EncryptAesGcmExternalKey const& job) -> Jobs::Response { return OnEncryptGcm(job); },
        [this] (Jobs::Requests::DecryptAesGcm const& job) -> Jobs::Response { return OnDecryptGcm(job); },
        [this] (Jobs::Requests::DecryptAesGcmExternalKey const& job) -> Jobs::Response { return OnDecryptGcm(job); },
        [this] (Jobs::Requests::EncryptAesCbc const& job) -> Jobs::Response { return OnEncryptCbc(job); },
        [this] (Jobs::Requests::EncryptAesCbcExternalKey const& job) -> Jobs::Response { return OnEncryptCbc(job); },
        [this] (Jobs::Requests::DecryptAesCbc const& job) -> Jobs::Response { return OnDecryptCbc(job); },
        [this] (Jobs::Requests::DecryptAesCbcExternalKey const& job) -> Jobs::Response { return OnDecryptCbc(job); },
        [this, &request] (auto const&) -> Jobs::Response { return OnUnexpectedRequest(request); }
    }, request);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnEncryptGcm(Jobs::Requests::EncryptAesGcm const& request)
{
    auto const lease = m_keyBuffer.Acquire(); // The exported key is zeroed when the lease goes out of scope.
    auto const resolved = ResolveKey(*m_spKeyStore, request.keyId, lease.GetWriteable());
    if (auto const pError = std::get_if<KeyStore::Error>(&resolved); pError) {
        return Jobs::MakeError(request, *pError);
    }

    auto const& [key, info] = std::get<ResolvedKey>(resolved);
    auto const optVariant = GetGcmVariant(info.type);
    if (!optVariant) { return Jobs::MakeError(request, KeyStore::Error::InvalidKeyType); }

    auto const result = EncryptGcm(*optVariant, key, { request.iv, request.aad, request.buffer }, request.tag);
    return Complete(request, result, [&request] (Security::WriteableView buffer) -> Jobs::Response {
        return Jobs::Responses::EncryptAesGcm{ request.clientId, request.requestId, buffer, request.tag };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnEncryptGcm(Jobs::Requests::EncryptAesGcmExternalKey const& request)
{
    auto const optVariant = GetGcmVariant(request.key.size());
    if (!optVariant) { return Jobs::MakeError(request, Crypto::Error::InvalidSymmetricKeySize); }

    auto const result = EncryptGcm(*optVariant, request.key, { request.iv, request.aad, request.buffer }, request.tag);
    return Complete(request, result, [&request] (Security::WriteableView buffer) -> Jobs::Response {
        return Jobs::Responses::EncryptAesGcm{ request.clientId, request.requestId, buffer, request.tag };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnDecryptGcm(Jobs::Requests::DecryptAesGcm const& request)
{
    auto const lease = m_keyBuffer.Acquire();
    auto const resolved = ResolveKey(*m_spKeyStore, request.keyId, lease.GetWriteable());
    if (auto const pError = std::get_if<KeyStore::Error>(&resolved); pError) {
        return Jobs::MakeError(request, *pError);
    }

    auto const& [key, info] = std::get<ResolvedKey>(resolved);
    auto const optVariant = GetGcmVariant(info.type);
    if (!optVariant) { return Jobs::MakeError(request, KeyStore::Error::InvalidKeyType); }

    auto const result = DecryptGcm(*optVariant, key, { request.iv, request.aad, request.buffer }, request.tag);
    return Complete(request, result, [&request] (Security::WriteableView plaintext) -> Jobs::Response {
        return Jobs::Responses::DecryptAesGcm{ request.clientId, request.requestId, plaintext };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnDecryptGcm(Jobs::Requests::DecryptAesGcmExternalKey const& request)
{
    auto const optVariant = GetGcmVariant(request.key.size());
    if (!optVariant) { return Jobs::MakeError(request, Crypto::Error::InvalidSymmetricKeySize); }

    auto const result = DecryptGcm(*optVariant, request.key, { request.iv, request.aad, request.buffer }, request.tag);
    return Complete(request, result, [&request] (Security::WriteableView plaintext) -> Jobs::Response {
        return Jobs::Responses::DecryptAesGcm{ request.clientId, request.requestId, plaintext };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnEncryptCbc(Jobs::Requests::EncryptAesCbc const& request)
{
    auto const lease = m_keyBuffer.Acquire();
    auto const resolved = ResolveKey(*m_spKeyStore, request.keyId, lease.GetWriteable());
    if (auto const pError = std::get_if<KeyStore::Error>(&resolved); pError) {
        return Jobs::MakeError(request, *pError);
    }

    auto const& [key, info] = std::get<ResolvedKey>(resolved);
    auto const optVariant = GetCbcVariant(info.type);
    if (!optVariant) { return Jobs::MakeError(request, KeyStore::Error::InvalidKeyType); }

    auto const result = EncryptCbc(*optVariant, key, { request.iv, request.buffer }, request.plaintextSize);
    return Complete(request, result, [&request] (Security::WriteableView ciphertext) -> Jobs::Response {
        return Jobs::Responses::EncryptAesCbc{ request.clientId, request.requestId, ciphertext };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnEncryptCbc(Jobs::Requests::EncryptAesCbcExternalKey const& request)
{
    auto const optVariant = GetCbcVariant(request.key.size());
    if (!optVariant) { return Jobs::MakeError(request, Crypto::Error::InvalidSymmetricKeySize); }

    auto const result = EncryptCbc(*optVariant, request.key, { request.iv, request.buffer }, request.plaintextSize);
    return Complete(request, result, [&request] (Security::WriteableView ciphertext) -> Jobs::Response {
        return Jobs::Responses::EncryptAesCbc{ request.clientId, request.requestId, ciphertext };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnDecryptCbc(Jobs::Requests::DecryptAesCbc const& request)
{
    auto const lease = m_keyBuffer.Acquire();
    auto const resolved = ResolveKey(*m_spKeyStore, request.keyId, lease.GetWriteable());
    if (auto const pError = std::get_if<KeyStore::Error>(&resolved); pError) {
        return Jobs::MakeError(request, *pError);
    }

    auto const& [key, info] = std::get<ResolvedKey>(resolved);
    auto const optVariant = GetCbcVariant(info.type);
    if (!optVariant) { return Jobs::MakeError(request, KeyStore::Error::InvalidKeyType); }

    auto const result = DecryptCbc(*optVariant, key, { request.iv, request.buffer });
    return Complete(request, result, [&request] (Security::WriteableView plaintext) -> Jobs::Response {
        return Jobs::Responses::DecryptAesCbc{ request.clientId, request.requestId, plaintext };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnDecryptCbc(Jobs::Requests::DecryptAesCbcExternalKey const& request)
{
    auto const optVariant = GetCbcVariant(request.key.size());
    if (!optVariant) { return Jobs::MakeError(request, Crypto::Error::InvalidSymmetricKeySize); }

    auto const result = DecryptCbc(*optVariant, request.key, { request.iv, request.buffer });
    return Complete(request, result, [&request] (Security::WriteableView plaintext) -> Jobs::Response {
        return Jobs::Responses::DecryptAesCbc{ request.clientId, request.requestId, plaintext };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::AesWorker::OnUnexpectedRequest(Jobs::Request const& request)
{
    m_logger->warn(
        "Received an unexpected {} request {} from client {}.",
        Jobs::GetRequestName(request), Jobs::GetRequestId(request).ToString(), Jobs::GetClientId(request).ToString());
    return Jobs::MakeError(request, Jobs::ProtocolError::UnexpectedRequestType);
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Workers::AesWorker::EncryptGcm(
    Variant variant, Security::ReadableView key, GcmParameters const& parameters, Security::WriteableView tag)
{
    auto const& [iv, aad, buffer] = parameters;
    switch (variant) {
        case Variant::Aes128: return Crypto::Aes::Aes128GcmEncryptInPlaceDetached(key, iv, aad, buffer, tag);
        case Variant::Aes256: return Crypto::Aes::Aes256GcmEncryptInPlaceDetached(key, iv, aad, buffer, tag);
        default: break;
    }
    return Crypto::Error::InvalidSymmetricKeySize;
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Workers::AesWorker::DecryptGcm(
    Variant variant, Security::ReadableView key, GcmParameters const& parameters, Security::ReadableView tag)
{
    auto const& [iv, aad, buffer] = parameters;
    switch (variant) {
        case Variant::Aes128: return Crypto::Aes::Aes128GcmDecryptInPlaceDetached(key, iv, aad, buffer, tag);
        case Variant::Aes256: return Crypto::Aes::Aes256GcmDecryptInPlaceDetached(key, iv, aad, buffer, tag);
        default: break;
    }
    return Crypto::Error::InvalidSymmetricKeySize;
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Workers::AesWorker::EncryptCbc(
    Variant variant, Security::ReadableView key, CbcParameters const& parameters, std::size_t plaintextSize)
{
    auto const& [iv, buffer] = parameters;
    switch (variant) {
        case Variant::Aes128: return Crypto::Aes::Aes128CbcEncrypt(key, iv, buffer, plaintextSize);
        case Variant::Aes192: return Crypto::Aes::Aes192CbcEncrypt(key, iv, buffer, plaintextSize);
        case Variant::Aes256: return Crypto::Aes::Aes256CbcEncrypt(key, iv, buffer, plaintextSize);
    }
    return Crypto::Error::InvalidSymmetricKeySize;
}

//----------------------------------------------------------------------------------------------------------------------

Crypto::Result<Security::WriteableView> Workers::AesWorker::DecryptCbc(
    Variant variant, Security::ReadableView key, CbcParameters const& parameters)
{
    auto const& [iv, buffer] = parameters;
    switch (variant) {
        case Variant::Aes128: return Crypto::Aes::Aes128CbcDecrypt(key, iv, buffer);
        case Variant::Aes192: return Crypto::Aes::Aes192CbcDecrypt(key, iv, buffer);
        case Variant::Aes256: return Crypto::Aes::Aes256CbcDecrypt(key, iv, buffer);
    }
    return Crypto::Error::InvalidSymmetricKeySize;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Workers::AesWorker::Variant> Workers::AesWorker::GetGcmVariant(KeyStore::KeyType type)
{
    switch (type) {
        case KeyStore::KeyType::Symmetric128Bits: return Variant::Aes128;
        case KeyStore::KeyType::Symmetric256Bits: return Variant::Aes256;
        default: return {}; // AES-192-GCM is not offered.
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Workers::AesWorker::Variant> Workers::AesWorker::GetGcmVariant(std::size_t size)
{
    switch (size) {
        case Crypto::Aes::Key128Size: return Variant::Aes128;
        case Crypto::Aes::Key256Size: return Variant::Aes256;
        default: return {};
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Workers::AesWorker::Variant> Workers::AesWorker::GetCbcVariant(KeyStore::KeyType type)
{
    switch (type) {
        case KeyStore::KeyType::Symmetric128Bits: return Variant::Aes128;
        case KeyStore::KeyType::Symmetric192Bits: return Variant::Aes192;
        case KeyStore::KeyType::Symmetric256Bits: return Variant::Aes256;
        default: return {};
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Workers::AesWorker::Variant> Workers::AesWorker::GetCbcVariant(std::size_t size)
{
    switch (size) {
        case Crypto::Aes::Key128Size: return Variant::Aes128;
        case Crypto::Aes::Key192Size: return Variant::Aes192;
        case Crypto::Aes::Key256Size: return Variant::Aes256;
        default: return {};
    }
}

//----------------------------------------------------------------------------------------------------------------------
