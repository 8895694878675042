//----------------------------------------------------------------------------------------------------------------------
// File: ChaChaPolyWorker.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "ChaChaPolyWorker.hpp"
#include "KeyResolution.hpp"
#include "WorkerUtils.hpp"
#include "Components/Crypto/ChaChaPoly.hpp"
#include "Components/KeyStore/SharedStore.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <stdexcept>
#include <utility>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

Workers::ChaChaPolyWorker::ChaChaPolyWorker(
    std::shared_ptr<KeyStore::SharedStore> const& spKeyStore,
    std::shared_ptr<Jobs::RequestSource> const& spRequests,
    std::shared_ptr<Jobs::ResponseSink> const& spResponses)
    : m_logger(LogUtils::Fetch(LogUtils::Name::ChaChaPolyWorker))
    , m_spKeyStore(spKeyStore)
    , m_spRequests(spRequests)
    , m_spResponses(spResponses)
    , m_keyBuffer()
{
    if (!m_spRequests) { throw std::invalid_argument("The ChaCha20-Poly1305 worker requires a request source!"); }
    if (!m_spResponses) { throw std::invalid_argument("The ChaCha20-Poly1305 worker requires a response sink!"); }
    if (!m_spKeyStore) { m_logger->info("No key store has been provided, only external keys will be accepted."); }
}

//----------------------------------------------------------------------------------------------------------------------

Workers::ExecuteStatus Workers::ChaChaPolyWorker::Execute()
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

bool Workers::ChaChaPolyWorker::HasKeyStore() const { return m_spKeyStore != nullptr; }

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::Process(Jobs::Request const& request)
{
    return std::visit(VariantVisitor{
        [this] (Jobs::Requests::EncryptChaChaPoly const& job) -> Jobs::Response { return OnEncrypt(job); },
        [this] (Jobs::Requests::EncryptChaChaPolyExternalKey const& job) -> Jobs::Response { return OnEncrypt(job); },
        [this] (Jobs::Requests::DecryptChaChaPoly const& job) -> Jobs::Response { return OnDecrypt(job); },
        [this] (Jobs::Requests::DecryptChaChaPolyExternalKey const& job) -> Jobs::Response { return OnDecrypt(job); },
        [this, &request] (auto const&) -> Jobs::Response { return OnUnexpectedRequest(request); }
    }, request);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::OnEncrypt(Jobs::Requests::EncryptChaChaPoly const& request)
{
    if (!m_spKeyStore) { return Jobs::MakeError(request, KeyStore::Error::NoKeyStore); }

    auto const lease = m_keyBuffer.Acquire(); // The exported key is zeroed when the lease goes out of scope.
    auto const resolved = ResolveKey(*m_spKeyStore, request.keyId, lease.GetWriteable());
    if (auto const pError = std::get_if<KeyStore::Error>(&resolved); pError) {
        return Jobs::MakeError(request, *pError);
    }

    auto const& [key, info] = std::get<ResolvedKey>(resolved);
    if (info.type != KeyStore::KeyType::Symmetric256Bits) {
        return Jobs::MakeError(request, KeyStore::Error::InvalidKeyType);
    }

    return Encrypt(
        key, { request.clientId, request.requestId, request.nonce, request.aad, request.plaintext }, request.tag);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::OnEncrypt(Jobs::Requests::EncryptChaChaPolyExternalKey const& request)
{
    Parameters const parameters{ request.clientId, request.requestId, request.nonce, request.aad, request.plaintext };
    return Encrypt(request.key, parameters, request.tag);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::OnDecrypt(Jobs::Requests::DecryptChaChaPoly const& request)
{
    if (!m_spKeyStore) { return Jobs::MakeError(request, KeyStore::Error::NoKeyStore); }

    auto const lease = m_keyBuffer.Acquire();
    auto const resolved = ResolveKey(*m_spKeyStore, request.keyId, lease.GetWriteable());
    if (auto const pError = std::get_if<KeyStore::Error>(&resolved); pError) {
        return Jobs::MakeError(request, *pError);
    }

    auto const& [key, info] = std::get<ResolvedKey>(resolved);
    if (info.type != KeyStore::KeyType::Symmetric256Bits) {
        return Jobs::MakeError(request, KeyStore::Error::InvalidKeyType);
    }

    return Decrypt(
        key, { request.clientId, request.requestId, request.nonce, request.aad, request.ciphertext }, request.tag);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::OnDecrypt(Jobs::Requests::DecryptChaChaPolyExternalKey const& request)
{
    Parameters const parameters{ request.clientId, request.requestId, request.nonce, request.aad, request.ciphertext };
    return Decrypt(request.key, parameters, request.tag);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::OnUnexpectedRequest(Jobs::Request const& request)
{
    m_logger->warn(
        "Received an unexpected {} request {} from client {}.",
        Jobs::GetRequestName(request), Jobs::GetRequestId(request).ToString(), Jobs::GetClientId(request).ToString());
    return Jobs::MakeError(request, Jobs::ProtocolError::UnexpectedRequestType);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::Encrypt(
    Security::ReadableView key, Parameters const& parameters, Security::WriteableView tag)
{
    auto const result = Crypto::ChaChaPoly::EncryptInPlaceDetached(
        key, parameters.nonce, parameters.aad, parameters.buffer, tag);
    return Complete(parameters, result, [&parameters, &tag] (Security::WriteableView ciphertext) -> Jobs::Response {
        return Jobs::Responses::EncryptChaChaPoly{ parameters.clientId, parameters.requestId, ciphertext, tag };
    });
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Response Workers::ChaChaPolyWorker::Decrypt(
    Security::ReadableView key, Parameters const& parameters, Security::ReadableView tag)
{
    auto const result = Crypto::ChaChaPoly::DecryptInPlaceDetached(
        key, parameters.nonce, parameters.aad, parameters.buffer, tag);
    return Complete(parameters, result, [&parameters] (Security::WriteableView plaintext) -> Jobs::Response {
        return Jobs::Responses::DecryptChaChaPoly{ parameters.clientId, parameters.requestId, plaintext };
    });
}

//----------------------------------------------------------------------------------------------------------------------
