//----------------------------------------------------------------------------------------------------------------------
// File: ChaChaPolyWorker.hpp
// Description: Processes ChaCha20-Poly1305 jobs. The worker may be created without a key store, in which case only 
// requests that carry their own key can be served and every key store backed request fails with NoKeyStore. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "WorkerDefinitions.hpp"
#include "Components/Jobs/Channel.hpp"
#include "Components/Jobs/JobTypes.hpp"
#include "Components/Security/KeyBuffer.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

namespace KeyStore { class SharedStore; }

//----------------------------------------------------------------------------------------------------------------------
namespace Workers {
//----------------------------------------------------------------------------------------------------------------------

class ChaChaPolyWorker;

//----------------------------------------------------------------------------------------------------------------------
} // Workers namespace
//----------------------------------------------------------------------------------------------------------------------

class Workers::ChaChaPolyWorker
{
public:
    // Note: A null key store is permitted and places the worker in external key only mode. 
    ChaChaPolyWorker(
        std::shared_ptr<KeyStore::SharedStore> const& spKeyStore,
        std::shared_ptr<Jobs::RequestSource> const& spRequests,
        std::shared_ptr<Jobs::ResponseSink> const& spResponses);

    ChaChaPolyWorker(ChaChaPolyWorker const&) = delete;
    ChaChaPolyWorker& operator=(ChaChaPolyWorker const&) = delete;

    [[nodiscard]] ExecuteStatus Execute();
    [[nodiscard]] bool HasKeyStore() const;

private:
    struct Parameters
    {
        Jobs::ClientId clientId;
        Jobs::RequestId requestId;
        Security::ReadableView nonce;
        Security::ReadableView aad;
        Security::WriteableView buffer;
    };

    [[nodiscard]] Jobs::Response Process(Jobs::Request const& request);

    [[nodiscard]] Jobs::Response OnEncrypt(Jobs::Requests::EncryptChaChaPoly const& request);
    [[nodiscard]] Jobs::Response OnEncrypt(Jobs::Requests::EncryptChaChaPolyExternalKey const& request);
    [[nodiscard]] Jobs::Response OnDecrypt(Jobs::Requests::DecryptChaChaPoly const& request);
    [[nodiscard]] Jobs::Response OnDecrypt(Jobs::Requests::DecryptChaChaPolyExternalKey const& request);
    [[nodiscard]] Jobs::Response OnUnexpectedRequest(Jobs::Request const& request);

    [[nodiscard]] static Jobs::Response Encrypt(
        Security::ReadableView key, Parameters const& parameters, Security::WriteableView tag);
    [[nodiscard]] static Jobs::Response Decrypt(
        Security::ReadableView key, Parameters const& parameters, Security::ReadableView tag);

    LogUtils::Logger m_logger;
    std::shared_ptr<KeyStore::SharedStore> const m_spKeyStore;
    std::shared_ptr<Jobs::RequestSource> const m_spRequests;
    std::shared_ptr<Jobs::ResponseSink> const m_spResponses;
    Security::KeyBuffer m_keyBuffer;
};

//----------------------------------------------------------------------------------------------------------------------
