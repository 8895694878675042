//----------------------------------------------------------------------------------------------------------------------
// File: AesWorker.hpp
// Description: Processes AES-GCM and AES-CBC jobs. Each call to Execute takes at most one request from the request 
// source and forwards exactly one response for it to the response sink. Keys are either resolved from the shared key 
// store at the moment of use or supplied inline by the client. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "WorkerDefinitions.hpp"
#include "Components/Jobs/Channel.hpp"
#include "Components/Jobs/JobTypes.hpp"
#include "Components/Security/KeyBuffer.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

namespace KeyStore { class SharedStore; }

//----------------------------------------------------------------------------------------------------------------------
namespace Workers {
//----------------------------------------------------------------------------------------------------------------------

class AesWorker;

//----------------------------------------------------------------------------------------------------------------------
} // Workers namespace
//----------------------------------------------------------------------------------------------------------------------

class Workers::AesWorker
{
public:
    AesWorker(
        std::shared_ptr<KeyStore::SharedStore> const& spKeyStore,
        std::shared_ptr<Jobs::RequestSource> const& spRequests,
        std::shared_ptr<Jobs::ResponseSink> const& spResponses);

    AesWorker(AesWorker const&) = delete;
    AesWorker& operator=(AesWorker const&) = delete;

    [[nodiscard]] ExecuteStatus Execute();

private:
    enum class Variant : std::uint32_t { Aes128, Aes192, Aes256 };

    struct GcmParameters
    {
        Security::ReadableView iv;
        Security::ReadableView aad;
        Security::WriteableView buffer;
    };

    struct CbcParameters
    {
        Security::ReadableView iv;
        Security::WriteableView buffer;
    };

    [[nodiscard]] Jobs::Response Process(Jobs::Request const& request);

    [[nodiscard]] Jobs::Response OnEncryptGcm(Jobs::Requests::EncryptAesGcm const& request);
    [[nodiscard]] Jobs::Response OnEncryptGcm(Jobs::Requests::EncryptAesGcmExternalKey const& request);
    [[nodiscard]] Jobs::Response OnDecryptGcm(Jobs::Requests::DecryptAesGcm const& request);
    [[nodiscard]] Jobs::Response OnDecryptGcm(Jobs::Requests::DecryptAesGcmExternalKey const& request);
    [[nodiscard]] Jobs::Response OnEncryptCbc(Jobs::Requests::EncryptAesCbc const& request);
    [[nodiscard]] Jobs::Response OnEncryptCbc(Jobs::Requests::EncryptAesCbcExternalKey const& request);
    [[nodiscard]] Jobs::Response OnDecryptCbc(Jobs::Requests::DecryptAesCbc const& request);
    [[nodiscard]] Jobs::Response OnDecryptCbc(Jobs::Requests::DecryptAesCbcExternalKey const& request);
    [[nodiscard]] Jobs::Response OnUnexpectedRequest(Jobs::Request const& request);

    [[nodiscard]] static Crypto::Result<Security::WriteableView> EncryptGcm(
        Variant variant, Security::ReadableView key, GcmParameters const& parameters, Security::WriteableView tag);
    [[nodiscard]] static Crypto::Result<Security::WriteableView> DecryptGcm(
        Variant variant, Security::ReadableView key, GcmParameters const& parameters, Security::ReadableView tag);
    [[nodiscard]] static Crypto::Result<Security::WriteableView> EncryptCbc(
        Variant variant, Security::ReadableView key, CbcParameters const& parameters, std::size_t plaintextSize);
    [[nodiscard]] static Crypto::Result<Security::WriteableView> DecryptCbc(
        Variant variant, Security::ReadableView key, CbcParameters const& parameters);

    [[nodiscard]] static std::optional<Variant> GetGcmVariant(KeyStore::KeyType type);
    [[nodiscard]] static std::optional<Variant> GetGcmVariant(std::size_t size);
    [[nodiscard]] static std::optional<Variant> GetCbcVariant(KeyStore::KeyType type);
    [[nodiscard]] static std::optional<Variant> GetCbcVariant(std::size_t size);

    LogUtils::Logger m_logger;
    std::shared_ptr<KeyStore::SharedStore> const m_spKeyStore;
    std::shared_ptr<Jobs::RequestSource> const m_spRequests;
    std::shared_ptr<Jobs::ResponseSink> const m_spResponses;
    Security::KeyBuffer m_keyBuffer;
};

//----------------------------------------------------------------------------------------------------------------------
