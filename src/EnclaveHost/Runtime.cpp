//----------------------------------------------------------------------------------------------------------------------
// File: Runtime.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Runtime.hpp"
#include "Components/KeyStore/MemoryStore.hpp"
#include "Components/KeyStore/SharedStore.hpp"
#include "Components/Security/KeyBuffer.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Components/Workers/AesWorker.hpp"
#include "Components/Workers/ChaChaPolyWorker.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

std::vector<KeyStore::KeyInfo> Host::Slots::GetLayout()
{
    constexpr KeyStore::KeyPermissions Exportable{
        .import = true, .exportable = true, .overwrite = true, .remove = true };
    constexpr KeyStore::KeyPermissions Sealed{
        .import = true, .exportable = false, .overwrite = false, .remove = true };
    return {
        { Aes128, KeyStore::KeyType::Symmetric128Bits, Exportable },
        { Aes192, KeyStore::KeyType::Symmetric192Bits, Exportable },
        { Symmetric256, KeyStore::KeyType::Symmetric256Bits, Exportable },
        { Sealed256, KeyStore::KeyType::Symmetric256Bits, Sealed },
        { NistP256, KeyStore::KeyType::EccKeypairNistP256, Exportable },
    };
}

//----------------------------------------------------------------------------------------------------------------------

Host::Runtime::Runtime(Settings const& settings)
    : m_logger(LogUtils::Fetch(LogUtils::Name::Core))
    , m_spMemoryStore(std::make_shared<KeyStore::MemoryStore>(Slots::GetLayout()))
    , m_spSharedStore(std::make_shared<KeyStore::SharedStore>(m_spMemoryStore))
    , m_spAesRequests(std::make_shared<Jobs::RequestChannel>(settings.requestCapacity))
    , m_spAesResponses(std::make_shared<Jobs::ResponseChannel>(settings.responseCapacity))
    , m_spChaChaPolyRequests(std::make_shared<Jobs::RequestChannel>(settings.requestCapacity))
    , m_spChaChaPolyResponses(std::make_shared<Jobs::ResponseChannel>(settings.responseCapacity))
    , m_upAesWorker()
    , m_upChaChaPolyWorker()
    , m_scheduler()
{
    m_upAesWorker = std::make_unique<Workers::AesWorker>(m_spSharedStore, m_spAesRequests, m_spAesResponses);

    // Both workers share the same guarded store when the ChaCha20-Poly1305 worker is given access to it. 
    auto const spChaChaPolyStore = settings.attachChaChaPolyKeyStore ? m_spSharedStore : nullptr;
    m_upChaChaPolyWorker = std::make_unique<Workers::ChaChaPolyWorker>(
        spChaChaPolyStore, m_spChaChaPolyRequests, m_spChaChaPolyResponses);

    // Workers are executed in registration order, the AES worker is given priority. 
    auto const spAesDelegate = m_scheduler.Register<Workers::AesWorker>(
        [pWorker = m_upAesWorker.get()] () -> Workers::ExecuteStatus { return pWorker->Execute(); });
    auto const spChaChaPolyDelegate = m_scheduler.Register<Workers::ChaChaPolyWorker>(
        [pWorker = m_upChaChaPolyWorker.get()] () -> Workers::ExecuteStatus { return pWorker->Execute(); });

    m_spAesRequests->OnItemAvailable([spAesDelegate] () { spAesDelegate->OnTaskAvailable(); });
    m_spChaChaPolyRequests->OnItemAvailable([spChaChaPolyDelegate] () { spChaChaPolyDelegate->OnTaskAvailable(); });

    m_logger->debug(
        "Runtime initialized with request capacity {} and response capacity {}.",
        settings.requestCapacity, settings.responseCapacity);
}

//----------------------------------------------------------------------------------------------------------------------

Host::Runtime::~Runtime()
{
    // The channel observers reference the scheduler's delegates, they must be released before the scheduler is.
    m_spAesRequests->OnItemAvailable({});
    m_spChaChaPolyRequests->OnItemAvailable({});
}

//----------------------------------------------------------------------------------------------------------------------

KeyStore::MemoryStore& Host::Runtime::GetKeyStore() { return *m_spMemoryStore; }

//----------------------------------------------------------------------------------------------------------------------

bool Host::Runtime::HasChaChaPolyKeyStore() const { return m_upChaChaPolyWorker->HasKeyStore(); }

//----------------------------------------------------------------------------------------------------------------------

bool Host::Runtime::ProvisionEphemeralKeys()
{
    std::array<std::uint8_t, Security::KeyBuffer::Capacity> key{};
    bool success = true;
    for (auto const& info : Slots::GetLayout()) {
        if (!KeyStore::IsSymmetric(info.type) || m_spMemoryStore->IsStored(info.id)) { continue; }

        auto const generated = Security::WriteableView{ key }.first(KeyStore::GetKeySize(info.type));
        if (!Security::GenerateRandomData(generated)) { success = false; break; }

        if (auto const optError = m_spMemoryStore->Import(info.id, generated); optError) {
            m_logger->error("Failed to provision key slot {}: {}.", info.id.ToString(), KeyStore::ToString(*optError));
            success = false;
            break;
        }
    }

    Security::EraseMemory(key);
    return success;
}

//----------------------------------------------------------------------------------------------------------------------

bool Host::Runtime::Submit(Target target, Jobs::Request&& request)
{
    return GetRequests(target)->Send(std::move(request));
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Jobs::Response> Host::Runtime::Collect(Target target)
{
    return GetResponses(target)->Next();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Host::Runtime::Execute() { return m_scheduler.Execute(); }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Host::Runtime::ExecuteUntilIdle(std::size_t cycles)
{
    std::size_t executed = 0;
    for (std::size_t cycle = 0; cycle < cycles && m_scheduler.AvailableTasks() != 0; ++cycle) {
        executed += m_scheduler.Execute();
    }
    return executed;
}

//----------------------------------------------------------------------------------------------------------------------

void Host::Runtime::Shutdown()
{
    m_spAesRequests->Close();
    m_spChaChaPolyRequests->Close();
}

//----------------------------------------------------------------------------------------------------------------------

bool Host::Runtime::Terminated() const { return m_scheduler.Terminated(); }

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Jobs::RequestChannel> const& Host::Runtime::GetRequests(Target target) const
{
    return (target == Target::Aes) ? m_spAesRequests : m_spChaChaPolyRequests;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Jobs::ResponseChannel> const& Host::Runtime::GetResponses(Target target) const
{
    return (target == Target::Aes) ? m_spAesResponses : m_spChaChaPolyResponses;
}

//----------------------------------------------------------------------------------------------------------------------
