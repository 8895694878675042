//----------------------------------------------------------------------------------------------------------------------
// File: Runtime.hpp
// Description: Wires the key store, the worker channels, the workers, and the scheduler together. The runtime is the
// host side of the enclave, requests are submitted to a worker's request channel and responses are collected from 
// the worker's response channel after the scheduler has been cycled. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Settings.hpp"
#include "Components/Jobs/Channel.hpp"
#include "Components/Jobs/JobTypes.hpp"
#include "Components/KeyStore/KeyStoreDefinitions.hpp"
#include "Components/Scheduler/Service.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace KeyStore { class MemoryStore; class SharedStore; }
namespace Workers { class AesWorker; class ChaChaPolyWorker; }

//----------------------------------------------------------------------------------------------------------------------
namespace Host {
//----------------------------------------------------------------------------------------------------------------------

enum class Target : std::uint32_t { Aes, ChaChaPoly };

class Runtime;

//----------------------------------------------------------------------------------------------------------------------
namespace Slots {
//----------------------------------------------------------------------------------------------------------------------

constexpr KeyStore::KeyId Aes128{ 0 };
constexpr KeyStore::KeyId Aes192{ 1 };
constexpr KeyStore::KeyId Symmetric256{ 2 };
constexpr KeyStore::KeyId Sealed256{ 3 }; // Never leaves the store.
constexpr KeyStore::KeyId NistP256{ 4 };

[[nodiscard]] std::vector<KeyStore::KeyInfo> GetLayout();

//----------------------------------------------------------------------------------------------------------------------
} // Slots namespace
//----------------------------------------------------------------------------------------------------------------------
} // Host namespace
//----------------------------------------------------------------------------------------------------------------------

class Host::Runtime
{
public:
    explicit Runtime(Settings const& settings);
    ~Runtime();

    Runtime(Runtime const&) = delete;
    Runtime& operator=(Runtime const&) = delete;
    Runtime(Runtime&&) = delete;
    Runtime& operator=(Runtime&&) = delete;

    [[nodiscard]] KeyStore::MemoryStore& GetKeyStore();
    [[nodiscard]] bool HasChaChaPolyKeyStore() const;

    // Imports freshly generated keys into every empty symmetric slot of the store. 
    [[nodiscard]] bool ProvisionEphemeralKeys();

    [[nodiscard]] bool Submit(Target target, Jobs::Request&& request);
    [[nodiscard]] std::optional<Jobs::Response> Collect(Target target);

    // Runs a single scheduler cycle, returning the number of worker steps taken. 
    std::size_t Execute();

    // Cycles the scheduler until no announced work remains or the cycle limit is reached. 
    std::size_t ExecuteUntilIdle(std::size_t cycles = 64);

    // Closes the request channels. The workers terminate once their pending requests have been processed.
    void Shutdown();
    [[nodiscard]] bool Terminated() const;

private:
    [[nodiscard]] std::shared_ptr<Jobs::RequestChannel> const& GetRequests(Target target) const;
    [[nodiscard]] std::shared_ptr<Jobs::ResponseChannel> const& GetResponses(Target target) const;

    LogUtils::Logger m_logger;
    std::shared_ptr<KeyStore::MemoryStore> m_spMemoryStore;
    std::shared_ptr<KeyStore::SharedStore> m_spSharedStore;

    std::shared_ptr<Jobs::RequestChannel> m_spAesRequests;
    std::shared_ptr<Jobs::ResponseChannel> m_spAesResponses;
    std::shared_ptr<Jobs::RequestChannel> m_spChaChaPolyRequests;
    std::shared_ptr<Jobs::ResponseChannel> m_spChaChaPolyResponses;

    std::unique_ptr<Workers::AesWorker> m_upAesWorker;
    std::unique_ptr<Workers::ChaChaPolyWorker> m_upChaChaPolyWorker;

    Scheduler::Service m_scheduler;
};

//----------------------------------------------------------------------------------------------------------------------
