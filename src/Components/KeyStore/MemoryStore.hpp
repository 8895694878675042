//----------------------------------------------------------------------------------------------------------------------
// File: MemoryStore.hpp
// Description: A volatile key store with a fixed set of key slots. Each slot is described by its KeyInfo when the 
// store is created; keys may then be imported into, exported from, and deleted from the slots as their permissions 
// allow. Stored keys are zeroed when they are deleted, overwritten, or when the store is destroyed. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "KeyStoreDefinitions.hpp"
#include "Components/Security/SecureBuffer.hpp"
#include "Interfaces/KeyStore.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace KeyStore {
//----------------------------------------------------------------------------------------------------------------------

class MemoryStore;

//----------------------------------------------------------------------------------------------------------------------
} // KeyStore namespace
//----------------------------------------------------------------------------------------------------------------------

class KeyStore::MemoryStore : public IKeyStore
{
public:
    explicit MemoryStore(std::vector<KeyInfo> const& slots);

    MemoryStore(MemoryStore const&) = delete;
    MemoryStore& operator=(MemoryStore const&) = delete;

    // IKeyStore {
    [[nodiscard]] virtual Result<Security::ReadableView> Export(
        KeyId id, Security::WriteableView destination) const override;
    [[nodiscard]] virtual Result<KeyInfo> GetKeyInfo(KeyId id) const override;
    // } IKeyStore

    [[nodiscard]] OptionalError Import(KeyId id, Security::ReadableView key);
    [[nodiscard]] OptionalError Delete(KeyId id);
    [[nodiscard]] bool IsStored(KeyId id) const;
    [[nodiscard]] std::size_t GetSlotCount() const;

private:
    struct Slot
    {
        KeyInfo info;
        Security::SecureBuffer key;
    };

    using SlotMap = std::unordered_map<KeyId, Slot, KeyId::Hasher>;

    LogUtils::Logger m_logger;
    SlotMap m_slots;
};

//----------------------------------------------------------------------------------------------------------------------
