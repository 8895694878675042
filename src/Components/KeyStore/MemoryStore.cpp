//----------------------------------------------------------------------------------------------------------------------
// File: MemoryStore.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "MemoryStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

KeyStore::MemoryStore::MemoryStore(std::vector<KeyInfo> const& slots)
    : m_logger(LogUtils::Fetch(LogUtils::Name::KeyStore))
    , m_slots()
{
    for (auto const& info : slots) {
        auto const [itr, emplaced] = m_slots.emplace(info.id, Slot{ info, Security::SecureBuffer{} });
        if (!emplaced) { throw std::invalid_argument("Key slot identifiers must be unique!"); }
    }
    m_logger->debug("Created a memory key store with {} slots.", m_slots.size());
}

//----------------------------------------------------------------------------------------------------------------------

KeyStore::Result<Security::ReadableView> KeyStore::MemoryStore::Export(
    KeyId id, Security::WriteableView destination) const
{
    auto const itr = m_slots.find(id);
    if (itr == m_slots.end()) { return Error::InvalidKeyId; }

    auto const& [info, key] = itr->second;
    if (!info.permissions.exportable) { return Error::NotAllowed; }
    if (key.IsEmpty()) { return Error::KeyNotFound; }
    if (destination.size() < key.GetSize()) { return Error::InvalidBufferSize; }

    auto const data = key.GetData();
    std::ranges::copy(data, destination.begin());
    return Security::ReadableView{ destination.first(data.size()) };
}

//----------------------------------------------------------------------------------------------------------------------

KeyStore::Result<KeyStore::KeyInfo> KeyStore::MemoryStore::GetKeyInfo(KeyId id) const
{
    auto const itr = m_slots.find(id);
    if (itr == m_slots.end()) { return Error::InvalidKeyId; }
    return itr->second.info;
}

//----------------------------------------------------------------------------------------------------------------------

KeyStore::OptionalError KeyStore::MemoryStore::Import(KeyId id, Security::ReadableView key)
{
    auto const itr = m_slots.find(id);
    if (itr == m_slots.end()) { return Error::InvalidKeyId; }

    auto& [info, stored] = itr->second;
    if (!info.permissions.import) { return Error::NotAllowed; }
    if (key.size() != GetKeySize(info.type)) { return Error::InvalidBufferSize; }
    if (!stored.IsEmpty() && !info.permissions.overwrite) { return Error::KeyAlreadyExists; }

    stored.Assign(key);
    m_logger->debug("Imported a {} key into slot {}.", ToString(info.type), id.ToString());
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

KeyStore::OptionalError KeyStore::MemoryStore::Delete(KeyId id)
{
    auto const itr = m_slots.find(id);
    if (itr == m_slots.end()) { return Error::InvalidKeyId; }

    auto& [info, stored] = itr->second;
    if (!info.permissions.remove) { return Error::NotAllowed; }
    if (stored.IsEmpty()) { return Error::KeyNotFound; }

    stored.Erase();
    m_logger->debug("Deleted the key in slot {}.", id.ToString());
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

bool KeyStore::MemoryStore::IsStored(KeyId id) const
{
    auto const itr = m_slots.find(id);
    return itr != m_slots.end() && !itr->second.key.IsEmpty();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t KeyStore::MemoryStore::GetSlotCount() const { return m_slots.size(); }

//----------------------------------------------------------------------------------------------------------------------
