//----------------------------------------------------------------------------------------------------------------------
// File: KeyResolution.hpp
// Description: Resolves a key identifier into key bytes and metadata for a single request. The export and metadata 
// lookup happen under one acquisition of the shared store's guard, which is released before returning. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/KeyStore/KeyStoreDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

namespace KeyStore { class SharedStore; }

//----------------------------------------------------------------------------------------------------------------------
namespace Workers {
//----------------------------------------------------------------------------------------------------------------------

struct ResolvedKey
{
    Security::ReadableView key; // A view into the caller's scratch buffer.
    KeyStore::KeyInfo info;
};

[[nodiscard]] KeyStore::Result<ResolvedKey> ResolveKey(
    KeyStore::SharedStore const& store, KeyStore::KeyId id, Security::WriteableView destination);

//----------------------------------------------------------------------------------------------------------------------
} // Workers namespace
//----------------------------------------------------------------------------------------------------------------------
