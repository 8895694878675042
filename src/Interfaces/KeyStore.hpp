//----------------------------------------------------------------------------------------------------------------------
// File: KeyStore.hpp
// Description: Defines the capability the symmetric workers require from a key store. Implementations resolve a key
// identifier to raw key bytes and metadata at the moment of use, callers must not cache either. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/KeyStore/KeyStoreDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

class IKeyStore
{
public:
    virtual ~IKeyStore() = default;

    // Copies the key into the provided buffer and returns the written prefix of it. 
    [[nodiscard]] virtual KeyStore::Result<Security::ReadableView> Export(
        KeyStore::KeyId id, Security::WriteableView destination) const = 0;

    [[nodiscard]] virtual KeyStore::Result<KeyStore::KeyInfo> GetKeyInfo(KeyStore::KeyId id) const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
