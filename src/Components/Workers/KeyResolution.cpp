//----------------------------------------------------------------------------------------------------------------------
// File: KeyResolution.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "KeyResolution.hpp"
#include "Components/KeyStore/SharedStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

KeyStore::Result<Workers::ResolvedKey> Workers::ResolveKey(
    KeyStore::SharedStore const& store, KeyStore::KeyId id, Security::WriteableView destination)
{
    return store.Access([&] (IKeyStore const& keyStore) -> KeyStore::Result<ResolvedKey> {
        auto const info = keyStore.GetKeyInfo(id);
        if (auto const pError = std::get_if<KeyStore::Error>(&info); pError) { return *pError; }

        // Asymmetric material never fits the symmetric scratch buffer and is rejected before it is exported. 
        auto const& keyInfo = std::get<KeyStore::KeyInfo>(info);
        if (!KeyStore::IsSymmetric(keyInfo.type)) { return KeyStore::Error::InvalidKeyType; }

        auto const exported = keyStore.Export(id, destination);
        if (auto const pError = std::get_if<KeyStore::Error>(&exported); pError) { return *pError; }

        return ResolvedKey{ std::get<Security::ReadableView>(exported), keyInfo };
    });
}

//----------------------------------------------------------------------------------------------------------------------
