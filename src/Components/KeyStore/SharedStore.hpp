//----------------------------------------------------------------------------------------------------------------------
// File: SharedStore.hpp
// Description: A key store shared between workers behind a single mutual exclusion guard. The store is only 
// reachable from within the callback provided to Access, the guard is released when the callback returns. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Interfaces/KeyStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace KeyStore {
//----------------------------------------------------------------------------------------------------------------------

class SharedStore;

//----------------------------------------------------------------------------------------------------------------------
} // KeyStore namespace
//----------------------------------------------------------------------------------------------------------------------

class KeyStore::SharedStore
{
public:
    explicit SharedStore(std::shared_ptr<IKeyStore> const& spStore)
        : m_mutex()
        , m_spStore(spStore)
    {
        if (!m_spStore) { throw std::invalid_argument("A shared key store requires a backing store!"); }
    }

    SharedStore(SharedStore const&) = delete;
    SharedStore& operator=(SharedStore const&) = delete;

    // Note: The callback must not call Access on the same store, the guard is not recursive. 
    template<typename Callback> requires std::invocable<Callback, IKeyStore const&>
    auto Access(Callback&& callback) const -> std::invoke_result_t<Callback, IKeyStore const&>
    {
        std::scoped_lock lock{ m_mutex };
        return std::invoke(std::forward<Callback>(callback), static_cast<IKeyStore const&>(*m_spStore));
    }

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<IKeyStore> const m_spStore;
};

//----------------------------------------------------------------------------------------------------------------------
