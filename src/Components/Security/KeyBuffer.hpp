//----------------------------------------------------------------------------------------------------------------------
// File: KeyBuffer.hpp
// Description: Fixed size scratch storage for a key exported from the key store for the duration of one request.
// Access is granted through a Lease, the lease zeroes the storage when it goes out of scope regardless of how the 
// owning scope is exited. The storage is never allocated on the heap. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstddef>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class KeyBuffer;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::KeyBuffer
{
public:
    static constexpr std::size_t Capacity = 32; // The largest supported symmetric key. 

    class Lease;

    KeyBuffer();
    ~KeyBuffer();

    KeyBuffer(KeyBuffer const&) = delete;
    KeyBuffer& operator=(KeyBuffer const&) = delete;
    KeyBuffer(KeyBuffer&&) = delete;
    KeyBuffer& operator=(KeyBuffer&&) = delete;

    // Note: Only one lease may be outstanding at a time. 
    [[nodiscard]] Lease Acquire();

    [[nodiscard]] bool IsLeased() const { return m_leased; }
    [[nodiscard]] bool IsErased() const;

private:
    void Release();

    std::array<std::uint8_t, Capacity> m_storage;
    bool m_leased;
};

//----------------------------------------------------------------------------------------------------------------------

class Security::KeyBuffer::Lease
{
public:
    Lease(Lease const&) = delete;
    Lease& operator=(Lease const&) = delete;
    Lease(Lease&& other) = delete;
    Lease& operator=(Lease&& other) = delete;

    ~Lease();

    [[nodiscard]] WriteableView GetWriteable() const;

private:
    friend class KeyBuffer;
    explicit Lease(KeyBuffer& buffer) : m_buffer(buffer) {}

    KeyBuffer& m_buffer;
};

//----------------------------------------------------------------------------------------------------------------------
