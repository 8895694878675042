//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.hpp
// Description: Heap backed storage for long lived secret material (e.g. keys resident in a memory store). The
// contents are zeroed before the storage is released or replaced. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class SecureBuffer;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::SecureBuffer
{
public:
    SecureBuffer() = default;
    explicit SecureBuffer(std::size_t size);
    explicit SecureBuffer(ReadableView data);

    SecureBuffer(SecureBuffer const& other) = delete;
    SecureBuffer& operator=(SecureBuffer const& other) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept : m_buffer(std::exchange(other.m_buffer, {})) {}
    SecureBuffer& operator=(SecureBuffer&& other) noexcept;

    ~SecureBuffer();

    [[nodiscard]] ReadableView GetData() const;
    [[nodiscard]] WriteableView GetData();
    [[nodiscard]] std::size_t GetSize() const;
    [[nodiscard]] bool IsEmpty() const;

    void Assign(ReadableView data);
    void Erase();
    
private:
    Buffer m_buffer;
};

//----------------------------------------------------------------------------------------------------------------------
