//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SecureBuffer.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::SecureBuffer(std::size_t size)
    : m_buffer(size, 0x00)
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::SecureBuffer(ReadableView data)
    : m_buffer(data.begin(), data.end())
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer& Security::SecureBuffer::operator=(SecureBuffer&& other) noexcept
{
    if (this != &other) {
        Erase();
        m_buffer = std::exchange(other.m_buffer, {});
    }
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::~SecureBuffer()
{
    EraseMemory(m_buffer.data(), m_buffer.size());
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::SecureBuffer::GetData() const { return m_buffer; }

//----------------------------------------------------------------------------------------------------------------------

Security::WriteableView Security::SecureBuffer::GetData() { return m_buffer; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Security::SecureBuffer::GetSize() const { return m_buffer.size(); }

//----------------------------------------------------------------------------------------------------------------------

bool Security::SecureBuffer::IsEmpty() const { return m_buffer.empty(); }

//----------------------------------------------------------------------------------------------------------------------

void Security::SecureBuffer::Assign(ReadableView data)
{
    // The vector may reallocate on growth, the previous allocation must not be left behind with key material.
    Erase();
    m_buffer.assign(data.begin(), data.end());
}

//----------------------------------------------------------------------------------------------------------------------

void Security::SecureBuffer::Erase()
{
    EraseMemory(m_buffer.data(), m_buffer.size());
    m_buffer.clear();
}

//----------------------------------------------------------------------------------------------------------------------
