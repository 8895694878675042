//----------------------------------------------------------------------------------------------------------------------
// File: KeyBuffer.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "KeyBuffer.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Security::KeyBuffer::KeyBuffer()
    : m_storage()
    , m_leased(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::KeyBuffer::~KeyBuffer()
{
    assert(!m_leased);
    EraseMemory(m_storage.data(), m_storage.size());
}

//----------------------------------------------------------------------------------------------------------------------

Security::KeyBuffer::Lease Security::KeyBuffer::Acquire()
{
    assert(!m_leased);
    m_leased = true;
    return Lease{ *this };
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::KeyBuffer::IsErased() const
{
    return Security::IsErased(m_storage);
}

//----------------------------------------------------------------------------------------------------------------------

void Security::KeyBuffer::Release()
{
    EraseMemory(m_storage.data(), m_storage.size());
    m_leased = false;
}

//----------------------------------------------------------------------------------------------------------------------

Security::KeyBuffer::Lease::~Lease()
{
    m_buffer.Release();
}

//----------------------------------------------------------------------------------------------------------------------

Security::WriteableView Security::KeyBuffer::Lease::GetWriteable() const
{
    return m_buffer.m_storage;
}

//----------------------------------------------------------------------------------------------------------------------
