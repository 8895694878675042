//----------------------------------------------------------------------------------------------------------------------
// File: Delegate.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Delegate.hpp"
#include "Service.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <limits>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Delegate::Delegate(Identifier const& identifier, OnExecute const& callback, Sentinel* const sentinel)
    : m_identifier(identifier)
    , m_priority(std::numeric_limits<std::size_t>::max())
    , m_available(0)
    , m_execute(callback)
    , m_optTerminalStatus()
    , m_sentinel(sentinel)
{
    if (!m_execute) { throw std::invalid_argument("A scheduler delegate requires an execution callback!"); }
    assert(m_sentinel);
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Delegate::Identifier Scheduler::Delegate::GetIdentifier() const { return m_identifier; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::GetPriority() const { return m_priority; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::AvailableTasks() const { return m_available; }

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Delegate::Ready() const { return m_available != 0; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Workers::ExecuteStatus> Scheduler::Delegate::GetTerminalStatus() const { return m_optTerminalStatus; }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::OnTaskAvailable(std::size_t available)
{
    m_available += available;
    m_sentinel->OnTaskAvailable(available);
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::SetPriority([[maybe_unused]] ExecuteKey key, std::size_t priority)
{
    m_priority = priority;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Delegate::Execute([[maybe_unused]] ExecuteKey key)
{
    // Only the work announced before this call is considered, anything announced while the worker is running will be 
    // picked up on the next cycle. 
    std::size_t const announced = m_available;
    std::size_t consumed = 0;

    while (consumed < announced && !m_optTerminalStatus) {
        auto const status = m_execute();
        ++consumed;
        if (status == Workers::ExecuteStatus::Processed) { continue; }
        if (Workers::IsTerminal(status)) { m_optTerminalStatus = status; break; }
        break; // The worker found nothing to do, the announcement was stale. 
    }

    if (m_optTerminalStatus) { consumed = announced; }

    m_available -= consumed;
    return consumed;
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Delegate::Delist()
{
    assert(m_sentinel);
    m_sentinel->Delist(m_identifier);
    m_priority = std::numeric_limits<std::size_t>::max();
}

//----------------------------------------------------------------------------------------------------------------------
