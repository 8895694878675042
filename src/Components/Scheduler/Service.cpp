//----------------------------------------------------------------------------------------------------------------------
// File: Service.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Service.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <ranges>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Sentinel::Sentinel()
    : m_mutex()
    , m_waiter()
    , m_available(0)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Sentinel::AwaitTask(std::chrono::milliseconds timeout)
{
    if (m_available) { return false; } // If there are ready tasks, there is no need to wait. 
    std::unique_lock lock(m_mutex);
    m_waiter.wait_for(lock, timeout, [this] () -> bool { return m_available != 0; });
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Sentinel::AvailableTasks() const { return m_available; }

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Sentinel::OnTaskAvailable(std::size_t available)
{
    // If this is the first notification of work we've had recently, wake any waiting runtime thread early in order 
    // to process the work as soon as possible. 
    std::size_t result = 0;
    {
        std::scoped_lock lock(m_mutex);
        result = m_available += available;
    }
    if (result == available) { m_waiter.notify_one(); }
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Sentinel::OnTaskCompleted(std::size_t completed) { m_available -= completed; }

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Service::Service()
    : m_logger(LogUtils::Fetch(LogUtils::Name::Scheduler))
    , m_delegates()
{
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Service::Execute()
{
    constexpr auto ready = [] (auto const& spDelegate) -> bool { return spDelegate->Ready(); };

    // Note: The delegates are stored in priority order, copying the set allows a worker to delist itself. 
    auto const delegates = m_delegates;
    std::size_t executed = 0;
    std::ranges::for_each(delegates | std::views::filter(ready), [this, &executed] (auto const& spDelegate) { 
        bool const terminated = spDelegate->GetTerminalStatus().has_value();
        std::size_t const consumed = spDelegate->Execute({});
        OnTaskCompleted(consumed);
        executed += consumed;

        if (auto const optStatus = spDelegate->GetTerminalStatus(); optStatus && !terminated) {
            m_logger->info(
                "A worker at priority {} has stopped: {}.", spDelegate->GetPriority(), Workers::ToString(*optStatus));
        }
    });

    return executed;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Scheduler::Service::RegisteredCount() const { return m_delegates.size(); }

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Service::Terminated() const
{
    return std::ranges::all_of(m_delegates, [] (auto const& spDelegate) -> bool { 
        return spDelegate->GetTerminalStatus().has_value();
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Service::Delist(Delegate::Identifier identifier)
{
    constexpr auto projection = [] (auto const& spDelegate) -> auto { return spDelegate->GetIdentifier(); };
    if (auto const itr = std::ranges::find(m_delegates, identifier, projection); itr != m_delegates.end()) {
        OnTaskCompleted((*itr)->AvailableTasks());
        m_delegates.erase(itr);
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Scheduler::Delegate> Scheduler::Service::GetDelegate(Delegate::Identifier identifier) const
{
    constexpr auto projection = [] (auto const& spDelegate) -> auto { return spDelegate->GetIdentifier(); };
    if (auto const itr = std::ranges::find(m_delegates, identifier, projection); itr != m_delegates.end()) {
        return *itr;
    }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------
