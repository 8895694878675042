//----------------------------------------------------------------------------------------------------------------------
// File: Delegate.hpp
// Description: The scheduler's handle for a registered worker. Producers mark work as available through the delegate 
// and the scheduler runs the worker's step function once for every unit of work that has been announced. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Workers/WorkerDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

using OnExecute = std::function<Workers::ExecuteStatus()>;

class Delegate;
class Sentinel;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Delegate
{
public:
    using Identifier = std::size_t;

    // Note: Only the scheduler should be used to set the priority and execute the worker. 
    class ExecuteKey { public: friend class Service; private: ExecuteKey() = default; };

    Delegate(Identifier const& identifier, OnExecute const& callback, Sentinel* const sentinel);

    Delegate(Delegate const&) = delete;
    Delegate& operator=(Delegate const&) = delete;

    [[nodiscard]] Identifier GetIdentifier() const;
    [[nodiscard]] std::size_t GetPriority() const;
    [[nodiscard]] std::size_t AvailableTasks() const;
    [[nodiscard]] bool Ready() const;
    [[nodiscard]] std::optional<Workers::ExecuteStatus> GetTerminalStatus() const;

    void OnTaskAvailable(std::size_t available = 1);
    void SetPriority(ExecuteKey key, std::size_t priority);

    // Returns the number of announced tasks that were consumed. Once the worker reports a terminal status the 
    // delegate consumes every remaining announcement without stepping the worker again. 
    [[nodiscard]] std::size_t Execute(ExecuteKey key);

    void Delist();

private:
    Identifier const m_identifier;
    std::size_t m_priority;
    std::atomic_size_t m_available;
    OnExecute const m_execute;
    std::optional<Workers::ExecuteStatus> m_optTerminalStatus;
    Sentinel* const m_sentinel;
};

//----------------------------------------------------------------------------------------------------------------------
