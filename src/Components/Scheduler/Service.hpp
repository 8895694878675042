//----------------------------------------------------------------------------------------------------------------------
// File: Service.hpp
// Description: A cooperative, single threaded scheduler for the enclave's workers. Each worker type registers one 
// delegate, the delegates are executed in registration order whenever they have announced work. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Delegate.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>
#include <typeinfo>
#include <type_traits>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class Sentinel;
class Service;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Sentinel
{
public:
    Sentinel();
    virtual ~Sentinel() = default;

    virtual void Delist(Delegate::Identifier identifier) = 0;

    bool AwaitTask(std::chrono::milliseconds timeout);
    [[nodiscard]] std::size_t AvailableTasks() const;
    void OnTaskAvailable(std::size_t available);

protected:
    void OnTaskCompleted(std::size_t completed);

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_waiter;
    std::atomic_size_t m_available;
};

//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Service : public Scheduler::Sentinel
{
public:
    using Delegates = std::vector<std::shared_ptr<Delegate>>;

    Service();

    // Runs every ready delegate once and returns the number of tasks that were consumed. 
    std::size_t Execute();

    template<typename WorkerType> requires std::is_class_v<WorkerType>
    std::shared_ptr<Delegate> Register(OnExecute const& callback);

    template<typename WorkerType> requires std::is_class_v<WorkerType>
    [[nodiscard]] std::shared_ptr<Delegate> GetDelegate() const;

    [[nodiscard]] std::size_t RegisteredCount() const;

    // Indicates whether every registered delegate's worker has reported a terminal status. 
    [[nodiscard]] bool Terminated() const;

    // Sentinel {
    virtual void Delist(Delegate::Identifier identifier) override;
    // } Sentinel

private:
    [[nodiscard]] std::shared_ptr<Delegate> GetDelegate(Delegate::Identifier identifier) const;

    LogUtils::Logger m_logger;
    Delegates m_delegates;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename WorkerType> requires std::is_class_v<WorkerType>
std::shared_ptr<Scheduler::Delegate> Scheduler::Service::Register(OnExecute const& callback)
{
    assert(!GetDelegate<WorkerType>()); // Currently, only one delegate per worker type is supported. 
    auto const& spDelegate = m_delegates.emplace_back(
        std::make_shared<Delegate>(typeid(WorkerType).hash_code(), callback, this));
    spDelegate->SetPriority({}, m_delegates.size() - 1);
    return spDelegate;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename WorkerType> requires std::is_class_v<WorkerType>
std::shared_ptr<Scheduler::Delegate> Scheduler::Service::GetDelegate() const
{
    return GetDelegate(typeid(WorkerType).hash_code());
}

//----------------------------------------------------------------------------------------------------------------------
