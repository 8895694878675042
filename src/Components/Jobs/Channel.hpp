//----------------------------------------------------------------------------------------------------------------------
// File: Channel.hpp
// Description: A bounded first-in first-out queue connecting a producer to a consumer. The producing side sees an 
// IResponseSink and the consuming side an IRequestSource. Closing a channel refuses new items, the consumer may still 
// drain what was queued before the source reports it is exhausted. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "JobTypes.hpp"
#include "Interfaces/RequestSource.hpp"
#include "Interfaces/ResponseSink.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Jobs {
//----------------------------------------------------------------------------------------------------------------------

using RequestSource = IRequestSource<Request>;
using ResponseSink = IResponseSink<Response>;

template<typename ItemType>
class Channel;

using RequestChannel = Channel<Request>;
using ResponseChannel = Channel<Response>;

//----------------------------------------------------------------------------------------------------------------------
} // Jobs namespace
//----------------------------------------------------------------------------------------------------------------------

template<typename ItemType>
class Jobs::Channel : public IRequestSource<ItemType>, public IResponseSink<ItemType>
{
public:
    using AvailableCallback = std::function<void()>;

    explicit Channel(std::size_t capacity)
        : m_mutex()
        , m_items()
        , m_capacity(capacity)
        , m_closed(false)
        , m_onAvailable()
    {
        if (m_capacity == 0) { throw std::invalid_argument("A channel must be able to hold at least one item!"); }
    }

    Channel(Channel const&) = delete;
    Channel& operator=(Channel const&) = delete;

    // IRequestSource {
    [[nodiscard]] virtual std::optional<ItemType> Next() override
    {
        std::scoped_lock lock{ m_mutex };
        if (m_items.empty()) { return {}; }
        std::optional<ItemType> optItem{ std::move(m_items.front()) };
        m_items.pop_front();
        return optItem;
    }

    [[nodiscard]] virtual bool Exhausted() const override
    {
        std::scoped_lock lock{ m_mutex };
        return m_closed && m_items.empty();
    }
    // } IRequestSource

    // IResponseSink {
    [[nodiscard]] virtual bool Send(ItemType&& item) override
    {
        AvailableCallback onAvailable;
        {
            std::scoped_lock lock{ m_mutex };
            if (m_closed || m_items.size() >= m_capacity) { return false; }
            m_items.emplace_back(std::move(item));
            onAvailable = m_onAvailable;
        }

        // The observer is notified outside of the guard so it may immediately pull from the channel.
        if (onAvailable) { onAvailable(); }
        return true;
    }
    // } IResponseSink

    void OnItemAvailable(AvailableCallback const& callback)
    {
        std::scoped_lock lock{ m_mutex };
        m_onAvailable = callback;
    }

    // Closing is announced to the observer as well, the consumer must step once more to observe the exhaustion. 
    void Close()
    {
        AvailableCallback onAvailable;
        {
            std::scoped_lock lock{ m_mutex };
            if (m_closed) { return; }
            m_closed = true;
            onAvailable = m_onAvailable;
        }

        if (onAvailable) { onAvailable(); }
    }

    [[nodiscard]] bool IsClosed() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_closed;
    }

    [[nodiscard]] std::size_t Size() const
    {
        std::scoped_lock lock{ m_mutex };
        return m_items.size();
    }

    [[nodiscard]] std::size_t Capacity() const { return m_capacity; }

private:
    mutable std::mutex m_mutex;
    std::deque<ItemType> m_items;
    std::size_t const m_capacity;
    bool m_closed;
    AvailableCallback m_onAvailable;
};

//----------------------------------------------------------------------------------------------------------------------
