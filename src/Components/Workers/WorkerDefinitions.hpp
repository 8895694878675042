//----------------------------------------------------------------------------------------------------------------------
// File: WorkerDefinitions.hpp
// Description: The outcome of a single worker step. Per request failures are not step outcomes, they are reported to 
// the client through the request's error response. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Workers {
//----------------------------------------------------------------------------------------------------------------------

enum class ExecuteStatus : std::uint32_t { 
    Processed, // A request was taken from the source and its response was accepted by the sink.
    Idle, // The source is open but had nothing pending.
    StreamTerminated, // The source has been exhausted and will never produce another request.
    SendFailure // The sink refused the response, the response has been dropped.
};

[[nodiscard]] constexpr bool IsTerminal(ExecuteStatus status) noexcept
{
    return status == ExecuteStatus::StreamTerminated || status == ExecuteStatus::SendFailure;
}

[[nodiscard]] constexpr std::string_view ToString(ExecuteStatus status) noexcept
{
    switch (status) {
        case ExecuteStatus::Processed: return "processed";
        case ExecuteStatus::Idle: return "idle";
        case ExecuteStatus::StreamTerminated: return "stream terminated";
        case ExecuteStatus::SendFailure: return "send failure";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------
} // Workers namespace
//----------------------------------------------------------------------------------------------------------------------
