//----------------------------------------------------------------------------------------------------------------------
// File: Settings.hpp
// Description: The runtime settings of the enclave host, produced from the startup options and configuration file.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Host {
//----------------------------------------------------------------------------------------------------------------------

struct Settings
{
    static constexpr std::size_t DefaultChannelCapacity = 16;
    static constexpr std::uint32_t DefaultIterations = 8;

    spdlog::level::level_enum verbosity = spdlog::level::info;
    std::size_t requestCapacity = DefaultChannelCapacity;
    std::size_t responseCapacity = DefaultChannelCapacity;
    bool attachChaChaPolyKeyStore = true;
    bool runSelfTest = true;
    std::uint32_t iterations = DefaultIterations;
};

//----------------------------------------------------------------------------------------------------------------------
} // Host namespace
//----------------------------------------------------------------------------------------------------------------------
