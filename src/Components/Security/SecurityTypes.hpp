//----------------------------------------------------------------------------------------------------------------------
// File: SecurityTypes.hpp
// Description: Byte buffer and view aliases shared by the key store, the crypto adapters, and the job protocol.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

using Buffer = std::vector<std::uint8_t>;
using ReadableView = std::span<std::uint8_t const, std::dynamic_extent>;
using WriteableView = std::span<std::uint8_t, std::dynamic_extent>;
using OptionalBuffer = std::optional<Buffer>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
