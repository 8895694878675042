//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] OptionalBuffer GenerateRandomData(std::size_t size);
[[nodiscard]] bool GenerateRandomData(WriteableView writeable);

void EraseMemory(void* begin, std::size_t size);
void EraseMemory(WriteableView writeable);

[[nodiscard]] bool IsErased(ReadableView readable);

// Decodes a hexadecimal string (optionally colon separated) into bytes, used for embedded known answer vectors. 
[[nodiscard]] OptionalBuffer DecodeHex(std::string_view hex);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
