//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Enclave {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.4.0";

//----------------------------------------------------------------------------------------------------------------------
} // Enclave namespace
//----------------------------------------------------------------------------------------------------------------------
