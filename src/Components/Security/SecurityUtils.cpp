//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/crypto.h>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Generate and return a buffer of the provided size filled with random data. 
//----------------------------------------------------------------------------------------------------------------------
Security::OptionalBuffer Security::GenerateRandomData(std::size_t size)
{
    if (!std::in_range<std::int32_t>(size)) { return {}; }
    auto buffer = Buffer(size, 0x00);
    if (RAND_bytes(buffer.data(), static_cast<std::int32_t>(size)) != 1) { return {}; }
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::GenerateRandomData(WriteableView writeable)
{
    if (!std::in_range<std::int32_t>(writeable.size())) { return false; }
    return RAND_bytes(writeable.data(), static_cast<std::int32_t>(writeable.size())) == 1;
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Overwrite the region with zeros in a way the optimizer is not permitted to elide. 
//----------------------------------------------------------------------------------------------------------------------
void Security::EraseMemory(void* begin, std::size_t size)
{
    if (begin == nullptr || size == 0) { return; }
    OPENSSL_cleanse(begin, size);
}

//----------------------------------------------------------------------------------------------------------------------

void Security::EraseMemory(WriteableView writeable)
{
    EraseMemory(writeable.data(), writeable.size());
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::IsErased(ReadableView readable)
{
    return std::ranges::all_of(readable, [] (std::uint8_t value) { return value == 0x00; });
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::DecodeHex(std::string_view hex)
{
    if (hex.empty()) { return Buffer{}; }

    std::string const terminated{ hex };
    long size = 0;
    auto const deleter = [] (std::uint8_t* pData) { OPENSSL_free(pData); };
    std::unique_ptr<std::uint8_t, decltype(deleter)> upDecoded(OPENSSL_hexstr2buf(terminated.c_str(), &size), deleter);
    if (!upDecoded || size < 0) { return {}; }

    return Buffer(upDecoded.get(), upDecoded.get() + size);
}

//----------------------------------------------------------------------------------------------------------------------
