//----------------------------------------------------------------------------------------------------------------------
// File: StrongType.hpp
// Description: Opaque integral value types used for identifiers that must not be mixed with each other (e.g. a
// client identifier can't be passed where a key identifier is expected).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

template<std::integral WeakType, typename TypeTag>
class StrongType
{
public:
    using UnderlyingType = WeakType;

    constexpr StrongType() : m_value() {}
    constexpr explicit StrongType(UnderlyingType value) : m_value(value) {}

    constexpr StrongType(StrongType const& other) = default;
    constexpr StrongType(StrongType&& other) noexcept = default;
    constexpr StrongType& operator=(StrongType const& other) = default;
    constexpr StrongType& operator=(StrongType&& other) noexcept = default;

    [[nodiscard]] constexpr bool operator==(StrongType const& other) const noexcept = default;
    [[nodiscard]] constexpr std::strong_ordering operator<=>(StrongType const& other) const noexcept = default;

    [[nodiscard]] constexpr UnderlyingType GetValue() const noexcept { return m_value; }
    [[nodiscard]] std::string ToString() const { return std::to_string(m_value); }

    struct Hasher
    {
        [[nodiscard]] std::size_t operator()(StrongType const& value) const noexcept
        {
            return std::hash<UnderlyingType>{}(value.m_value);
        }
    };

private:
    UnderlyingType m_value;
};

//----------------------------------------------------------------------------------------------------------------------
