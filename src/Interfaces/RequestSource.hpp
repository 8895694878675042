//----------------------------------------------------------------------------------------------------------------------
// File: RequestSource.hpp
// Description: Defines an interface that allows a worker to pull the next pending item without blocking. An 
// exhausted source will never produce another item.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

template<typename ItemType>
class IRequestSource
{
public:
    virtual ~IRequestSource() = default;
    [[nodiscard]] virtual std::optional<ItemType> Next() = 0;
    [[nodiscard]] virtual bool Exhausted() const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
