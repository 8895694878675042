//----------------------------------------------------------------------------------------------------------------------
// File: ResponseSink.hpp
// Description: Defines an interface that allows a worker to forward a completed item. A sink that refuses the item 
// returns false and the item is dropped.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------

template<typename ItemType>
class IResponseSink
{
public:
    virtual ~IResponseSink() = default;
    [[nodiscard]] virtual bool Send(ItemType&& item) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
