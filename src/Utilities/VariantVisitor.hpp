//----------------------------------------------------------------------------------------------------------------------
// File: VariantVisitor.hpp
// Description: Builds a single visitor out of a set of lambdas, used when dispatching on the request and response 
// variants of the job protocol.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------

template<typename... Handlers>
struct VariantVisitor : Handlers... 
{ 
    using Handlers::operator()...;
};

template<typename... Handlers> VariantVisitor(Handlers...) -> VariantVisitor<Handlers...>;

//----------------------------------------------------------------------------------------------------------------------
