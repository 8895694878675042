//----------------------------------------------------------------------------------------------------------------------
// File: WorkerUtils.hpp
// Description: Helpers shared by the worker implementations for turning adapter results into responses.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Crypto/CryptoDefinitions.hpp"
#include "Components/Jobs/JobTypes.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Workers {
//----------------------------------------------------------------------------------------------------------------------

template<typename RequestType, typename OnSuccess> 
    requires std::invocable<OnSuccess, Security::WriteableView>
[[nodiscard]] Jobs::Response Complete(
    RequestType const& request, Crypto::Result<Security::WriteableView> const& result, OnSuccess&& onSuccess)
{
    if (auto const pError = std::get_if<Crypto::Error>(&result); pError) { return Jobs::MakeError(request, *pError); }
    return onSuccess(std::get<Security::WriteableView>(result));
}

void LogOutcome(LogUtils::Logger const& logger, Jobs::Request const& request, Jobs::Response const& response);

//----------------------------------------------------------------------------------------------------------------------
} // Workers namespace
//----------------------------------------------------------------------------------------------------------------------
