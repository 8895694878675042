//----------------------------------------------------------------------------------------------------------------------
// File: WorkerUtils.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "WorkerUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------

void Workers::LogOutcome(LogUtils::Logger const& logger, Jobs::Request const& request, Jobs::Response const& response)
{
    // Only identifiers and error names are logged, key and payload bytes must never reach a sink. 
    if (auto const pError = std::get_if<Jobs::Responses::Error>(&response); pError) {
        logger->debug(
            "Request {} from client {} ({}) failed: {}.",
            Jobs::GetRequestId(request).ToString(), Jobs::GetClientId(request).ToString(),
            Jobs::GetRequestName(request), Jobs::ToString(pError->error));
        return;
    }

    logger->trace(
        "Request {} from client {} ({}) completed.",
        Jobs::GetRequestId(request).ToString(), Jobs::GetClientId(request).ToString(), Jobs::GetRequestName(request));
}

//----------------------------------------------------------------------------------------------------------------------
