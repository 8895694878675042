//----------------------------------------------------------------------------------------------------------------------
// File: JobTypes.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "JobTypes.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <type_traits>
//----------------------------------------------------------------------------------------------------------------------

Jobs::ClientId Jobs::GetClientId(Request const& request)
{
    return std::visit([] (auto const& concrete) -> ClientId { return concrete.clientId; }, request);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::RequestId Jobs::GetRequestId(Request const& request)
{
    return std::visit([] (auto const& concrete) -> RequestId { return concrete.requestId; }, request);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Jobs::GetRequestName(Request const& request)
{
    return std::visit(VariantVisitor{
        [] (Requests::EncryptAesGcm const&) -> std::string_view { return "encrypt-aes-gcm"; },
        [] (Requests::EncryptAesGcmExternalKey const&) -> std::string_view { return "encrypt-aes-gcm-external-key"; },
        [] (Requests::DecryptAesGcm const&) -> std::string_view { return "decrypt-aes-gcm"; },
        [] (Requests::DecryptAesGcmExternalKey const&) -> std::string_view { return "decrypt-aes-gcm-external-key"; },
        [] (Requests::EncryptAesCbc const&) -> std::string_view { return "encrypt-aes-cbc"; },
        [] (Requests::EncryptAesCbcExternalKey const&) -> std::string_view { return "encrypt-aes-cbc-external-key"; },
        [] (Requests::DecryptAesCbc const&) -> std::string_view { return "decrypt-aes-cbc"; },
        [] (Requests::DecryptAesCbcExternalKey const&) -> std::string_view { return "decrypt-aes-cbc-external-key"; },
        [] (Requests::EncryptChaChaPoly const&) -> std::string_view { return "encrypt-chachapoly"; },
        [] (Requests::EncryptChaChaPolyExternalKey const&) -> std::string_view { 
            return "encrypt-chachapoly-external-key"; 
        },
        [] (Requests::DecryptChaChaPoly const&) -> std::string_view { return "decrypt-chachapoly"; },
        [] (Requests::DecryptChaChaPolyExternalKey const&) -> std::string_view { 
            return "decrypt-chachapoly-external-key"; 
        },
        [] (Requests::GetRandom const&) -> std::string_view { return "get-random"; },
    }, request);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::ClientId Jobs::GetClientId(Response const& response)
{
    return std::visit([] (auto const& concrete) -> ClientId { return concrete.clientId; }, response);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::RequestId Jobs::GetRequestId(Response const& response)
{
    return std::visit([] (auto const& concrete) -> RequestId { return concrete.requestId; }, response);
}

//----------------------------------------------------------------------------------------------------------------------

bool Jobs::IsError(Response const& response)
{
    return std::holds_alternative<Responses::Error>(response);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Responses::Error Jobs::MakeError(Request const& request, Error const& error)
{
    return Responses::Error{ GetClientId(request), GetRequestId(request), error };
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Jobs::ToString(ProtocolError error)
{
    switch (error) {
        case ProtocolError::UnexpectedRequestType: return "unexpected request type";
        case ProtocolError::StreamTerminated: return "request stream terminated";
        case ProtocolError::Send: return "response could not be sent";
    }
    return "unknown protocol error";
}

//----------------------------------------------------------------------------------------------------------------------

std::string Jobs::ToString(Error const& error)
{
    return std::visit([] (auto const& concrete) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(concrete)>, ProtocolError>) {
            return std::string{ "protocol: " }.append(ToString(concrete));
        } else if constexpr (std::is_same_v<std::decay_t<decltype(concrete)>, KeyStore::Error>) {
            return std::string{ "keystore: " }.append(KeyStore::ToString(concrete));
        } else {
            return std::string{ "crypto: " }.append(Crypto::ToString(concrete));
        }
    }, error);
}

//----------------------------------------------------------------------------------------------------------------------
