//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Runtime.hpp"
#include "SelfTest.hpp"
#include "Settings.hpp"
#include "StartupOptions.hpp"
#include "Components/Crypto/CryptoDefinitions.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Utilities/LogUtils.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace Signal {
//----------------------------------------------------------------------------------------------------------------------

volatile std::sig_atomic_t ShutdownRequested = 0;

extern "C" void OnShutdownRequested(std::int32_t signal);

//----------------------------------------------------------------------------------------------------------------------
} // Signal namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t PayloadSize = 96;
constexpr Jobs::ClientId HostClient{ 1 };

[[nodiscard]] bool RunRoundTrip(Host::Runtime& runtime, Host::Target target, std::uint32_t iteration);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

extern "C" void Signal::OnShutdownRequested(std::int32_t)
{
    // The runtime checks the flag between round trips, SIGINT and SIGTERM are expected shutdown signals.
    ShutdownRequested = 1;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    if (SIG_ERR == std::signal(SIGINT, Signal::OnShutdownRequested)) { return 1; }
    if (SIG_ERR == std::signal(SIGTERM, Signal::OnShutdownRequested)) { return 1; }

    Startup::Options options; 
    switch (options.Parse(argc, argv)) {
        case Startup::ParseCode::Success: break;
        case Startup::ParseCode::ExitRequested: return 0;
        default: {
            std::cout << "Unable to parse startup options!" << std::endl;
            return 1;
        }
    }

    Host::Settings const settings = options;

    // From here on the logger should be used for errors. 
    LogUtils::InitializeLoggers(settings.verbosity); 
    auto const logger = LogUtils::Fetch(LogUtils::Name::Core);
    logger->info("Starting the enclave (version {}).", Enclave::Version);

    Host::Runtime runtime{ settings };

    if (settings.runSelfTest && !Host::RunSelfTest(runtime)) {
        logger->critical("The power-on self test failed, refusing to accept work!");
        return 1;
    }

    if (!runtime.ProvisionEphemeralKeys()) {
        logger->critical("Failed to provision the ephemeral key slots!");
        return 1;
    }

    std::uint32_t completed = 0;
    for (std::uint32_t iteration = 0; iteration < settings.iterations && !Signal::ShutdownRequested; ++iteration) {
        bool const success = 
            local::RunRoundTrip(runtime, Host::Target::Aes, iteration) &&
            local::RunRoundTrip(runtime, Host::Target::ChaChaPoly, iteration);
        if (!success) {
            logger->error("Round trip {} did not reproduce its payload!", iteration);
            break;
        }
        ++completed;
    }

    // Closing the request channels lets the workers observe the end of their streams. 
    runtime.Shutdown();
    runtime.ExecuteUntilIdle();
    if (!runtime.Terminated()) {
        logger->error("The workers did not terminate after their request streams were closed!");
        return 1;
    }

    logger->info("Completed {} of {} round trips.", completed, settings.iterations);
    return (completed == settings.iterations || Signal::ShutdownRequested) ? 0 : 1;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::RunRoundTrip(Host::Runtime& runtime, Host::Target target, std::uint32_t iteration)
{
    auto const optPayload = Security::GenerateRandomData(PayloadSize);
    auto const optNonce = Security::GenerateRandomData(Crypto::ChaChaPoly::NonceSize);
    if (!optPayload || !optNonce) { return false; }

    Security::Buffer buffer = *optPayload;
    std::array<std::uint8_t, Crypto::ChaChaPoly::TagSize> tag{};
    Jobs::RequestId const encryptId{ iteration * 2 };
    Jobs::RequestId const decryptId{ iteration * 2 + 1 };

    // The ChaCha20-Poly1305 worker falls back to a request scoped key when it has no access to the store. 
    auto optExternalKey = Security::GenerateRandomData(Crypto::ChaChaPoly::KeySize);
    if (!optExternalKey) { return false; }

    bool const stored = target == Host::Target::Aes || runtime.HasChaChaPolyKeyStore();
    auto const encrypt = [&] () -> Jobs::Request {
        if (target == Host::Target::Aes) {
            return Jobs::Requests::EncryptAesGcm{ 
                HostClient, encryptId, Host::Slots::Symmetric256, *optNonce, {}, buffer, tag };
        }
        if (stored) {
            return Jobs::Requests::EncryptChaChaPoly{ 
                HostClient, encryptId, Host::Slots::Symmetric256, *optNonce, {}, buffer, tag };
        }
        return Jobs::Requests::EncryptChaChaPolyExternalKey{ 
            HostClient, encryptId, *optExternalKey, *optNonce, {}, buffer, tag };
    };

    auto const decrypt = [&] () -> Jobs::Request {
        if (target == Host::Target::Aes) {
            return Jobs::Requests::DecryptAesGcm{ 
                HostClient, decryptId, Host::Slots::Symmetric256, *optNonce, {}, buffer, tag };
        }
        if (stored) {
            return Jobs::Requests::DecryptChaChaPoly{ 
                HostClient, decryptId, Host::Slots::Symmetric256, *optNonce, {}, buffer, tag };
        }
        return Jobs::Requests::DecryptChaChaPolyExternalKey{ 
            HostClient, decryptId, *optExternalKey, *optNonce, {}, buffer, tag };
    };

    bool success = true;
    for (auto&& request : { encrypt(), decrypt() }) {
        // Each request is completed before the next is submitted, the decryption operates on the encrypted buffer. 
        if (!runtime.Submit(target, Jobs::Request{ request })) { success = false; break; }
        runtime.ExecuteUntilIdle();
        auto const optResponse = runtime.Collect(target);
        if (!optResponse || Jobs::IsError(*optResponse)) { success = false; break; }
    }

    success = success && std::ranges::equal(buffer, *optPayload);
    Security::EraseMemory(*optExternalKey);
    return success;
}

//----------------------------------------------------------------------------------------------------------------------
