//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description: Command line and configuration file options for the enclave host. Options supplied on the command 
// line take precedence over the same options supplied through the configuration file. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Settings.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view RequestCapacity = "request-capacity";
    static constexpr std::string_view ResponseCapacity = "response-capacity";
    static constexpr std::string_view ChaChaPolyKeyStore = "chachapoly-keystore";
    static constexpr std::string_view SelfTest = "self-test";
    static constexpr std::string_view Iterations = "iterations";

    Options();

    [[nodiscard]] ParseCode Parse(std::int32_t argc, char const* const* argv);

    [[nodiscard]] std::string GenerateHelpText(std::int32_t argc, char const* const* argv) const;
    [[nodiscard]] std::string GenerateVersionText(std::int32_t argc, char const* const* argv) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosityLevel() const;
    [[nodiscard]] std::string const& GetConfigPath() const;
    [[nodiscard]] std::size_t GetRequestCapacity() const;
    [[nodiscard]] std::size_t GetResponseCapacity() const;
    [[nodiscard]] bool AttachChaChaPolyKeyStore() const;
    [[nodiscard]] bool RunSelfTest() const;
    [[nodiscard]] std::uint32_t GetIterations() const;

    [[nodiscard]] operator Host::Settings() const;

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    void SetupDescriptions();

    boost::program_options::options_description m_descriptions;
    boost::program_options::options_description m_fileDescriptions;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    std::string m_configurationFilepath;
    std::size_t m_requestCapacity;
    std::size_t m_responseCapacity;
    bool m_attachChaChaPolyKeyStore;
    bool m_runSelfTest;
    std::uint32_t m_iterations;
};

//----------------------------------------------------------------------------------------------------------------------
