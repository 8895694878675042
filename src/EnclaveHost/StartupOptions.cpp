//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t DefaultTerminalWidth = 80;

std::uint32_t GetTerminalWidth();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_fileDescriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_configurationFilepath()
    , m_requestCapacity(Host::Settings::DefaultChannelCapacity)
    , m_responseCapacity(Host::Settings::DefaultChannelCapacity)
    , m_attachChaChaPolyKeyStore(true)
    , m_runSelfTest(true)
    , m_iterations(Host::Settings::DefaultIterations)
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    std::uint32_t const width = local::GetTerminalWidth();
    boost::program_options::options_description general("General Options", width);
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    // Option to disable console output.
    {
        AddGeneralOption(
            Quiet.data(),
            boost::program_options::bool_switch()->default_value(false),
            "Disables all output to the console. Takes precedence over the verbosity level.");
    }

    // Option to set the configuration filepath.
    {
        AddGeneralOption(
            ConfigurationFilepath.data(),
            boost::program_options::value(&m_configurationFilepath)->value_name("<filepath>"),
            "Read additional options from an INI style configuration file. Options supplied on the command line "
            "take precedence over those read from the file.");
    }

    m_descriptions.add(general);

    boost::program_options::options_description runtime("Runtime Options", width);
    auto AddRuntimeOption = runtime.add_options();

    // Option to set the log verbosity level.
    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };
        
        std::ostringstream oss;
        oss << "Sets the maximum log level for console output. ";
        oss << "Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddRuntimeOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    // Options to set the bounds of the worker channels.
    {
        AddRuntimeOption(
            RequestCapacity.data(),
            boost::program_options::value(&m_requestCapacity)->value_name("<count>")->default_value(
                Host::Settings::DefaultChannelCapacity),
            "The number of requests each worker may have pending.");

        AddRuntimeOption(
            ResponseCapacity.data(),
            boost::program_options::value(&m_responseCapacity)->value_name("<count>")->default_value(
                Host::Settings::DefaultChannelCapacity),
            "The number of uncollected responses each worker may hold before responses are dropped.");
    }

    // Option to run the ChaCha20-Poly1305 worker without access to the key store.
    {
        AddRuntimeOption(
            ChaChaPolyKeyStore.data(),
            boost::program_options::value(&m_attachChaChaPolyKeyStore)->value_name("<bool>")->default_value(true),
            "Provide the key store to the ChaCha20-Poly1305 worker. When disabled only requests carrying their own "
            "key are served.");
    }

    // Option to disable the power-on known answer tests.
    {
        AddRuntimeOption(
            SelfTest.data(),
            boost::program_options::value(&m_runSelfTest)->value_name("<bool>")->default_value(true),
            "Run the known answer tests through the workers before accepting work.");
    }

    // Option to set the number of demonstration round trips.
    {
        AddRuntimeOption(
            Iterations.data(),
            boost::program_options::value(&m_iterations)->value_name("<count>")->default_value(
                Host::Settings::DefaultIterations),
            "The number of encrypt and decrypt round trips to push through each worker.");
    }

    m_descriptions.add(runtime);
    m_fileDescriptions.add(runtime);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char const* const* argv)
{
    constexpr auto IsOptionSupplied = [] (
        boost::program_options::variables_map const& options,
        std::string_view option) -> bool
    {
        return options.count(option.data()) && !options[option.data()].defaulted();
    };

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv).options(m_descriptions).run(), m_options);

        // Note: The first stored value of an option is retained, the file must be stored after the command line.
        if (IsOptionSupplied(m_options, ConfigurationFilepath)) {
            auto const& filepath = m_options[ConfigurationFilepath.data()].as<std::string>();
            std::ifstream file(filepath);
            if (!file.is_open()) {
                std::cout << "Unable to open the configuration file at \"" << filepath << "\"." << std::endl;
                return ParseCode::Malformed;
            }
            boost::program_options::store(
                boost::program_options::parse_config_file(file, m_fileDescriptions), m_options);
        }

        boost::program_options::notify(m_options);
    } catch (std::exception const& e) {
        std::cout << "An error occured parsing startup options due to: ";
        std::cout << e.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(argc, argv) << std::endl;
        return ParseCode::ExitRequested;
    }

    {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level \"" << argument << "\"!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (m_options[Quiet.data()].as<bool>()) { m_verbosity = spdlog::level::off; }

    if (m_requestCapacity == 0 || m_responseCapacity == 0) { 
        std::cout << "The channel capacities must be at least one." << std::endl;
        return ParseCode::Malformed;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText([[maybe_unused]] std::int32_t argc, char const* const* argv) const
{   
    std::ostringstream oss;
    std::string const name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " [options] \n" << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText([[maybe_unused]] std::int32_t argc, char const* const* argv) const
{   
    std::ostringstream oss;
    std::string const name = std::filesystem::path(argv[0]).stem().string();
    oss << name << " (Enclave) " << Enclave::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosityLevel() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Startup::Options::GetConfigPath() const { return m_configurationFilepath; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Startup::Options::GetRequestCapacity() const { return m_requestCapacity; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Startup::Options::GetResponseCapacity() const { return m_responseCapacity; }

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::AttachChaChaPolyKeyStore() const { return m_attachChaChaPolyKeyStore; }

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::RunSelfTest() const { return m_runSelfTest; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Startup::Options::GetIterations() const { return m_iterations; }

//----------------------------------------------------------------------------------------------------------------------

Startup::Options::operator Host::Settings() const
{
    // Package the parsed options into the runtime settings aggregate.
    return {
        .verbosity = m_verbosity,
        .requestCapacity = m_requestCapacity,
        .responseCapacity = m_responseCapacity,
        .attachChaChaPolyKeyStore = m_attachChaChaPolyKeyStore,
        .runSelfTest = m_runSelfTest,
        .iterations = m_iterations
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    struct winsize size{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col == 0) { return DefaultTerminalWidth; }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------
