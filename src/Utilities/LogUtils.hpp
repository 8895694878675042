//----------------------------------------------------------------------------------------------------------------------
// File: LogUtils.hpp
// Description: Named loggers for the enclave components. The host registers colored console loggers at startup,
// components that are created without an initialized host (tests, embedding applications) receive a silent logger.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#define SPDLOG_NO_THREAD_ID
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace LogUtils {
//----------------------------------------------------------------------------------------------------------------------

using Logger = std::shared_ptr<spdlog::logger>;

void InitializeLoggers(spdlog::level::level_enum verbosity = spdlog::level::info);
[[nodiscard]] Logger Fetch(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
namespace Name {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "core";
constexpr std::string_view AesWorker = "aes-worker";
constexpr std::string_view ChaChaPolyWorker = "chachapoly-worker";
constexpr std::string_view KeyStore = "keystore";
constexpr std::string_view Scheduler = "scheduler";

//----------------------------------------------------------------------------------------------------------------------
} // Name namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==";
constexpr std::string_view TagOpen = "[";
constexpr std::string_view TagClose = "]";
constexpr std::string_view TagSeperator = " ";
constexpr std::string_view Date = "[%a, %d %b %Y %T]";
constexpr std::string_view Message = "%^[%l] - %v%$";

std::string Generate(std::string_view color, std::vector<std::string> const& tags);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";
constexpr std::string_view Worker = "\x1b[1;38;2;0;195;255m";
constexpr std::string_view Store = "\x1b[1;38;2;255;170;0m";

constexpr spdlog::string_view_t Info = "\x1b[38;2;26;204;148m";
constexpr spdlog::string_view_t Warn = "\x1b[38;2;255;214;102m";
constexpr spdlog::string_view_t Error = "\x1b[38;2;255;56;56m";
constexpr spdlog::string_view_t Critical = "\x1b[1;38;2;255;56;56m";
constexpr spdlog::string_view_t Debug = "\x1b[38;2;45;204;255m";
constexpr spdlog::string_view_t Trace = "\x1b[38;2;255;255;255m";

constexpr std::string_view Reset = "\x1b[0m";

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> CreateTrueColorConsole();

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
} // LogUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline void LogUtils::InitializeLoggers(spdlog::level::level_enum verbosity)
{
    struct Registration { std::string_view name; std::string_view color; std::vector<std::string> tags; };
    std::array<Registration, 5> const registrations = {
        Registration{ Name::Core, Color::Core, { "core" } },
        Registration{ Name::AesWorker, Color::Worker, { "worker", "aes" } },
        Registration{ Name::ChaChaPolyWorker, Color::Worker, { "worker", "chachapoly" } },
        Registration{ Name::KeyStore, Color::Store, { "keystore" } },
        Registration{ Name::Scheduler, Color::Core, { "scheduler" } },
    };

    auto const spConsole = Color::CreateTrueColorConsole();
    for (auto const& [name, color, tags] : registrations) {
        // Replace any silent logger that was handed out before the host initialized logging.
        spdlog::drop(name.data());
        auto spLogger = std::make_shared<spdlog::logger>(name.data(), spConsole);
        spLogger->set_pattern(Pattern::Generate(color, tags));
        spdlog::register_logger(spLogger);
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline LogUtils::Logger LogUtils::Fetch(std::string_view name)
{
    static std::mutex mutex;
    std::scoped_lock lock(mutex);
    if (auto spLogger = spdlog::get(name.data()); spLogger) { return spLogger; }

    // A logger without sinks discards every record.
    auto spSilent = std::make_shared<spdlog::logger>(std::string{ name });
    spdlog::register_logger(spSilent);
    return spSilent;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string LogUtils::Pattern::Generate(std::string_view color, std::vector<std::string> const& tags)
{
    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    for (auto const& tag : tags) {
        oss << TagOpen << color << tag << Color::Reset << TagClose << TagSeperator;
    }
    oss << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> LogUtils::Color::CreateTrueColorConsole()
{
    auto spColorSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    spColorSink->set_color_mode(spdlog::color_mode::always);
    spColorSink->set_color(spdlog::level::info, Color::Info);
    spColorSink->set_color(spdlog::level::warn, Color::Warn);
    spColorSink->set_color(spdlog::level::err, Color::Error);
    spColorSink->set_color(spdlog::level::critical, Color::Critical);
    spColorSink->set_color(spdlog::level::debug, Color::Debug);
    spColorSink->set_color(spdlog::level::trace, Color::Trace);

    return spColorSink;
}

//----------------------------------------------------------------------------------------------------------------------
