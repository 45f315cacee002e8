//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Registration of the named spdlog loggers used by the discovery components.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

void Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink);
void AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink);

//----------------------------------------------------------------------------------------------------------------------
namespace Name {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "core";
constexpr std::string_view Overlay = "overlay";
constexpr std::string_view Exchange = "exchange";

constexpr std::array<std::string_view, 3> All = { Core, Overlay, Exchange };

//----------------------------------------------------------------------------------------------------------------------
} // Name namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==>";
constexpr std::string_view Date = "[%T.%e]";
constexpr std::string_view Message = "%^[%l] %v%$";

[[nodiscard]] std::string Generate(std::string_view color, std::string_view tag);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";
constexpr std::string_view Overlay = "\x1b[1;38;2;0;195;255m";
constexpr std::string_view Exchange = "\x1b[1;38;2;255;175;0m";
constexpr std::string_view Reset = "\x1b[0m";

[[nodiscard]] std::string_view ForLogger(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    // Note: Sinks are shared between the named loggers such that AttachSink applies to every component.
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> spConsole;
    if (useStdOutSink) { spConsole = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(); }

    for (auto const& name : Name::All) {
        if (spdlog::get(name.data())) { continue; } // The logger has been registered by a prior call.
        auto spLogger = std::make_shared<spdlog::logger>(name.data());
        if (spConsole) { spLogger->sinks().emplace_back(spConsole); }
        spLogger->set_pattern(Pattern::Generate(Color::ForLogger(name), name));
        spdlog::register_logger(spLogger);
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline void Logger::AttachSink(std::shared_ptr<spdlog::sinks::sink> const& spSink)
{
    for (auto const& name : Name::All) {
        auto const spLogger = spdlog::get(name.data());
        assert(spLogger);
        spLogger->sinks().emplace_back(spSink);
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Logger::Pattern::Generate(std::string_view color, std::string_view tag)
{
    std::ostringstream oss;
    oss << Prefix << " " << Date << " [" << color << tag << Color::Reset << "] " << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Logger::Color::ForLogger(std::string_view name)
{
    if (name == Name::Overlay) { return Overlay; }
    if (name == Name::Exchange) { return Exchange; }
    return Core;
}

//----------------------------------------------------------------------------------------------------------------------
