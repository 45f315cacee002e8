//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads and writes the JSON configuration file of a discovery server.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    static constexpr std::string_view VersionSymbol = "version";

    explicit Parser(std::filesystem::path const& filepath);

    // Note: A missing configuration file is created from the default options. The overlay root defaults to a 
    // directory beside the configuration file. 
    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] Options const& GetOptions() const;
    [[nodiscard]] bool Validated() const;

    void SetOptions(Options const& options);

private:
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] ValidationResult ValidateOptions();

    std::shared_ptr<spdlog::logger> m_logger;
    std::filesystem::path m_filepath;
    std::string m_version;
    Options m_options;
    bool m_validated;
};

//----------------------------------------------------------------------------------------------------------------------
