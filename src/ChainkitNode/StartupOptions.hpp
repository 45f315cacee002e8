//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
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
    static constexpr std::string_view Manifest = "manifest";
    static constexpr std::string_view Genesis = "genesis";
    static constexpr std::string_view Image = "image";
    static constexpr std::string_view Workspace = "workspace";
    static constexpr std::string_view Joiners = "joiners";
    static constexpr std::string_view PeerToPeerPort = "p2p-port";
    static constexpr std::string_view ConfigurationFilepath = "config";

    static constexpr std::uint32_t DefaultJoiners = 2;

    Options();

    void SetupDescriptions();
    [[nodiscard]] ParseCode Parse(std::int32_t argc, char** argv);

    [[nodiscard]] std::string GenerateHelpText(std::int32_t argc, char** argv) const;
    [[nodiscard]] std::string GenerateVersionText(std::int32_t argc, char** argv) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosityLevel() const;
    [[nodiscard]] std::filesystem::path const& GetManifestPath() const;
    [[nodiscard]] std::filesystem::path const& GetGenesisPath() const;
    [[nodiscard]] std::filesystem::path const& GetImagePath() const;
    [[nodiscard]] std::optional<std::filesystem::path> const& GetWorkspace() const;
    [[nodiscard]] std::uint32_t GetJoinerCount() const;
    [[nodiscard]] std::optional<std::uint16_t> const& GetPeerToPeerPort() const;
    [[nodiscard]] std::optional<std::filesystem::path> const& GetConfigPath() const;

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    std::filesystem::path m_manifest;
    std::filesystem::path m_genesis;
    std::filesystem::path m_image;
    std::optional<std::filesystem::path> m_optWorkspace;
    std::uint32_t m_joiners;
    std::optional<std::uint16_t> m_optPeerToPeerPort;
    std::optional<std::filesystem::path> m_optConfigurationFilepath;
};

//----------------------------------------------------------------------------------------------------------------------
