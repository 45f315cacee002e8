//----------------------------------------------------------------------------------------------------------------------
// File: Paths.hpp
// Description: The on-disk layout of a chain project and the location of joined networks.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Paths;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Paths final
{
public:
    static constexpr std::string_view ApplicationFolder = ".chainkit";
    static constexpr std::string_view NetworksFolder = "networks";
    static constexpr std::string_view ManifestFilename = "chainkit.yml";
    static constexpr std::string_view ConfigFilename = "config.toml";
    static constexpr std::string_view GenesisFilename = "genesis.json";

    explicit Paths(std::filesystem::path const& root);

    [[nodiscard]] std::filesystem::path const& GetRoot() const;
    [[nodiscard]] std::filesystem::path GetStateDirectory() const;
    [[nodiscard]] std::filesystem::path GetDataDirectory() const;
    [[nodiscard]] std::filesystem::path GetConfigDirectory() const;
    [[nodiscard]] std::filesystem::path GetCommandLineDirectory() const;
    [[nodiscard]] std::filesystem::path GetOverlayDirectory() const;
    [[nodiscard]] std::filesystem::path GetLogFile() const;
    [[nodiscard]] std::filesystem::path GetConfigFile() const;
    [[nodiscard]] std::filesystem::path GetGenesisFile() const;
    [[nodiscard]] std::filesystem::path GetManifestFile() const;

    [[nodiscard]] bool CreateDirectories() const;

    // Note: Networks are joined into <home>/.chainkit/networks/<network>. Only the final component of the network 
    // identifier is used, identifiers may be supplied as content paths. 
    [[nodiscard]] static std::optional<std::filesystem::path> GetNetworkDirectory(
        std::string_view network, std::optional<std::filesystem::path> const& optHome = {});

private:
    std::filesystem::path m_root;
};

//----------------------------------------------------------------------------------------------------------------------
