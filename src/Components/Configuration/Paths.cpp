//----------------------------------------------------------------------------------------------------------------------
// File: Paths.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Paths.hpp"
#include "Utilities/FileUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdlib>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::filesystem::path MakeAbsolute(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Folder {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view State = "state";
constexpr std::string_view Data = "data";
constexpr std::string_view Config = "config";
constexpr std::string_view CommandLine = "cli";
constexpr std::string_view Overlay = "ipfs";
constexpr std::string_view Log = "log";

//----------------------------------------------------------------------------------------------------------------------
} // Folder namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Configuration::Paths::Paths(std::filesystem::path const& root)
    : m_root(root)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Paths::GetRoot() const { return m_root; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetStateDirectory() const { return local::MakeAbsolute(m_root) / Folder::State; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetDataDirectory() const { return GetStateDirectory() / Folder::Data; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetConfigDirectory() const { return GetStateDirectory() / Folder::Config; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetCommandLineDirectory() const
{
    return GetStateDirectory() / Folder::CommandLine;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetOverlayDirectory() const { return GetStateDirectory() / Folder::Overlay; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetLogFile() const { return GetStateDirectory() / Folder::Log; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetConfigFile() const { return GetConfigDirectory() / ConfigFilename; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetGenesisFile() const { return GetConfigDirectory() / GenesisFilename; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Paths::GetManifestFile() const { return m_root / ManifestFilename; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Paths::CreateDirectories() const
{
    return FileUtils::CreateFolderIfNoneExist(GetDataDirectory()) &&
        FileUtils::CreateFolderIfNoneExist(GetConfigDirectory()) &&
        FileUtils::CreateFolderIfNoneExist(GetOverlayDirectory());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> Configuration::Paths::GetNetworkDirectory(
    std::string_view network, std::optional<std::filesystem::path> const& optHome)
{
    std::filesystem::path home;
    if (optHome) {
        home = *optHome;
    } else if (char const* const pHome = std::getenv("HOME"); pHome && *pHome != '\0') {
        home = pHome;
    } else {
        return {};
    }

    while (!network.empty() && network.back() == '/') { network.remove_suffix(1); }
    auto const base = std::filesystem::path{ network }.filename();
    if (base.empty() || base == "." || base == "..") { return {}; }

    return home / ApplicationFolder / NetworksFolder / base;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path local::MakeAbsolute(std::filesystem::path const& path)
{
    std::error_code error;
    auto absolute = std::filesystem::absolute(path, error);
    return (error) ? path : absolute;
}

//----------------------------------------------------------------------------------------------------------------------
