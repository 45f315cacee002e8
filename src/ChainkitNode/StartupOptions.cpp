//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Defaults.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t DefaultTerminalWidth = 80;
constexpr std::uint32_t JoinerLimit = 64;

std::uint32_t GetTerminalWidth();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_manifest()
    , m_genesis()
    , m_image()
    , m_optWorkspace()
    , m_joiners(DefaultJoiners)
    , m_optPeerToPeerPort()
    , m_optConfigurationFilepath()
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
        AddGeneralOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    m_descriptions.add(general);

    boost::program_options::options_description network("Network Options", width);
    auto AddNetworkOption = network.add_options();

    AddNetworkOption(
        Manifest.data(),
        boost::program_options::value<std::string>()->value_name("<filepath>")->required(),
        "The project manifest published with the network.");

    AddNetworkOption(
        Genesis.data(),
        boost::program_options::value<std::string>()->value_name("<filepath>")->required(),
        "The genesis state published with the network.");

    AddNetworkOption(
        Image.data(),
        boost::program_options::value<std::string>()->value_name("<filepath>")->required(),
        "The container image archive published with the network.");

    AddNetworkOption(
        PeerToPeerPort.data(),
        boost::program_options::value<std::uint32_t>()->value_name("<port>"),
        "The consensus peer-to-peer port announced by the publishing node. "
        "If not specified, the port in the configuration file is used.");

    m_descriptions.add(network);

    boost::program_options::options_description sandbox("Sandbox Options", width);
    auto AddSandboxOption = sandbox.add_options();

    AddSandboxOption(
        Workspace.data(),
        boost::program_options::value<std::string>()->value_name("<directory>"),
        "The directory the nodes' state is kept in. If not specified, a temporary directory is created.");

    AddSandboxOption(
        Joiners.data(),
        boost::program_options::value<std::uint32_t>()->value_name("<count>")->default_value(DefaultJoiners),
        "The number of nodes joining the published network.");

    AddSandboxOption(
        ConfigurationFilepath.data(),
        boost::program_options::value<std::string>()->value_name("<filepath>"),
        "Set the configuration filepath of the publishing node. If not specified, a default configuration file is "
        "created in the workspace.");

    m_descriptions.add(sandbox);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char** argv)
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

    // Required options are only checked once it's known the caller did not request the help or version text.
    try {
        boost::program_options::notify(m_options);
    } catch (std::exception const& e) {
        std::cout << "An error occured parsing startup options due to: ";
        std::cout << e.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cout << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    m_manifest = m_options[Manifest.data()].as<std::string>();
    m_genesis = m_options[Genesis.data()].as<std::string>();
    m_image = m_options[Image.data()].as<std::string>();

    if (IsOptionSupplied(m_options, Workspace)) {
        m_optWorkspace = m_options[Workspace.data()].as<std::string>();
    }

    m_joiners = m_options[Joiners.data()].as<std::uint32_t>();
    if (m_joiners == 0 || m_joiners > local::JoinerLimit) {
        std::cout << "The number of joining nodes must be between 1 and " << local::JoinerLimit << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, PeerToPeerPort)) {
        auto const port = m_options[PeerToPeerPort.data()].as<std::uint32_t>();
        if (port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
            std::cout << "The peer-to-peer port must be between 1 and 65535." << std::endl;
            return ParseCode::Malformed;
        }
        m_optPeerToPeerPort = static_cast<std::uint16_t>(port);
    }

    if (IsOptionSupplied(m_options, ConfigurationFilepath)) {
        m_optConfigurationFilepath = m_options[ConfigurationFilepath.data()].as<std::string>();
        if (m_optConfigurationFilepath->empty()) {
            std::cout << "The configuration filepath cannot be empty." << std::endl;
            return ParseCode::Malformed;
        }
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText([[maybe_unused]] std::int32_t argc, char** argv) const
{   
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << "Usage: " << name << " --manifest <filepath> --genesis <filepath> --image <filepath> [options] \n";
    oss << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText([[maybe_unused]] std::int32_t argc, char** argv) const
{   
    std::ostringstream oss;
    std::string name = std::filesystem::path(argv[0]).stem().string();
    oss << name << " (Chainkit) " << Configuration::Defaults::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosityLevel() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Startup::Options::GetManifestPath() const { return m_manifest; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Startup::Options::GetGenesisPath() const { return m_genesis; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Startup::Options::GetImagePath() const { return m_image; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> const& Startup::Options::GetWorkspace() const { return m_optWorkspace; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t Startup::Options::GetJoinerCount() const { return m_joiners; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint16_t> const& Startup::Options::GetPeerToPeerPort() const { return m_optPeerToPeerPort; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> const& Startup::Options::GetConfigPath() const
{
    return m_optConfigurationFilepath;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    struct winsize size{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col == 0) { return DefaultTerminalWidth; }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------
