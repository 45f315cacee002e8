//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description: Runs a complete announce and join scenario between in-process discovery servers on the loopback 
// overlay. One server publishes and announces the network, every other server joins it and searches for its peers.
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Configuration/Paths.hpp"
#include "Components/Discovery/PeerInfo.hpp"
#include "Components/Discovery/Server.hpp"
#include "Components/Overlay/Loopback/Fabric.hpp"
#include "Components/Overlay/Loopback/Node.hpp"
#include "Components/Overlay/Multiaddress.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Sandbox {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view WorkspacePrefix = "chainkit-sandbox";
constexpr std::string_view PublisherName = "publisher";
constexpr std::string_view ConfigurationFilename = "discovery.json";
constexpr std::string_view ImageFilename = "image.tar";

struct Participant
{
    std::string name;
    Configuration::Paths paths;
    std::unique_ptr<Discovery::Server> upServer;
};

[[nodiscard]] std::optional<std::filesystem::path> PrepareWorkspace(Startup::Options const& startup);

[[nodiscard]] std::optional<Configuration::Options> FetchPublisherOptions(
    Startup::Options const& startup, Configuration::Paths const& paths);

[[nodiscard]] std::optional<Configuration::Options> CreateJoinerOptions(
    Configuration::Paths const& paths, Configuration::Options const& publisher, std::uint32_t index,
    Configuration::BootstrapList const& bootstraps);

[[nodiscard]] std::unique_ptr<Participant> Launch(
    std::string_view name,
    Configuration::Paths const& paths,
    Configuration::Options const& options,
    std::shared_ptr<Overlay::Loopback::Fabric> const& spFabric);

[[nodiscard]] bool Publish(Participant& publisher, Startup::Options const& startup, std::string& network);
[[nodiscard]] bool Join(Participant& joiner, std::string const& network);

//----------------------------------------------------------------------------------------------------------------------
} // Sandbox namespace
//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    Startup::Options startup;
    switch (startup.Parse(argc, argv)) {
        case Startup::ParseCode::Success: break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: return 1;
    }

    Logger::Initialize(startup.GetVerbosityLevel(), true);
    auto const logger = spdlog::get(Logger::Name::Core.data()); // From here on we should use the logger for errors. 

    auto const optWorkspace = Sandbox::PrepareWorkspace(startup);
    if (!optWorkspace) { return 1; }
    logger->info("Using the sandbox workspace at {}.", optWorkspace->string());

    // Every participant shares the loopback fabric, the fabric is the sandbox's substitute for the public overlay.
    auto const spFabric = std::make_shared<Overlay::Loopback::Fabric>();

    Configuration::Paths const publisherPaths{ *optWorkspace / Sandbox::PublisherName };
    auto const optPublisherOptions = Sandbox::FetchPublisherOptions(startup, publisherPaths);
    if (!optPublisherOptions) { return 1; }

    auto const upPublisher = Sandbox::Launch(Sandbox::PublisherName, publisherPaths, *optPublisherOptions, spFabric);
    if (!upPublisher) { return 1; }

    std::string network;
    if (!Sandbox::Publish(*upPublisher, startup, network)) { return 1; }

    // The joining nodes enter the overlay through the publisher's announced addresses.
    Configuration::BootstrapList bootstraps;
    auto const optPublisherIdentifier = upPublisher->upServer->GetIdentifier();
    assert(optPublisherIdentifier);
    for (auto const& address : upPublisher->upServer->GetAnnounceAddresses()) {
        if (auto const optAddress = Overlay::Multiaddress::Parse(address); optAddress) {
            bootstraps.emplace_back(optAddress->WithPeerIdentifier(*optPublisherIdentifier).GetUri());
        }
    }

    std::vector<std::unique_ptr<Sandbox::Participant>> joiners;
    for (std::uint32_t index = 0; index < startup.GetJoinerCount(); ++index) {
        auto const name = fmt::format("joiner-{}", index + 1);
        Configuration::Paths const paths{ *optWorkspace / name };
        auto const optOptions = Sandbox::CreateJoinerOptions(paths, *optPublisherOptions, index, bootstraps);
        if (!optOptions) { return 1; }

        auto upJoiner = Sandbox::Launch(name, paths, *optOptions, spFabric);
        if (!upJoiner) { return 1; }
        joiners.emplace_back(std::move(upJoiner));
    }

    bool success = true;
    for (auto const& upJoiner : joiners) {
        success = Sandbox::Join(*upJoiner, network) && success;
    }

    for (auto const& upJoiner : joiners) { upJoiner->upServer->Stop(); }
    upPublisher->upServer->Stop();

    if (!success) {
        logger->critical("The sandbox scenario did not complete successfully!");
        return 1;
    }

    logger->info("The sandbox scenario completed, {} node(s) joined {}.", joiners.size(), network);
    return 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> Sandbox::PrepareWorkspace(Startup::Options const& startup)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());

    if (auto const& optWorkspace = startup.GetWorkspace(); optWorkspace) {
        if (!FileUtils::CreateFolderIfNoneExist(*optWorkspace)) {
            logger->critical("Unable to create the sandbox workspace at {}!", optWorkspace->string());
            return {};
        }
        return optWorkspace;
    }

    auto optWorkspace = FileUtils::CreateTemporaryFolder(WorkspacePrefix);
    if (!optWorkspace) { logger->critical("Unable to create a temporary sandbox workspace!"); }
    return optWorkspace;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::Options> Sandbox::FetchPublisherOptions(
    Startup::Options const& startup, Configuration::Paths const& paths)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());

    // The default configuration file is placed such that the overlay root defaults to the project's overlay directory. 
    auto const filepath = startup.GetConfigPath().value_or(paths.GetStateDirectory() / ConfigurationFilename);
    Configuration::Parser parser(filepath);
    if (auto const [code, message] = parser.FetchOptions(); code != Configuration::StatusCode::Success) {
        logger->critical("Unable to read the configuration file at {}: {}", filepath.string(), message);
        return {};
    }

    auto options = parser.GetOptions();
    if (auto const& optPort = startup.GetPeerToPeerPort(); optPort) { options.SetPeerToPeerPort(*optPort); }
    return options;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Configuration::Options> Sandbox::CreateJoinerOptions(
    Configuration::Paths const& paths, Configuration::Options const& publisher, std::uint32_t index,
    Configuration::BootstrapList const& bootstraps)
{
    // Each participant must listen on a distinct port of the fabric.
    std::uint32_t const port = static_cast<std::uint32_t>(publisher.GetPort()) + index + 1;
    if (port > std::numeric_limits<std::uint16_t>::max()) {
        spdlog::get(Logger::Name::Core.data())->critical("Unable to assign a listening port to joiner {}!", index + 1);
        return {};
    }

    Configuration::Options options{ paths.GetOverlayDirectory() };
    options.SetPort(static_cast<std::uint16_t>(port));
    options.SetBootstraps(bootstraps);
    options.SetConnectionTimeout(publisher.GetConnectionTimeout());
    options.SetPeerToPeerPort(publisher.GetPeerToPeerPort());
    return options;
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<Sandbox::Participant> Sandbox::Launch(
    std::string_view name,
    Configuration::Paths const& paths,
    Configuration::Options const& options,
    std::shared_ptr<Overlay::Loopback::Fabric> const& spFabric)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());

    if (!paths.CreateDirectories()) {
        logger->critical("Unable to create the state directories of the {}!", name);
        return nullptr;
    }

    auto upParticipant = std::make_unique<Participant>(Participant{
        .name = std::string{ name },
        .paths = paths,
        .upServer = std::make_unique<Discovery::Server>(options, std::make_shared<Overlay::Loopback::Node>(spFabric))
    });

    if (auto const status = upParticipant->upServer->Start(); !status.IsSuccess()) {
        logger->critical("Unable to start the {}: {}", name, status.ToString());
        return nullptr;
    }

    return upParticipant;
}

//----------------------------------------------------------------------------------------------------------------------

bool Sandbox::Publish(Participant& publisher, Startup::Options const& startup, std::string& network)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());

    auto published = publisher.upServer->Publish({ 
        .manifest = startup.GetManifestPath(),
        .genesis = startup.GetGenesisPath(),
        .image = startup.GetImagePath()
    });

    if (auto const pStatus = std::get_if<Discovery::Status>(&published); pStatus) {
        logger->critical("Unable to publish the network: {}", pStatus->ToString());
        return false;
    }

    network = std::get<Overlay::ContentIdentifier>(std::move(published));
    logger->info("Published the network as {}.", network);

    auto const optIdentifier = publisher.upServer->GetIdentifier();
    assert(optIdentifier);

    Discovery::PeerInfo const local{
        .identifier = *optIdentifier,
        .addresses = {},
        .port = publisher.upServer->GetOptions().GetPeerToPeerPort()
    };

    if (auto const status = publisher.upServer->Announce(network, local); !status.IsSuccess()) {
        logger->critical("Unable to announce the network: {}", status.ToString());
        return false;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Sandbox::Join(Participant& joiner, std::string const& network)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());

    auto joined = joiner.upServer->Join(network);
    if (auto const pStatus = std::get_if<Discovery::Status>(&joined); pStatus) {
        logger->error("The {} was unable to join {}: {}", joiner.name, network, pStatus->ToString());
        return false;
    }

    auto& info = std::get<Content::NetworkInfo>(joined);

    auto const optDirectory = Configuration::Paths::GetNetworkDirectory(network, joiner.paths.GetRoot());
    if (!optDirectory) {
        logger->error("The {} was unable to determine the directory for {}.", joiner.name, network);
        return false;
    }

    Configuration::Paths const paths{ *optDirectory };
    if (!paths.CreateDirectories()) {
        logger->error("The {} was unable to create the directory at {}.", joiner.name, optDirectory->string());
        return false;
    }

    if (!info.WriteManifest(paths.GetManifestFile()) || !info.WriteGenesis(paths.GetGenesisFile()) ||
        !info.WriteImage(paths.GetDataDirectory() / ImageFilename)) {
        logger->error("The {} was unable to write the network artifacts to {}.", joiner.name, optDirectory->string());
        return false;
    }

    logger->info("The {} wrote the artifacts of {} to {}.", joiner.name, network, optDirectory->string());

    auto searched = joiner.upServer->Peers(network);
    if (auto const pStatus = std::get_if<Discovery::Status>(&searched); pStatus) {
        logger->error("The {} was unable to search for peers: {}", joiner.name, pStatus->ToString());
        return false;
    }

    std::size_t found = 0;
    for (auto const& peer : std::get<Discovery::PeerStream>(searched)) {
        ++found;
        logger->info(
            "The {} found {} at [{}] with peer-to-peer port {}.",
            joiner.name, peer.identifier, fmt::join(peer.addresses, ", "), peer.port);
    }

    if (found == 0) {
        logger->error("The {} did not find any peers of {}.", joiner.name, network);
        return false;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------
