//----------------------------------------------------------------------------------------------------------------------
// File: Server.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Server.hpp"
#include "BootstrapConnector.hpp"
#include "ProviderRegistry.hpp"
#include "Components/Configuration/Defaults.hpp"
#include "Components/Content/Identifier.hpp"
#include "Components/Overlay/Multiaddress.hpp"
#include "Interfaces/OverlayNode.hpp"
#include "Utilities/LinkedStopSource.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

Discovery::Server::Server(Configuration::Options const& options, std::shared_ptr<IOverlayNode> const& spNode)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_options(options)
    , m_mutex()
    , m_state(State::Stopped)
    , m_lifetime()
    , m_spNode(spNode)
    , m_publisher(spNode)
    , m_resolver(spNode)
    , m_upConnector()
    , m_upRegistry()
{
    assert(m_logger);
    assert(m_spNode);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Server::~Server()
{
    if (IsOnline()) { Stop(); }
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Status Discovery::Server::Start()
{
    std::unique_lock lock(m_mutex);
    if (m_state == State::Online) { return { StatusCode::AlreadyStarted, "the discovery server is online" }; }

    // The repository lock is taken before anything else and kept until the node is closed, a competing server on the 
    // same root can not initialize or open it in the meantime. 
    auto const& root = m_options.GetRoot();
    if (!m_spNode->AcquireRepository(root)) {
        m_logger->error("The overlay repository at {} is in use by another process.", root.string());
        return { StatusCode::AlreadyRunning, fmt::format("the overlay repository at {} is in use", root.string()) };
    }

    m_state = State::Initializing;
    if (auto const status = InitializeNode(); !status.IsSuccess()) {
        m_logger->error("Failed to start the discovery server: {}.", status.GetCause());
        m_spNode->Close(); // Note: No resource opened on the failed path may be retained. 
        m_state = State::Stopped;
        return status;
    }

    m_lifetime = std::stop_source{};
    m_upConnector = std::make_unique<BootstrapConnector>(
        m_spNode, m_options.GetBootstraps(), m_options.GetConnectionTimeout());
    m_upRegistry = std::make_unique<ProviderRegistry>(
        m_spNode, m_upConnector->GetReadinessSignal(), m_lifetime.get_token());

    [[maybe_unused]] bool const launched = m_upConnector->Launch();
    assert(launched);

    m_state = State::Online;
    m_logger->info("The discovery server is online as {}.", m_spNode->GetIdentifier());
    m_logger->info("Listening on {}.", fmt::join(m_spNode->GetListenAddresses(), ", "));
    m_logger->info("Announcing {}.", fmt::join(m_spNode->GetAnnounceAddresses(), ", "));

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Server::Stop()
{
    // Outstanding operations hold the shared lock, they must be interrupted before the lifecycle may be locked.
    {
        std::shared_lock lock(m_mutex);
        m_lifetime.request_stop();
    }

    std::unique_lock lock(m_mutex);
    if (m_state != State::Online) { return; }
    Teardown();
    m_state = State::Stopped;
    m_logger->info("The discovery server has been stopped.");
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<Overlay::ContentIdentifier> Discovery::Server::Publish(Content::Publisher::Artifacts const& artifacts)
{
    std::shared_lock lock(m_mutex);
    if (m_state != State::Online) { return Status{ StatusCode::NotStarted, "the discovery server has not started" }; }
    return m_publisher.Publish(artifacts);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<Content::NetworkInfo> Discovery::Server::Join(
    Overlay::ContentIdentifier const& identifier, std::stop_token token)
{
    std::shared_lock lock(m_mutex);
    if (auto const optStatus = CheckRequest(identifier); optStatus) { return *optStatus; }

    Awaitable::LinkedStopSource source{ token, m_lifetime.get_token() };
    return m_resolver.Resolve(identifier, source.GetToken());
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Status Discovery::Server::Announce(
    Overlay::ContentIdentifier const& identifier, PeerInfo const& local, std::stop_token token)
{
    std::shared_lock lock(m_mutex);
    if (auto const optStatus = CheckRequest(identifier); optStatus) { return *optStatus; }
    return m_upRegistry->Announce(identifier, local, token);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<Discovery::PeerStream> Discovery::Server::Peers(
    Overlay::ContentIdentifier const& identifier, std::stop_token token)
{
    std::shared_lock lock(m_mutex);
    if (auto const optStatus = CheckRequest(identifier); optStatus) { return *optStatus; }
    return m_upRegistry->FindPeers(identifier, token);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Server::State Discovery::Server::GetState() const
{
    std::shared_lock lock(m_mutex);
    return m_state;
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Server::IsOnline() const { return GetState() == State::Online; }

//----------------------------------------------------------------------------------------------------------------------

Awaitable::Result Discovery::Server::WaitUntilReady(std::stop_token token) const
{
    std::shared_lock lock(m_mutex);
    if (m_state != State::Online) { return Awaitable::Result::Canceled; }

    Awaitable::LinkedStopSource source{ token, m_lifetime.get_token() };
    return m_upConnector->GetReadinessSignal().Wait(source.GetToken());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::PeerIdentifier> Discovery::Server::GetIdentifier() const
{
    std::shared_lock lock(m_mutex);
    if (m_state != State::Online) { return {}; }
    return m_spNode->GetIdentifier();
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList Discovery::Server::GetListenAddresses() const
{
    std::shared_lock lock(m_mutex);
    if (m_state != State::Online) { return {}; }
    return m_spNode->GetListenAddresses();
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList Discovery::Server::GetAnnounceAddresses() const
{
    std::shared_lock lock(m_mutex);
    if (m_state != State::Online) { return {}; }
    return m_spNode->GetAnnounceAddresses();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options const& Discovery::Server::GetOptions() const { return m_options; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::Status Discovery::Server::InitializeNode()
{
    auto const& root = m_options.GetRoot();

    auto const plugins = root / Configuration::Defaults::PluginsDirectory;
    if (!m_spNode->LoadPlugins(plugins)) {
        return { StatusCode::InitializationFailure, fmt::format("unable to load the plugins in {}", plugins.string()) };
    }

    if (!m_spNode->IsInitialized(root)) {
        m_logger->info("Initializing a new overlay repository at {}.", root.string());
        if (!m_spNode->Initialize(root)) {
            return { StatusCode::InitializationFailure, fmt::format("unable to initialize {}", root.string()) };
        }
    }

    if (!m_spNode->Open(root)) {
        return { StatusCode::InitializationFailure, fmt::format("unable to open {}", root.string()) };
    }

    if (!m_spNode->SetListenAddresses(Overlay::CreateWildcardListeners(m_options.GetPort()))) {
        return { 
            StatusCode::InitializationFailure, 
            fmt::format("unable to listen on port {}", m_options.GetPort())
        };
    }

    if (!m_spNode->Online()) {
        return { StatusCode::InitializationFailure, "unable to bring the overlay node online" };
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::Status> Discovery::Server::CheckRequest(Overlay::ContentIdentifier const& identifier) const
{
    if (m_state != State::Online) { return Status{ StatusCode::NotStarted, "the discovery server has not started" }; }
    if (!Content::Identifier::IsValid(identifier)) {
        return Status{ StatusCode::InvalidIdentifier, fmt::format("{} is not a network identifier", identifier) };
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::Server::Teardown()
{
    // Searches are interrupted by the lifetime token, their producers must return before the node is closed.
    if (m_upRegistry) {
        m_upRegistry->WaitForSearches();
        m_upRegistry.reset();
    }

    if (m_upConnector) {
        m_upConnector->Stop();
        m_upConnector.reset();
    }

    m_spNode->Close();
}

//----------------------------------------------------------------------------------------------------------------------
