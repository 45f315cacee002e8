//----------------------------------------------------------------------------------------------------------------------
// File: Server.hpp
// Description: The discovery server coordinates the overlay node, bootstrapping, content publication and resolution, 
// and the provider registry. The server exclusively owns the lifecycle of its overlay node. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "PeerInfo.hpp"
#include "PeerStream.hpp"
#include "Status.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Content/NetworkInfo.hpp"
#include "Components/Content/Publisher.hpp"
#include "Components/Content/Resolver.hpp"
#include "Components/Overlay/OverlayTypes.hpp"
#include "Utilities/OneShotSignal.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayNode;
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class BootstrapConnector;
class ProviderRegistry;
class Server;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::Server final
{
public:
    enum class State : std::uint32_t { Stopped, Initializing, Online };

    Server(Configuration::Options const& options, std::shared_ptr<IOverlayNode> const& spNode);
    ~Server();

    Server(Server const& other) = delete;
    Server& operator=(Server const& other) = delete;

    // Note: Start returns once the overlay node is online, bootstrapping continues in the background. A failed start 
    // leaves the server stopped with the overlay node closed. 
    [[nodiscard]] Status Start();
    void Stop();

    [[nodiscard]] Result<Overlay::ContentIdentifier> Publish(Content::Publisher::Artifacts const& artifacts);
    [[nodiscard]] Result<Content::NetworkInfo> Join(
        Overlay::ContentIdentifier const& identifier, std::stop_token token = {});

    [[nodiscard]] Status Announce(
        Overlay::ContentIdentifier const& identifier, PeerInfo const& local, std::stop_token token = {});

    // Note: The returned stream ends when the search times out, the providers are exhausted, the caller's token is 
    // stopped, or the server is stopped. 
    [[nodiscard]] Result<PeerStream> Peers(Overlay::ContentIdentifier const& identifier, std::stop_token token = {});

    [[nodiscard]] State GetState() const;
    [[nodiscard]] bool IsOnline() const;
    [[nodiscard]] Awaitable::Result WaitUntilReady(std::stop_token token = {}) const;

    [[nodiscard]] std::optional<Overlay::PeerIdentifier> GetIdentifier() const;
    [[nodiscard]] Overlay::AddressList GetListenAddresses() const;
    [[nodiscard]] Overlay::AddressList GetAnnounceAddresses() const;
    [[nodiscard]] Configuration::Options const& GetOptions() const;

private:
    [[nodiscard]] Status InitializeNode();
    [[nodiscard]] std::optional<Status> CheckRequest(Overlay::ContentIdentifier const& identifier) const;
    void Teardown();

    std::shared_ptr<spdlog::logger> m_logger;
    Configuration::Options const m_options;

    mutable std::shared_mutex m_mutex;
    State m_state;
    std::stop_source m_lifetime;

    std::shared_ptr<IOverlayNode> m_spNode;
    Content::Publisher m_publisher;
    Content::Resolver m_resolver;
    std::unique_ptr<BootstrapConnector> m_upConnector;
    std::unique_ptr<ProviderRegistry> m_upRegistry;
};

//----------------------------------------------------------------------------------------------------------------------
