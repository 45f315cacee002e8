//----------------------------------------------------------------------------------------------------------------------
// File: ProviderRegistry.hpp
// Description: Advertises the local node as a provider of a network identifier and discovers the other providers of 
// an identifier. Discovered providers are asked for their peer info over the exchange protocol.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "DeadlineService.hpp"
#include "PeerExchange.hpp"
#include "PeerInfo.hpp"
#include "PeerStream.hpp"
#include "Status.hpp"
#include "Components/Overlay/OverlayTypes.hpp"
#include "Utilities/OneShotSignal.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayNode;
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class ProviderRegistry;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::ProviderRegistry final
{
public:
    struct Limits
    {
        std::chrono::milliseconds provide;
        std::chrono::milliseconds search;
        std::size_t providers;
    };

    static Limits const DefaultLimits;

    // Note: The readiness signal must outlive the registry. Stopping the lifetime token interrupts every operation.
    ProviderRegistry(
        std::shared_ptr<IOverlayNode> const& spNode,
        Awaitable::OneShotSignal const& readiness,
        std::stop_token lifetime,
        Limits const& limits = DefaultLimits);
    ~ProviderRegistry();

    ProviderRegistry(ProviderRegistry const& other) = delete;
    ProviderRegistry& operator=(ProviderRegistry const& other) = delete;

    [[nodiscard]] Status Announce(
        Overlay::ContentIdentifier const& identifier, PeerInfo const& local, std::stop_token token = {});

    [[nodiscard]] Result<PeerStream> FindPeers(
        Overlay::ContentIdentifier const& identifier, std::stop_token token = {});

    // Note: Blocks until every search producer has returned. The lifetime token must be stopped beforehand. 
    void WaitForSearches();
    [[nodiscard]] std::size_t GetActiveSearches() const;

private:
    class SearchTracker;

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IOverlayNode> m_spNode;
    Awaitable::OneShotSignal const& m_readiness;
    std::stop_token m_lifetime;
    Limits const m_limits;

    std::shared_ptr<DeadlineService> m_spDeadlines;
    std::shared_ptr<SearchTracker> m_spTracker;
    PeerExchange m_exchange;
};

//----------------------------------------------------------------------------------------------------------------------

class Discovery::ProviderRegistry::SearchTracker : public std::enable_shared_from_this<SearchTracker>
{
public:
    class Ticket;

    // Note: The search is counted as active until every copy of the returned ticket has been destroyed. 
    [[nodiscard]] std::shared_ptr<Ticket> Acquire();
    void Wait();
    [[nodiscard]] std::size_t GetActive() const;

private:
    void Release();

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::size_t m_active = 0;
};

//----------------------------------------------------------------------------------------------------------------------

class Discovery::ProviderRegistry::SearchTracker::Ticket
{
public:
    explicit Ticket(std::shared_ptr<SearchTracker> const& spTracker);
    ~Ticket();

    Ticket(Ticket const& other) = delete;
    Ticket& operator=(Ticket const& other) = delete;

private:
    std::shared_ptr<SearchTracker> m_spTracker;
};

//----------------------------------------------------------------------------------------------------------------------
