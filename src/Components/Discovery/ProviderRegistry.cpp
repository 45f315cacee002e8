//----------------------------------------------------------------------------------------------------------------------
// File: ProviderRegistry.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ProviderRegistry.hpp"
#include "Components/Configuration/Defaults.hpp"
#include "Components/Overlay/Multiaddress.hpp"
#include "Interfaces/OverlayNode.hpp"
#include "Interfaces/OverlayStream.hpp"
#include "Utilities/LinkedStopSource.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

void AppendObservedAddresses(Discovery::PeerInfo& info, Overlay::AddressList const& observed);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Discovery::ProviderRegistry::Limits const Discovery::ProviderRegistry::DefaultLimits = {
    .provide = Configuration::Defaults::ProvideTimeout,
    .search = Configuration::Defaults::FindProvidersTimeout,
    .providers = Configuration::Defaults::ProviderLimit
};

//----------------------------------------------------------------------------------------------------------------------

Discovery::ProviderRegistry::ProviderRegistry(
    std::shared_ptr<IOverlayNode> const& spNode,
    Awaitable::OneShotSignal const& readiness,
    std::stop_token lifetime,
    Limits const& limits)
    : m_logger(spdlog::get(Logger::Name::Exchange.data()))
    , m_spNode(spNode)
    , m_readiness(readiness)
    , m_lifetime(std::move(lifetime))
    , m_limits(limits)
    , m_spDeadlines(DeadlineService::Create())
    , m_spTracker(std::make_shared<SearchTracker>())
    , m_exchange()
{
    assert(m_logger);
    assert(m_spNode);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::ProviderRegistry::~ProviderRegistry()
{
    m_spNode->RemoveStreamHandler(ExchangeProtocol);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Status Discovery::ProviderRegistry::Announce(
    Overlay::ContentIdentifier const& identifier, PeerInfo const& local, std::stop_token token)
{
    Awaitable::LinkedStopSource source{ token, m_lifetime };
    if (m_readiness.Wait(source.GetToken()) != Awaitable::Result::Signaled) {
        return { StatusCode::Canceled, "the announcement was canceled before bootstrapping completed" };
    }

    // The exchange must be available before other peers can discover the local node through the provider record.
    m_spNode->SetStreamHandler(ExchangeProtocol, m_exchange.CreateResponder(local));

    auto const upDeadline = m_spDeadlines->Schedule(m_limits.provide, source.GetToken());
    auto const status = m_spNode->Provide(identifier, true, upDeadline->GetToken());
    switch (status) {
        case Overlay::OperationStatus::Success: {
            m_logger->info("Announced the local node as a provider of {}.", identifier);
            return {};
        }
        case Overlay::OperationStatus::Timeout: break;
        case Overlay::OperationStatus::Canceled: {
            if (upDeadline->Expired()) { break; }
            return { StatusCode::Canceled, "the announcement was canceled" };
        }
        case Overlay::OperationStatus::Failure: {
            m_logger->warn("The overlay failed to provide {}.", identifier);
            return { StatusCode::ProvideFailure, fmt::format("the overlay failed to provide {}", identifier) };
        }
    }

    m_logger->warn("Providing {} did not complete within {} ms.", identifier, m_limits.provide.count());
    return { 
        StatusCode::ProvideTimeout, 
        fmt::format("providing {} did not complete within {} ms", identifier, m_limits.provide.count())
    };
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<Discovery::PeerStream> Discovery::ProviderRegistry::FindPeers(
    Overlay::ContentIdentifier const& identifier, std::stop_token token)
{
    {
        Awaitable::LinkedStopSource source{ token, m_lifetime };
        if (m_readiness.Wait(source.GetToken()) != Awaitable::Result::Signaled) {
            return Status{ StatusCode::Canceled, "the search was canceled before bootstrapping completed" };
        }
    }

    // The search is released when the producer is destroyed, whether it ran to completion or never started. 
    auto const spTicket = m_spTracker->Acquire();

    // The producer may outlive the registry when the caller keeps the stream, everything it uses is captured by value.
    auto const producer = [
        logger = m_logger, spNode = m_spNode, spDeadlines = m_spDeadlines, spTicket,
        exchange = m_exchange, limits = m_limits, lifetime = m_lifetime, caller = token, identifier,
        self = m_spNode->GetIdentifier()
    ] (std::stop_token abandoned, PeerStream::Channel& channel) {
        Awaitable::LinkedStopSource source{ abandoned, caller, lifetime };
        auto const upDeadline = spDeadlines->Schedule(limits.search, source.GetToken());
        auto const stopped = upDeadline->GetToken();

        std::size_t delivered = 0;
        std::size_t const candidates = spNode->FindProviders(identifier, limits.providers, stopped,
            [&] (Overlay::ProviderRecord const& record) -> CallbackIteration {
                if (stopped.stop_requested()) { return CallbackIteration::Stop; }
                if (record.identifier == self) { return CallbackIteration::Continue; }
                if (record.addresses.empty()) {
                    logger->debug("Skipping provider {} without known addresses.", record.identifier);
                    return CallbackIteration::Continue;
                }

                auto const upStream = spNode->NewStream(record.identifier, ExchangeProtocol, stopped);
                if (!upStream) {
                    logger->warn("Failed to open an exchange stream to {}.", record.identifier);
                    return CallbackIteration::Continue;
                }

                std::optional<PeerInfo> optInfo;
                {
                    // Abandoning the search must unblock a pending read on the candidate's stream.
                    std::stop_callback reset(stopped, [&stream = *upStream] { stream.Reset(); });
                    optInfo = exchange.Request(*upStream);
                }

                if (!optInfo) { return CallbackIteration::Continue; }
                local::AppendObservedAddresses(*optInfo, record.addresses);

                if (!channel.Push(std::move(*optInfo), stopped)) { return CallbackIteration::Stop; }
                ++delivered;
                return CallbackIteration::Continue;
            });

        if (upDeadline->Expired()) {
            logger->debug("The search for providers of {} timed out.", identifier);
        }

        logger->debug("Delivered {} peer(s) of {} provider(s) found for {}.", delivered, candidates, identifier);
    };

    m_logger->debug("Searching for providers of {}.", identifier);
    return PeerStream{ m_limits.providers, producer };
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::ProviderRegistry::WaitForSearches()
{
    m_spTracker->Wait();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Discovery::ProviderRegistry::GetActiveSearches() const { return m_spTracker->GetActive(); }

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Discovery::ProviderRegistry::SearchTracker::Ticket>
Discovery::ProviderRegistry::SearchTracker::Acquire()
{
    return std::make_shared<Ticket>(shared_from_this());
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::ProviderRegistry::SearchTracker::Release()
{
    {
        std::scoped_lock lock(m_mutex);
        assert(m_active != 0);
        --m_active;
    }
    m_condition.notify_all();
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::ProviderRegistry::SearchTracker::Wait()
{
    std::unique_lock lock(m_mutex);
    m_condition.wait(lock, [this] { return m_active == 0; });
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Discovery::ProviderRegistry::SearchTracker::GetActive() const
{
    std::scoped_lock lock(m_mutex);
    return m_active;
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::ProviderRegistry::SearchTracker::Ticket::Ticket(std::shared_ptr<SearchTracker> const& spTracker)
    : m_spTracker(spTracker)
{
    std::scoped_lock lock(m_spTracker->m_mutex);
    ++m_spTracker->m_active;
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::ProviderRegistry::SearchTracker::Ticket::~Ticket()
{
    m_spTracker->Release();
}

//----------------------------------------------------------------------------------------------------------------------

void local::AppendObservedAddresses(Discovery::PeerInfo& info, Overlay::AddressList const& observed)
{
    for (auto const& address : observed) {
        auto const optAddress = Overlay::Multiaddress::Parse(address);
        if (!optAddress) { continue; }
        if (auto optIPv4 = optAddress->GetIPv4(); optIPv4) { info.addresses.emplace_back(std::move(*optIPv4)); }
    }
}

//----------------------------------------------------------------------------------------------------------------------
