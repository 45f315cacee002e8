//----------------------------------------------------------------------------------------------------------------------
// File: Fabric.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Fabric.hpp"
#include "Node.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <condition_variable>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsSameEndpoint(Overlay::Multiaddress const& lhs, Overlay::Multiaddress const& rhs);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Overlay::Loopback::Fabric::Fabric()
    : m_mutex()
    , m_online()
    , m_known()
    , m_providers()
    , m_holders()
    , m_latency(std::chrono::milliseconds::zero())
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Fabric::Register(
    PeerIdentifier const& identifier, AddressList const& addresses, std::weak_ptr<Node> const& wpNode)
{
    Entry entry{ wpNode, {} };
    for (auto const& address : addresses) {
        auto optAddress = Multiaddress::Parse(address);
        if (!optAddress) { return false; }
        entry.addresses.emplace_back(optAddress->WithLoopbackHost());
    }

    std::scoped_lock lock(m_mutex);
    if (m_online.contains(identifier)) { return false; }

    // Two nodes may not listen on the same endpoint. 
    for (auto const& [other, registered] : m_online) {
        for (auto const& address : entry.addresses) {
            auto const matches = [&address] (auto const& candidate) {
                return local::IsSameEndpoint(address, candidate);
            };
            if (std::ranges::any_of(registered.addresses, matches)) { return false; }
        }
    }

    AddressList known;
    for (auto const& address : entry.addresses) { known.emplace_back(address.GetUri()); }
    m_known[identifier] = std::move(known);
    m_online.emplace(identifier, std::move(entry));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Fabric::Unregister(PeerIdentifier const& identifier)
{
    std::scoped_lock lock(m_mutex);
    m_online.erase(identifier);
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Overlay::Loopback::Node> Overlay::Loopback::Fabric::Find(PeerIdentifier const& identifier) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_online.find(identifier); itr != m_online.end()) { return itr->second.wpNode.lock(); }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Overlay::Loopback::Node> Overlay::Loopback::Fabric::Resolve(Multiaddress const& address) const
{
    auto const dialable = address.WithLoopbackHost();

    std::shared_lock lock(m_mutex);
    for (auto const& [identifier, entry] : m_online) {
        auto const matches = [&dialable] (auto const& candidate) { return local::IsSameEndpoint(dialable, candidate); };
        if (std::ranges::any_of(entry.addresses, matches)) {
            // An address naming a peer must name the peer listening on the endpoint. 
            auto const& optPeer = address.GetPeerIdentifier();
            if (optPeer && *optPeer != identifier) { return nullptr; }
            return entry.wpNode.lock();
        }
    }

    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::AddressList> Overlay::Loopback::Fabric::GetKnownAddresses(PeerIdentifier const& identifier) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_known.find(identifier); itr != m_known.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Overlay::Loopback::Fabric::OnlineCount() const
{
    std::shared_lock lock(m_mutex);
    return m_online.size();
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Fabric::AddProvider(ContentIdentifier const& content, PeerIdentifier const& provider)
{
    std::scoped_lock lock(m_mutex);
    auto& providers = m_providers[content];
    if (std::ranges::find(providers, provider) == providers.end()) { providers.emplace_back(provider); }
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Overlay::PeerIdentifier> Overlay::Loopback::Fabric::GetProviders(ContentIdentifier const& content) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_providers.find(content); itr != m_providers.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Fabric::AddHolder(ContentIdentifier const& content, PeerIdentifier const& holder)
{
    std::scoped_lock lock(m_mutex);
    m_holders[content].emplace(holder);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<Overlay::PeerIdentifier> Overlay::Loopback::Fabric::GetHolders(ContentIdentifier const& content) const
{
    std::shared_lock lock(m_mutex);
    if (auto const itr = m_holders.find(content); itr != m_holders.end()) {
        return { itr->second.begin(), itr->second.end() };
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Fabric::SetLatency(std::chrono::milliseconds latency)
{
    std::scoped_lock lock(m_mutex);
    m_latency = latency;
}

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Overlay::Loopback::Fabric::GetLatency() const
{
    std::shared_lock lock(m_mutex);
    return m_latency;
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::OperationStatus Overlay::Loopback::Fabric::SimulateLatency(
    std::chrono::milliseconds deadline, std::stop_token token) const
{
    auto const latency = GetLatency();
    auto const wait = std::min(latency, deadline);
    if (wait > std::chrono::milliseconds::zero()) {
        std::mutex mutex;
        std::condition_variable_any condition;
        std::unique_lock lock(mutex);
        condition.wait_for(lock, token, wait, [] { return false; });
    }

    if (token.stop_requested()) { return OperationStatus::Canceled; }
    if (latency >= deadline) { return OperationStatus::Timeout; }
    return OperationStatus::Success;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsSameEndpoint(Overlay::Multiaddress const& lhs, Overlay::Multiaddress const& rhs)
{
    return lhs.GetNetwork() == rhs.GetNetwork() && lhs.GetHost() == rhs.GetHost() &&
        lhs.GetTransport() == rhs.GetTransport() && lhs.GetPort() == rhs.GetPort();
}

//----------------------------------------------------------------------------------------------------------------------
