//----------------------------------------------------------------------------------------------------------------------
// File: Fabric.hpp
// Description: The substrate shared by the loopback overlay nodes of a process. The fabric tracks the online nodes and 
// their addresses, the provider records of the routing table, and the nodes holding published content.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Overlay/Multiaddress.hpp"
#include "Components/Overlay/OverlayTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stop_token>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Overlay::Loopback {
//----------------------------------------------------------------------------------------------------------------------

class Fabric;
class Node;

//----------------------------------------------------------------------------------------------------------------------
} // Overlay::Loopback namespace
//----------------------------------------------------------------------------------------------------------------------

class Overlay::Loopback::Fabric final
{
public:
    Fabric();

    Fabric(Fabric const& other) = delete;
    Fabric& operator=(Fabric const& other) = delete;

    // Note: Registration fails if the identifier is already online or one of the addresses is in use. 
    [[nodiscard]] bool Register(
        PeerIdentifier const& identifier, AddressList const& addresses, std::weak_ptr<Node> const& wpNode);
    void Unregister(PeerIdentifier const& identifier);

    [[nodiscard]] std::shared_ptr<Node> Find(PeerIdentifier const& identifier) const;
    [[nodiscard]] std::shared_ptr<Node> Resolve(Multiaddress const& address) const;
    [[nodiscard]] std::optional<AddressList> GetKnownAddresses(PeerIdentifier const& identifier) const;
    [[nodiscard]] std::size_t OnlineCount() const;

    void AddProvider(ContentIdentifier const& content, PeerIdentifier const& provider);
    [[nodiscard]] std::vector<PeerIdentifier> GetProviders(ContentIdentifier const& content) const;

    void AddHolder(ContentIdentifier const& content, PeerIdentifier const& holder);
    [[nodiscard]] std::vector<PeerIdentifier> GetHolders(ContentIdentifier const& content) const;

    // Simulated network latency applied to dials and provider announcements. 
    void SetLatency(std::chrono::milliseconds latency);
    [[nodiscard]] std::chrono::milliseconds GetLatency() const;

    // Note: Returns Timeout if the latency exceeds the deadline and Canceled if the token is stopped first. 
    [[nodiscard]] OperationStatus SimulateLatency(std::chrono::milliseconds deadline, std::stop_token token) const;

private:
    struct Entry
    {
        std::weak_ptr<Node> wpNode;
        std::vector<Multiaddress> addresses;
    };

    mutable std::shared_mutex m_mutex;
    std::unordered_map<PeerIdentifier, Entry> m_online;
    std::unordered_map<PeerIdentifier, AddressList> m_known; // Note: Addresses outlive the node's session. 
    std::unordered_map<ContentIdentifier, std::vector<PeerIdentifier>> m_providers;
    std::unordered_map<ContentIdentifier, std::set<PeerIdentifier>> m_holders;
    std::chrono::milliseconds m_latency;
};

//----------------------------------------------------------------------------------------------------------------------
