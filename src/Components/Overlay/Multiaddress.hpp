//----------------------------------------------------------------------------------------------------------------------
// File: Multiaddress.hpp
// Description: Parsing of the textual self-describing addresses used by the overlay 
// (e.g. /ip4/127.0.0.1/tcp/4001/p2p/QmPeer).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OverlayTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Overlay {
//----------------------------------------------------------------------------------------------------------------------

class Multiaddress;

//----------------------------------------------------------------------------------------------------------------------
namespace Protocol {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view IPv4 = "ip4";
constexpr std::string_view IPv6 = "ip6";
constexpr std::string_view DNS4 = "dns4";
constexpr std::string_view DNS6 = "dns6";
constexpr std::string_view TCP = "tcp";
constexpr std::string_view UDP = "udp";
constexpr std::string_view P2P = "p2p";
constexpr std::string_view IPFS = "ipfs"; // Note: Legacy alias of the p2p component. 

//----------------------------------------------------------------------------------------------------------------------
} // Protocol namespace
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] AddressList CreateWildcardListeners(std::uint16_t port);

//----------------------------------------------------------------------------------------------------------------------
} // Overlay namespace
//----------------------------------------------------------------------------------------------------------------------

class Overlay::Multiaddress
{
public:
    enum class Network : std::uint32_t { IPv4, IPv6, DNS4, DNS6 };
    enum class Transport : std::uint32_t { TCP, UDP };

    [[nodiscard]] static std::optional<Multiaddress> Parse(std::string_view uri);

    [[nodiscard]] std::string const& GetUri() const;
    [[nodiscard]] Network GetNetwork() const;
    [[nodiscard]] std::string const& GetHost() const;
    [[nodiscard]] std::optional<std::string> GetIPv4() const;
    [[nodiscard]] std::optional<Transport> GetTransport() const;
    [[nodiscard]] std::optional<std::uint16_t> GetPort() const;
    [[nodiscard]] std::optional<PeerIdentifier> const& GetPeerIdentifier() const;
    [[nodiscard]] bool IsWildcard() const;

    // Note: Produces a dialable form of the address (i.e. wildcard hosts are replaced with loopback hosts).
    [[nodiscard]] Multiaddress WithLoopbackHost() const;
    [[nodiscard]] Multiaddress WithPeerIdentifier(PeerIdentifier const& identifier) const;
    [[nodiscard]] Multiaddress WithoutPeerIdentifier() const;

    [[nodiscard]] bool operator==(Multiaddress const& other) const;

private:
    Multiaddress() = default;
    void Rebuild();

    std::string m_uri;
    Network m_network = Network::IPv4;
    std::string m_host;
    std::optional<Transport> m_optTransport;
    std::optional<std::uint16_t> m_optPort;
    std::optional<PeerIdentifier> m_optPeer;
};

//----------------------------------------------------------------------------------------------------------------------
