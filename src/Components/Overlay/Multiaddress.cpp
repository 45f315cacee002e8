//----------------------------------------------------------------------------------------------------------------------
// File: Multiaddress.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Multiaddress.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/ip/address.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <charconv>
#include <sstream>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::vector<std::string_view> Split(std::string_view uri);
[[nodiscard]] std::optional<std::uint16_t> ParsePort(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Wildcard {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view IPv4 = "0.0.0.0";
constexpr std::string_view IPv6 = "::";

//----------------------------------------------------------------------------------------------------------------------
} // Wildcard namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Loopback {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view IPv4 = "127.0.0.1";
constexpr std::string_view IPv6 = "::1";

//----------------------------------------------------------------------------------------------------------------------
} // Loopback namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList Overlay::CreateWildcardListeners(std::uint16_t port)
{
    return {
        "/" + std::string{ Protocol::IPv4 } + "/" + std::string{ Wildcard::IPv4 } + "/tcp/" + std::to_string(port),
        "/" + std::string{ Protocol::IPv6 } + "/" + std::string{ Wildcard::IPv6 } + "/tcp/" + std::to_string(port),
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::Multiaddress> Overlay::Multiaddress::Parse(std::string_view uri)
{
    auto const components = local::Split(uri);
    if (components.size() < 2 || components.size() % 2 != 0) { return {}; }

    Multiaddress address;

    // The first component pair must identify the network host of the address. 
    auto const network = components[0];
    auto const host = components[1];
    boost::system::error_code error;
    if (network == Protocol::IPv4) {
        boost::asio::ip::make_address_v4(std::string{ host }, error);
        address.m_network = Network::IPv4;
    } else if (network == Protocol::IPv6) {
        boost::asio::ip::make_address_v6(std::string{ host }, error);
        address.m_network = Network::IPv6;
    } else if (network == Protocol::DNS4 || network == Protocol::DNS6) {
        address.m_network = (network == Protocol::DNS4) ? Network::DNS4 : Network::DNS6;
    } else {
        return {};
    }

    if (error || host.empty()) { return {}; }
    address.m_host = host;

    for (std::size_t idx = 2; idx < components.size(); idx += 2) {
        auto const protocol = components[idx];
        auto const value = components[idx + 1];
        if (protocol == Protocol::TCP || protocol == Protocol::UDP) {
            if (address.m_optTransport || address.m_optPeer) { return {}; } // Transports must precede the peer. 
            address.m_optTransport = (protocol == Protocol::TCP) ? Transport::TCP : Transport::UDP;
            if (address.m_optPort = local::ParsePort(value); !address.m_optPort) { return {}; }
        } else if (protocol == Protocol::P2P || protocol == Protocol::IPFS) {
            if (address.m_optPeer || value.empty()) { return {}; }
            address.m_optPeer = PeerIdentifier{ value };
        } else {
            return {};
        }
    }

    address.Rebuild();
    return address;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Overlay::Multiaddress::GetUri() const { return m_uri; }

//----------------------------------------------------------------------------------------------------------------------

Overlay::Multiaddress::Network Overlay::Multiaddress::GetNetwork() const { return m_network; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Overlay::Multiaddress::GetHost() const { return m_host; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Overlay::Multiaddress::GetIPv4() const
{
    if (m_network != Network::IPv4) { return {}; }
    return m_host;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::Multiaddress::Transport> Overlay::Multiaddress::GetTransport() const { return m_optTransport; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint16_t> Overlay::Multiaddress::GetPort() const { return m_optPort; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::PeerIdentifier> const& Overlay::Multiaddress::GetPeerIdentifier() const { return m_optPeer; }

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Multiaddress::IsWildcard() const
{
    switch (m_network) {
        case Network::IPv4: return m_host == Wildcard::IPv4;
        case Network::IPv6: return m_host == Wildcard::IPv6;
        default: return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::Multiaddress Overlay::Multiaddress::WithLoopbackHost() const
{
    if (!IsWildcard()) { return *this; }
    Multiaddress address = *this;
    address.m_host = (m_network == Network::IPv4) ? Loopback::IPv4 : Loopback::IPv6;
    address.Rebuild();
    return address;
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::Multiaddress Overlay::Multiaddress::WithPeerIdentifier(PeerIdentifier const& identifier) const
{
    Multiaddress address = *this;
    address.m_optPeer = identifier;
    address.Rebuild();
    return address;
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::Multiaddress Overlay::Multiaddress::WithoutPeerIdentifier() const
{
    Multiaddress address = *this;
    address.m_optPeer.reset();
    address.Rebuild();
    return address;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Multiaddress::operator==(Multiaddress const& other) const { return m_uri == other.m_uri; }

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Multiaddress::Rebuild()
{
    // Note: The canonical form always uses the p2p component name, the legacy ipfs name is only accepted as input. 
    std::ostringstream oss;
    switch (m_network) {
        case Network::IPv4: oss << "/" << Protocol::IPv4; break;
        case Network::IPv6: oss << "/" << Protocol::IPv6; break;
        case Network::DNS4: oss << "/" << Protocol::DNS4; break;
        case Network::DNS6: oss << "/" << Protocol::DNS6; break;
    }
    oss << "/" << m_host;
    if (m_optTransport) {
        oss << "/" << ((*m_optTransport == Transport::TCP) ? Protocol::TCP : Protocol::UDP) << "/" << *m_optPort;
    }
    if (m_optPeer) { oss << "/" << Protocol::P2P << "/" << *m_optPeer; }
    m_uri = oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string_view> local::Split(std::string_view uri)
{
    std::vector<std::string_view> components;
    if (uri.empty() || uri.front() != '/') { return components; }

    uri.remove_prefix(1);
    while (!uri.empty()) {
        auto const position = uri.find('/');
        components.emplace_back(uri.substr(0, position));
        if (position == std::string_view::npos) { break; }
        uri.remove_prefix(position + 1);
    }

    return components;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint16_t> local::ParsePort(std::string_view value)
{
    std::uint16_t port = 0;
    auto const [end, error] = std::from_chars(value.data(), value.data() + value.size(), port);
    if (error != std::errc{} || end != value.data() + value.size()) { return {}; }
    return port;
}

//----------------------------------------------------------------------------------------------------------------------
