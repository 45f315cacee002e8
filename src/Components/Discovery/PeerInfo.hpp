//----------------------------------------------------------------------------------------------------------------------
// File: PeerInfo.hpp
// Description: The record a running node hands to a joining node: its consensus node identifier, the IP addresses it 
// may be reached on, and its consensus peer-to-peer port. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

struct PeerInfo
{
    struct Symbols
    {
        static constexpr std::string_view NodeIdentifier = "node_id";
        static constexpr std::string_view Addresses = "ips";
        static constexpr std::string_view PeerToPeerPort = "tendermint_p2p_port";
    };

    static constexpr std::size_t EncodedSizeLimit = 16 * 1024;

    [[nodiscard]] bool operator==(PeerInfo const& other) const = default;

    [[nodiscard]] std::string Encode() const;
    [[nodiscard]] static std::optional<PeerInfo> Decode(std::string_view encoded);

    std::string identifier;
    std::vector<std::string> addresses;
    std::int32_t port = 0;
};

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------
