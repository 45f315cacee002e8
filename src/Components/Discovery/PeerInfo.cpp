//----------------------------------------------------------------------------------------------------------------------
// File: PeerInfo.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PeerInfo.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

std::string Discovery::PeerInfo::Encode() const
{
    boost::json::array ips;
    for (auto const& address : addresses) { ips.emplace_back(boost::json::string{ address }); }

    boost::json::object json;
    json[Symbols::NodeIdentifier] = identifier;
    json[Symbols::Addresses] = std::move(ips);
    json[Symbols::PeerToPeerPort] = port;

    // Note: Records are newline terminated, a reader may stop at the delimiter rather than the end of stream. 
    auto encoded = boost::json::serialize(json);
    encoded.push_back('\n');
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::PeerInfo> Discovery::PeerInfo::Decode(std::string_view encoded)
{
    if (encoded.empty() || encoded.size() > EncodedSizeLimit) { return {}; }

    boost::json::error_code error;
    auto const json = boost::json::parse(encoded, error);
    if (error || !json.is_object()) { return {}; }

    auto const& object = json.get_object();
    PeerInfo info;

    // The node identifier is required, unknown fields are ignored.
    auto const pIdentifier = object.if_contains(Symbols::NodeIdentifier);
    if (!pIdentifier || !pIdentifier->is_string()) { return {}; }
    auto const& identifier = pIdentifier->get_string();
    info.identifier.assign(identifier.data(), identifier.size());

    if (auto const pAddresses = object.if_contains(Symbols::Addresses); pAddresses && !pAddresses->is_null()) {
        if (!pAddresses->is_array()) { return {}; }
        for (auto const& value : pAddresses->get_array()) {
            if (!value.is_string()) { return {}; }
            auto const& address = value.get_string();
            info.addresses.emplace_back(address.data(), address.size());
        }
    }

    if (auto const pPort = object.if_contains(Symbols::PeerToPeerPort); pPort) {
        constexpr auto Maximum = std::numeric_limits<std::int32_t>::max();
        constexpr auto Minimum = std::numeric_limits<std::int32_t>::min();
        if (pPort->is_int64() && pPort->get_int64() >= Minimum && pPort->get_int64() <= Maximum) {
            info.port = static_cast<std::int32_t>(pPort->get_int64());
        } else if (pPort->is_uint64() && pPort->get_uint64() <= static_cast<std::uint64_t>(Maximum)) {
            info.port = static_cast<std::int32_t>(pPort->get_uint64());
        } else {
            return {};
        }
    }

    return info;
}

//----------------------------------------------------------------------------------------------------------------------
