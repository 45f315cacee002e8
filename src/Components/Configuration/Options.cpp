//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Components/Overlay/Multiaddress.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <limits>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::int64_t> GetInteger(boost::json::value const& value);
[[nodiscard]] std::optional<std::uint16_t> GetPort(boost::json::value const& value);
[[nodiscard]] std::string_view ToStringView(boost::json::string const& value);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Options()
    : m_root()
    , m_port(Defaults::OverlayPort)
    , m_bootstraps(Defaults::BootstrapPeers.begin(), Defaults::BootstrapPeers.end())
    , m_connectionTimeout(Defaults::ConnectionTimeout)
    , m_p2pPort(Defaults::PeerToPeerPort)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Options(std::filesystem::path const& root)
    : Options()
{
    m_root = root;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Merge(boost::json::object const& json)
{
    // Each section is optional, omitted sections and fields keep their current values. 
    if (auto const itr = json.find(Symbols::Discovery); itr != json.end()) {
        if (!itr->value().is_object()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", Symbols::Discovery) };
        }
        if (auto const status = MergeDiscovery(itr->value().get_object()); status.first != StatusCode::Success) {
            return status;
        }
    }

    if (auto const itr = json.find(Symbols::Peer); itr != json.end()) {
        if (!itr->value().is_object()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", Symbols::Peer) };
        }
        if (auto const status = MergePeer(itr->value().get_object()); status.first != StatusCode::Success) {
            return status;
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Write(boost::json::object& json) const
{
    boost::json::array bootstraps;
    for (auto const& bootstrap : m_bootstraps) { bootstraps.emplace_back(boost::json::string{ bootstrap }); }

    boost::json::object discovery;
    discovery[Symbols::Root] = m_root.string();
    discovery[Symbols::Port] = m_port;
    discovery[Symbols::Bootstraps] = std::move(bootstraps);
    discovery[Symbols::ConnectionTimeout] = m_connectionTimeout.count();
    json[Symbols::Discovery] = std::move(discovery);

    boost::json::object peer;
    peer[Symbols::PeerToPeerPort] = m_p2pPort;
    json[Symbols::Peer] = std::move(peer);

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::AreOptionsAllowable() const
{
    if (m_root.empty()) {
        return { StatusCode::InputError, CreateInvalidValueMessage(Symbols::Discovery, Symbols::Root) };
    }

    if (m_port == 0) {
        return { StatusCode::InputError, CreateValueRangeMessage(1, 65535, Symbols::Discovery, Symbols::Port) };
    }

    for (std::size_t idx = 0; idx < m_bootstraps.size(); ++idx) {
        if (!Overlay::Multiaddress::Parse(m_bootstraps[idx])) {
            return {
                StatusCode::InputError,
                CreateInvalidValueInArrayMessage(idx, Symbols::Discovery, Symbols::Bootstraps)
            };
        }
    }

    if (m_connectionTimeout <= std::chrono::milliseconds::zero()) {
        return { StatusCode::InputError, CreateInvalidValueMessage(Symbols::Discovery, Symbols::ConnectionTimeout) };
    }

    if (m_p2pPort == 0) {
        return { StatusCode::InputError, CreateValueRangeMessage(1, 65535, Symbols::Peer, Symbols::PeerToPeerPort) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Options::GetRoot() const { return m_root; }

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Configuration::Options::GetPort() const { return m_port; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::BootstrapList const& Configuration::Options::GetBootstraps() const { return m_bootstraps; }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::milliseconds Configuration::Options::GetConnectionTimeout() const { return m_connectionTimeout; }

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Configuration::Options::GetPeerToPeerPort() const { return m_p2pPort; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::SetRoot(std::filesystem::path const& root) { m_root = root; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::SetPort(std::uint16_t port) { m_port = port; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::SetBootstraps(BootstrapList const& bootstraps) { m_bootstraps = bootstraps; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::SetConnectionTimeout(std::chrono::milliseconds timeout) { m_connectionTimeout = timeout; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::SetPeerToPeerPort(std::uint16_t port) { m_p2pPort = port; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::MergeDiscovery(boost::json::object const& json)
{
    if (auto const itr = json.find(Symbols::Root); itr != json.end()) {
        if (!itr->value().is_string()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("string", Symbols::Discovery, Symbols::Root)
            };
        }
        auto const root = local::ToStringView(itr->value().get_string());
        if (root.empty()) {
            return { StatusCode::InputError, CreateInvalidValueMessage(Symbols::Discovery, Symbols::Root) };
        }
        m_root = root;
    }

    if (auto const itr = json.find(Symbols::Port); itr != json.end()) {
        if (!local::GetInteger(itr->value())) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("integer", Symbols::Discovery, Symbols::Port)
            };
        }
        auto const optPort = local::GetPort(itr->value());
        if (!optPort) {
            return { StatusCode::InputError, CreateValueRangeMessage(1, 65535, Symbols::Discovery, Symbols::Port) };
        }
        m_port = *optPort;
    }

    if (auto const itr = json.find(Symbols::Bootstraps); itr != json.end()) {
        if (!itr->value().is_array()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("array", Symbols::Discovery, Symbols::Bootstraps)
            };
        }

        BootstrapList bootstraps;
        auto const& array = itr->value().get_array();
        for (std::size_t idx = 0; idx < array.size(); ++idx) {
            if (!array[idx].is_string()) {
                return {
                    StatusCode::DecodeError,
                    CreateInvalidValueInArrayMessage(idx, Symbols::Discovery, Symbols::Bootstraps)
                };
            }

            auto const bootstrap = local::ToStringView(array[idx].get_string());
            if (!Overlay::Multiaddress::Parse(bootstrap)) {
                return {
                    StatusCode::InputError,
                    CreateInvalidValueInArrayMessage(idx, Symbols::Discovery, Symbols::Bootstraps)
                };
            }
            bootstraps.emplace_back(bootstrap);
        }
        m_bootstraps = std::move(bootstraps);
    }

    if (auto const itr = json.find(Symbols::ConnectionTimeout); itr != json.end()) {
        auto const optTimeout = local::GetInteger(itr->value());
        if (!optTimeout) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("integer", Symbols::Discovery, Symbols::ConnectionTimeout)
            };
        }
        if (*optTimeout <= 0) {
            return {
                StatusCode::InputError,
                CreateInvalidValueMessage(Symbols::Discovery, Symbols::ConnectionTimeout)
            };
        }
        m_connectionTimeout = std::chrono::milliseconds{ *optTimeout };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::MergePeer(boost::json::object const& json)
{
    if (auto const itr = json.find(Symbols::PeerToPeerPort); itr != json.end()) {
        if (!local::GetInteger(itr->value())) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("integer", Symbols::Peer, Symbols::PeerToPeerPort)
            };
        }
        auto const optPort = local::GetPort(itr->value());
        if (!optPort) {
            return {
                StatusCode::InputError,
                CreateValueRangeMessage(1, 65535, Symbols::Peer, Symbols::PeerToPeerPort)
            };
        }
        m_p2pPort = *optPort;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::int64_t> local::GetInteger(boost::json::value const& value)
{
    if (value.is_int64()) { return value.get_int64(); }
    if (value.is_uint64() && value.get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(value.get_uint64());
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint16_t> local::GetPort(boost::json::value const& value)
{
    auto const optValue = GetInteger(value);
    if (!optValue || *optValue < 1 || *optValue > std::numeric_limits<std::uint16_t>::max()) { return {}; }
    return static_cast<std::uint16_t>(*optValue);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view local::ToStringView(boost::json::string const& value)
{
    return std::string_view{ value.data(), value.size() };
}

//----------------------------------------------------------------------------------------------------------------------
