//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The tunable options of a discovery server and their JSON representation.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Options;

using BootstrapList = std::vector<std::string>;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Options final
{
public:
    //------------------------------------------------------------------------------------------------------------------
    // JSON Schema:
    // "discovery": {
    //     "root": Optional String,
    //     "port": Optional Integer,
    //     "bootstraps": Optional [String],
    //     "connection_timeout": Optional Integer (milliseconds)
    // },
    // "peer": {
    //     "p2p_port": Optional Integer
    // }
    //------------------------------------------------------------------------------------------------------------------
    struct Symbols
    {
        static constexpr std::string_view Discovery = "discovery";
        static constexpr std::string_view Root = "root";
        static constexpr std::string_view Port = "port";
        static constexpr std::string_view Bootstraps = "bootstraps";
        static constexpr std::string_view ConnectionTimeout = "connection_timeout";
        static constexpr std::string_view Peer = "peer";
        static constexpr std::string_view PeerToPeerPort = "p2p_port";
    };

    Options();
    explicit Options(std::filesystem::path const& root);

    [[nodiscard]] bool operator==(Options const& other) const = default;

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::filesystem::path const& GetRoot() const;
    [[nodiscard]] std::uint16_t GetPort() const;
    [[nodiscard]] BootstrapList const& GetBootstraps() const;
    [[nodiscard]] std::chrono::milliseconds GetConnectionTimeout() const;
    [[nodiscard]] std::uint16_t GetPeerToPeerPort() const;

    void SetRoot(std::filesystem::path const& root);
    void SetPort(std::uint16_t port);
    void SetBootstraps(BootstrapList const& bootstraps);
    void SetConnectionTimeout(std::chrono::milliseconds timeout);
    void SetPeerToPeerPort(std::uint16_t port);

private:
    [[nodiscard]] DeserializationResult MergeDiscovery(boost::json::object const& json);
    [[nodiscard]] DeserializationResult MergePeer(boost::json::object const& json);

    std::filesystem::path m_root;
    std::uint16_t m_port;
    BootstrapList m_bootstraps;
    std::chrono::milliseconds m_connectionTimeout;
    std::uint16_t m_p2pPort;
};

//----------------------------------------------------------------------------------------------------------------------
