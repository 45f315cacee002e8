//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description: Default option values and the fixed limits of the discovery workflows.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB
constexpr std::string_view Version = "0.1.0";
constexpr std::string_view OverlayDirectory = "ipfs";
constexpr std::string_view PluginsDirectory = "plugins";

constexpr std::uint16_t OverlayPort = 4001;
constexpr std::uint16_t PeerToPeerPort = 26656;

constexpr auto ConnectionTimeout = std::chrono::milliseconds{ 15'000 };

// Note: The routing timeouts and the provider limit are enforced regardless of the caller's own deadline. 
constexpr auto ProvideTimeout = std::chrono::milliseconds{ 10'000 };
constexpr auto FindProvidersTimeout = std::chrono::milliseconds{ 10'000 };
constexpr std::size_t ProviderLimit = 10;

constexpr std::array<std::string_view, 5> BootstrapPeers = {
    "/ip4/104.131.131.82/tcp/4001/ipfs/QmaCpDMGvV2BGHeYERUEnRQAwe3N8SzbUtfsmvsqQLuvuJ",
    "/ip4/104.236.179.241/tcp/4001/ipfs/QmSoLPppuBtQSGwKDZT2M73ULpjvfd3aZ6ha4oFGL1KrGM",
    "/ip4/104.236.76.40/tcp/4001/ipfs/QmSoLV4Bbm51jM9C4gDYZQ9Cy3U6aXMJDAbzgu2fzaDs64",
    "/ip4/128.199.219.111/tcp/4001/ipfs/QmSoLSafTMBsPKadTEgaXctDQVcqN88CNLHXMkTNwMKPnu",
    "/ip4/178.62.158.247/tcp/4001/ipfs/QmSoLer265NRgSp2LA3dPaeykiS1J6DifTC88f5uVQKNAd",
};

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
