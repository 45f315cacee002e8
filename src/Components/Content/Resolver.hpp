//----------------------------------------------------------------------------------------------------------------------
// File: Resolver.hpp
// Description: Fetches the startup artifacts of a published network from the overlay.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "NetworkInfo.hpp"
#include "Components/Discovery/Status.hpp"
#include "Components/Overlay/OverlayTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <istream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayNode;
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Content {
//----------------------------------------------------------------------------------------------------------------------

class Resolver;

[[nodiscard]] std::string CreateArtifactPath(Overlay::ContentIdentifier const& identifier, std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
} // Content namespace
//----------------------------------------------------------------------------------------------------------------------

class Content::Resolver final
{
public:
    explicit Resolver(std::shared_ptr<IOverlayNode> const& spNode);

    // Note: No partial result is returned, a missing artifact fails the resolution. 
    [[nodiscard]] Discovery::Result<NetworkInfo> Resolve(
        Overlay::ContentIdentifier const& identifier, std::stop_token token = {}) const;

private:
    [[nodiscard]] Discovery::Result<std::unique_ptr<std::istream>> Fetch(
        Overlay::ContentIdentifier const& identifier, std::string_view name, std::stop_token token) const;

    [[nodiscard]] Discovery::Result<NetworkInfo::Buffer> FetchBuffer(
        Overlay::ContentIdentifier const& identifier, std::string_view name, std::stop_token token) const;

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IOverlayNode> m_spNode;
};

//----------------------------------------------------------------------------------------------------------------------
