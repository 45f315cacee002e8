//----------------------------------------------------------------------------------------------------------------------
// File: Resolver.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Resolver.hpp"
#include "Interfaces/OverlayNode.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

std::string Content::CreateArtifactPath(Overlay::ContentIdentifier const& identifier, std::string_view name)
{
    return fmt::format("/ipfs/{}/{}", identifier, name);
}

//----------------------------------------------------------------------------------------------------------------------

Content::Resolver::Resolver(std::shared_ptr<IOverlayNode> const& spNode)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_spNode(spNode)
{
    assert(m_logger);
    assert(m_spNode);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<Content::NetworkInfo> Content::Resolver::Resolve(
    Overlay::ContentIdentifier const& identifier, std::stop_token token) const
{
    auto manifest = FetchBuffer(identifier, Artifact::Manifest, token);
    if (auto const pStatus = std::get_if<Discovery::Status>(&manifest); pStatus) { return *pStatus; }

    auto genesis = FetchBuffer(identifier, Artifact::Genesis, token);
    if (auto const pStatus = std::get_if<Discovery::Status>(&genesis); pStatus) { return *pStatus; }

    auto image = Fetch(identifier, Artifact::Image, token);
    if (auto const pStatus = std::get_if<Discovery::Status>(&image); pStatus) { return *pStatus; }

    m_logger->debug("Resolved the network artifacts of {}.", identifier);
    return NetworkInfo{
        std::get<NetworkInfo::Buffer>(std::move(manifest)),
        std::get<NetworkInfo::Buffer>(std::move(genesis)),
        std::get<std::unique_ptr<std::istream>>(std::move(image))
    };
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<std::unique_ptr<std::istream>> Content::Resolver::Fetch(
    Overlay::ContentIdentifier const& identifier, std::string_view name, std::stop_token token) const
{
    auto upArtifact = m_spNode->Get(CreateArtifactPath(identifier, name), token);
    if (!upArtifact) {
        m_logger->warn("Unable to resolve the {} of {}.", name, identifier);
        return Discovery::Status{ 
            Discovery::StatusCode::ContentNotFound, fmt::format("the {} of {} was not found", name, identifier) };
    }

    return upArtifact;
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<Content::NetworkInfo::Buffer> Content::Resolver::FetchBuffer(
    Overlay::ContentIdentifier const& identifier, std::string_view name, std::stop_token token) const
{
    auto fetched = Fetch(identifier, name, token);
    if (auto const pStatus = std::get_if<Discovery::Status>(&fetched); pStatus) { return *pStatus; }

    auto const& upArtifact = std::get<std::unique_ptr<std::istream>>(fetched);
    auto optBuffer = FileUtils::ReadAll(*upArtifact);
    if (!optBuffer) {
        return Discovery::Status{
            Discovery::StatusCode::ContentNotFound, fmt::format("the {} of {} could not be read", name, identifier) };
    }

    return std::move(*optBuffer);
}

//----------------------------------------------------------------------------------------------------------------------
