//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.hpp
// Description: Bundles the startup artifacts of a network into a single content addressed unit. The identifier of the 
// unit is the network identifier.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Discovery/Status.hpp"
#include "Components/Overlay/OverlayTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayNode;
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Content {
//----------------------------------------------------------------------------------------------------------------------

class Publisher;

//----------------------------------------------------------------------------------------------------------------------
} // Content namespace
//----------------------------------------------------------------------------------------------------------------------

class Content::Publisher final
{
public:
    struct Artifacts
    {
        std::filesystem::path manifest;
        std::filesystem::path genesis;
        std::filesystem::path image;
    };

    explicit Publisher(std::shared_ptr<IOverlayNode> const& spNode);

    [[nodiscard]] Discovery::Result<Overlay::ContentIdentifier> Publish(Artifacts const& artifacts) const;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<IOverlayNode> m_spNode;
};

//----------------------------------------------------------------------------------------------------------------------
