//----------------------------------------------------------------------------------------------------------------------
// File: PeerExchange.hpp
// Description: The peer info exchange protocol. Opening a stream on the protocol is the request, the responder writes 
// a single JSON encoded peer info record and closes the stream.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "PeerInfo.hpp"
#include "Components/Overlay/OverlayTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayStream;
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class PeerExchange;

// Note: Incompatible changes to the exchange must be introduced under a new protocol identifier.
constexpr std::string_view ExchangeProtocol = "/chainkit/0.1.0";

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::PeerExchange final
{
public:
    PeerExchange();

    [[nodiscard]] Overlay::StreamHandler CreateResponder(PeerInfo const& local) const;
    [[nodiscard]] bool Respond(IOverlayStream& stream, PeerInfo const& local) const;
    [[nodiscard]] std::optional<PeerInfo> Request(IOverlayStream& stream) const;

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
