//----------------------------------------------------------------------------------------------------------------------
// File: PeerExchange.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PeerExchange.hpp"
#include "Interfaces/OverlayStream.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t ReadChunkSize = 1024;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerExchange::PeerExchange()
    : m_logger(spdlog::get(Logger::Name::Exchange.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::StreamHandler Discovery::PeerExchange::CreateResponder(PeerInfo const& local) const
{
    return [exchange = *this, local] (std::unique_ptr<IOverlayStream>&& upStream) {
        if (!upStream) { return; }
        [[maybe_unused]] bool const responded = exchange.Respond(*upStream, local);
    };
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::PeerExchange::Respond(IOverlayStream& stream, PeerInfo const& local) const
{
    auto const encoded = local.Encode();
    std::span<std::uint8_t const> const buffer{ reinterpret_cast<std::uint8_t const*>(encoded.data()), encoded.size() };

    bool const written = stream.Write(buffer);
    stream.Close();

    if (!written) {
        m_logger->warn("Failed to send the peer info to {}.", stream.GetRemoteIdentifier());
        return false;
    }

    m_logger->debug("Sent the peer info to {}.", stream.GetRemoteIdentifier());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::PeerInfo> Discovery::PeerExchange::Request(IOverlayStream& stream) const
{
    std::string received;
    std::array<std::uint8_t, local::ReadChunkSize> chunk;

    // A single record is expected, reading stops at the record delimiter or when the responder closes the stream. 
    while (received.find('\n') == std::string::npos) {
        auto const optRead = stream.Read(chunk);
        if (!optRead) {
            m_logger->warn("The peer info exchange with {} was interrupted.", stream.GetRemoteIdentifier());
            return {};
        }

        if (*optRead == 0) { break; }
        received.append(reinterpret_cast<char const*>(chunk.data()), *optRead);

        if (received.size() > PeerInfo::EncodedSizeLimit) {
            m_logger->warn("The peer info sent by {} exceeded the size limit.", stream.GetRemoteIdentifier());
            stream.Reset();
            return {};
        }
    }

    stream.Close();

    auto optInfo = PeerInfo::Decode(std::string_view{ received }.substr(0, received.find('\n')));
    if (!optInfo) {
        m_logger->warn("Failed to decode the peer info sent by {}.", stream.GetRemoteIdentifier());
        return {};
    }

    return optInfo;
}

//----------------------------------------------------------------------------------------------------------------------
