//----------------------------------------------------------------------------------------------------------------------
// File: Stream.hpp
// Description: One side of a loopback overlay stream. Both sides are connected through a local stream socket pair.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Overlay/OverlayTypes.hpp"
#include "Interfaces/OverlayStream.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Overlay::Loopback {
//----------------------------------------------------------------------------------------------------------------------

class Stream;

using StreamPair = std::pair<std::unique_ptr<Stream>, std::unique_ptr<Stream>>;

//----------------------------------------------------------------------------------------------------------------------
} // Overlay::Loopback namespace
//----------------------------------------------------------------------------------------------------------------------

class Overlay::Loopback::Stream final : public IOverlayStream
{
public:
    using Socket = boost::asio::local::stream_protocol::socket;

    Stream(boost::asio::io_context& context, PeerIdentifier const& remote);
    ~Stream() override;

    Stream(Stream const& other) = delete;
    Stream& operator=(Stream const& other) = delete;

    // Note: The first stream is the dialer's side and the second stream is the listener's side. 
    [[nodiscard]] static std::optional<StreamPair> CreatePair(
        boost::asio::io_context& dialer, PeerIdentifier const& dialerIdentifier,
        boost::asio::io_context& listener, PeerIdentifier const& listenerIdentifier);

    // IOverlayStream {
    [[nodiscard]] virtual PeerIdentifier const& GetRemoteIdentifier() const override;
    [[nodiscard]] virtual std::optional<std::size_t> Read(std::span<std::uint8_t> buffer) override;
    [[nodiscard]] virtual bool Write(std::span<std::uint8_t const> buffer) override;
    virtual void Close() override;
    virtual void Reset() override;
    // } IOverlayStream

private:
    PeerIdentifier const m_remote;
    Socket m_socket;
    std::mutex m_mutex; // Note: Guards the socket's lifetime state, reads and writes are not serialized. 
    std::atomic_bool m_closed;
    std::atomic_bool m_reset;
};

//----------------------------------------------------------------------------------------------------------------------
