//----------------------------------------------------------------------------------------------------------------------
// File: Stream.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Stream.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/write.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <sys/socket.h>
//----------------------------------------------------------------------------------------------------------------------

Overlay::Loopback::Stream::Stream(boost::asio::io_context& context, PeerIdentifier const& remote)
    : m_remote(remote)
    , m_socket(context)
    , m_mutex()
    , m_closed(false)
    , m_reset(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::Loopback::Stream::~Stream()
{
    Close();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::Loopback::StreamPair> Overlay::Loopback::Stream::CreatePair(
    boost::asio::io_context& dialer, PeerIdentifier const& dialerIdentifier,
    boost::asio::io_context& listener, PeerIdentifier const& listenerIdentifier)
{
    // Each side refers to the identifier of the opposite peer. 
    auto upDialerSide = std::make_unique<Stream>(dialer, listenerIdentifier);
    auto upListenerSide = std::make_unique<Stream>(listener, dialerIdentifier);

    boost::system::error_code error;
    boost::asio::local::connect_pair(upDialerSide->m_socket, upListenerSide->m_socket, error);
    if (error) { return {}; }

    return StreamPair{ std::move(upDialerSide), std::move(upListenerSide) };
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::PeerIdentifier const& Overlay::Loopback::Stream::GetRemoteIdentifier() const { return m_remote; }

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::size_t> Overlay::Loopback::Stream::Read(std::span<std::uint8_t> buffer)
{
    if (m_reset || m_closed) { return {}; }

    boost::system::error_code error;
    auto const received = m_socket.read_some(boost::asio::buffer(buffer.data(), buffer.size()), error);

    // A reset shuts down the socket, which wakes a blocked read with an end of stream result. The reset flag is 
    // checked after the read to report the abort rather than a graceful close. 
    if (m_reset) { return {}; }
    if (error == boost::asio::error::eof) { return 0; }
    if (error) { return {}; }
    return received;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Stream::Write(std::span<std::uint8_t const> buffer)
{
    if (m_reset || m_closed) { return false; }

    boost::system::error_code error;
    boost::asio::write(m_socket, boost::asio::buffer(buffer.data(), buffer.size()), error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Stream::Close()
{
    std::scoped_lock lock(m_mutex);
    if (m_closed.exchange(true)) { return; }

    // Buffered data remains readable by the remote side, which observes the end of stream after draining it. 
    boost::system::error_code error;
    m_socket.shutdown(Socket::shutdown_both, error);
    m_socket.close(error);
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Stream::Reset()
{
    std::scoped_lock lock(m_mutex);
    if (m_closed || m_reset.exchange(true)) { return; }

    // Note: A reader may be blocked in the socket object on another thread, the descriptor is shut down directly so 
    // the object itself is left untouched. The descriptor is released by Close or the destructor. 
    ::shutdown(m_socket.native_handle(), SHUT_RDWR);
}

//----------------------------------------------------------------------------------------------------------------------
