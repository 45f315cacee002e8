//----------------------------------------------------------------------------------------------------------------------
// File: PeerStream.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PeerStream.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerStream::PeerStream(std::size_t capacity, Producer const& producer)
    : m_spChannel(std::make_shared<Channel>(capacity))
    , m_producer([spChannel = m_spChannel, producer] (std::stop_token token) {
        producer(token, *spChannel);
        spChannel->Close();
    })
{
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerStream::~PeerStream()
{
    Cancel(); // Note: The producer is joined when the thread is destroyed. 
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::PeerInfo> Discovery::PeerStream::Next(std::stop_token token)
{
    if (!m_spChannel) { return {}; }
    return m_spChannel->Pop(token);
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::PeerStream::Cancel()
{
    if (m_producer.joinable()) { m_producer.request_stop(); }
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::PeerStream::Finished() const { return !m_spChannel || m_spChannel->Drained(); }

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerStream::Iterator Discovery::PeerStream::begin() { return Iterator{ this }; }

//----------------------------------------------------------------------------------------------------------------------

std::default_sentinel_t Discovery::PeerStream::end() const { return std::default_sentinel; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerStream::Channel::Channel(std::size_t capacity)
    : m_mutex()
    , m_condition()
    , m_queue()
    , m_capacity(std::max<std::size_t>(capacity, 1))
    , m_delivered(0)
    , m_closed(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::PeerStream::Channel::Push(PeerInfo&& info, std::stop_token token)
{
    std::unique_lock lock(m_mutex);
    bool const writable = m_condition.wait(lock, token, [this] { return m_closed || m_queue.size() < m_capacity; });
    if (!writable || m_closed) { return false; }

    m_queue.emplace_back(std::move(info));
    lock.unlock();
    m_condition.notify_all();
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Discovery::PeerInfo> Discovery::PeerStream::Channel::Pop(std::stop_token token)
{
    std::unique_lock lock(m_mutex);
    bool const readable = m_condition.wait(lock, token, [this] { return m_closed || !m_queue.empty(); });
    if (!readable || m_queue.empty()) { return {}; }

    auto info = std::move(m_queue.front());
    m_queue.pop_front();
    ++m_delivered;
    lock.unlock();
    m_condition.notify_all();
    return info;
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::PeerStream::Channel::Close()
{
    {
        std::scoped_lock lock(m_mutex);
        m_closed = true;
    }
    m_condition.notify_all();
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::PeerStream::Channel::Drained() const
{
    std::scoped_lock lock(m_mutex);
    return m_closed && m_queue.empty();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Discovery::PeerStream::Channel::Delivered() const
{
    std::scoped_lock lock(m_mutex);
    return m_delivered;
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerStream::Iterator::Iterator(PeerStream* pStream)
    : m_pStream(pStream)
    , m_optCurrent()
{
    assert(m_pStream);
    m_optCurrent = m_pStream->Next();
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerInfo const& Discovery::PeerStream::Iterator::operator*() const { return *m_optCurrent; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerInfo const* Discovery::PeerStream::Iterator::operator->() const { return &*m_optCurrent; }

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerStream::Iterator& Discovery::PeerStream::Iterator::operator++()
{
    if (m_pStream) { m_optCurrent = m_pStream->Next(); }
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::PeerStream::Iterator::operator++(int) { ++*this; }

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::PeerStream::Iterator::operator==(std::default_sentinel_t) const { return !m_optCurrent.has_value(); }

//----------------------------------------------------------------------------------------------------------------------
