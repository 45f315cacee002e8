//----------------------------------------------------------------------------------------------------------------------
// File: PeerStream.hpp
// Description: A lazily produced, finite sequence of discovered peers. The sequence is fed by a single producer task 
// through a bounded queue and can not be restarted. Destroying or canceling the stream stops the producer. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "PeerInfo.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class PeerStream;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::PeerStream final
{
public:
    class Channel;
    class Iterator;

    // Note: The producer runs on its own thread. The channel is closed when the producer returns. 
    using Producer = std::function<void(std::stop_token token, Channel& channel)>;

    PeerStream(std::size_t capacity, Producer const& producer);
    ~PeerStream();

    PeerStream(PeerStream&& other) = default;
    PeerStream& operator=(PeerStream&& other) = default;
    PeerStream(PeerStream const& other) = delete;
    PeerStream& operator=(PeerStream const& other) = delete;

    // Note: Blocks until a peer is available, the sequence has ended, or the token has been stopped. 
    [[nodiscard]] std::optional<PeerInfo> Next(std::stop_token token = {});

    void Cancel();
    [[nodiscard]] bool Finished() const;

    [[nodiscard]] Iterator begin();
    [[nodiscard]] std::default_sentinel_t end() const;

private:
    std::shared_ptr<Channel> m_spChannel;
    std::jthread m_producer;
};

//----------------------------------------------------------------------------------------------------------------------

class Discovery::PeerStream::Channel
{
public:
    explicit Channel(std::size_t capacity);

    // Note: Blocks while the queue is full. Returns false if the token has been stopped before the peer was queued.
    [[nodiscard]] bool Push(PeerInfo&& info, std::stop_token token);
    [[nodiscard]] std::optional<PeerInfo> Pop(std::stop_token token);

    void Close();
    [[nodiscard]] bool Drained() const;
    [[nodiscard]] std::size_t Delivered() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable_any m_condition;
    std::deque<PeerInfo> m_queue;
    std::size_t const m_capacity;
    std::size_t m_delivered;
    bool m_closed;
};

//----------------------------------------------------------------------------------------------------------------------

class Discovery::PeerStream::Iterator
{
public:
    using iterator_category = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = PeerInfo;

    Iterator() = default;
    explicit Iterator(PeerStream* pStream);

    [[nodiscard]] PeerInfo const& operator*() const;
    [[nodiscard]] PeerInfo const* operator->() const;
    Iterator& operator++();
    void operator++(int);

    [[nodiscard]] bool operator==(std::default_sentinel_t) const;

private:
    PeerStream* m_pStream = nullptr;
    std::optional<PeerInfo> m_optCurrent;
};

//----------------------------------------------------------------------------------------------------------------------
