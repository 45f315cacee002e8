//----------------------------------------------------------------------------------------------------------------------
// File: OverlayNodeStub.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "OverlayNodeStub.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

OverlayNodeStub::OverlayNodeStub(Overlay::PeerIdentifier const& identifier)
    : m_identifier(identifier)
    , m_mutex()
    , m_condition()
    , m_locked(false)
    , m_initialized(false)
    , m_initializeResult(true)
    , m_opened(false)
    , m_online(false)
    , m_closed(0)
    , m_connectHangs(false)
    , m_provideBehavior(ProvideBehavior::Succeed)
    , m_listening()
    , m_connectResults()
    , m_handlers()
    , m_candidates()
    , m_events()
    , m_dialed()
    , m_streams()
{
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::IsLockedByOtherProcess(std::filesystem::path const&) const
{
    std::scoped_lock lock(m_mutex);
    return m_locked;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::AcquireRepository(std::filesystem::path const&)
{
    std::scoped_lock lock(m_mutex);
    return !m_locked;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::IsInitialized(std::filesystem::path const&) const
{
    std::scoped_lock lock(m_mutex);
    return m_initialized;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::Initialize(std::filesystem::path const&)
{
    std::scoped_lock lock(m_mutex);
    m_initialized = m_initializeResult;
    return m_initializeResult;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::Open(std::filesystem::path const&)
{
    std::scoped_lock lock(m_mutex);
    if (!m_initialized || m_opened) { return false; }
    m_opened = true;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::LoadPlugins(std::filesystem::path const&) { return true; }

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::SetListenAddresses(Overlay::AddressList const& addresses)
{
    std::scoped_lock lock(m_mutex);
    if (!m_opened) { return false; }
    m_listening = addresses;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::Online()
{
    std::scoped_lock lock(m_mutex);
    if (!m_opened || m_online) { return false; }
    m_online = true;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::Close()
{
    {
        std::scoped_lock lock(m_mutex);
        m_opened = false;
        m_online = false;
        m_handlers.clear();
        ++m_closed;
    }
    Record(Event::Close);
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::PeerIdentifier const& OverlayNodeStub::GetIdentifier() const { return m_identifier; }

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList OverlayNodeStub::GetListenAddresses() const
{
    std::scoped_lock lock(m_mutex);
    return m_listening;
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList OverlayNodeStub::GetAnnounceAddresses() const { return GetListenAddresses(); }

//----------------------------------------------------------------------------------------------------------------------

Overlay::OperationStatus OverlayNodeStub::Connect(
    std::string_view address, std::chrono::milliseconds, std::stop_token token)
{
    Record(Event::Connect);

    std::unique_lock lock(m_mutex);
    m_dialed.emplace_back(address);
    if (m_connectHangs) {
        m_condition.wait(lock, token, [] { return false; });
        return Overlay::OperationStatus::Canceled;
    }

    if (auto const itr = m_connectResults.find(address); itr != m_connectResults.end()) { return itr->second; }
    return Overlay::OperationStatus::Failure;
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<IOverlayStream> OverlayNodeStub::NewStream(
    Overlay::PeerIdentifier const& peer, std::string_view, std::stop_token token)
{
    if (token.stop_requested()) { return nullptr; }

    std::scoped_lock lock(m_mutex);
    auto const itr = std::ranges::find_if(m_candidates, [&peer] (auto const& candidate) {
        return candidate.identifier == peer;
    });

    if (itr == m_candidates.end() || itr->unreachable) { return nullptr; }

    auto upStream = std::make_unique<OverlayStreamStub>(peer, itr->reply, itr->behavior);
    m_streams.emplace_back(upStream->GetState());
    return upStream;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::SetStreamHandler(std::string_view protocol, Overlay::StreamHandler const& handler)
{
    {
        std::scoped_lock lock(m_mutex);
        m_handlers.insert_or_assign(std::string{ protocol }, handler);
    }
    Record(Event::SetStreamHandler);
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::RemoveStreamHandler(std::string_view protocol)
{
    std::scoped_lock lock(m_mutex);
    if (auto const itr = m_handlers.find(protocol); itr != m_handlers.end()) { m_handlers.erase(itr); }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::ContentIdentifier> OverlayNodeStub::Add(std::filesystem::path const&) { return {}; }

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<std::istream> OverlayNodeStub::Get(std::string_view, std::stop_token) { return nullptr; }

//----------------------------------------------------------------------------------------------------------------------

Overlay::OperationStatus OverlayNodeStub::Provide(Overlay::ContentIdentifier const&, bool, std::stop_token token)
{
    Record(Event::Provide);

    std::unique_lock lock(m_mutex);
    switch (m_provideBehavior) {
        case ProvideBehavior::Succeed: return Overlay::OperationStatus::Success;
        case ProvideBehavior::Fail: return Overlay::OperationStatus::Failure;
        case ProvideBehavior::Hang: {
            m_condition.wait(lock, token, [] { return false; });
            return Overlay::OperationStatus::Canceled;
        }
    }
    return Overlay::OperationStatus::Failure;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t OverlayNodeStub::FindProviders(
    Overlay::ContentIdentifier const&, std::size_t limit, std::stop_token token, Overlay::ProviderReader const& reader)
{
    Record(Event::FindProviders);

    std::vector<Candidate> candidates;
    {
        std::scoped_lock lock(m_mutex);
        candidates = m_candidates;
    }

    std::size_t found = 0;
    for (auto const& candidate : candidates) {
        if (found >= limit || token.stop_requested()) { break; }
        ++found;
        if (reader({ candidate.identifier, candidate.addresses }) == CallbackIteration::Stop) { break; }
    }

    return found;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::SetLocked(bool locked)
{
    std::scoped_lock lock(m_mutex);
    m_locked = locked;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::SetInitializeResult(bool result)
{
    std::scoped_lock lock(m_mutex);
    m_initializeResult = result;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::SetConnectResult(std::string const& address, Overlay::OperationStatus status)
{
    std::scoped_lock lock(m_mutex);
    m_connectResults.insert_or_assign(address, status);
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::SetConnectHangs(bool hangs)
{
    std::scoped_lock lock(m_mutex);
    m_connectHangs = hangs;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::SetProvideBehavior(ProvideBehavior behavior)
{
    std::scoped_lock lock(m_mutex);
    m_provideBehavior = behavior;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::SetCandidates(std::vector<Candidate> const& candidates)
{
    std::scoped_lock lock(m_mutex);
    m_candidates = candidates;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<OverlayNodeStub::Event> OverlayNodeStub::GetEvents() const
{
    std::scoped_lock lock(m_mutex);
    return m_events;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> OverlayNodeStub::GetDialed() const
{
    std::scoped_lock lock(m_mutex);
    return m_dialed;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::StreamHandler> OverlayNodeStub::GetStreamHandler(std::string_view protocol) const
{
    std::scoped_lock lock(m_mutex);
    if (auto const itr = m_handlers.find(protocol); itr != m_handlers.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::shared_ptr<OverlayStreamStub::State>> OverlayNodeStub::GetOpenedStreams() const
{
    std::scoped_lock lock(m_mutex);
    return m_streams;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::IsOnline() const
{
    std::scoped_lock lock(m_mutex);
    return m_online;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t OverlayNodeStub::GetCloseCount() const
{
    std::scoped_lock lock(m_mutex);
    return m_closed;
}

//----------------------------------------------------------------------------------------------------------------------

bool OverlayNodeStub::WaitForHangingRead(std::chrono::milliseconds timeout) const
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        for (auto const& spState : GetOpenedStreams()) {
            std::scoped_lock lock(spState->mutex);
            if (spState->reading) { return true; }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

void OverlayNodeStub::Record(Event event)
{
    std::scoped_lock lock(m_mutex);
    m_events.emplace_back(event);
}

//----------------------------------------------------------------------------------------------------------------------
