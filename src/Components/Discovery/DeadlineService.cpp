//----------------------------------------------------------------------------------------------------------------------
// File: DeadlineService.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "DeadlineService.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/post.hpp>
//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Discovery::DeadlineService> Discovery::DeadlineService::Create()
{
    return std::shared_ptr<DeadlineService>(new DeadlineService());
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::DeadlineService::DeadlineService()
    : m_context()
    , m_guard(boost::asio::make_work_guard(m_context))
    , m_worker([this] { m_context.run(); })
{
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::DeadlineService::~DeadlineService()
{
    m_guard.reset();
    m_context.stop();
    if (m_worker.joinable()) { m_worker.join(); }
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<Discovery::Deadline> Discovery::DeadlineService::Schedule(
    std::chrono::milliseconds timeout, std::stop_token parent)
{
    auto spState = std::make_shared<Deadline::State>(parent);
    auto spTimer = std::make_shared<boost::asio::steady_timer>(m_context, timeout);

    // The handler only refers to the shared state, the deadline may be destroyed before the timer fires. 
    spTimer->async_wait([spState] (boost::system::error_code const& error) {
        if (error) { return; } // The timer was canceled. 
        spState->expired = true;
        spState->source.RequestStop();
    });

    return std::make_unique<Deadline>(shared_from_this(), spTimer, spState);
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::DeadlineService::Cancel(std::shared_ptr<boost::asio::steady_timer> const& spTimer)
{
    // Timers are only touched by the service's worker after being armed. 
    boost::asio::post(m_context, [spTimer] { spTimer->cancel(); });
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Deadline::Deadline(
    std::shared_ptr<DeadlineService> const& spService,
    std::shared_ptr<boost::asio::steady_timer> const& spTimer,
    std::shared_ptr<State> const& spState)
    : m_spService(spService)
    , m_spTimer(spTimer)
    , m_spState(spState)
{
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Deadline::~Deadline()
{
    m_spService->Cancel(m_spTimer);
}

//----------------------------------------------------------------------------------------------------------------------

std::stop_token Discovery::Deadline::GetToken() const { return m_spState->source.GetToken(); }

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Deadline::Expired() const { return m_spState->expired; }

//----------------------------------------------------------------------------------------------------------------------
