//----------------------------------------------------------------------------------------------------------------------
// File: DeadlineService.hpp
// Description: Enforces the server side deadlines of the routing operations. A deadline provides a stop token that is 
// stopped when the timeout elapses or when the parent token is stopped, whichever occurs first.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/LinkedStopSource.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class Deadline;
class DeadlineService;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::DeadlineService final : public std::enable_shared_from_this<DeadlineService>
{
public:
    [[nodiscard]] static std::shared_ptr<DeadlineService> Create();
    ~DeadlineService();

    DeadlineService(DeadlineService const& other) = delete;
    DeadlineService& operator=(DeadlineService const& other) = delete;

    [[nodiscard]] std::unique_ptr<Deadline> Schedule(std::chrono::milliseconds timeout, std::stop_token parent = {});

private:
    friend class Deadline;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    DeadlineService();
    void Cancel(std::shared_ptr<boost::asio::steady_timer> const& spTimer);

    boost::asio::io_context m_context;
    WorkGuard m_guard;
    std::jthread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------

class Discovery::Deadline final
{
public:
    struct State
    {
        explicit State(std::stop_token parent) : source{ parent }, expired(false) { }

        Awaitable::LinkedStopSource source;
        std::atomic_bool expired;
    };

    Deadline(
        std::shared_ptr<DeadlineService> const& spService,
        std::shared_ptr<boost::asio::steady_timer> const& spTimer,
        std::shared_ptr<State> const& spState);
    ~Deadline();

    Deadline(Deadline const& other) = delete;
    Deadline& operator=(Deadline const& other) = delete;

    [[nodiscard]] std::stop_token GetToken() const;
    [[nodiscard]] bool Expired() const;

private:
    std::shared_ptr<DeadlineService> m_spService; // Note: The service must outlive its outstanding timers. 
    std::shared_ptr<boost::asio::steady_timer> m_spTimer;
    std::shared_ptr<State> m_spState;
};

//----------------------------------------------------------------------------------------------------------------------
