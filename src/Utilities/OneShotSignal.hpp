//----------------------------------------------------------------------------------------------------------------------
// File: OneShotSignal.hpp
// Description: A broadcast signal that may be notified once. Every waiter, whether it began waiting before or after
// the notification, observes the signal.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Awaitable {
//----------------------------------------------------------------------------------------------------------------------

enum class Result : std::uint32_t { Signaled, Canceled, TimedOut };

class OneShotSignal;

//----------------------------------------------------------------------------------------------------------------------
} // Awaitable namespace
//----------------------------------------------------------------------------------------------------------------------

class Awaitable::OneShotSignal
{
public:
    OneShotSignal() : m_spState(std::make_shared<State>()) { }
    ~OneShotSignal() = default;

    OneShotSignal(OneShotSignal const& other) = delete;
    OneShotSignal(OneShotSignal&& other) = default;
    OneShotSignal& operator=(OneShotSignal const& other) = delete;
    OneShotSignal& operator=(OneShotSignal&& other) = default;

    [[nodiscard]] bool Signaled() const
    {
        std::scoped_lock lock(m_spState->mutex);
        return m_spState->signaled;
    }

    // Note: Returns true only for the call that transitioned the signal. Subsequent calls have no effect.
    bool Notify()
    {
        {
            std::scoped_lock lock(m_spState->mutex);
            if (m_spState->signaled) { return false; }
            m_spState->signaled = true;
        }
        m_spState->condition.notify_all();
        return true;
    }

    [[nodiscard]] Result Wait(std::stop_token token = {}) const
    {
        std::unique_lock lock(m_spState->mutex);
        bool const signaled = m_spState->condition.wait(lock, token, [this] { return m_spState->signaled; });
        return (signaled) ? Result::Signaled : Result::Canceled;
    }

    template<typename Rep, typename Period>
    [[nodiscard]] Result WaitFor(std::chrono::duration<Rep, Period> const& timeout, std::stop_token token = {}) const
    {
        std::unique_lock lock(m_spState->mutex);
        if (m_spState->condition.wait_for(lock, token, timeout, [this] { return m_spState->signaled; })) {
            return Result::Signaled;
        }
        return (token.stop_requested()) ? Result::Canceled : Result::TimedOut;
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable_any condition;
        bool signaled = false;
    };

    std::shared_ptr<State> m_spState; // Note: Shared state keeps the signal valid for moved-from waiters.
};

//----------------------------------------------------------------------------------------------------------------------
