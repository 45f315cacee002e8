//----------------------------------------------------------------------------------------------------------------------
// File: BootstrapConnector.hpp
// Description: Connects the overlay node to the configured entry peers such that it joins the routing overlay. The 
// readiness signal is notified once every entry has been attempted, regardless of how many attempts succeeded.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Options.hpp"
#include "Utilities/OneShotSignal.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayNode;
namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

class BootstrapConnector;

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::BootstrapConnector final
{
public:
    BootstrapConnector(
        std::shared_ptr<IOverlayNode> const& spNode,
        Configuration::BootstrapList const& bootstraps,
        std::chrono::milliseconds timeout);
    ~BootstrapConnector();

    BootstrapConnector(BootstrapConnector const& other) = delete;
    BootstrapConnector& operator=(BootstrapConnector const& other) = delete;

    // Note: The connector may only be launched once. Stopping it abandons the remaining entries and notifies the 
    // readiness signal such that no waiter is stranded. 
    [[nodiscard]] bool Launch();
    void Stop();

    [[nodiscard]] Awaitable::OneShotSignal const& GetReadinessSignal() const;
    [[nodiscard]] std::size_t GetConnectedCount() const;
    [[nodiscard]] std::size_t GetAttemptedCount() const;

private:
    void Connect(std::stop_token token);

    std::shared_ptr<spdlog::logger> m_logger;
    std::weak_ptr<IOverlayNode> m_wpNode;
    Configuration::BootstrapList const m_bootstraps;
    std::chrono::milliseconds const m_timeout;

    Awaitable::OneShotSignal m_readiness;
    std::atomic_size_t m_attempted;
    std::atomic_size_t m_connected;
    std::jthread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------
