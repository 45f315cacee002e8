//----------------------------------------------------------------------------------------------------------------------
// File: BootstrapConnector.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "BootstrapConnector.hpp"
#include "Components/Overlay/OverlayTypes.hpp"
#include "Interfaces/OverlayNode.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Discovery::BootstrapConnector::BootstrapConnector(
    std::shared_ptr<IOverlayNode> const& spNode,
    Configuration::BootstrapList const& bootstraps,
    std::chrono::milliseconds timeout)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_wpNode(spNode)
    , m_bootstraps(bootstraps)
    , m_timeout(timeout)
    , m_readiness()
    , m_attempted(0)
    , m_connected(0)
    , m_worker()
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::BootstrapConnector::~BootstrapConnector()
{
    Stop();
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::BootstrapConnector::Launch()
{
    if (m_worker.joinable() || m_readiness.Signaled()) { return false; }
    m_worker = std::jthread([this] (std::stop_token token) { Connect(token); });
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Discovery::BootstrapConnector::Stop()
{
    if (m_worker.joinable()) {
        m_worker.request_stop();
        m_worker.join();
    }

    m_readiness.Notify(); // Note: The connector may have been stopped before it was launched.
}

//----------------------------------------------------------------------------------------------------------------------

Awaitable::OneShotSignal const& Discovery::BootstrapConnector::GetReadinessSignal() const { return m_readiness; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Discovery::BootstrapConnector::GetConnectedCount() const { return m_connected; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Discovery::BootstrapConnector::GetAttemptedCount() const { return m_attempted; }

//----------------------------------------------------------------------------------------------------------------------

void Discovery::BootstrapConnector::Connect(std::stop_token token)
{
    m_logger->debug("Connecting to {} bootstrap peer(s).", m_bootstraps.size());

    for (auto const& bootstrap : m_bootstraps) {
        if (token.stop_requested()) { break; }

        auto const spNode = m_wpNode.lock();
        if (!spNode) { break; }

        ++m_attempted;
        auto const status = spNode->Connect(bootstrap, m_timeout, token);
        if (status == Overlay::OperationStatus::Success) {
            ++m_connected;
            m_logger->debug("Connected to bootstrap peer {}.", bootstrap);
        } else if (status != Overlay::OperationStatus::Canceled) {
            m_logger->warn("Failed to connect to bootstrap peer {}: {}.", bootstrap, Overlay::ToString(status));
        }
    }

    if (token.stop_requested()) {
        m_logger->debug("Bootstrapping was interrupted after {} attempt(s).", m_attempted.load());
    } else {
        m_logger->info(
            "Bootstrapping completed with {} of {} peer(s) connected.", m_connected.load(), m_bootstraps.size());
    }

    m_readiness.Notify();
}

//----------------------------------------------------------------------------------------------------------------------
