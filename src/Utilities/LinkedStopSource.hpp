//----------------------------------------------------------------------------------------------------------------------
// File: LinkedStopSource.hpp
// Description: A stop source that is stopped when any of its parent tokens are stopped. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <initializer_list>
#include <memory>
#include <stop_token>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Awaitable {
//----------------------------------------------------------------------------------------------------------------------

class LinkedStopSource;

//----------------------------------------------------------------------------------------------------------------------
} // Awaitable namespace
//----------------------------------------------------------------------------------------------------------------------

class Awaitable::LinkedStopSource
{
public:
    LinkedStopSource(std::initializer_list<std::stop_token> parents)
        : m_source()
        , m_relays()
    {
        for (auto const& parent : parents) {
            if (!parent.stop_possible()) { continue; }
            m_relays.emplace_back(std::make_unique<std::stop_callback<Relay>>(parent, Relay{ m_source }));
        }
    }

    LinkedStopSource(LinkedStopSource const& other) = delete;
    LinkedStopSource& operator=(LinkedStopSource const& other) = delete;

    [[nodiscard]] std::stop_token GetToken() const { return m_source.get_token(); }
    [[nodiscard]] bool StopRequested() const { return m_source.stop_requested(); }
    bool RequestStop() { return m_source.request_stop(); }

private:
    struct Relay
    {
        std::stop_source source;
        void operator()() noexcept { source.request_stop(); }
    };

    std::stop_source m_source;
    std::vector<std::unique_ptr<std::stop_callback<Relay>>> m_relays; // Note: Relays unregister on destruction. 
};

//----------------------------------------------------------------------------------------------------------------------
