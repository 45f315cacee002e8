//----------------------------------------------------------------------------------------------------------------------
// File: OverlayTypes.hpp
// Description: Common types exchanged with the content-addressed peer-to-peer overlay.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/CallbackIteration.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayStream;

//----------------------------------------------------------------------------------------------------------------------
namespace Overlay {
//----------------------------------------------------------------------------------------------------------------------

using PeerIdentifier = std::string;
using ContentIdentifier = std::string;
using ProtocolIdentifier = std::string;
using AddressList = std::vector<std::string>;

enum class OperationStatus : std::uint32_t { Success, Timeout, Canceled, Failure };

struct ProviderRecord
{
    PeerIdentifier identifier;
    AddressList addresses; // The addresses of the provider known to the local address book. 
};

using ProviderReader = std::function<CallbackIteration(ProviderRecord const& record)>;
using StreamHandler = std::function<void(std::unique_ptr<IOverlayStream>&& upStream)>;

[[nodiscard]] constexpr std::string_view ToString(OperationStatus status)
{
    switch (status) {
        case OperationStatus::Success: return "success";
        case OperationStatus::Timeout: return "timed out";
        case OperationStatus::Canceled: return "canceled";
        case OperationStatus::Failure: return "failed";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------
} // Overlay namespace
//----------------------------------------------------------------------------------------------------------------------
