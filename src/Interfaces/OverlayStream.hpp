//----------------------------------------------------------------------------------------------------------------------
// File: OverlayStream.hpp
// Description: A bidirectional byte stream opened on a protocol identifier between two overlay peers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Overlay/OverlayTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayStream
{
public:
    virtual ~IOverlayStream() = default;

    [[nodiscard]] virtual Overlay::PeerIdentifier const& GetRemoteIdentifier() const = 0;

    // Note: A result of zero bytes indicates the remote closed the stream. An empty result indicates the stream 
    // has been reset or has failed. 
    [[nodiscard]] virtual std::optional<std::size_t> Read(std::span<std::uint8_t> buffer) = 0;
    [[nodiscard]] virtual bool Write(std::span<std::uint8_t const> buffer) = 0;

    virtual void Close() = 0;
    virtual void Reset() = 0; // Note: Reset must be safe to call from any thread and must unblock a pending read. 
};

//----------------------------------------------------------------------------------------------------------------------
