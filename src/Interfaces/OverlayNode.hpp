//----------------------------------------------------------------------------------------------------------------------
// File: OverlayNode.hpp
// Description: The content-addressed peer-to-peer node consumed by the discovery server. The node provides the
// repository, identity, transport, content store, and DHT primitives. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Overlay/OverlayTypes.hpp"
#include "Interfaces/OverlayStream.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IOverlayNode
{
public:
    virtual ~IOverlayNode() = default;

    // Repository {
    [[nodiscard]] virtual bool IsLockedByOtherProcess(std::filesystem::path const& root) const = 0;
    // Note: Creates the root if needed and takes the repository lock, which is held until the node is closed. Fails 
    // when any other holder exists. Initialization and opening of the root then run under the node's lock. 
    [[nodiscard]] virtual bool AcquireRepository(std::filesystem::path const& root) = 0;
    [[nodiscard]] virtual bool IsInitialized(std::filesystem::path const& root) const = 0;
    [[nodiscard]] virtual bool Initialize(std::filesystem::path const& root) = 0;
    [[nodiscard]] virtual bool Open(std::filesystem::path const& root) = 0;
    [[nodiscard]] virtual bool LoadPlugins(std::filesystem::path const& directory) = 0;
    [[nodiscard]] virtual bool SetListenAddresses(Overlay::AddressList const& addresses) = 0;
    [[nodiscard]] virtual bool Online() = 0;
    virtual void Close() = 0;
    // } Repository

    // Identity {
    [[nodiscard]] virtual Overlay::PeerIdentifier const& GetIdentifier() const = 0;
    [[nodiscard]] virtual Overlay::AddressList GetListenAddresses() const = 0;
    [[nodiscard]] virtual Overlay::AddressList GetAnnounceAddresses() const = 0;
    // } Identity

    // Transport {
    [[nodiscard]] virtual Overlay::OperationStatus Connect(
        std::string_view address, std::chrono::milliseconds timeout, std::stop_token token) = 0;

    [[nodiscard]] virtual std::unique_ptr<IOverlayStream> NewStream(
        Overlay::PeerIdentifier const& peer, std::string_view protocol, std::stop_token token) = 0;

    virtual void SetStreamHandler(std::string_view protocol, Overlay::StreamHandler const& handler) = 0;
    virtual void RemoveStreamHandler(std::string_view protocol) = 0;
    // } Transport

    // Content {
    [[nodiscard]] virtual std::optional<Overlay::ContentIdentifier> Add(std::filesystem::path const& directory) = 0;
    [[nodiscard]] virtual std::unique_ptr<std::istream> Get(std::string_view path, std::stop_token token) = 0;
    // } Content

    // Routing {
    [[nodiscard]] virtual Overlay::OperationStatus Provide(
        Overlay::ContentIdentifier const& identifier, bool announce, std::stop_token token) = 0;

    // Note: The reader is called for each provider as it is found. The call blocks until the providers have been 
    // exhausted, the limit has been reached, the reader stops the iteration, or the token has been stopped. 
    virtual std::size_t FindProviders(
        Overlay::ContentIdentifier const& identifier,
        std::size_t limit,
        std::stop_token token,
        Overlay::ProviderReader const& reader) = 0;
    // } Routing
};

//----------------------------------------------------------------------------------------------------------------------
