//----------------------------------------------------------------------------------------------------------------------
// File: Node.hpp
// Description: An overlay node whose network is the process local loopback fabric. Nodes sharing a fabric can dial 
// each other, open protocol streams, fetch each other's published content, and discover each other as providers. 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Overlay/OverlayTypes.hpp"
#include "Interfaces/OverlayNode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Overlay { class RepositoryLock; }
//----------------------------------------------------------------------------------------------------------------------
namespace Overlay::Loopback {
//----------------------------------------------------------------------------------------------------------------------

class Fabric;
class Node;
class Repository;

//----------------------------------------------------------------------------------------------------------------------
} // Overlay::Loopback namespace
//----------------------------------------------------------------------------------------------------------------------

class Overlay::Loopback::Node final : public IOverlayNode, public std::enable_shared_from_this<Node>
{
public:
    explicit Node(std::shared_ptr<Fabric> const& spFabric);
    ~Node() override;

    Node(Node const& other) = delete;
    Node& operator=(Node const& other) = delete;

    // IOverlayNode {
    [[nodiscard]] virtual bool IsLockedByOtherProcess(std::filesystem::path const& root) const override;
    [[nodiscard]] virtual bool AcquireRepository(std::filesystem::path const& root) override;
    [[nodiscard]] virtual bool IsInitialized(std::filesystem::path const& root) const override;
    [[nodiscard]] virtual bool Initialize(std::filesystem::path const& root) override;
    [[nodiscard]] virtual bool Open(std::filesystem::path const& root) override;
    [[nodiscard]] virtual bool LoadPlugins(std::filesystem::path const& directory) override;
    [[nodiscard]] virtual bool SetListenAddresses(AddressList const& addresses) override;
    [[nodiscard]] virtual bool Online() override;
    virtual void Close() override;

    [[nodiscard]] virtual PeerIdentifier const& GetIdentifier() const override;
    [[nodiscard]] virtual AddressList GetListenAddresses() const override;
    [[nodiscard]] virtual AddressList GetAnnounceAddresses() const override;

    [[nodiscard]] virtual OperationStatus Connect(
        std::string_view address, std::chrono::milliseconds timeout, std::stop_token token) override;
    [[nodiscard]] virtual std::unique_ptr<IOverlayStream> NewStream(
        PeerIdentifier const& peer, std::string_view protocol, std::stop_token token) override;
    virtual void SetStreamHandler(std::string_view protocol, StreamHandler const& handler) override;
    virtual void RemoveStreamHandler(std::string_view protocol) override;

    [[nodiscard]] virtual std::optional<ContentIdentifier> Add(std::filesystem::path const& directory) override;
    [[nodiscard]] virtual std::unique_ptr<std::istream> Get(std::string_view path, std::stop_token token) override;

    [[nodiscard]] virtual OperationStatus Provide(
        ContentIdentifier const& identifier, bool announce, std::stop_token token) override;
    virtual std::size_t FindProviders(
        ContentIdentifier const& identifier,
        std::size_t limit,
        std::stop_token token,
        ProviderReader const& reader) override;
    // } IOverlayNode

    [[nodiscard]] bool IsOnline() const;
    [[nodiscard]] std::optional<AddressList> GetPeerAddresses(PeerIdentifier const& peer) const;

    // Fabric facing methods used by remote nodes of the same fabric. 
    [[nodiscard]] std::unique_ptr<IOverlayStream> Accept(
        PeerIdentifier const& dialer, std::string_view protocol, boost::asio::io_context& dialerContext);
    [[nodiscard]] std::unique_ptr<std::istream> OpenBlock(
        ContentIdentifier const& content, std::string_view name) const;
    void RecordPeerAddresses(PeerIdentifier const& peer, AddressList const& addresses);

private:
    struct PluginDeleter { void operator()(void* pHandle) const; };
    using PluginHandle = std::unique_ptr<void, PluginDeleter>;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    [[nodiscard]] bool HoldsRepository(std::filesystem::path const& root) const;
    [[nodiscard]] bool IsCurrentSession(std::uint64_t session) const;
    void RegisterHeldContent();
    [[nodiscard]] AddressList CreateAnnounceAddresses() const;

    std::shared_ptr<Fabric> const m_spFabric;
    std::shared_ptr<spdlog::logger> m_logger;

    mutable std::mutex m_mutex;
    std::unique_ptr<RepositoryLock> m_upLock; // Note: Held from acquisition until the repository has been opened. 
    std::unique_ptr<Repository> m_upRepository;
    PeerIdentifier m_identifier;
    std::filesystem::path m_blocks;
    AddressList m_listening;
    bool m_online;
    std::uint64_t m_session; // Note: Advanced on close, inbound handlers queued by an earlier session are dropped.

    std::map<std::string, StreamHandler, std::less<>> m_handlers;
    std::unordered_map<PeerIdentifier, AddressList> m_addressBook;
    std::vector<PluginHandle> m_plugins;

    boost::asio::io_context m_context;
    std::unique_ptr<WorkGuard> m_upWorkGuard;
    std::jthread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------
