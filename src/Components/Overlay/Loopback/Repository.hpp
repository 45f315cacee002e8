//----------------------------------------------------------------------------------------------------------------------
// File: Repository.hpp
// Description: The on-disk state of a loopback overlay node. The repository holds the node's identity and swarm 
// addresses in config.json and the published content under blocks/.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Overlay/OverlayTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Overlay { class RepositoryLock; }
//----------------------------------------------------------------------------------------------------------------------
namespace Overlay::Loopback {
//----------------------------------------------------------------------------------------------------------------------

class Repository;

struct Identity
{
    PeerIdentifier identifier;
    std::string key; // Note: The base64 encoded Ed25519 private key. 
};

[[nodiscard]] std::optional<Identity> GenerateIdentity();
[[nodiscard]] std::optional<PeerIdentifier> DeriveIdentifier(std::string_view key);

//----------------------------------------------------------------------------------------------------------------------
} // Overlay::Loopback namespace
//----------------------------------------------------------------------------------------------------------------------

class Overlay::Loopback::Repository final
{
public:
    static constexpr std::string_view ConfigFilename = "config.json";
    static constexpr std::string_view BlocksDirectory = "blocks";
    static constexpr std::string_view PluginsDirectory = "plugins";

    ~Repository();

    Repository(Repository const& other) = delete;
    Repository& operator=(Repository const& other) = delete;

    [[nodiscard]] static bool IsInitialized(std::filesystem::path const& root);
    [[nodiscard]] static bool Initialize(std::filesystem::path const& root);

    // Note: Opening the repository acquires the repository lock for the lifetime of the returned object. 
    [[nodiscard]] static std::unique_ptr<Repository> Open(std::filesystem::path const& root);

    // Note: Opens the root under a lock the caller already holds. The lock is only taken on success, otherwise it is 
    // left with the caller. 
    [[nodiscard]] static std::unique_ptr<Repository> Open(
        std::filesystem::path const& root, std::unique_ptr<RepositoryLock>& upLock);

    [[nodiscard]] std::filesystem::path const& GetRoot() const;
    [[nodiscard]] std::filesystem::path GetBlocksPath() const;
    [[nodiscard]] PeerIdentifier const& GetIdentifier() const;
    [[nodiscard]] AddressList const& GetSwarmAddresses() const;

    [[nodiscard]] bool SetSwarmAddresses(AddressList const& addresses);

private:
    Repository(std::filesystem::path const& root, std::unique_ptr<RepositoryLock>&& upLock);

    [[nodiscard]] bool Load();
    [[nodiscard]] bool Store() const;

    std::filesystem::path m_root;
    std::unique_ptr<RepositoryLock> m_upLock;
    Identity m_identity;
    AddressList m_swarm;
};

//----------------------------------------------------------------------------------------------------------------------
