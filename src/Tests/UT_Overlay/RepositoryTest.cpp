//----------------------------------------------------------------------------------------------------------------------
#include "Components/Overlay/Multiaddress.hpp"
#include "Components/Overlay/RepositoryLock.hpp"
#include "Components/Overlay/Loopback/Repository.hpp"
#include "Utilities/FileUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view IdentifierPrefix = "12D3KooW"; // Identity multihashes of Ed25519 keys. 

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class OverlayRepositorySuite : public testing::Test
{
protected:
    void SetUp() override
    {
        auto const optWorkspace = FileUtils::CreateTemporaryFolder("chainkit-repository-test");
        ASSERT_TRUE(optWorkspace);
        m_workspace = *optWorkspace;
        m_root = m_workspace / "overlay";
    }

    void TearDown() override
    {
        std::error_code error;
        std::filesystem::remove_all(m_workspace, error);
    }

    std::filesystem::path m_workspace;
    std::filesystem::path m_root;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(OverlayIdentitySuite, GenerateIdentityTest)
{
    auto const optFirst = Overlay::Loopback::GenerateIdentity();
    ASSERT_TRUE(optFirst);
    EXPECT_TRUE(optFirst->identifier.starts_with(test::IdentifierPrefix));
    EXPECT_FALSE(optFirst->key.empty());

    auto const optSecond = Overlay::Loopback::GenerateIdentity();
    ASSERT_TRUE(optSecond);
    EXPECT_NE(optFirst->identifier, optSecond->identifier);
    EXPECT_NE(optFirst->key, optSecond->key);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(OverlayIdentitySuite, DeriveIdentifierTest)
{
    auto const optIdentity = Overlay::Loopback::GenerateIdentity();
    ASSERT_TRUE(optIdentity);
    EXPECT_EQ(Overlay::Loopback::DeriveIdentifier(optIdentity->key), optIdentity->identifier);

    EXPECT_FALSE(Overlay::Loopback::DeriveIdentifier(""));
    EXPECT_FALSE(Overlay::Loopback::DeriveIdentifier("not base64"));
    EXPECT_FALSE(Overlay::Loopback::DeriveIdentifier("AAAA")); // Valid encoding of a key with the wrong size. 
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(OverlayRepositorySuite, InitializeTest)
{
    EXPECT_FALSE(Overlay::Loopback::Repository::IsInitialized(m_root));
    ASSERT_TRUE(Overlay::Loopback::Repository::Initialize(m_root));
    EXPECT_TRUE(Overlay::Loopback::Repository::IsInitialized(m_root));
    EXPECT_TRUE(std::filesystem::is_regular_file(m_root / Overlay::Loopback::Repository::ConfigFilename));
    EXPECT_TRUE(std::filesystem::is_directory(m_root / Overlay::Loopback::Repository::BlocksDirectory));

    // An existing repository is never overwritten. 
    EXPECT_FALSE(Overlay::Loopback::Repository::Initialize(m_root));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(OverlayRepositorySuite, OpenTest)
{
    EXPECT_FALSE(Overlay::Loopback::Repository::Open(m_root));
    ASSERT_TRUE(Overlay::Loopback::Repository::Initialize(m_root));

    std::string identifier;
    {
        auto const upRepository = Overlay::Loopback::Repository::Open(m_root);
        ASSERT_TRUE(upRepository);
        identifier = upRepository->GetIdentifier();
        EXPECT_TRUE(identifier.starts_with(test::IdentifierPrefix));
        EXPECT_TRUE(upRepository->GetSwarmAddresses().empty());
        EXPECT_EQ(upRepository->GetBlocksPath(), upRepository->GetRoot() / "blocks");

        // The repository lock is held while the repository is open. 
        EXPECT_TRUE(Overlay::RepositoryLock::IsHeld(m_root));
        EXPECT_FALSE(Overlay::Loopback::Repository::Open(m_root));
    }

    EXPECT_FALSE(Overlay::RepositoryLock::IsHeld(m_root));

    // The identity is stable across openings of the repository. 
    auto const upReopened = Overlay::Loopback::Repository::Open(m_root);
    ASSERT_TRUE(upReopened);
    EXPECT_EQ(upReopened->GetIdentifier(), identifier);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(OverlayRepositorySuite, SwarmAddressesTest)
{
    ASSERT_TRUE(Overlay::Loopback::Repository::Initialize(m_root));

    auto const listeners = Overlay::CreateWildcardListeners(4001);
    {
        auto const upRepository = Overlay::Loopback::Repository::Open(m_root);
        ASSERT_TRUE(upRepository);
        EXPECT_FALSE(upRepository->SetSwarmAddresses({ "/ip4/0.0.0.0/tcp/4001", "not an address" }));
        EXPECT_TRUE(upRepository->GetSwarmAddresses().empty());
        ASSERT_TRUE(upRepository->SetSwarmAddresses(listeners));
        EXPECT_EQ(upRepository->GetSwarmAddresses(), listeners);
    }

    auto const upReopened = Overlay::Loopback::Repository::Open(m_root);
    ASSERT_TRUE(upReopened);
    EXPECT_EQ(upReopened->GetSwarmAddresses(), listeners);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(OverlayRepositorySuite, CorruptConfigTest)
{
    ASSERT_TRUE(Overlay::Loopback::Repository::Initialize(m_root));
    {
        std::ofstream writer(m_root / Overlay::Loopback::Repository::ConfigFilename, std::ios::trunc);
        writer << R"({ "Identity": { "PeerID": "12D3KooWForged", "PrivKey": "AAAA" } })";
    }

    EXPECT_FALSE(Overlay::Loopback::Repository::Open(m_root));
    EXPECT_FALSE(Overlay::RepositoryLock::IsHeld(m_root)); // A failed open releases the lock. 
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(OverlayRepositorySuite, RepositoryLockTest)
{
    ASSERT_TRUE(FileUtils::CreateFolderIfNoneExist(m_root));
    EXPECT_FALSE(Overlay::RepositoryLock::IsHeld(m_root));

    {
        auto const upLock = Overlay::RepositoryLock::Acquire(m_root);
        ASSERT_TRUE(upLock);
        EXPECT_TRUE(Overlay::RepositoryLock::IsHeld(m_root));
        EXPECT_TRUE(Overlay::RepositoryLock::IsHeld(m_workspace / "overlay" / ".")); // Paths are normalized. 
        EXPECT_FALSE(Overlay::RepositoryLock::Acquire(m_root));
    }

    EXPECT_FALSE(Overlay::RepositoryLock::IsHeld(m_root));
    EXPECT_TRUE(Overlay::RepositoryLock::Acquire(m_root));
}

//----------------------------------------------------------------------------------------------------------------------
