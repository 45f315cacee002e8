//----------------------------------------------------------------------------------------------------------------------
#include "Components/Content/Identifier.hpp"
#include "Components/Content/NetworkInfo.hpp"
#include "Components/Content/Publisher.hpp"
#include "Components/Content/Resolver.hpp"
#include "Components/Overlay/Multiaddress.hpp"
#include "Components/Overlay/Loopback/Fabric.hpp"
#include "Components/Overlay/Loopback/Node.hpp"
#include "Utilities/FileUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::shared_ptr<Overlay::Loopback::Node> CreateOnlineNode(
    std::shared_ptr<Overlay::Loopback::Fabric> const& spFabric, std::filesystem::path const& root, std::uint16_t port);

[[nodiscard]] bool WriteText(std::filesystem::path const& path, std::string_view text);
[[nodiscard]] std::string ReadText(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint16_t PublisherPort = 35410;
constexpr std::uint16_t ResolverPort = 35411;

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class ContentPublisherSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        auto const optWorkspace = FileUtils::CreateTemporaryFolder("chainkit-publisher-test");
        ASSERT_TRUE(optWorkspace);
        m_workspace = *optWorkspace;

        m_artifacts = { m_workspace / "chainkit.yml", m_workspace / "genesis.json", m_workspace / "image.tar" };
        ASSERT_TRUE(local::WriteText(m_artifacts.manifest, "name: mynet"));
        ASSERT_TRUE(local::WriteText(m_artifacts.genesis, R"({"chain_id":"mynet"})"));
        ASSERT_TRUE(local::WriteText(m_artifacts.image, "image"));

        m_spFabric = std::make_shared<Overlay::Loopback::Fabric>();
        m_spPublisherNode = local::CreateOnlineNode(m_spFabric, m_workspace / "publisher", test::PublisherPort);
        ASSERT_TRUE(m_spPublisherNode);
    }

    void TearDown() override
    {
        m_spPublisherNode.reset();
        std::error_code error;
        std::filesystem::remove_all(m_workspace, error);
    }

    std::filesystem::path m_workspace;
    Content::Publisher::Artifacts m_artifacts;
    std::shared_ptr<Overlay::Loopback::Fabric> m_spFabric;
    std::shared_ptr<Overlay::Loopback::Node> m_spPublisherNode;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ContentPublisherSuite, PublishIsDeterministicTest)
{
    Content::Publisher const publisher{ m_spPublisherNode };

    auto const first = publisher.Publish(m_artifacts);
    ASSERT_TRUE(std::holds_alternative<Overlay::ContentIdentifier>(first));
    EXPECT_TRUE(Content::Identifier::IsValid(std::get<Overlay::ContentIdentifier>(first)));

    // The same artifacts staged from another location produce the same network identifier. 
    auto const copies = m_workspace / "copies";
    ASSERT_TRUE(FileUtils::CreateFolderIfNoneExist(copies));
    Content::Publisher::Artifacts const copied = { copies / "a.yml", copies / "b.json", copies / "c.tar" };
    ASSERT_TRUE(FileUtils::LinkOrCopy(m_artifacts.manifest, copied.manifest));
    ASSERT_TRUE(FileUtils::LinkOrCopy(m_artifacts.genesis, copied.genesis));
    ASSERT_TRUE(FileUtils::LinkOrCopy(m_artifacts.image, copied.image));

    auto const second = publisher.Publish(copied);
    ASSERT_TRUE(std::holds_alternative<Overlay::ContentIdentifier>(second));
    EXPECT_EQ(std::get<Overlay::ContentIdentifier>(second), std::get<Overlay::ContentIdentifier>(first));

    // A change to any artifact changes the identifier. 
    ASSERT_TRUE(local::WriteText(m_artifacts.image, "updated image"));
    auto const third = publisher.Publish(m_artifacts);
    ASSERT_TRUE(std::holds_alternative<Overlay::ContentIdentifier>(third));
    EXPECT_NE(std::get<Overlay::ContentIdentifier>(third), std::get<Overlay::ContentIdentifier>(first));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ContentPublisherSuite, PublishUnreadableArtifactTest)
{
    Content::Publisher const publisher{ m_spPublisherNode };

    auto artifacts = m_artifacts;
    artifacts.genesis = m_workspace / "missing.json";

    auto const result = publisher.Publish(artifacts);
    ASSERT_TRUE(std::holds_alternative<Discovery::Status>(result));
    auto const& status = std::get<Discovery::Status>(result);
    EXPECT_EQ(status, Discovery::StatusCode::PublishFailure);
    EXPECT_NE(status.GetCause().find(Content::Artifact::Genesis), std::string::npos);

    artifacts.genesis = m_workspace; // Directories are not artifacts. 
    EXPECT_TRUE(std::holds_alternative<Discovery::Status>(publisher.Publish(artifacts)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ContentPublisherSuite, ResolvePublishedNetworkTest)
{
    Content::Publisher const publisher{ m_spPublisherNode };
    auto const published = publisher.Publish(m_artifacts);
    ASSERT_TRUE(std::holds_alternative<Overlay::ContentIdentifier>(published));
    auto const& identifier = std::get<Overlay::ContentIdentifier>(published);

    // The resolving node fetches the artifacts from the publishing node.
    auto const spResolverNode = local::CreateOnlineNode(m_spFabric, m_workspace / "resolver", test::ResolverPort);
    ASSERT_TRUE(spResolverNode);

    Content::Resolver const resolver{ spResolverNode };
    auto resolved = resolver.Resolve(identifier);
    ASSERT_TRUE(std::holds_alternative<Content::NetworkInfo>(resolved));
    auto& info = std::get<Content::NetworkInfo>(resolved);

    auto const destination = m_workspace / "joined";
    ASSERT_TRUE(FileUtils::CreateFolderIfNoneExist(destination / "data"));
    EXPECT_TRUE(info.WriteManifest(destination / "chainkit.yml"));
    EXPECT_TRUE(info.WriteGenesis(destination / "genesis.json"));
    EXPECT_TRUE(info.WriteImage(destination / "data" / "image.tar"));

    EXPECT_EQ(local::ReadText(destination / "chainkit.yml"), "name: mynet");
    EXPECT_EQ(local::ReadText(destination / "genesis.json"), R"({"chain_id":"mynet"})");
    EXPECT_EQ(local::ReadText(destination / "data" / "image.tar"), "image");
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ContentPublisherSuite, ResolveUnknownNetworkTest)
{
    Content::Resolver const resolver{ m_spPublisherNode };

    std::string_view const unknown = "hello world";
    auto const optIdentifier = Content::Identifier::FromBuffer(
        std::span{ reinterpret_cast<std::uint8_t const*>(unknown.data()), unknown.size() });
    ASSERT_TRUE(optIdentifier);

    auto const resolved = resolver.Resolve(*optIdentifier);
    ASSERT_TRUE(std::holds_alternative<Discovery::Status>(resolved));
    auto const& status = std::get<Discovery::Status>(resolved);
    EXPECT_EQ(status, Discovery::StatusCode::ContentNotFound);
    EXPECT_NE(status.GetCause().find(Content::Artifact::Manifest), std::string::npos);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ContentResolverSuite, ArtifactPathTest)
{
    EXPECT_EQ(Content::CreateArtifactPath("QmNetwork", Content::Artifact::Genesis), "/ipfs/QmNetwork/genesis");
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Overlay::Loopback::Node> local::CreateOnlineNode(
    std::shared_ptr<Overlay::Loopback::Fabric> const& spFabric, std::filesystem::path const& root, std::uint16_t port)
{
    auto const spNode = std::make_shared<Overlay::Loopback::Node>(spFabric);
    if (!spNode->Initialize(root) || !spNode->Open(root)) { return nullptr; }
    if (!spNode->SetListenAddresses(Overlay::CreateWildcardListeners(port)) || !spNode->Online()) { return nullptr; }
    return spNode;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::WriteText(std::filesystem::path const& path, std::string_view text)
{
    return FileUtils::WriteFile(path, std::vector<std::uint8_t>{ text.begin(), text.end() });
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::ReadText(std::filesystem::path const& path)
{
    auto const optBuffer = FileUtils::ReadFile(path);
    if (!optBuffer) { return {}; }
    return std::string{ optBuffer->begin(), optBuffer->end() };
}

//----------------------------------------------------------------------------------------------------------------------
