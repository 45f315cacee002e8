//----------------------------------------------------------------------------------------------------------------------
#include "OverlayNodeStub.hpp"
#include "TestHelpers.hpp"
#include "Components/Discovery/BootstrapConnector.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <string>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

std::string const FirstBootstrap = "/ip4/10.0.0.1/tcp/4001/p2p/12D3KooWFirstBootstrap";
std::string const SecondBootstrap = "/ip4/10.0.0.2/tcp/4001/p2p/12D3KooWSecondBootstrap";
std::string const ThirdBootstrap = "/ip4/10.0.0.3/tcp/4001/p2p/12D3KooWThirdBootstrap";

constexpr std::chrono::milliseconds ConnectionTimeout{ 100 };

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class BootstrapConnectorSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spNode = std::make_shared<OverlayNodeStub>(Discovery::Test::LocalIdentifier);
    }

    std::shared_ptr<OverlayNodeStub> m_spNode;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(BootstrapConnectorSuite, ConnectsEachBootstrapInOrderTest)
{
    m_spNode->SetConnectResult(test::SecondBootstrap, Overlay::OperationStatus::Success);
    m_spNode->SetConnectResult(test::ThirdBootstrap, Overlay::OperationStatus::Timeout);

    Discovery::BootstrapConnector connector{ 
        m_spNode, { test::FirstBootstrap, test::SecondBootstrap, test::ThirdBootstrap }, test::ConnectionTimeout };
    EXPECT_FALSE(connector.GetReadinessSignal().Signaled());

    ASSERT_TRUE(connector.Launch());
    EXPECT_EQ(connector.GetReadinessSignal().WaitFor(Discovery::Test::BoundedWait), Awaitable::Result::Signaled);

    // A failed entry never prevents the remaining entries from being attempted. 
    auto const dialed = m_spNode->GetDialed();
    ASSERT_EQ(dialed.size(), std::size_t{ 3 });
    EXPECT_EQ(dialed[0], test::FirstBootstrap);
    EXPECT_EQ(dialed[1], test::SecondBootstrap);
    EXPECT_EQ(dialed[2], test::ThirdBootstrap);

    EXPECT_EQ(connector.GetAttemptedCount(), std::size_t{ 3 });
    EXPECT_EQ(connector.GetConnectedCount(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(BootstrapConnectorSuite, EmptyBootstrapListSignalsReadinessTest)
{
    Discovery::BootstrapConnector connector{ m_spNode, {}, test::ConnectionTimeout };
    ASSERT_TRUE(connector.Launch());
    EXPECT_EQ(connector.GetReadinessSignal().WaitFor(Discovery::Test::BoundedWait), Awaitable::Result::Signaled);
    EXPECT_EQ(connector.GetAttemptedCount(), std::size_t{ 0 });
    EXPECT_TRUE(m_spNode->GetDialed().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(BootstrapConnectorSuite, LaunchOnlyOnceTest)
{
    Discovery::BootstrapConnector connector{ m_spNode, { test::FirstBootstrap }, test::ConnectionTimeout };
    EXPECT_TRUE(connector.Launch());
    EXPECT_FALSE(connector.Launch());
    EXPECT_EQ(connector.GetReadinessSignal().WaitFor(Discovery::Test::BoundedWait), Awaitable::Result::Signaled);
    EXPECT_FALSE(connector.Launch());
    EXPECT_EQ(m_spNode->GetDialed().size(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(BootstrapConnectorSuite, StopInterruptsPendingDialTest)
{
    m_spNode->SetConnectHangs(true);

    Discovery::BootstrapConnector connector{ 
        m_spNode, { test::FirstBootstrap, test::SecondBootstrap }, test::ConnectionTimeout };
    ASSERT_TRUE(connector.Launch());

    auto const deadline = std::chrono::steady_clock::now() + Discovery::Test::BoundedWait;
    while (m_spNode->GetDialed().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
    }
    ASSERT_EQ(m_spNode->GetDialed().size(), std::size_t{ 1 });
    EXPECT_FALSE(connector.GetReadinessSignal().Signaled());

    connector.Stop();
    EXPECT_TRUE(connector.GetReadinessSignal().Signaled());
    EXPECT_EQ(connector.GetAttemptedCount(), std::size_t{ 1 });
    EXPECT_EQ(connector.GetConnectedCount(), std::size_t{ 0 });
    EXPECT_EQ(m_spNode->GetDialed().size(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(BootstrapConnectorSuite, StopWithoutLaunchSignalsReadinessTest)
{
    Discovery::BootstrapConnector connector{ m_spNode, { test::FirstBootstrap }, test::ConnectionTimeout };
    connector.Stop();
    EXPECT_TRUE(connector.GetReadinessSignal().Signaled());
    EXPECT_FALSE(connector.Launch());
    EXPECT_TRUE(m_spNode->GetDialed().empty());
}

//----------------------------------------------------------------------------------------------------------------------
