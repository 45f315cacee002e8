//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Discovery/PeerInfo.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
//----------------------------------------------------------------------------------------------------------------------

TEST(PeerInfoSuite, EncodeTest)
{
    Discovery::PeerInfo const info{ 
        Discovery::Test::RemoteIdentifier, { "10.0.0.5" }, Discovery::Test::PeerToPeerPort };

    auto const encoded = info.Encode();
    ASSERT_FALSE(encoded.empty());
    EXPECT_EQ(encoded.back(), '\n');
    EXPECT_EQ(encoded.find('\n'), encoded.size() - 1);
    EXPECT_NE(encoded.find("\"node_id\":\"12D3KooWRemoteNode\""), std::string::npos);
    EXPECT_NE(encoded.find("\"ips\":[\"10.0.0.5\"]"), std::string::npos);
    EXPECT_NE(encoded.find("\"tendermint_p2p_port\":26656"), std::string::npos);

    auto const optDecoded = Discovery::PeerInfo::Decode(encoded);
    ASSERT_TRUE(optDecoded);
    EXPECT_EQ(*optDecoded, info);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerInfoSuite, EmptyAddressesEncodeAsArrayTest)
{
    auto const encoded = Discovery::Test::GenerateRemoteInfo().Encode();
    EXPECT_NE(encoded.find("\"ips\":[]"), std::string::npos);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerInfoSuite, DecodeToleratesMissingAndUnknownFieldsTest)
{
    {
        auto const optInfo = Discovery::PeerInfo::Decode(R"({"node_id":"12D3KooWRemoteNode"})");
        ASSERT_TRUE(optInfo);
        EXPECT_EQ(optInfo->identifier, Discovery::Test::RemoteIdentifier);
        EXPECT_TRUE(optInfo->addresses.empty());
        EXPECT_EQ(optInfo->port, 0);
    }

    {
        auto const optInfo = Discovery::PeerInfo::Decode(
            R"({"node_id":"12D3KooWRemoteNode","ips":null,"tendermint_p2p_port":26656,"moniker":"validator"})");
        ASSERT_TRUE(optInfo);
        EXPECT_TRUE(optInfo->addresses.empty());
        EXPECT_EQ(optInfo->port, Discovery::Test::PeerToPeerPort);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerInfoSuite, DecodeMalformedTest)
{
    EXPECT_FALSE(Discovery::PeerInfo::Decode(""));
    EXPECT_FALSE(Discovery::PeerInfo::Decode("not json"));
    EXPECT_FALSE(Discovery::PeerInfo::Decode("[]"));
    EXPECT_FALSE(Discovery::PeerInfo::Decode(R"({"ips":["10.0.0.5"]})"));
    EXPECT_FALSE(Discovery::PeerInfo::Decode(R"({"node_id":42})"));
    EXPECT_FALSE(Discovery::PeerInfo::Decode(R"({"node_id":"12D3KooWRemoteNode","ips":"10.0.0.5"})"));
    EXPECT_FALSE(Discovery::PeerInfo::Decode(R"({"node_id":"12D3KooWRemoteNode","ips":[1]})"));
    EXPECT_FALSE(Discovery::PeerInfo::Decode(R"({"node_id":"12D3KooWRemoteNode","tendermint_p2p_port":"26656"})"));
    EXPECT_FALSE(Discovery::PeerInfo::Decode(
        R"({"node_id":"12D3KooWRemoteNode","tendermint_p2p_port":4294967296})"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerInfoSuite, DecodeOversizedTest)
{
    std::string oversized = R"({"node_id":")";
    oversized.append(Discovery::PeerInfo::EncodedSizeLimit, 'a');
    oversized.append(R"("})");
    EXPECT_FALSE(Discovery::PeerInfo::Decode(oversized));
}

//----------------------------------------------------------------------------------------------------------------------
