//----------------------------------------------------------------------------------------------------------------------
#include "OverlayStreamStub.hpp"
#include "TestHelpers.hpp"
#include "Components/Discovery/PeerExchange.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

TEST(PeerExchangeSuite, RespondWritesSingleRecordTest)
{
    Discovery::PeerExchange const exchange;
    auto const local = Discovery::Test::GenerateRemoteInfo();

    OverlayStreamStub stream{ Discovery::Test::LocalIdentifier, "", OverlayStreamStub::Behavior::Reply };
    EXPECT_TRUE(exchange.Respond(stream, local));

    auto const& spState = stream.GetState();
    EXPECT_EQ(OverlayStreamStub::GetWritten(spState), local.Encode());
    EXPECT_TRUE(OverlayStreamStub::WasClosed(spState));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerExchangeSuite, ResponderHandlesOwnedStreamTest)
{
    Discovery::PeerExchange const exchange;
    auto const local = Discovery::Test::GenerateRemoteInfo();
    auto const responder = exchange.CreateResponder(local);

    auto upStream = std::make_unique<OverlayStreamStub>(
        Discovery::Test::LocalIdentifier, "", OverlayStreamStub::Behavior::Reply);
    auto const spState = upStream->GetState();

    responder(std::move(upStream));
    EXPECT_EQ(OverlayStreamStub::GetWritten(spState), local.Encode());
    EXPECT_TRUE(OverlayStreamStub::WasClosed(spState));

    EXPECT_NO_THROW(responder(nullptr));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerExchangeSuite, RequestReadsUntilDelimiterTest)
{
    Discovery::PeerExchange const exchange;
    auto const remote = Discovery::Test::GenerateRemoteInfo();

    // Bytes trailing the record delimiter are not part of the record. 
    OverlayStreamStub stream{ 
        Discovery::Test::RemoteIdentifier, remote.Encode() + "trailing", OverlayStreamStub::Behavior::Reply };

    auto const optInfo = exchange.Request(stream);
    ASSERT_TRUE(optInfo);
    EXPECT_EQ(*optInfo, remote);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerExchangeSuite, RequestReadsUntilEndOfStreamTest)
{
    Discovery::PeerExchange const exchange;
    auto encoded = Discovery::Test::GenerateRemoteInfo().Encode();
    encoded.pop_back();

    OverlayStreamStub stream{ Discovery::Test::RemoteIdentifier, encoded, OverlayStreamStub::Behavior::Reply };
    auto const optInfo = exchange.Request(stream);
    ASSERT_TRUE(optInfo);
    EXPECT_EQ(optInfo->identifier, Discovery::Test::RemoteIdentifier);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerExchangeSuite, RequestMalformedReplyTest)
{
    Discovery::PeerExchange const exchange;

    {
        OverlayStreamStub stream{ Discovery::Test::RemoteIdentifier, "garbage\n", OverlayStreamStub::Behavior::Reply };
        EXPECT_FALSE(exchange.Request(stream));
    }

    {
        OverlayStreamStub stream{ Discovery::Test::RemoteIdentifier, "", OverlayStreamStub::Behavior::Reply };
        EXPECT_FALSE(exchange.Request(stream));
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerExchangeSuite, RequestOversizedReplyTest)
{
    Discovery::PeerExchange const exchange;

    std::string const oversized(Discovery::PeerInfo::EncodedSizeLimit + 1024, 'a');
    OverlayStreamStub stream{ Discovery::Test::RemoteIdentifier, oversized, OverlayStreamStub::Behavior::Reply };
    EXPECT_FALSE(exchange.Request(stream));
    EXPECT_TRUE(OverlayStreamStub::WasReset(stream.GetState()));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerExchangeSuite, RequestInterruptedTest)
{
    Discovery::PeerExchange const exchange;

    OverlayStreamStub stream{ Discovery::Test::RemoteIdentifier, "", OverlayStreamStub::Behavior::Reply };
    stream.Reset();
    EXPECT_FALSE(exchange.Request(stream));
}

//----------------------------------------------------------------------------------------------------------------------
