//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Discovery/PeerStream.hpp"
#include "Utilities/OneShotSignal.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerInfo GenerateInfo(std::size_t index);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(PeerStreamSuite, IterationDeliversInProducedOrderTest)
{
    constexpr std::size_t Produced = 5;
    Discovery::PeerStream stream{ 2, [] (std::stop_token token, Discovery::PeerStream::Channel& channel) {
        for (std::size_t index = 0; index < Produced; ++index) {
            if (!channel.Push(local::GenerateInfo(index), token)) { return; }
        }
    } };

    std::vector<std::string> received;
    for (auto const& info : stream) { received.emplace_back(info.identifier); }

    ASSERT_EQ(received.size(), Produced);
    for (std::size_t index = 0; index < Produced; ++index) {
        EXPECT_EQ(received[index], local::GenerateInfo(index).identifier);
    }

    EXPECT_TRUE(stream.Finished());
    EXPECT_FALSE(stream.Next());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerStreamSuite, EmptyProducerEndsStreamTest)
{
    Discovery::PeerStream stream{ 1, [] (std::stop_token, Discovery::PeerStream::Channel&) { } };
    EXPECT_FALSE(stream.Next());
    EXPECT_TRUE(stream.Finished());
    EXPECT_TRUE(stream.begin() == stream.end());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerStreamSuite, FullChannelBlocksProducerTest)
{
    std::atomic_size_t pushed = 0;
    Awaitable::OneShotSignal blocked;

    Discovery::PeerStream stream{ 1, [&] (std::stop_token token, Discovery::PeerStream::Channel& channel) {
        for (std::size_t index = 0; index < 3; ++index) {
            if (index == 1) { blocked.Notify(); }
            if (!channel.Push(local::GenerateInfo(index), token)) { return; }
            ++pushed;
        }
    } };

    ASSERT_EQ(blocked.WaitFor(Discovery::Test::BoundedWait), Awaitable::Result::Signaled);
    std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
    EXPECT_EQ(pushed, std::size_t{ 1 }); // The second peer may not be queued until the first has been consumed.

    std::size_t received = 0;
    while (stream.Next()) { ++received; }
    EXPECT_EQ(received, std::size_t{ 3 });
    EXPECT_EQ(pushed, std::size_t{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerStreamSuite, CancelStopsBlockedProducerTest)
{
    std::atomic_bool rejected = false;
    Awaitable::OneShotSignal finished;

    {
        Discovery::PeerStream stream{ 1, [&] (std::stop_token token, Discovery::PeerStream::Channel& channel) {
            for (std::size_t index = 0; ; ++index) {
                if (!channel.Push(local::GenerateInfo(index), token)) { rejected = true; break; }
            }
            finished.Notify();
        } };

        ASSERT_TRUE(stream.Next());
        stream.Cancel();
        EXPECT_EQ(finished.WaitFor(Discovery::Test::BoundedWait), Awaitable::Result::Signaled);
    }

    EXPECT_TRUE(rejected);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerStreamSuite, DestructionJoinsProducerTest)
{
    std::atomic_bool returned = false;

    {
        Discovery::PeerStream stream{ 1, [&] (std::stop_token token, Discovery::PeerStream::Channel&) {
            std::mutex mutex;
            std::condition_variable_any condition;
            std::unique_lock lock(mutex);
            condition.wait(lock, token, [] { return false; });
            returned = true;
        } };
    }

    EXPECT_TRUE(returned);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerStreamSuite, NextHonorsCallerTokenTest)
{
    Discovery::PeerStream stream{ 1, [] (std::stop_token token, Discovery::PeerStream::Channel&) {
        std::mutex mutex;
        std::condition_variable_any condition;
        std::unique_lock lock(mutex);
        condition.wait(lock, token, [] { return false; });
    } };

    std::stop_source source;
    source.request_stop();
    EXPECT_FALSE(stream.Next(source.get_token()));
    EXPECT_FALSE(stream.Finished());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PeerStreamSuite, MovedStreamContinuesDeliveryTest)
{
    Discovery::PeerStream source{ 4, [] (std::stop_token token, Discovery::PeerStream::Channel& channel) {
        [[maybe_unused]] bool const pushed = channel.Push(local::GenerateInfo(0), token);
    } };

    Discovery::PeerStream stream = std::move(source);
    auto const optInfo = stream.Next();
    ASSERT_TRUE(optInfo);
    EXPECT_EQ(optInfo->identifier, local::GenerateInfo(0).identifier);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::PeerInfo local::GenerateInfo(std::size_t index)
{
    return Discovery::PeerInfo{ "peer-" + std::to_string(index), { "10.0.0." + std::to_string(index) }, 26656 };
}

//----------------------------------------------------------------------------------------------------------------------
