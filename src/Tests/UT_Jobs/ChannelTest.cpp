//----------------------------------------------------------------------------------------------------------------------
#include "Components/Jobs/Channel.hpp"
#include "Components/Jobs/JobTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Jobs::Request GenerateRequest(std::uint32_t identifier);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr Jobs::ClientId ClientId{ 1 };
constexpr std::size_t Capacity = 4;

std::array<std::uint8_t, 16> Output{};

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, ZeroCapacityTest)
{
    EXPECT_THROW(Jobs::RequestChannel{ 0 }, std::invalid_argument);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, FirstInFirstOutTest)
{
    Jobs::RequestChannel channel{ test::Capacity };
    EXPECT_EQ(channel.Capacity(), test::Capacity);
    EXPECT_FALSE(channel.Next());

    for (std::uint32_t idx = 0; idx < test::Capacity; ++idx) {
        EXPECT_TRUE(channel.Send(local::GenerateRequest(idx)));
    }
    EXPECT_EQ(channel.Size(), test::Capacity);

    for (std::uint32_t idx = 0; idx < test::Capacity; ++idx) {
        auto const optRequest = channel.Next();
        ASSERT_TRUE(optRequest);
        EXPECT_EQ(Jobs::GetRequestId(*optRequest), Jobs::RequestId{ idx });
    }
    EXPECT_FALSE(channel.Next());
    EXPECT_FALSE(channel.Exhausted());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, CapacityTest)
{
    Jobs::RequestChannel channel{ 1 };
    EXPECT_TRUE(channel.Send(local::GenerateRequest(0)));
    EXPECT_FALSE(channel.Send(local::GenerateRequest(1)));
    EXPECT_EQ(channel.Size(), std::size_t{ 1 });

    ASSERT_TRUE(channel.Next());
    EXPECT_TRUE(channel.Send(local::GenerateRequest(2)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, CloseTest)
{
    Jobs::RequestChannel channel{ test::Capacity };
    EXPECT_TRUE(channel.Send(local::GenerateRequest(0)));

    channel.Close();
    EXPECT_TRUE(channel.IsClosed());
    EXPECT_FALSE(channel.Send(local::GenerateRequest(1)));

    // Items queued before the channel was closed are still delivered.
    EXPECT_FALSE(channel.Exhausted());
    ASSERT_TRUE(channel.Next());
    EXPECT_TRUE(channel.Exhausted());
    EXPECT_FALSE(channel.Next());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, ObserverTest)
{
    Jobs::RequestChannel channel{ test::Capacity };
    std::size_t notifications = 0;
    channel.OnItemAvailable([&] () {
        ++notifications;
        // The observer must be able to reenter the channel.
        EXPECT_LE(channel.Size(), test::Capacity);
    });

    EXPECT_TRUE(channel.Send(local::GenerateRequest(0)));
    EXPECT_TRUE(channel.Send(local::GenerateRequest(1)));
    EXPECT_EQ(notifications, std::size_t{ 2 });

    channel.Close();
    EXPECT_EQ(notifications, std::size_t{ 3 });

    // Neither a rejected item nor a repeated close is announced.
    EXPECT_FALSE(channel.Send(local::GenerateRequest(2)));
    channel.Close();
    EXPECT_EQ(notifications, std::size_t{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChannelSuite, InterfaceTest)
{
    auto const spChannel = std::make_shared<Jobs::RequestChannel>(test::Capacity);
    std::shared_ptr<IResponseSink<Jobs::Request>> const spSink = spChannel;
    std::shared_ptr<Jobs::RequestSource> const spSource = spChannel;

    EXPECT_TRUE(spSink->Send(local::GenerateRequest(5)));
    auto const optRequest = spSource->Next();
    ASSERT_TRUE(optRequest);
    EXPECT_TRUE(std::holds_alternative<Jobs::Requests::GetRandom>(*optRequest));
    EXPECT_EQ(Jobs::GetClientId(*optRequest), test::ClientId);
}

//----------------------------------------------------------------------------------------------------------------------

Jobs::Request local::GenerateRequest(std::uint32_t identifier)
{
    return Jobs::Requests::GetRandom{ test::ClientId, Jobs::RequestId{ identifier }, test::Output };
}

//----------------------------------------------------------------------------------------------------------------------
