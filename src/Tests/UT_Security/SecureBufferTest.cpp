//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecureBuffer.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Security::Buffer const Secret = { 0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF };

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(SecureBufferSuite, ConstructionTest)
{
    Security::SecureBuffer const empty;
    EXPECT_TRUE(empty.IsEmpty());
    EXPECT_EQ(empty.GetSize(), std::size_t{ 0 });

    Security::SecureBuffer const zeroed{ std::size_t{ 16 } };
    EXPECT_EQ(zeroed.GetSize(), std::size_t{ 16 });
    EXPECT_TRUE(Security::IsErased(zeroed.GetData()));

    Security::SecureBuffer const copied{ Security::ReadableView{ test::Secret } };
    EXPECT_TRUE(std::ranges::equal(copied.GetData(), test::Secret));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecureBufferSuite, AssignTest)
{
    Security::SecureBuffer buffer{ std::size_t{ 4 } };
    buffer.Assign(test::Secret);
    EXPECT_EQ(buffer.GetSize(), test::Secret.size());
    EXPECT_TRUE(std::ranges::equal(buffer.GetData(), test::Secret));

    Security::Buffer const replacement = { 0xFF, 0xEE };
    buffer.Assign(replacement);
    EXPECT_TRUE(std::ranges::equal(buffer.GetData(), replacement));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecureBufferSuite, EraseTest)
{
    Security::SecureBuffer buffer{ Security::ReadableView{ test::Secret } };
    EXPECT_FALSE(buffer.IsEmpty());

    buffer.Erase();
    EXPECT_TRUE(buffer.IsEmpty());
    EXPECT_TRUE(buffer.GetData().empty());

    // The buffer remains usable after being erased.
    buffer.Assign(test::Secret);
    EXPECT_TRUE(std::ranges::equal(buffer.GetData(), test::Secret));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecureBufferSuite, MoveTest)
{
    Security::SecureBuffer source{ Security::ReadableView{ test::Secret } };
    Security::SecureBuffer destination{ std::move(source) };
    EXPECT_TRUE(source.IsEmpty());
    EXPECT_TRUE(std::ranges::equal(destination.GetData(), test::Secret));

    Security::SecureBuffer assigned{ std::size_t{ 2 } };
    assigned = std::move(destination);
    EXPECT_TRUE(destination.IsEmpty());
    EXPECT_TRUE(std::ranges::equal(assigned.GetData(), test::Secret));
}

//----------------------------------------------------------------------------------------------------------------------
