//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Crypto/ChaChaPoly.hpp"
#include "Components/Crypto/CryptoDefinitions.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using Tag = std::array<std::uint8_t, Crypto::ChaChaPoly::TagSize>;

[[nodiscard]] bool HoldsError(Crypto::Result<Security::WriteableView> const& result, Crypto::Error expected);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Security::Buffer const Key = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Key);
Security::Buffer const Nonce = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Nonce);
Security::Buffer const Aad = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Aad);
Security::Buffer const Plaintext = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Plaintext);
Security::Buffer const Ciphertext = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Ciphertext);
Security::Buffer const Tag = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Tag);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolySuite, KnownAnswerTest)
{
    Security::Buffer buffer = test::Plaintext;
    local::Tag tag{};

    auto const encrypted = Crypto::ChaChaPoly::EncryptInPlaceDetached(test::Key, test::Nonce, test::Aad, buffer, tag);
    ASSERT_TRUE(std::holds_alternative<Security::WriteableView>(encrypted));
    EXPECT_EQ(std::get<Security::WriteableView>(encrypted).data(), buffer.data());
    EXPECT_EQ(buffer, test::Ciphertext);
    EXPECT_TRUE(std::ranges::equal(tag, test::Tag));

    auto const decrypted = Crypto::ChaChaPoly::DecryptInPlaceDetached(test::Key, test::Nonce, test::Aad, buffer, tag);
    ASSERT_TRUE(std::holds_alternative<Security::WriteableView>(decrypted));
    EXPECT_EQ(std::get<Security::WriteableView>(decrypted).size(), test::Plaintext.size());
    EXPECT_EQ(buffer, test::Plaintext);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolySuite, EmptyMessageTest)
{
    Security::Buffer buffer;
    local::Tag tag{};

    auto const encrypted = Crypto::ChaChaPoly::EncryptInPlaceDetached(test::Key, test::Nonce, test::Aad, buffer, tag);
    ASSERT_TRUE(std::holds_alternative<Security::WriteableView>(encrypted));
    EXPECT_FALSE(std::ranges::all_of(tag, [] (auto byte) { return byte == 0x00; }));

    auto const decrypted = Crypto::ChaChaPoly::DecryptInPlaceDetached(test::Key, test::Nonce, test::Aad, buffer, tag);
    EXPECT_TRUE(std::holds_alternative<Security::WriteableView>(decrypted));

    tag.front() ^= 0x01;
    auto const rejected = Crypto::ChaChaPoly::DecryptInPlaceDetached(test::Key, test::Nonce, test::Aad, buffer, tag);
    EXPECT_TRUE(local::HoldsError(rejected, Crypto::Error::Authentication));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolySuite, TamperedCiphertextTest)
{
    Security::Buffer buffer = test::Ciphertext;
    buffer[buffer.size() / 2] ^= 0x04;

    auto const result = Crypto::ChaChaPoly::DecryptInPlaceDetached(
        test::Key, test::Nonce, test::Aad, buffer, test::Tag);
    EXPECT_TRUE(local::HoldsError(result, Crypto::Error::Authentication));
    EXPECT_TRUE(Security::IsErased(buffer));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolySuite, TamperedAadTest)
{
    Security::Buffer buffer = test::Ciphertext;
    Security::Buffer aad = test::Aad;
    aad.back() ^= 0x10;

    auto const result = Crypto::ChaChaPoly::DecryptInPlaceDetached(test::Key, test::Nonce, aad, buffer, test::Tag);
    EXPECT_TRUE(local::HoldsError(result, Crypto::Error::Authentication));
    EXPECT_TRUE(Security::IsErased(buffer));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolySuite, MismatchedNonceTest)
{
    Security::Buffer buffer = test::Ciphertext;
    Security::Buffer nonce = test::Nonce;
    nonce.back() ^= 0xFF;

    auto const result = Crypto::ChaChaPoly::DecryptInPlaceDetached(test::Key, nonce, test::Aad, buffer, test::Tag);
    EXPECT_TRUE(local::HoldsError(result, Crypto::Error::Authentication));
    EXPECT_TRUE(Security::IsErased(buffer));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolySuite, ParameterSizeTest)
{
    Security::Buffer buffer = test::Plaintext;
    local::Tag tag{};

    {
        Security::Buffer const key(16, 0x00);
        auto const result = Crypto::ChaChaPoly::EncryptInPlaceDetached(key, test::Nonce, test::Aad, buffer, tag);
        EXPECT_TRUE(local::HoldsError(result, Crypto::Error::InvalidSymmetricKeySize));
    }

    {
        Security::Buffer const nonce(8, 0x00);
        auto const result = Crypto::ChaChaPoly::EncryptInPlaceDetached(test::Key, nonce, test::Aad, buffer, tag);
        EXPECT_TRUE(local::HoldsError(result, Crypto::Error::InvalidIvSize));
    }

    {
        std::array<std::uint8_t, 15> truncated{};
        auto const result = Crypto::ChaChaPoly::EncryptInPlaceDetached(test::Key, test::Nonce, {}, buffer, truncated);
        EXPECT_TRUE(local::HoldsError(result, Crypto::Error::InvalidTagSize));
    }

    {
        std::array<std::uint8_t, 17> oversized{};
        auto const result = Crypto::ChaChaPoly::DecryptInPlaceDetached(test::Key, test::Nonce, {}, buffer, oversized);
        EXPECT_TRUE(local::HoldsError(result, Crypto::Error::InvalidTagSize));
    }

    EXPECT_EQ(buffer, test::Plaintext);
}

//----------------------------------------------------------------------------------------------------------------------

bool local::HoldsError(Crypto::Result<Security::WriteableView> const& result, Crypto::Error expected)
{
    auto const pError = std::get_if<Crypto::Error>(&result);
    return pError && *pError == expected;
}

//----------------------------------------------------------------------------------------------------------------------
