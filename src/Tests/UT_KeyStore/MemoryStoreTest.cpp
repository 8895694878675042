//----------------------------------------------------------------------------------------------------------------------
#include "Components/KeyStore/MemoryStore.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] KeyStore::OptionalError ExportError(KeyStore::MemoryStore const& store, KeyStore::KeyId id);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr KeyStore::KeyId Open128{ 1 };
constexpr KeyStore::KeyId Sealed256{ 2 };
constexpr KeyStore::KeyId Fixed192{ 3 };
constexpr KeyStore::KeyId ImportOnly256{ 4 };
constexpr KeyStore::KeyId Unknown{ 99 };

std::vector<KeyStore::KeyInfo> const Layout = {
    KeyStore::KeyInfo{ Open128, KeyStore::KeyType::Symmetric128Bits, { true, true, true, true } },
    KeyStore::KeyInfo{ Sealed256, KeyStore::KeyType::Symmetric256Bits, { true, false, false, true } },
    KeyStore::KeyInfo{ Fixed192, KeyStore::KeyType::Symmetric192Bits, { true, true, false, false } },
    KeyStore::KeyInfo{ ImportOnly256, KeyStore::KeyType::Symmetric256Bits, { false, true, true, true } },
};

Security::Buffer const Key128(16, 0x11);
Security::Buffer const Key192(24, 0x22);
Security::Buffer const Key256(32, 0x33);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ConstructionTest)
{
    KeyStore::MemoryStore const store{ test::Layout };
    EXPECT_EQ(store.GetSlotCount(), test::Layout.size());

    for (auto const& expected : test::Layout) {
        EXPECT_FALSE(store.IsStored(expected.id));
        auto const result = store.GetKeyInfo(expected.id);
        ASSERT_TRUE(std::holds_alternative<KeyStore::KeyInfo>(result));
        EXPECT_EQ(std::get<KeyStore::KeyInfo>(result), expected);
    }

    auto const unknown = store.GetKeyInfo(test::Unknown);
    ASSERT_TRUE(std::holds_alternative<KeyStore::Error>(unknown));
    EXPECT_EQ(std::get<KeyStore::Error>(unknown), KeyStore::Error::InvalidKeyId);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, DuplicateSlotTest)
{
    auto layout = test::Layout;
    layout.emplace_back(layout.front());
    EXPECT_THROW(KeyStore::MemoryStore{ layout }, std::invalid_argument);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ImportExportTest)
{
    KeyStore::MemoryStore store{ test::Layout };
    EXPECT_FALSE(store.Import(test::Open128, test::Key128));
    EXPECT_TRUE(store.IsStored(test::Open128));

    std::array<std::uint8_t, KeyStore::MaxSymmetricKeySize> destination{};
    auto const result = store.Export(test::Open128, destination);
    ASSERT_TRUE(std::holds_alternative<Security::ReadableView>(result));

    // The exported key is a prefix of the caller's destination.
    auto const exported = std::get<Security::ReadableView>(result);
    EXPECT_EQ(exported.data(), destination.data());
    EXPECT_TRUE(std::ranges::equal(exported, test::Key128));
    EXPECT_TRUE(Security::IsErased(Security::ReadableView{ destination }.subspan(test::Key128.size())));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ExportErrorTest)
{
    KeyStore::MemoryStore store{ test::Layout };
    EXPECT_EQ(local::ExportError(store, test::Unknown), KeyStore::Error::InvalidKeyId);
    EXPECT_EQ(local::ExportError(store, test::Open128), KeyStore::Error::KeyNotFound);

    // The exportable permission is checked before the slot's contents.
    EXPECT_EQ(local::ExportError(store, test::Sealed256), KeyStore::Error::NotAllowed);
    EXPECT_FALSE(store.Import(test::Sealed256, test::Key256));
    EXPECT_EQ(local::ExportError(store, test::Sealed256), KeyStore::Error::NotAllowed);

    EXPECT_FALSE(store.Import(test::Fixed192, test::Key192));
    std::array<std::uint8_t, 16> undersized{};
    auto const result = store.Export(test::Fixed192, undersized);
    ASSERT_TRUE(std::holds_alternative<KeyStore::Error>(result));
    EXPECT_EQ(std::get<KeyStore::Error>(result), KeyStore::Error::InvalidBufferSize);
    EXPECT_TRUE(Security::IsErased(undersized));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, ImportErrorTest)
{
    KeyStore::MemoryStore store{ test::Layout };
    EXPECT_EQ(store.Import(test::Unknown, test::Key128), KeyStore::Error::InvalidKeyId);
    EXPECT_EQ(store.Import(test::ImportOnly256, test::Key256), KeyStore::Error::NotAllowed);
    EXPECT_EQ(store.Import(test::Open128, test::Key256), KeyStore::Error::InvalidBufferSize);
    EXPECT_FALSE(store.IsStored(test::Open128));

    EXPECT_FALSE(store.Import(test::Fixed192, test::Key192));
    EXPECT_EQ(store.Import(test::Fixed192, test::Key192), KeyStore::Error::KeyAlreadyExists);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, OverwriteTest)
{
    KeyStore::MemoryStore store{ test::Layout };
    Security::Buffer const replacement(16, 0x99);
    EXPECT_FALSE(store.Import(test::Open128, test::Key128));
    EXPECT_FALSE(store.Import(test::Open128, replacement));

    std::array<std::uint8_t, KeyStore::MaxSymmetricKeySize> destination{};
    auto const result = store.Export(test::Open128, destination);
    ASSERT_TRUE(std::holds_alternative<Security::ReadableView>(result));
    EXPECT_TRUE(std::ranges::equal(std::get<Security::ReadableView>(result), replacement));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, DeleteTest)
{
    KeyStore::MemoryStore store{ test::Layout };
    EXPECT_EQ(store.Delete(test::Unknown), KeyStore::Error::InvalidKeyId);
    EXPECT_EQ(store.Delete(test::Open128), KeyStore::Error::KeyNotFound);

    EXPECT_FALSE(store.Import(test::Open128, test::Key128));
    EXPECT_FALSE(store.Delete(test::Open128));
    EXPECT_FALSE(store.IsStored(test::Open128));
    EXPECT_EQ(local::ExportError(store, test::Open128), KeyStore::Error::KeyNotFound);

    EXPECT_FALSE(store.Import(test::Fixed192, test::Key192));
    EXPECT_EQ(store.Delete(test::Fixed192), KeyStore::Error::NotAllowed);
    EXPECT_TRUE(store.IsStored(test::Fixed192));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(MemoryStoreSuite, KeySizeTest)
{
    EXPECT_EQ(KeyStore::GetKeySize(KeyStore::KeyType::Symmetric128Bits), std::size_t{ 16 });
    EXPECT_EQ(KeyStore::GetKeySize(KeyStore::KeyType::Symmetric192Bits), std::size_t{ 24 });
    EXPECT_EQ(KeyStore::GetKeySize(KeyStore::KeyType::Symmetric256Bits), std::size_t{ 32 });
    EXPECT_TRUE(KeyStore::IsSymmetric(KeyStore::KeyType::Symmetric192Bits));
    EXPECT_FALSE(KeyStore::IsSymmetric(KeyStore::KeyType::EccKeypairNistP256));
    EXPECT_FALSE(KeyStore::IsSymmetric(KeyStore::KeyType::Ed25519));
}

//----------------------------------------------------------------------------------------------------------------------

KeyStore::OptionalError local::ExportError(KeyStore::MemoryStore const& store, KeyStore::KeyId id)
{
    std::array<std::uint8_t, KeyStore::MaxSymmetricKeySize> destination{};
    auto const result = store.Export(id, destination);
    if (auto const pError = std::get_if<KeyStore::Error>(&result); pError) { return *pError; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
