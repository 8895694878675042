//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Crypto/CryptoDefinitions.hpp"
#include "Components/Jobs/Channel.hpp"
#include "Components/KeyStore/SharedStore.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Components/Workers/ChaChaPolyWorker.hpp"
#include "Tests/UT_Crypto/TestHelpers.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class Harness;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr KeyStore::KeyId Symmetric256{ 10 };
constexpr KeyStore::KeyId Symmetric128{ 11 };
constexpr KeyStore::KeyId NistP256{ 12 };

std::vector<KeyStore::KeyInfo> const Layout = {
    KeyStore::KeyInfo{ Symmetric256, KeyStore::KeyType::Symmetric256Bits, { true, true, true, true } },
    KeyStore::KeyInfo{ Symmetric128, KeyStore::KeyType::Symmetric128Bits, { true, true, true, true } },
    KeyStore::KeyInfo{ NistP256, KeyStore::KeyType::EccKeypairNistP256, { true, true, true, true } },
};

using Tag = std::array<std::uint8_t, Crypto::ChaChaPoly::TagSize>;

Security::Buffer const Key = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Key);
Security::Buffer const Nonce = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Nonce);
Security::Buffer const Aad = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Aad);
Security::Buffer const Plaintext = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Plaintext);
Security::Buffer const Ciphertext = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Ciphertext);
Security::Buffer const ExpectedTag = Crypto::Test::FromHex(Crypto::Test::ChaChaPoly::Tag);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::Harness
{
public:
    explicit Harness(bool attachStore);

    [[nodiscard]] bool HasKeyStore() const { return m_upWorker->HasKeyStore(); }
    [[nodiscard]] Workers::Test::SpyStore const& GetSpy() const { return *m_spSpy; }

    [[nodiscard]] bool Submit(Jobs::Request&& request) { return m_spRequests->Send(std::move(request)); }
    [[nodiscard]] Workers::ExecuteStatus Execute() { return m_upWorker->Execute(); }
    [[nodiscard]] std::optional<Jobs::Response> Collect() { return m_spResponses->Next(); }
    void Close() { m_spRequests->Close(); }

    [[nodiscard]] std::optional<Jobs::Response> Exchange(Jobs::Request&& request);

private:
    std::shared_ptr<Workers::Test::SpyStore> m_spSpy;
    std::shared_ptr<Jobs::RequestChannel> m_spRequests;
    std::shared_ptr<Jobs::ResponseChannel> m_spResponses;
    std::unique_ptr<Workers::ChaChaPolyWorker> m_upWorker;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, ConstructionTest)
{
    auto const spRequests = std::make_shared<Jobs::RequestChannel>(4);
    auto const spResponses = std::make_shared<Jobs::ResponseChannel>(4);

    EXPECT_THROW(Workers::ChaChaPolyWorker(nullptr, nullptr, spResponses), std::invalid_argument);
    EXPECT_THROW(Workers::ChaChaPolyWorker(nullptr, spRequests, nullptr), std::invalid_argument);

    // The key store is optional.
    Workers::ChaChaPolyWorker const worker{ nullptr, spRequests, spResponses };
    EXPECT_FALSE(worker.HasKeyStore());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, StoredKeyTest)
{
    local::Harness harness{ true };
    ASSERT_TRUE(harness.HasKeyStore());

    Security::Buffer buffer = test::Plaintext;
    test::Tag tag{};

    {
        auto const optResponse = harness.Exchange(Jobs::Requests::EncryptChaChaPoly{
            Workers::Test::ClientId, Jobs::RequestId{ 1 }, test::Symmetric256, test::Nonce, test::Aad, buffer, tag });
        auto const pEncrypted = Workers::Test::GetIf<Jobs::Responses::EncryptChaChaPoly>(optResponse);
        ASSERT_NE(pEncrypted, nullptr);
        EXPECT_EQ(pEncrypted->ciphertext.data(), buffer.data());
        EXPECT_EQ(pEncrypted->tag.data(), tag.data());
        EXPECT_EQ(buffer, test::Ciphertext);
        EXPECT_TRUE(std::ranges::equal(tag, test::ExpectedTag));
    }

    {
        auto const optResponse = harness.Exchange(Jobs::Requests::DecryptChaChaPoly{
            Workers::Test::ClientId, Jobs::RequestId{ 2 }, test::Symmetric256, test::Nonce, test::Aad, buffer, tag });
        auto const pDecrypted = Workers::Test::GetIf<Jobs::Responses::DecryptChaChaPoly>(optResponse);
        ASSERT_NE(pDecrypted, nullptr);
        EXPECT_EQ(pDecrypted->plaintext.data(), buffer.data());
        EXPECT_EQ(buffer, test::Plaintext);
    }

    auto const& exports = harness.GetSpy().GetExports();
    ASSERT_EQ(exports.size(), std::size_t{ 2 });
    EXPECT_TRUE(std::ranges::all_of(exports, [] (auto const& exported) { return Security::IsErased(exported); }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, InvalidKeyTypeTest)
{
    local::Harness harness{ true };
    Security::Buffer buffer = test::Plaintext;
    test::Tag tag{};

    auto const optResponse = harness.Exchange(Jobs::Requests::EncryptChaChaPoly{
        Workers::Test::ClientId, Jobs::RequestId{ 1 }, test::Symmetric128, test::Nonce, {}, buffer, tag });
    EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ KeyStore::Error::InvalidKeyType });
    EXPECT_EQ(buffer, test::Plaintext);
    ASSERT_EQ(harness.GetSpy().GetExports().size(), std::size_t{ 1 });
    EXPECT_TRUE(Security::IsErased(harness.GetSpy().GetExports().front()));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, AsymmetricKeyTest)
{
    local::Harness harness{ true };
    Security::Buffer buffer = test::Plaintext;
    test::Tag tag{};

    {
        auto const optResponse = harness.Exchange(Jobs::Requests::EncryptChaChaPoly{
            Workers::Test::ClientId, Jobs::RequestId{ 1 }, test::NistP256, test::Nonce, test::Aad, buffer, tag });
        EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ KeyStore::Error::InvalidKeyType });
    }

    {
        auto const optResponse = harness.Exchange(Jobs::Requests::DecryptChaChaPoly{
            Workers::Test::ClientId, Jobs::RequestId{ 2 }, test::NistP256, test::Nonce, test::Aad, buffer, tag });
        EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ KeyStore::Error::InvalidKeyType });
    }

    // The keypair is rejected on its metadata alone and never leaves the store.
    EXPECT_EQ(buffer, test::Plaintext);
    EXPECT_TRUE(harness.GetSpy().GetExports().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, NoKeyStoreTest)
{
    local::Harness harness{ false };
    ASSERT_FALSE(harness.HasKeyStore());

    Security::Buffer buffer = test::Plaintext;
    test::Tag tag{};

    {
        auto const optResponse = harness.Exchange(Jobs::Requests::EncryptChaChaPoly{
            Workers::Test::ClientId, Jobs::RequestId{ 1 }, test::Symmetric256, test::Nonce, test::Aad, buffer, tag });
        EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ KeyStore::Error::NoKeyStore });
        EXPECT_EQ(buffer, test::Plaintext);
    }

    {
        auto const optResponse = harness.Exchange(Jobs::Requests::DecryptChaChaPoly{
            Workers::Test::ClientId, Jobs::RequestId{ 2 }, test::Symmetric256, test::Nonce, test::Aad, buffer, tag });
        EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ KeyStore::Error::NoKeyStore });
    }

    // Requests carrying their own key are still served.
    {
        auto const optResponse = harness.Exchange(Jobs::Requests::EncryptChaChaPolyExternalKey{
            Workers::Test::ClientId, Jobs::RequestId{ 3 }, test::Key, test::Nonce, test::Aad, buffer, tag });
        ASSERT_NE(Workers::Test::GetIf<Jobs::Responses::EncryptChaChaPoly>(optResponse), nullptr);
        EXPECT_EQ(buffer, test::Ciphertext);
        EXPECT_TRUE(std::ranges::equal(tag, test::ExpectedTag));
    }

    EXPECT_TRUE(harness.GetSpy().GetCalls().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, ExternalKeyErrorTest)
{
    local::Harness harness{ false };

    {
        Security::Buffer const key(16, 0x01);
        Security::Buffer buffer = test::Plaintext;
        test::Tag tag{};
        auto const optResponse = harness.Exchange(Jobs::Requests::EncryptChaChaPolyExternalKey{
            Workers::Test::ClientId, Jobs::RequestId{ 1 }, key, test::Nonce, {}, buffer, tag });
        EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ Crypto::Error::InvalidSymmetricKeySize });
    }

    {
        Security::Buffer buffer = test::Ciphertext;
        auto tag = test::ExpectedTag;
        tag.back() ^= 0x10;
        auto const optResponse = harness.Exchange(Jobs::Requests::DecryptChaChaPolyExternalKey{
            Workers::Test::ClientId, Jobs::RequestId{ 2 }, test::Key, test::Nonce, test::Aad, buffer, tag });
        EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ Crypto::Error::Authentication });
        EXPECT_TRUE(Security::IsErased(buffer));
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, UnexpectedRequestTest)
{
    local::Harness harness{ true };
    Security::Buffer const key(16, 0x01);
    Security::Buffer const iv(12, 0x02);
    Security::Buffer buffer(16, 0x5A);
    test::Tag tag{};

    ASSERT_TRUE(harness.Submit(Jobs::Requests::EncryptAesGcmExternalKey{
        Jobs::ClientId{ 5 }, Jobs::RequestId{ 6 }, key, iv, {}, buffer, tag }));
    EXPECT_EQ(harness.Execute(), Workers::ExecuteStatus::Processed);

    auto const optResponse = harness.Collect();
    ASSERT_TRUE(optResponse);
    EXPECT_EQ(Jobs::GetClientId(*optResponse), Jobs::ClientId{ 5 });
    EXPECT_EQ(Jobs::GetRequestId(*optResponse), Jobs::RequestId{ 6 });
    EXPECT_EQ(Workers::Test::GetError(optResponse), Jobs::Error{ Jobs::ProtocolError::UnexpectedRequestType });
    EXPECT_TRUE(std::ranges::all_of(buffer, [] (std::uint8_t byte) { return byte == 0x5A; }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, TerminationTest)
{
    local::Harness harness{ false };
    EXPECT_EQ(harness.Execute(), Workers::ExecuteStatus::Idle);
    harness.Close();
    EXPECT_EQ(harness.Execute(), Workers::ExecuteStatus::StreamTerminated);
    EXPECT_FALSE(harness.Submit(Jobs::Requests::GetRandom{ Workers::Test::ClientId, Jobs::RequestId{ 1 }, {} }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ChaChaPolyWorkerSuite, SendFailureTest)
{
    auto const spRequests = std::make_shared<Jobs::RequestChannel>(4);
    auto const spSink = std::make_shared<Workers::Test::RejectingSink>();
    Workers::ChaChaPolyWorker worker{ nullptr, spRequests, spSink };

    Security::Buffer buffer = test::Plaintext;
    test::Tag tag{};
    ASSERT_TRUE(spRequests->Send(Jobs::Requests::EncryptChaChaPolyExternalKey{
        Workers::Test::ClientId, Jobs::RequestId{ 1 }, test::Key, test::Nonce, test::Aad, buffer, tag }));

    EXPECT_EQ(worker.Execute(), Workers::ExecuteStatus::SendFailure);
    EXPECT_EQ(spSink->GetAttempts(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

local::Harness::Harness(bool attachStore)
    : m_spSpy(std::make_shared<Workers::Test::SpyStore>(test::Layout))
    , m_spRequests(std::make_shared<Jobs::RequestChannel>(8))
    , m_spResponses(std::make_shared<Jobs::ResponseChannel>(8))
    , m_upWorker()
{
    auto& store = m_spSpy->GetStore();
    Security::Buffer const key128(16, 0x7F);
    Security::Buffer const keypair(KeyStore::GetKeySize(KeyStore::KeyType::EccKeypairNistP256), 0x5A);
    if (store.Import(test::Symmetric256, test::Key) || store.Import(test::Symmetric128, key128) ||
        store.Import(test::NistP256, keypair)) {
        throw std::runtime_error("Failed to provision a test key!");
    }

    auto const spShared = attachStore ? std::make_shared<KeyStore::SharedStore>(m_spSpy) : nullptr;
    m_upWorker = std::make_unique<Workers::ChaChaPolyWorker>(spShared, m_spRequests, m_spResponses);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Jobs::Response> local::Harness::Exchange(Jobs::Request&& request)
{
    if (!Submit(std::move(request))) { return {}; }
    if (Execute() != Workers::ExecuteStatus::Processed) { return {}; }
    return Collect();
}

//----------------------------------------------------------------------------------------------------------------------
