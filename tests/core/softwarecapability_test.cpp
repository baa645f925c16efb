#include "core/softwarecapability.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace cipherledger;
using namespace cipherledger::core;

class SoftwareCapabilityTest : public ::testing::Test {
protected:
    void SetUp() override {
        capability_ = std::make_unique<SoftwareCapability>("ledger");
    }

    std::vector<uint8_t> stringToBytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    std::unique_ptr<SoftwareCapability> capability_;
};

TEST_F(SoftwareCapabilityTest, EncryptHidesPlaintext) {
    auto plaintext = stringToBytes("Quarterly report contents");
    auto handle = capability_->encrypt(plaintext);

    // IV || ciphertext || tag
    EXPECT_EQ(handle.value().size(), 12 + plaintext.size() + 16);
    std::string value(handle.value().begin(), handle.value().end());
    EXPECT_EQ(value.find("Quarterly"), std::string::npos);
}

TEST_F(SoftwareCapabilityTest, EncryptionIsRandomized) {
    auto plaintext = stringToBytes("same");
    auto a = capability_->encrypt(plaintext);
    auto b = capability_->encrypt(plaintext);
    EXPECT_NE(a.value(), b.value());
}

TEST_F(SoftwareCapabilityTest, AllowedPrincipalDecrypts) {
    auto plaintext = stringToBytes("secret");
    auto handle = capability_->encrypt(plaintext);

    EXPECT_EQ(capability_->decrypt(handle, "ledger"), plaintext);

    capability_->grantDecrypt(handle, "alice");
    EXPECT_EQ(capability_->decrypt(handle, "alice"), plaintext);
}

TEST_F(SoftwareCapabilityTest, OtherPrincipalCannotDecrypt) {
    auto handle = capability_->encrypt(stringToBytes("secret"));
    EXPECT_THROW(capability_->decrypt(handle, "mallory"), NoAccess);
    EXPECT_THROW(capability_->decrypt(handle, ""), NoAccess);
}

TEST_F(SoftwareCapabilityTest, ForeignCiphertextFailsAuthentication) {
    SoftwareCapability other("ledger");
    auto handle = other.encrypt(stringToBytes("secret"));
    EXPECT_THROW(capability_->decrypt(handle, "ledger"), std::runtime_error);
}

TEST_F(SoftwareCapabilityTest, EncryptedPriceRoundTrips) {
    auto price = capability_->encryptUint64(250);
    EXPECT_EQ(EncryptionCapability::decodeUint64(capability_->decrypt(price, "ledger")), 250u);
}

TEST_F(SoftwareCapabilityTest, RandomCiphertextIsFreshKeyMaterial) {
    auto a = capability_->randomCiphertext();
    auto b = capability_->randomCiphertext();

    auto keyA = capability_->decrypt(a, "ledger");
    auto keyB = capability_->decrypt(b, "ledger");
    EXPECT_EQ(keyA.size(), 32u);
    EXPECT_EQ(keyB.size(), 32u);
    EXPECT_NE(keyA, keyB);
    EXPECT_TRUE(a.isAllowed("ledger"));
}

TEST_F(SoftwareCapabilityTest, DecryptionIsAsynchronous) {
    auto handle = capability_->encrypt(stringToBytes("payload"));

    bool called = false;
    auto id = capability_->requestDecryption(
        {handle}, [&](RequestId, std::vector<Plaintext>, std::vector<uint8_t>) {
            called = true;
        });

    EXPECT_GT(id, 0u);
    EXPECT_FALSE(called);
    EXPECT_EQ(capability_->pendingRequests(), 1u);

    EXPECT_EQ(capability_->processPending(), 1u);
    EXPECT_TRUE(called);
    EXPECT_EQ(capability_->pendingRequests(), 0u);
}

TEST_F(SoftwareCapabilityTest, OracleResponseIsSigned) {
    auto plaintext = stringToBytes("payload");
    auto handle = capability_->encrypt(plaintext);

    RequestId seenId = 0;
    std::vector<Plaintext> seenCleartexts;
    std::vector<uint8_t> seenSignature;
    auto id = capability_->requestDecryption(
        {handle}, [&](RequestId requestId, std::vector<Plaintext> cleartexts,
                      std::vector<uint8_t> signature) {
            seenId = requestId;
            seenCleartexts = std::move(cleartexts);
            seenSignature = std::move(signature);
        });
    capability_->processPending();

    EXPECT_EQ(seenId, id);
    ASSERT_EQ(seenCleartexts.size(), 1u);
    EXPECT_EQ(seenCleartexts[0], plaintext);

    SignatureSystem signatures;
    EXPECT_TRUE(signatures.verifyDecryptionResponse(
        id, seenCleartexts, seenSignature, capability_->oracleVerificationKey()));
}

TEST_F(SoftwareCapabilityTest, RequestIdsIncrease) {
    auto handle = capability_->encrypt(stringToBytes("payload"));
    auto first = capability_->requestDecryption({handle}, nullptr);
    auto second = capability_->requestDecryption({handle}, nullptr);
    EXPECT_LT(first, second);
    EXPECT_EQ(capability_->processPending(), 2u);
}

TEST_F(SoftwareCapabilityTest, InvalidDecryptionRequests) {
    EXPECT_THROW(capability_->requestDecryption({}, nullptr), InvalidInput);
    EXPECT_THROW(capability_->requestDecryption({CiphertextHandle()}, nullptr), InvalidInput);
    EXPECT_EQ(capability_->pendingRequests(), 0u);
}
