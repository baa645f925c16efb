#include "core/crypto/signaturesystem.hpp"
#include <gtest/gtest.h>
#include <vector>
#include <string>
#include <memory>

using namespace cipherledger::core;

class SignatureSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        system_ = std::make_unique<SignatureSystem>();
        oracleKeyPair_ = system_->generateKeyPair();

        ASSERT_FALSE(oracleKeyPair_.privateKey.empty()) << "Oracle private key is empty";
        ASSERT_FALSE(oracleKeyPair_.publicKey.empty()) << "Oracle public key is empty";
        ASSERT_EQ(oracleKeyPair_.privateKey.size(), 32) << "Incorrect private key size";
        ASSERT_EQ(oracleKeyPair_.publicKey.size(), 32) << "Incorrect public key size";
    }

    std::vector<uint8_t> stringToBytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    std::unique_ptr<SignatureSystem> system_;
    SignatureSystem::KeyPair oracleKeyPair_;
};

TEST_F(SignatureSystemTest, KeyPairGeneration) {
    auto keyPair = system_->generateKeyPair();
    EXPECT_EQ(keyPair.privateKey.size(), 32);
    EXPECT_EQ(keyPair.publicKey.size(), 32);
    EXPECT_NE(keyPair.publicKey, oracleKeyPair_.publicKey);
}

TEST_F(SignatureSystemTest, SignAndVerify) {
    auto data = stringToBytes("Test message");
    auto signature = system_->sign(data, oracleKeyPair_.privateKey);
    ASSERT_EQ(signature.size(), 64);
    EXPECT_TRUE(system_->verify(data, signature, oracleKeyPair_.publicKey));

    // Tampered data
    auto tampered = stringToBytes("Test massage");
    EXPECT_FALSE(system_->verify(tampered, signature, oracleKeyPair_.publicKey));

    // Wrong key
    auto other = system_->generateKeyPair();
    EXPECT_FALSE(system_->verify(data, signature, other.publicKey));
}

TEST_F(SignatureSystemTest, MalformedInputsDoNotVerify) {
    auto data = stringToBytes("Test message");
    auto signature = system_->sign(data, oracleKeyPair_.privateKey);

    std::vector<uint8_t> shortKey(oracleKeyPair_.publicKey.begin(),
                                  oracleKeyPair_.publicKey.begin() + 16);
    EXPECT_FALSE(system_->verify(data, signature, shortKey));

    std::vector<uint8_t> shortSig(signature.begin(), signature.begin() + 32);
    EXPECT_FALSE(system_->verify(data, shortSig, oracleKeyPair_.publicKey));

    EXPECT_FALSE(system_->verify(data, {}, oracleKeyPair_.publicKey));
}

TEST_F(SignatureSystemTest, DecryptionResponseEncoding) {
    auto encoded = SignatureSystem::encodeDecryptionResponse(7, {stringToBytes("ab")});
    std::vector<uint8_t> expected = {
        0, 0, 0, 0, 0, 0, 0, 7,     // request id
        0, 0, 0, 1,                 // count
        0, 0, 0, 2, 'a', 'b'        // length-prefixed cleartext
    };
    EXPECT_EQ(encoded, expected);
}

TEST_F(SignatureSystemTest, DecryptionResponseSignature) {
    std::vector<Plaintext> cleartexts = {stringToBytes("payload")};
    auto signature = system_->signDecryptionResponse(42, cleartexts, oracleKeyPair_.privateKey);
    ASSERT_FALSE(signature.empty());

    EXPECT_TRUE(system_->verifyDecryptionResponse(42, cleartexts, signature,
                                                  oracleKeyPair_.publicKey));

    // Signature is bound to the correlation id
    EXPECT_FALSE(system_->verifyDecryptionResponse(43, cleartexts, signature,
                                                   oracleKeyPair_.publicKey));

    // And to the cleartext
    std::vector<Plaintext> forged = {stringToBytes("payloae")};
    EXPECT_FALSE(system_->verifyDecryptionResponse(42, forged, signature,
                                                   oracleKeyPair_.publicKey));
}

TEST_F(SignatureSystemTest, CleartextBoundariesAreSigned) {
    std::vector<Plaintext> split = {stringToBytes("ab"), stringToBytes("c")};
    std::vector<Plaintext> joined = {stringToBytes("a"), stringToBytes("bc")};
    auto signature = system_->signDecryptionResponse(1, split, oracleKeyPair_.privateKey);

    EXPECT_TRUE(system_->verifyDecryptionResponse(1, split, signature,
                                                  oracleKeyPair_.publicKey));
    EXPECT_FALSE(system_->verifyDecryptionResponse(1, joined, signature,
                                                   oracleKeyPair_.publicKey));
}
