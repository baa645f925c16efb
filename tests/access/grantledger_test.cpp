#include "access/grantledger.hpp"
#include "access/tokenstore.hpp"
#include "core/errors.hpp"
#include "core/softwarecapability.hpp"
#include "registry/contentregistry.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace cipherledger;
using namespace cipherledger::core;
using namespace cipherledger::access;
using std::chrono::seconds;

class GrantLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        capability_ = std::make_unique<SoftwareCapability>("ledger");
        registry_ = std::make_unique<registry::ContentRegistry>(*capability_);
        tokens_ = std::make_unique<TokenStore>(*capability_);
        grants_ = std::make_unique<GrantLedger>(*registry_, *tokens_, *capability_, seconds(86400));
        now_ = fromUnixSeconds(1700000000);

        content_ = registry_->createContent("alice", stringToBytes("report body"), 100,
                                            "Report", "Quarterly numbers", now_);
    }

    std::vector<uint8_t> stringToBytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    std::unique_ptr<SoftwareCapability> capability_;
    std::unique_ptr<registry::ContentRegistry> registry_;
    std::unique_ptr<TokenStore> tokens_;
    std::unique_ptr<GrantLedger> grants_;
    TimePoint now_;
    ContentId content_ = 0;
};

TEST_F(GrantLedgerTest, PurchaseGrantsAccess) {
    auto receipt = grants_->purchase("bob", content_, seconds(3600), now_);

    EXPECT_EQ(receipt.tokenId, 1u);
    EXPECT_EQ(receipt.expiresAt, now_ + seconds(3600));
    EXPECT_FALSE(receipt.previousGrant.has_value());
    EXPECT_TRUE(grants_->checkAccess(content_, "bob", now_));

    auto grant = grants_->getGrant(content_, "bob");
    ASSERT_TRUE(grant.has_value());
    EXPECT_TRUE(grant->active);
    EXPECT_EQ(grant->tokenId, std::optional<TokenId>(1));
    EXPECT_EQ(grant->grantedAt, now_);
}

TEST_F(GrantLedgerTest, PurchaseExtendsPayloadPermission) {
    EXPECT_FALSE(registry_->get(content_).payload.isAllowed("bob"));
    grants_->purchase("bob", content_, seconds(3600), now_);

    const auto& payload = registry_->get(content_).payload;
    EXPECT_TRUE(payload.isAllowed("bob"));
    EXPECT_EQ(capability_->decrypt(payload, "bob"), stringToBytes("report body"));
}

TEST_F(GrantLedgerTest, CreatorAlwaysHasAccess) {
    EXPECT_TRUE(grants_->checkAccess(content_, "alice", now_));
    EXPECT_FALSE(grants_->getGrant(content_, "alice").has_value());
    EXPECT_FALSE(grants_->checkAccess(content_, "bob", now_));
    EXPECT_FALSE(grants_->checkAccess(content_, "", now_));
    EXPECT_FALSE(grants_->checkAccess(99, "alice", now_));
}

TEST_F(GrantLedgerTest, PurchaseValidation) {
    EXPECT_THROW(grants_->purchase("bob", 99, seconds(60), now_), NotFound);
    EXPECT_THROW(grants_->purchase("bob", content_, seconds(0), now_), InvalidInput);
    EXPECT_THROW(grants_->purchase("bob", content_, seconds(-1), now_), InvalidInput);
    EXPECT_THROW(grants_->purchase("bob", content_, seconds(86401), now_), InvalidInput);
    EXPECT_THROW(grants_->purchase("", content_, seconds(60), now_), InvalidInput);

    registry_->setActive(content_, "alice", false);
    EXPECT_THROW(grants_->purchase("bob", content_, seconds(60), now_), Inactive);
}

TEST_F(GrantLedgerTest, ExpiryOverflowRejected) {
    GrantLedger unlimited(*registry_, *tokens_, *capability_, seconds(0));
    EXPECT_THROW(unlimited.purchase("bob", content_, seconds::max(), now_), InvalidInput);
    EXPECT_EQ(tokens_->count(), 0u);
}

TEST_F(GrantLedgerTest, FailedPurchaseChangesNothing) {
    grants_->purchase("bob", content_, seconds(100), now_);
    auto payloadBefore = registry_->get(content_).payload;

    EXPECT_THROW(grants_->purchase("bob", content_, seconds(100), now_), AlreadyGranted);
    EXPECT_THROW(grants_->purchase("carol", content_, seconds(0), now_), InvalidInput);

    EXPECT_EQ(tokens_->count(), 1u);
    EXPECT_EQ(registry_->get(content_).payload, payloadBefore);
    EXPECT_FALSE(grants_->getGrant(content_, "carol").has_value());
    EXPECT_TRUE(tokens_->listByOwner("carol").empty());
}

TEST_F(GrantLedgerTest, DuplicatePurchaseRejected) {
    grants_->purchase("bob", content_, seconds(100), now_);
    EXPECT_THROW(grants_->purchase("bob", content_, seconds(100), now_), AlreadyGranted);
}

TEST_F(GrantLedgerTest, RepurchaseAfterExpiryReusesGrant) {
    grants_->purchase("bob", content_, seconds(100), now_);
    auto later = now_ + seconds(100);
    EXPECT_FALSE(grants_->checkAccess(content_, "bob", later));

    auto receipt = grants_->purchase("bob", content_, seconds(100), later);
    EXPECT_EQ(receipt.tokenId, 2u);
    ASSERT_TRUE(receipt.previousGrant.has_value());
    EXPECT_EQ(receipt.previousGrant->tokenId, std::optional<TokenId>(1));

    auto grant = grants_->getGrant(content_, "bob");
    ASSERT_TRUE(grant.has_value());
    EXPECT_EQ(grant->tokenId, std::optional<TokenId>(2));
    EXPECT_EQ(grant->grantedAt, later);
    EXPECT_TRUE(grants_->checkAccess(content_, "bob", later));
}

TEST_F(GrantLedgerTest, RevokeCutsAccess) {
    grants_->purchase("bob", content_, seconds(3600), now_);
    auto receipt = grants_->revoke("alice", content_, "bob");

    EXPECT_EQ(receipt.tokenId, std::optional<TokenId>(1));
    EXPECT_TRUE(receipt.tokenWasValid);
    EXPECT_FALSE(grants_->checkAccess(content_, "bob", now_));
    EXPECT_FALSE(tokens_->info(1).valid);

    auto grant = grants_->getGrant(content_, "bob");
    ASSERT_TRUE(grant.has_value());
    EXPECT_FALSE(grant->active);
    EXPECT_EQ(grant->tokenId, std::optional<TokenId>(1));

    // Decrypt rights already handed out are not retracted
    EXPECT_TRUE(registry_->get(content_).payload.isAllowed("bob"));
}

TEST_F(GrantLedgerTest, RevokeTwiceFails) {
    grants_->purchase("bob", content_, seconds(3600), now_);
    grants_->revoke("alice", content_, "bob");
    EXPECT_THROW(grants_->revoke("alice", content_, "bob"), NoAccess);
    EXPECT_FALSE(grants_->getGrant(content_, "bob")->active);
}

TEST_F(GrantLedgerTest, RevokeValidation) {
    grants_->purchase("bob", content_, seconds(3600), now_);

    EXPECT_THROW(grants_->revoke("alice", 99, "bob"), NotFound);
    EXPECT_THROW(grants_->revoke("bob", content_, "bob"), Unauthorized);
    EXPECT_THROW(grants_->revoke("alice", content_, "carol"), NoAccess);
    // The creator holds no grant and cannot be revoked
    EXPECT_THROW(grants_->revoke("alice", content_, "alice"), NoAccess);
    EXPECT_TRUE(grants_->checkAccess(content_, "bob", now_));
}

TEST_F(GrantLedgerTest, AccessContentGate) {
    EXPECT_THROW(grants_->accessContent("bob", 99, now_), NotFound);
    EXPECT_THROW(grants_->accessContent("bob", content_, now_), NoAccess);

    const auto& creatorView = grants_->accessContent("alice", content_, now_);
    EXPECT_TRUE(creatorView.isAllowed("alice"));

    grants_->purchase("bob", content_, seconds(60), now_);
    EXPECT_NO_THROW(grants_->accessContent("bob", content_, now_));
    EXPECT_THROW(grants_->accessContent("bob", content_, now_ + seconds(60)), NoAccess);

    registry_->setActive(content_, "alice", false);
    EXPECT_THROW(grants_->accessContent("alice", content_, now_), Inactive);
}

TEST_F(GrantLedgerTest, PurchaseRollbackRestoresState) {
    auto payloadBefore = registry_->get(content_).payload;
    auto receipt = grants_->purchase("bob", content_, seconds(60), now_);

    grants_->rollback(receipt);
    EXPECT_EQ(tokens_->count(), 0u);
    EXPECT_FALSE(grants_->getGrant(content_, "bob").has_value());
    EXPECT_EQ(registry_->get(content_).payload, payloadBefore);
    EXPECT_FALSE(grants_->checkAccess(content_, "bob", now_));
}

TEST_F(GrantLedgerTest, RevokeRollbackRestoresState) {
    grants_->purchase("bob", content_, seconds(60), now_);
    auto receipt = grants_->revoke("alice", content_, "bob");

    grants_->rollback(receipt);
    EXPECT_TRUE(grants_->getGrant(content_, "bob")->active);
    EXPECT_TRUE(tokens_->info(1).valid);
    EXPECT_TRUE(grants_->checkAccess(content_, "bob", now_));
}

TEST_F(GrantLedgerTest, CreatorMayPurchaseOwnContent) {
    auto receipt = grants_->purchase("alice", content_, seconds(60), now_);
    EXPECT_EQ(receipt.tokenId, 1u);
    EXPECT_TRUE(grants_->getGrant(content_, "alice")->active);
}

TEST_F(GrantLedgerTest, NegativeMaximumRejected) {
    EXPECT_THROW((GrantLedger{*registry_, *tokens_, *capability_, seconds(-1)}), InvalidInput);
}
