#include "access/tokenstore.hpp"
#include "core/errors.hpp"
#include "core/softwarecapability.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <vector>

using namespace cipherledger;
using namespace cipherledger::core;
using namespace cipherledger::access;
using std::chrono::seconds;

class TokenStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        capability_ = std::make_unique<SoftwareCapability>("ledger");
        store_ = std::make_unique<TokenStore>(*capability_);
        now_ = fromUnixSeconds(1700000000);
    }

    std::unique_ptr<SoftwareCapability> capability_;
    std::unique_ptr<TokenStore> store_;
    TimePoint now_;
};

TEST_F(TokenStoreTest, MintIssuesSequentialTokens) {
    const auto& first = store_->mint(1, "bob", seconds(3600), now_);
    EXPECT_EQ(first.id, 1u);
    EXPECT_EQ(first.contentId, 1u);
    EXPECT_EQ(first.owner, "bob");
    EXPECT_EQ(first.expiresAt, now_ + seconds(3600));
    EXPECT_TRUE(first.valid);

    EXPECT_EQ(store_->mint(2, "carol", seconds(10), now_).id, 2u);
    EXPECT_EQ(store_->count(), 2u);
}

TEST_F(TokenStoreTest, AccessKeyBelongsToOwner) {
    const auto& token = store_->mint(1, "bob", seconds(60), now_);
    EXPECT_TRUE(token.accessKey.isAllowed("bob"));
    EXPECT_TRUE(token.accessKey.isAllowed("ledger"));
    EXPECT_FALSE(token.accessKey.isAllowed("carol"));
    EXPECT_EQ(capability_->decrypt(token.accessKey, "bob").size(), 32u);
}

TEST_F(TokenStoreTest, MintRejectsBadInput) {
    EXPECT_THROW(store_->mint(1, "", seconds(60), now_), InvalidInput);
    EXPECT_THROW(store_->mint(1, "bob", seconds(0), now_), InvalidInput);
    EXPECT_THROW(store_->mint(1, "bob", seconds(-5), now_), InvalidInput);
    EXPECT_THROW(store_->mint(1, "bob", seconds::max(), now_), InvalidInput);
    EXPECT_EQ(store_->count(), 0u);
}

TEST_F(TokenStoreTest, ExpiryIsStrict) {
    auto id = store_->mint(1, "bob", seconds(100), now_).id;

    EXPECT_TRUE(store_->isUsable(id, now_));
    EXPECT_TRUE(store_->isUsable(id, now_ + seconds(99)));
    // expiresAt == now counts as expired
    EXPECT_FALSE(store_->isUsable(id, now_ + seconds(100)));
    EXPECT_FALSE(store_->isUsable(id, now_ + seconds(101)));

    // Expiry does not touch the validity flag
    EXPECT_TRUE(store_->info(id).valid);
}

TEST_F(TokenStoreTest, InvalidateIsIdempotent) {
    auto id = store_->mint(1, "bob", seconds(100), now_).id;

    EXPECT_TRUE(store_->invalidate(id));
    EXPECT_FALSE(store_->isUsable(id, now_));
    EXPECT_FALSE(store_->invalidate(id));
    EXPECT_FALSE(store_->info(id).valid);
    EXPECT_EQ(store_->count(), 1u);
}

TEST_F(TokenStoreTest, UnknownTokens) {
    EXPECT_THROW(store_->invalidate(1), NotFound);
    EXPECT_THROW(store_->info(0), NotFound);
    EXPECT_THROW(store_->get(7), NotFound);
    EXPECT_FALSE(store_->isUsable(1, now_));
}

TEST_F(TokenStoreTest, ListByOwnerKeepsIssueOrder) {
    store_->mint(1, "bob", seconds(10), now_);
    store_->mint(2, "carol", seconds(10), now_);
    store_->mint(3, "bob", seconds(10), now_);

    EXPECT_EQ(store_->listByOwner("bob"), (std::vector<TokenId>{1, 3}));
    EXPECT_EQ(store_->listByOwner("carol"), (std::vector<TokenId>{2}));
    EXPECT_TRUE(store_->listByOwner("dave").empty());
}

TEST_F(TokenStoreTest, DiscardAndReinstate) {
    store_->mint(1, "bob", seconds(10), now_);
    auto id = store_->mint(1, "carol", seconds(10), now_).id;

    EXPECT_THROW(store_->discard(1), std::logic_error);
    store_->discard(id);
    EXPECT_EQ(store_->count(), 1u);
    EXPECT_TRUE(store_->listByOwner("carol").empty());

    store_->invalidate(1);
    store_->reinstate(1, true);
    EXPECT_TRUE(store_->isUsable(1, now_));
}
