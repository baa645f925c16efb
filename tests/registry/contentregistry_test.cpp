#include "registry/contentregistry.hpp"
#include "core/errors.hpp"
#include "core/softwarecapability.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace cipherledger;
using namespace cipherledger::core;
using namespace cipherledger::registry;

class ContentRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        capability_ = std::make_unique<SoftwareCapability>("ledger");
        registry_ = std::make_unique<ContentRegistry>(*capability_);
        now_ = fromUnixSeconds(1700000000);
    }

    std::vector<uint8_t> stringToBytes(const std::string& str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    ContentId createReport(const PrincipalId& creator = "alice") {
        return registry_->createContent(creator, stringToBytes("report body"), 100,
                                        "Report", "Quarterly numbers", now_);
    }

    std::unique_ptr<SoftwareCapability> capability_;
    std::unique_ptr<ContentRegistry> registry_;
    TimePoint now_;
};

TEST_F(ContentRegistryTest, CreateAssignsSequentialIds) {
    EXPECT_EQ(createReport(), 1u);
    EXPECT_EQ(createReport("bob"), 2u);
    EXPECT_EQ(createReport(), 3u);
    EXPECT_EQ(registry_->count(), 3u);
}

TEST_F(ContentRegistryTest, CreateStoresMetadata) {
    auto id = createReport();
    auto info = registry_->getInfo(id);

    EXPECT_EQ(info.creator, "alice");
    EXPECT_EQ(info.title, "Report");
    EXPECT_EQ(info.description, "Quarterly numbers");
    EXPECT_EQ(info.createdAt, now_);
    EXPECT_TRUE(info.active);
}

TEST_F(ContentRegistryTest, PayloadAndPriceAreEncryptedForCreator) {
    auto id = createReport();
    const auto& item = registry_->get(id);

    EXPECT_TRUE(item.payload.isAllowed("alice"));
    EXPECT_TRUE(item.payload.isAllowed("ledger"));
    EXPECT_FALSE(item.payload.isAllowed("bob"));
    EXPECT_TRUE(item.price.isAllowed("alice"));

    EXPECT_EQ(capability_->decrypt(item.payload, "alice"), stringToBytes("report body"));
    EXPECT_EQ(EncryptionCapability::decodeUint64(capability_->decrypt(item.price, "alice")), 100u);
}

TEST_F(ContentRegistryTest, CreateRejectsMissingFields) {
    auto body = stringToBytes("x");
    EXPECT_THROW(registry_->createContent("", body, 1, "t", "d", now_), InvalidInput);
    EXPECT_THROW(registry_->createContent("alice", body, 1, "", "d", now_), InvalidInput);
    EXPECT_THROW(registry_->createContent("alice", body, 1, "t", "", now_), InvalidInput);

    EXPECT_EQ(registry_->count(), 0u);
    EXPECT_TRUE(registry_->listByOwner("alice").empty());
    EXPECT_EQ(createReport(), 1u);
}

TEST_F(ContentRegistryTest, UnknownContent) {
    EXPECT_THROW(registry_->getInfo(1), NotFound);
    EXPECT_THROW(registry_->get(42), NotFound);
    EXPECT_THROW(registry_->setActive(1, "alice", false), NotFound);
    EXPECT_EQ(registry_->find(1), nullptr);
}

TEST_F(ContentRegistryTest, OnlyCreatorChangesStatus) {
    auto id = createReport();

    EXPECT_THROW(registry_->setActive(id, "bob", false), Unauthorized);
    EXPECT_THROW(registry_->setActive(id, "", false), Unauthorized);
    EXPECT_TRUE(registry_->getInfo(id).active);

    EXPECT_TRUE(registry_->setActive(id, "alice", false));
    EXPECT_FALSE(registry_->getInfo(id).active);
    EXPECT_THROW(registry_->requireActive(id), Inactive);

    EXPECT_FALSE(registry_->setActive(id, "alice", true));
    EXPECT_NO_THROW(registry_->requireActive(id));
}

TEST_F(ContentRegistryTest, ListByOwnerKeepsCreationOrder) {
    createReport("alice");
    createReport("bob");
    createReport("alice");

    EXPECT_EQ(registry_->listByOwner("alice"), (std::vector<ContentId>{1, 3}));
    EXPECT_EQ(registry_->listByOwner("bob"), (std::vector<ContentId>{2}));
    EXPECT_TRUE(registry_->listByOwner("carol").empty());
}

TEST_F(ContentRegistryTest, DiscardUndoesLatestCreate) {
    createReport("alice");
    auto id = createReport("alice");

    EXPECT_THROW(registry_->discard(1), std::logic_error);

    registry_->discard(id);
    EXPECT_EQ(registry_->count(), 1u);
    EXPECT_EQ(registry_->find(id), nullptr);
    EXPECT_EQ(registry_->listByOwner("alice"), (std::vector<ContentId>{1}));

    // The discarded id is handed out again since it was never observed
    EXPECT_EQ(createReport("bob"), id);
}

TEST_F(ContentRegistryTest, ReplacePayloadSwapsHandle) {
    auto id = createReport();
    auto payload = registry_->get(id).payload;
    capability_->grantDecrypt(payload, "bob");

    registry_->replacePayload(id, payload);
    EXPECT_TRUE(registry_->get(id).payload.isAllowed("bob"));
    EXPECT_THROW(registry_->replacePayload(99, payload), NotFound);
}
