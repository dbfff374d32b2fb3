/**
 * @file CachedCatalogRepositoryTest.cpp
 * @brief Unit tests for CachedCatalogRepository
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "adapters/secondary/cache/CachedCatalogRepository.hpp"
#include "settings/CacheSettings.hpp"

using namespace checkout;
using namespace checkout::adapters::secondary;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockPostgresCatalogRepository : public PostgresCatalogRepository {
public:
    MockPostgresCatalogRepository() : PostgresCatalogRepository(nullptr) {}

    MOCK_METHOD(domain::CatalogSnapshot, load, (), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class CachedCatalogRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockDelegate_ = std::make_shared<MockPostgresCatalogRepository>();
        cachedRepository_ = std::make_shared<CachedCatalogRepository>(
            mockDelegate_, std::make_shared<settings::CacheSettings>());

        snapshot_.locations = {"berlin", "paris"};
        snapshot_.categories = {"ring", "watch"};
    }

    std::shared_ptr<MockPostgresCatalogRepository> mockDelegate_;
    std::shared_ptr<CachedCatalogRepository> cachedRepository_;
    domain::CatalogSnapshot snapshot_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(CachedCatalogRepositoryTest, Load_SecondCallServedFromCache) {
    EXPECT_CALL(*mockDelegate_, load()).Times(1).WillOnce(Return(snapshot_));

    auto first = cachedRepository_->load();
    auto second = cachedRepository_->load();

    EXPECT_EQ(first.locations, snapshot_.locations);
    EXPECT_EQ(second.categories, snapshot_.categories);
    EXPECT_EQ(cachedRepository_->size(), 1u);
}

TEST_F(CachedCatalogRepositoryTest, Invalidate_ReloadsFromDelegate) {
    domain::CatalogSnapshot updated = snapshot_;
    updated.locations.push_back("rome");

    EXPECT_CALL(*mockDelegate_, load())
        .WillOnce(Return(snapshot_))
        .WillOnce(Return(updated));

    cachedRepository_->load();
    cachedRepository_->invalidate();
    EXPECT_EQ(cachedRepository_->size(), 0u);

    auto reloaded = cachedRepository_->load();
    EXPECT_TRUE(reloaded.hasLocation("rome"));
}

TEST_F(CachedCatalogRepositoryTest, Load_DelegateFailure_NotCached) {
    EXPECT_CALL(*mockDelegate_, load())
        .WillOnce(::testing::Throw(std::runtime_error("connection refused")))
        .WillOnce(Return(snapshot_));

    EXPECT_THROW(cachedRepository_->load(), std::runtime_error);
    EXPECT_EQ(cachedRepository_->size(), 0u);

    EXPECT_TRUE(cachedRepository_->load().hasCategory("watch"));
}
