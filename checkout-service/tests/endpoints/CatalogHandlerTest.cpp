/**
 * @file CatalogHandlerTest.cpp
 * @brief Unit-тесты для CatalogHandler и CatalogInvalidateHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/CatalogHandler.hpp"
#include "../mocks/TestSettings.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace checkout;
using namespace checkout::adapters::primary;
using namespace checkout::tests;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockCatalogService : public ports::input::ICatalogService {
public:
    MOCK_METHOD(domain::CatalogSnapshot, catalog, (), (override));
    MOCK_METHOD(void, invalidate, (), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class CatalogHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockCatalogService_ = std::make_shared<::testing::StrictMock<MockCatalogService>>();
        settings_ = std::make_shared<TestCheckoutSettings>();
        handler_ = std::make_unique<CatalogHandler>(mockCatalogService_);
    }

    SimpleRequest createRequest(const std::string& method, const std::string& path,
                                const std::string& adminToken = "") {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        if (!adminToken.empty()) {
            req.setHeader("X-Admin-Token", adminToken);
        }
        return req;
    }

    std::shared_ptr<::testing::StrictMock<MockCatalogService>> mockCatalogService_;
    std::shared_ptr<TestCheckoutSettings> settings_;
    std::unique_ptr<CatalogHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: GET /api/v1/catalog
// ============================================================================

TEST_F(CatalogHandlerTest, ReturnsLocationsAndCategories) {
    domain::CatalogSnapshot snapshot;
    snapshot.locations = {"berlin", "paris"};
    snapshot.categories = {"ring"};
    EXPECT_CALL(*mockCatalogService_, catalog()).WillOnce(Return(snapshot));

    auto req = createRequest("GET", "/api/v1/catalog");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["locations"].size(), 2u);
    EXPECT_EQ(json["categories"][0], "ring");
}

TEST_F(CatalogHandlerTest, DatastoreDown_500) {
    EXPECT_CALL(*mockCatalogService_, catalog())
        .WillOnce(::testing::Throw(std::runtime_error("connection refused")));

    auto req = createRequest("GET", "/api/v1/catalog");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

// ============================================================================
// ТЕСТЫ: POST /api/v1/admin/catalog/invalidate
// ============================================================================

TEST_F(CatalogHandlerTest, Invalidate_WithToken) {
    CatalogInvalidateHandler invalidateHandler(mockCatalogService_, settings_);
    EXPECT_CALL(*mockCatalogService_, invalidate()).Times(1);

    auto req = createRequest("POST", "/api/v1/admin/catalog/invalidate", "admin-secret");
    SimpleResponse res;

    invalidateHandler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(CatalogHandlerTest, Invalidate_WrongToken_401) {
    CatalogInvalidateHandler invalidateHandler(mockCatalogService_, settings_);

    auto req = createRequest("POST", "/api/v1/admin/catalog/invalidate", "guess");
    SimpleResponse res;

    invalidateHandler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
}

TEST_F(CatalogHandlerTest, Invalidate_NoTokenConfigured_403) {
    settings_->adminToken = "";
    CatalogInvalidateHandler invalidateHandler(mockCatalogService_, settings_);

    auto req = createRequest("POST", "/api/v1/admin/catalog/invalidate", "admin-secret");
    SimpleResponse res;

    invalidateHandler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 403);
}
