/**
 * @file TransferHandlerTest.cpp
 * @brief Unit tests for TransferHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/TransferHandler.hpp"
#include "ports/input/ITransferService.hpp"

#include <nlohmann/json.hpp>

using namespace finance;
using namespace finance::adapters::primary;
using ::testing::_;
using ::testing::Eq;
using ::testing::Field;
using ::testing::Property;
using ::testing::AllOf;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockTransferService : public ports::input::ITransferService {
public:
    MOCK_METHOD(domain::Transfer, createTransfer,
                (const std::string&, const domain::TransferRequest&), (override));
    MOCK_METHOD(domain::Transfer, updateTransfer,
                (const std::string&, int64_t, const domain::TransferRequest&), (override));
    MOCK_METHOD(void, deleteTransfer, (const std::string&, int64_t), (override));
    MOCK_METHOD(std::optional<domain::Transfer>, getTransfer, (const std::string&, int64_t), (override));
    MOCK_METHOD(std::vector<domain::Transfer>, listTransfers,
                (const std::string&, const domain::EntryFilter&), (override));
    MOCK_METHOD(domain::Transfer, depositSalary,
                (const std::string&, int64_t, const domain::Money&), (override));
    MOCK_METHOD(domain::Transfer, depositRandomSalary,
                (const std::string&, int64_t, const domain::Money&, const domain::Money&), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class TransferHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockService_ = std::make_shared<MockTransferService>();
        handler_ = std::make_unique<TransferHandler>(mockService_);
    }

    CommandRequest createRequest(const std::string& op, const nlohmann::json& data) {
        CommandRequest req;
        req.op = op;
        req.userId = "user-1";
        req.data = data;
        return req;
    }

    static domain::Transfer sampleTransfer() {
        domain::Transfer transfer;
        transfer.id = 11;
        transfer.userId = "user-1";
        transfer.fromAccountId = 1;
        transfer.toAccountId = 2;
        transfer.amount = domain::Money::fromString("200.00");
        transfer.createdAt = domain::Timestamp::fromDate(2025, 8, 1);
        return transfer;
    }

    std::shared_ptr<MockTransferService> mockService_;
    std::unique_ptr<TransferHandler> handler_;
};

// ============================================================================
// SUCCESS CASES
// ============================================================================

TEST_F(TransferHandlerTest, Create_Returns201) {
    EXPECT_CALL(*mockService_, createTransfer("user-1", AllOf(
            Field(&domain::TransferRequest::fromAccountId, Eq(1)),
            Field(&domain::TransferRequest::toAccountId, Eq(2)),
            Field(&domain::TransferRequest::amount, Property(&domain::Money::cents, Eq(20000))))))
        .WillOnce(Return(sampleTransfer()));

    CommandResponse res;
    handler_->handle(createRequest("transfer.create",
        {{"from_account", 1}, {"to_account", "2"}, {"amount", "200.00"}}), res);

    EXPECT_EQ(res.status, 201);
    EXPECT_EQ(res.body["id"], 11);
    EXPECT_EQ(res.body["from_account"], 1);
    EXPECT_EQ(res.body["to_account"], 2);
    EXPECT_EQ(res.body["amount"], "200.00");
    EXPECT_EQ(res.body["created_at"], "2025-08-01T00:00:00Z");
}

TEST_F(TransferHandlerTest, Update_PassesId) {
    EXPECT_CALL(*mockService_, updateTransfer("user-1", 11, _))
        .WillOnce(Return(sampleTransfer()));

    CommandResponse res;
    handler_->handle(createRequest("transfer.update",
        {{"id", 11}, {"from_account", 1}, {"to_account", 2}, {"amount", 200}}), res);

    EXPECT_EQ(res.status, 200);
}

TEST_F(TransferHandlerTest, Delete_Returns204) {
    EXPECT_CALL(*mockService_, deleteTransfer("user-1", 11));

    CommandResponse res;
    handler_->handle(createRequest("transfer.delete", {{"id", 11}}), res);

    EXPECT_EQ(res.status, 204);
    EXPECT_TRUE(res.body.is_null());
}

TEST_F(TransferHandlerTest, Get_Missing_Returns404) {
    EXPECT_CALL(*mockService_, getTransfer("user-1", 99)).WillOnce(Return(std::nullopt));

    CommandResponse res;
    handler_->handle(createRequest("transfer.get", {{"id", 99}}), res);

    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(res.body["error"], "Not found.");
}

TEST_F(TransferHandlerTest, List_ParsesFilter) {
    EXPECT_CALL(*mockService_, listTransfers("user-1", AllOf(
            Field(&domain::EntryFilter::fromAccountId, Eq(std::optional<int64_t>(1))),
            Field(&domain::EntryFilter::accountId, Eq(std::nullopt)))))
        .WillOnce(Return(std::vector<domain::Transfer>{sampleTransfer()}));

    CommandResponse res;
    handler_->handle(createRequest("transfer.list",
        {{"from_account", 1}, {"start", "2025-08"}, {"end", "2025-08"}}), res);

    EXPECT_EQ(res.status, 200);
    ASSERT_TRUE(res.body.is_array());
    EXPECT_EQ(res.body.size(), 1u);
}

TEST_F(TransferHandlerTest, Salary_Returns201) {
    EXPECT_CALL(*mockService_, depositSalary("user-1", 2, Property(&domain::Money::cents, Eq(150000))))
        .WillOnce(Return(sampleTransfer()));

    CommandResponse res;
    handler_->handle(createRequest("transfer.salary", {{"account", 2}, {"amount", "1500"}}), res);

    EXPECT_EQ(res.status, 201);
}

TEST_F(TransferHandlerTest, RandomSalary_ParsesBounds) {
    EXPECT_CALL(*mockService_, depositRandomSalary("user-1", 2,
            Property(&domain::Money::cents, Eq(10000)),
            Property(&domain::Money::cents, Eq(20050))))
        .WillOnce(Return(sampleTransfer()));

    CommandResponse res;
    handler_->handle(createRequest("transfer.salary_random",
        {{"account", 2}, {"min", "100"}, {"max", "200.50"}}), res);

    EXPECT_EQ(res.status, 201);
}

// ============================================================================
// ERROR CASES
// ============================================================================

TEST_F(TransferHandlerTest, MissingAmount_ValidationError) {
    EXPECT_CALL(*mockService_, createTransfer(_, _)).Times(0);

    CommandResponse res;
    try {
        handler_->handle(createRequest("transfer.create", {{"from_account", 1}, {"to_account", 2}}), res);
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_EQ(e.field(), "amount");
    }
}

TEST_F(TransferHandlerTest, BadAmountPrecision_ValidationError) {
    CommandResponse res;

    EXPECT_THROW(handler_->handle(createRequest("transfer.create",
        {{"from_account", 1}, {"to_account", 2}, {"amount", "1.234"}}), res), domain::ValidationError);
}

TEST_F(TransferHandlerTest, BadId_ValidationError) {
    CommandResponse res;

    EXPECT_THROW(handler_->handle(createRequest("transfer.get", {{"id", "abc"}}), res),
                 domain::ValidationError);
    EXPECT_THROW(handler_->handle(createRequest("transfer.list", {{"start", "2025-13-01"}}), res),
                 domain::ValidationError);
}

TEST_F(TransferHandlerTest, UnknownOp_Returns404) {
    CommandResponse res;
    handler_->handle(createRequest("transfer.explode", nlohmann::json::object()), res);

    EXPECT_EQ(res.status, 404);
}
