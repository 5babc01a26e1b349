#include <nlohmann/json.hpp>

#include "dlog_http_output.h"
#include "dlog_test_common.h"

static size_t countRecords(const std::vector<std::string>& bodies) {
    size_t recordCount = 0;
    for (const std::string& body : bodies) {
        nlohmann::json batch = nlohmann::json::parse(body);
        recordCount += batch.size();
    }
    return recordCount;
}

static int testBatchFlush() {
    TestWebhookServer server;
    if (!server.start()) {
        return 1;
    }

    // long interval, only size and close trigger a flush
    dlog::DLogHttpOutput output("webhook", server.getUrl(), "", 3, 60);
    if (output.start() != dlog::DLOG_E_OK) {
        return 2;
    }
    for (int i = 0; i < 5; ++i) {
        if (output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "record " + std::to_string(i))) !=
            dlog::DLOG_E_OK) {
            return 3;
        }
    }
    if (!server.waitForRequests(1)) {
        return 4;
    }
    if (output.close() != dlog::DLOG_E_OK) {
        return 5;
    }

    std::vector<std::string> bodies = server.getBodies();
    if (bodies.empty() || bodies.size() > 2) {
        fprintf(stderr, "Unexpected HTTP batch count: %zu\n", bodies.size());
        return 6;
    }
    if (countRecords(bodies) != 5) {
        return 7;
    }

    // records keep their order across batches
    int expected = 0;
    for (const std::string& body : bodies) {
        nlohmann::json batch = nlohmann::json::parse(body);
        if (!batch.is_array()) {
            return 8;
        }
        for (const nlohmann::json& entry : batch) {
            if (entry["message"].get<std::string>() != "record " + std::to_string(expected++)) {
                return 9;
            }
            if (entry["level"].get<std::string>() != "info" || !entry.contains("timestamp")) {
                return 10;
            }
        }
    }
    if (output.getSentBatchCount() != bodies.size() || output.getFailedBatchCount() != 0) {
        return 11;
    }
    return 0;
}

TEST(DLogHttp, BatchFlush) {
    int res = testBatchFlush();
    EXPECT_EQ(res, 0);
}

TEST(DLogHttp, PeriodicFlush) {
    TestWebhookServer server;
    ASSERT_TRUE(server.start());
    dlog::DLogHttpOutput output("webhook", server.getUrl(), "", 100, 1);
    ASSERT_EQ(output.start(), dlog::DLOG_E_OK);
    ASSERT_EQ(output.write(dlog::DLogRecord(dlog::DLEVEL_WARN, "lonely record")), dlog::DLOG_E_OK);

    // batch is far from full, the timer flushes it
    EXPECT_TRUE(server.waitForRequests(1, 4000));
    EXPECT_EQ(countRecords(server.getBodies()), 1u);
    EXPECT_EQ(output.close(), dlog::DLOG_E_OK);
    EXPECT_EQ(server.getBodies().size(), 1u);
}

TEST(DLogHttp, Headers) {
    TestWebhookServer server;
    ASSERT_TRUE(server.start());
    dlog::DLogHttpOutput output("webhook", server.getUrl(), "s3cr3t", 1, 60);
    ASSERT_EQ(output.start(), dlog::DLOG_E_OK);
    ASSERT_EQ(output.write(dlog::DLogRecord(dlog::DLEVEL_ERROR, "with token")), dlog::DLOG_E_OK);
    ASSERT_TRUE(server.waitForRequests(1));
    EXPECT_EQ(output.close(), dlog::DLOG_E_OK);

    std::vector<std::string> authHeaders = server.getAuthHeaders();
    ASSERT_EQ(authHeaders.size(), 1u);
    EXPECT_EQ(authHeaders[0], "Bearer s3cr3t");
    std::vector<std::string> contentTypes = server.getContentTypes();
    ASSERT_EQ(contentTypes.size(), 1u);
    EXPECT_EQ(contentTypes[0].find("application/json"), 0u);

    // no token, no authorization header
    dlog::DLogHttpOutput anonOutput("webhook", server.getUrl(), "", 1, 60);
    ASSERT_EQ(anonOutput.start(), dlog::DLOG_E_OK);
    ASSERT_EQ(anonOutput.write(dlog::DLogRecord(dlog::DLEVEL_ERROR, "anonymous")),
              dlog::DLOG_E_OK);
    ASSERT_TRUE(server.waitForRequests(2));
    EXPECT_EQ(anonOutput.close(), dlog::DLOG_E_OK);
    EXPECT_TRUE(server.getAuthHeaders()[1].empty());
}

static int testFailedBatchDropped() {
    TestWebhookServer server;
    if (!server.start()) {
        return 1;
    }
    server.setResponseStatus(500);
    dlog::DLogHttpOutput output("webhook", server.getUrl(), "", 1, 60);
    if (output.start() != dlog::DLOG_E_OK) {
        return 2;
    }
    if (output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "rejected")) != dlog::DLOG_E_OK) {
        return 3;
    }
    if (!waitFor([&output]() { return output.getFailedBatchCount() == 1; })) {
        return 4;
    }
    if (output.getDroppedRecordCount() != 1) {
        return 5;
    }

    // the failed batch is not retried with the next one
    server.setResponseStatus(200);
    if (output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "accepted")) != dlog::DLOG_E_OK) {
        return 6;
    }
    if (!server.waitForRequests(2)) {
        return 7;
    }
    nlohmann::json batch = nlohmann::json::parse(server.getBodies()[1]);
    if (batch.size() != 1 || batch[0]["message"].get<std::string>() != "accepted") {
        return 8;
    }
    if (output.close() != dlog::DLOG_E_OK) {
        return 9;
    }
    return 0;
}

TEST(DLogHttp, FailedBatchDropped) {
    int res = testFailedBatchDropped();
    EXPECT_EQ(res, 0);
}

TEST(DLogHttp, FinalFlushFailure) {
    TestWebhookServer server;
    ASSERT_TRUE(server.start());
    server.setResponseStatus(503);
    dlog::DLogHttpOutput output("webhook", server.getUrl(), "", 100, 60);
    ASSERT_EQ(output.start(), dlog::DLOG_E_OK);
    ASSERT_EQ(output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "pending")), dlog::DLOG_E_OK);

    std::string errorMsg;
    EXPECT_EQ(output.close(&errorMsg), dlog::DLOG_E_HTTP_ERROR);
    EXPECT_FALSE(errorMsg.empty());
    EXPECT_EQ(server.getBodies().size(), 1u);

    // closed output rejects records, second close is a no-op
    EXPECT_EQ(output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "late")), dlog::DLOG_E_CLOSED);
    EXPECT_EQ(output.close(), dlog::DLOG_E_OK);
}

TEST(DLogHttp, InvalidUrl) {
    dlog::DLogHttpOutput output("webhook", "ftp://example.com/logs", "", 10, 10);
    std::string errorMsg;
    EXPECT_EQ(output.start(&errorMsg), dlog::DLOG_E_INVALID_ARGUMENT);
    EXPECT_FALSE(errorMsg.empty());
    EXPECT_EQ(output.write(dlog::DLogRecord(dlog::DLEVEL_INFO, "never")), dlog::DLOG_E_CLOSED);
}
