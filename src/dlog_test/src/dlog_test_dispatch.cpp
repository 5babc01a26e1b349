#include <chrono>
#include <cstdio>

#include <nlohmann/json.hpp>

#include "dlog_async_output.h"
#include "dlog_dispatch_hook.h"
#include "dlog_test_common.h"

// capture output wrapped for asynchronous dispatch
static std::shared_ptr<dlog::DLogAsyncOutput> makeAsync(
    const std::shared_ptr<TestCaptureOutput>& capture, uint32_t queueLimit = 1000) {
    std::shared_ptr<dlog::DLogAsyncOutput> asyncOutput =
        std::make_shared<dlog::DLogAsyncOutput>(capture, queueLimit);
    asyncOutput->start();
    return asyncOutput;
}

TEST(DLogDispatch, ShouldDispatch) {
    // debug admits everything
    EXPECT_TRUE(dlog::dlogShouldDispatch(dlog::DLEVEL_DEBUG, dlog::DLEVEL_DEBUG));
    EXPECT_TRUE(dlog::dlogShouldDispatch(dlog::DLEVEL_PANIC, dlog::DLEVEL_DEBUG));

    // info
    EXPECT_FALSE(dlog::dlogShouldDispatch(dlog::DLEVEL_DEBUG, dlog::DLEVEL_INFO));
    EXPECT_TRUE(dlog::dlogShouldDispatch(dlog::DLEVEL_INFO, dlog::DLEVEL_INFO));
    EXPECT_TRUE(dlog::dlogShouldDispatch(dlog::DLEVEL_WARN, dlog::DLEVEL_INFO));

    // error admits only error, fatal and panic
    EXPECT_FALSE(dlog::dlogShouldDispatch(dlog::DLEVEL_INFO, dlog::DLEVEL_ERROR));
    EXPECT_FALSE(dlog::dlogShouldDispatch(dlog::DLEVEL_WARN, dlog::DLEVEL_ERROR));
    EXPECT_TRUE(dlog::dlogShouldDispatch(dlog::DLEVEL_ERROR, dlog::DLEVEL_ERROR));
    EXPECT_TRUE(dlog::dlogShouldDispatch(dlog::DLEVEL_FATAL, dlog::DLEVEL_ERROR));
    EXPECT_TRUE(dlog::dlogShouldDispatch(dlog::DLEVEL_PANIC, dlog::DLEVEL_ERROR));
}

TEST(DLogDispatch, LevelParsing) {
    dlog::DLogLevel level = dlog::DLEVEL_INFO;
    EXPECT_TRUE(dlog::dlogLevelFromStr("WARNING", level));
    EXPECT_EQ(level, dlog::DLEVEL_WARN);
    EXPECT_TRUE(dlog::dlogLevelFromStr("Error", level));
    EXPECT_EQ(level, dlog::DLEVEL_ERROR);
    EXPECT_FALSE(dlog::dlogLevelFromStr("verbose", level));
    EXPECT_EQ(dlog::dlogLevelFromStrDefault("verbose"), dlog::DLEVEL_INFO);
    EXPECT_STREQ(dlog::dlogLevelToStr(dlog::DLEVEL_NOTICE), "notice");
    EXPECT_FALSE(dlog::dlogIsValidFilterLevel("notice"));
    EXPECT_TRUE(dlog::dlogIsValidFilterLevel("warn"));
}

static int testFilterLevels() {
    std::shared_ptr<TestCaptureOutput> errorCapture = std::make_shared<TestCaptureOutput>("err");
    std::shared_ptr<TestCaptureOutput> debugCapture = std::make_shared<TestCaptureOutput>("dbg");
    std::shared_ptr<dlog::DLogAsyncOutput> errorOutput = makeAsync(errorCapture);
    std::shared_ptr<dlog::DLogAsyncOutput> debugOutput = makeAsync(debugCapture);

    std::shared_ptr<dlog::DLogDispatchSnapshot> snapshot =
        std::make_shared<dlog::DLogDispatchSnapshot>();
    snapshot->m_entries.push_back({"a", errorOutput, dlog::DLEVEL_ERROR});
    snapshot->m_entries.push_back({"b", debugOutput, dlog::DLEVEL_DEBUG});

    dlog::DLogDispatchHook hook;
    if (!hook.getSnapshot()->m_entries.empty()) {
        return 1;
    }
    hook.publish(snapshot);
    hook.fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_INFO, "info"));
    hook.fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_ERROR, "error"));
    hook.fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_DEBUG, "debug"));

    if (!debugCapture->waitForRecords(3) || !errorCapture->waitForRecords(1)) {
        return 2;
    }
    if (!waitFor([&errorOutput]() { return errorOutput->isCaughtUp(); })) {
        return 3;
    }
    std::vector<std::string> errorMessages = errorCapture->getMessages();
    if (errorMessages.size() != 1 || errorMessages[0] != "error") {
        return 4;
    }
    std::vector<std::string> debugMessages = debugCapture->getMessages();
    if (debugMessages.size() != 3 || debugMessages[0] != "info" || debugMessages[2] != "debug") {
        return 5;
    }

    // null publishes an empty snapshot
    hook.publish(nullptr);
    hook.fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_ERROR, "dropped"));
    if (errorOutput->getSubmitCount() != 1) {
        return 6;
    }
    (void)errorOutput->close();
    (void)debugOutput->close();
    return 0;
}

TEST(DLogDispatch, FilterLevels) {
    int res = testFilterLevels();
    EXPECT_EQ(res, 0);
}

TEST(DLogDispatch, AsyncFifo) {
    std::shared_ptr<TestCaptureOutput> capture = std::make_shared<TestCaptureOutput>();
    std::shared_ptr<dlog::DLogAsyncOutput> asyncOutput = makeAsync(capture, 0);
    const int recordCount = 1000;
    for (int i = 0; i < recordCount; ++i) {
        asyncOutput->submit(
            std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_INFO, std::to_string(i)));
    }
    // close drains the queue
    EXPECT_EQ(asyncOutput->close(), dlog::DLOG_E_OK);
    EXPECT_EQ(capture->getCloseCount(), 1u);

    std::vector<std::string> messages = capture->getMessages();
    ASSERT_EQ(messages.size(), (size_t)recordCount);
    for (int i = 0; i < recordCount; ++i) {
        EXPECT_EQ(messages[i], std::to_string(i));
    }
    EXPECT_TRUE(asyncOutput->isCaughtUp());

    // nothing is accepted after close
    asyncOutput->submit(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_INFO, "late"));
    EXPECT_EQ(asyncOutput->getSubmitCount(), (uint64_t)recordCount);
}

TEST(DLogDispatch, SlowOutputDoesNotBlock) {
    std::shared_ptr<TestCaptureOutput> slowCapture = std::make_shared<TestCaptureOutput>("slow");
    slowCapture->setWriteDelayMillis(200);
    std::shared_ptr<TestCaptureOutput> fastCapture = std::make_shared<TestCaptureOutput>("fast");
    std::shared_ptr<dlog::DLogAsyncOutput> slowOutput = makeAsync(slowCapture);
    std::shared_ptr<dlog::DLogAsyncOutput> fastOutput = makeAsync(fastCapture);

    std::shared_ptr<dlog::DLogDispatchSnapshot> snapshot =
        std::make_shared<dlog::DLogDispatchSnapshot>();
    snapshot->m_entries.push_back({"slow", slowOutput, dlog::DLEVEL_DEBUG});
    snapshot->m_entries.push_back({"fast", fastOutput, dlog::DLEVEL_DEBUG});
    dlog::DLogDispatchHook hook;
    hook.publish(snapshot);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; ++i) {
        hook.fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_INFO, "r"));
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
    EXPECT_LT(elapsed, 200);

    // the fast output is not held back by the slow one
    EXPECT_TRUE(fastCapture->waitForRecords(5, 500));
    EXPECT_LT(slowCapture->getRecordCount(), 5u);

    (void)fastOutput->close();
    (void)slowOutput->close();
    EXPECT_EQ(slowCapture->getRecordCount(), 5u);
}

TEST(DLogDispatch, WriteErrorsSwallowed) {
    std::shared_ptr<TestCaptureOutput> capture = std::make_shared<TestCaptureOutput>();
    capture->setFailWrites(true);
    std::shared_ptr<dlog::DLogAsyncOutput> asyncOutput = makeAsync(capture);
    for (int i = 0; i < 10; ++i) {
        asyncOutput->submit(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_ERROR, "x"));
    }
    EXPECT_TRUE(waitFor([&asyncOutput]() { return asyncOutput->isCaughtUp(); }));
    EXPECT_EQ(asyncOutput->getFailCount(), 10u);
    EXPECT_EQ(asyncOutput->getWriteCount(), 0u);

    // recovery
    capture->setFailWrites(false);
    asyncOutput->submit(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_ERROR, "ok"));
    EXPECT_TRUE(capture->waitForRecords(1));
    EXPECT_EQ(asyncOutput->close(), dlog::DLOG_E_OK);
    EXPECT_EQ(asyncOutput->getWriteCount(), 1u);
}

TEST(DLogDispatch, QueueLimit) {
    std::shared_ptr<TestCaptureOutput> capture = std::make_shared<TestCaptureOutput>();
    capture->setWriteDelayMillis(100);
    std::shared_ptr<dlog::DLogAsyncOutput> asyncOutput = makeAsync(capture, 2);
    for (int i = 0; i < 10; ++i) {
        asyncOutput->submit(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_INFO, "q"));
    }
    EXPECT_GT(asyncOutput->getDropCount(), 0u);
    EXPECT_EQ(asyncOutput->getSubmitCount() + asyncOutput->getDropCount(), 10u);
    (void)asyncOutput->close();
    EXPECT_EQ(capture->getRecordCount(), asyncOutput->getSubmitCount());
}

TEST(DLogDispatch, LoggerHooks) {
    dlog::DLogLogger logger(nullptr);
    logger.setLogLevel(dlog::DLEVEL_INFO);

    std::shared_ptr<TestCaptureOutput> capture = std::make_shared<TestCaptureOutput>();
    std::shared_ptr<dlog::DLogAsyncOutput> asyncOutput = makeAsync(capture);
    std::shared_ptr<dlog::DLogDispatchSnapshot> snapshot =
        std::make_shared<dlog::DLogDispatchSnapshot>();
    snapshot->m_entries.push_back({"c", asyncOutput, dlog::DLEVEL_DEBUG});
    dlog::DLogDispatchHook hook;
    hook.publish(snapshot);
    logger.addHook(&hook);
    logger.addHook(&hook);

    DLOG_DEBUG_EX(&logger, "below logger level");
    DLOG_INFO_EX(&logger, "object %s stored", "a.txt");
    DLOG_FIELDS_EX(&logger, dlog::DLEVEL_WARN, nlohmann::json({{"bucket", "b1"}}), "with fields");

    ASSERT_TRUE(capture->waitForRecords(2));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    // hook registered once, debug filtered by the logger
    std::vector<std::string> messages = capture->getMessages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "object a.txt stored");
    EXPECT_EQ(messages[1], "with fields");

    logger.removeHook(&hook);
    DLOG_INFO_EX(&logger, "after removal");
    (void)asyncOutput->close();
    EXPECT_EQ(capture->getRecordCount(), 2u);
}

TEST(DLogDispatch, LoggerConsoleFormat) {
    FILE* sink = tmpfile();
    ASSERT_NE(sink, nullptr);
    dlog::DLogLogger logger(sink);
    logger.setFormat(dlog::DLOG_FORMAT_JSON);
    logger.setIncludeCaller(true);
    DLOG_FIELDS_EX(&logger, dlog::DLEVEL_ERROR, nlohmann::json({{"bucket", "b1"}}), "json line");

    rewind(sink);
    char buf[1024] = {};
    ASSERT_NE(fgets(buf, sizeof(buf), sink), nullptr);
    fclose(sink);
    nlohmann::json entry = nlohmann::json::parse(buf);
    EXPECT_EQ(entry["level"].get<std::string>(), "error");
    EXPECT_EQ(entry["msg"].get<std::string>(), "json line");
    EXPECT_EQ(entry["bucket"].get<std::string>(), "b1");
    EXPECT_TRUE(entry.contains("caller"));
    EXPECT_TRUE(entry.contains("time"));

    dlog::DLogFormat format = dlog::DLOG_FORMAT_JSON;
    EXPECT_TRUE(dlog::dlogFormatFromStr("TEXT", format));
    EXPECT_EQ(format, dlog::DLOG_FORMAT_TEXT);
    EXPECT_FALSE(dlog::dlogFormatFromStr("xml", format));
}

TEST(DLogDispatch, ReportsThroughLogger) {
    dlog::DLogLogger logger(nullptr);
    logger.setLogLevel(dlog::DLEVEL_DEBUG);
    std::shared_ptr<TestCaptureOutput> capture = std::make_shared<TestCaptureOutput>();
    std::shared_ptr<dlog::DLogAsyncOutput> asyncOutput = makeAsync(capture);
    std::shared_ptr<dlog::DLogDispatchSnapshot> snapshot =
        std::make_shared<dlog::DLogDispatchSnapshot>();
    snapshot->m_entries.push_back({"c", asyncOutput, dlog::DLEVEL_DEBUG});
    dlog::DLogDispatchHook hook;
    hook.publish(snapshot);
    logger.addHook(&hook);

    dlog::DLogLoggerReportHandler reportHandler(&logger);
    dlog::DLogLevel prevReportLevel = dlog::getReportLevel();
    dlog::setReportHandler(&reportHandler);
    dlog::setReportLevel(dlog::DLEVEL_DEBUG);

    // target creation issues a debug report
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);
    dlog::DLogTargetConfig config = makeSyslogConfig("reported", "10.0.0.1", 514);
    ASSERT_EQ(store.create(config), dlog::DLOG_E_OK);

    dlog::setReportHandler(nullptr);
    dlog::setReportLevel(prevReportLevel);

    EXPECT_TRUE(capture->waitForRecords(1));
    (void)asyncOutput->close();
    std::vector<std::string> messages = capture->getMessages();
    bool found = false;
    for (const std::string& msg : messages) {
        if (msg.find("reported") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}
