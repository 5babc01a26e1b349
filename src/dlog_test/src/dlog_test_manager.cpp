#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <future>
#include <thread>

#include <nlohmann/json.hpp>

#include "dlog_test_common.h"

static bool sameIds(const std::vector<std::string>& actual, std::vector<std::string> expected) {
    std::sort(expected.begin(), expected.end());
    return actual == expected;
}

static int testConvergence() {
    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 1;
    }
    dlog::DLogTargetConfig configA = makeSyslogConfig("A", "10.0.0.1", 514);
    dlog::DLogTargetConfig configB = makeHttpConfig("B", "http://10.0.0.2/logs");
    if (store.create(configA) != dlog::DLOG_E_OK || store.create(configB) != dlog::DLOG_E_OK) {
        return 2;
    }

    TestManager manager;
    if (manager.setTargetStore(&store) != dlog::DLOG_E_OK) {
        return 3;
    }
    if (!sameIds(manager.getActiveOutputs(), {configA.m_id, configB.m_id}) ||
        manager.getActiveOutputCount() != 2) {
        return 4;
    }
    std::shared_ptr<TestCaptureOutput> captureB = manager.getCapture(configB.m_id);

    // disable B, add C
    configB.m_enabled = false;
    dlog::DLogTargetConfig configC = makeSyslogConfig("C", "10.0.0.3", 514, "udp");
    if (store.update(configB) != dlog::DLOG_E_OK || store.create(configC) != dlog::DLOG_E_OK) {
        return 5;
    }
    if (manager.reconfigure() != dlog::DLOG_E_OK) {
        return 6;
    }
    if (!sameIds(manager.getActiveOutputs(), {configA.m_id, configC.m_id})) {
        return 7;
    }
    if (captureB == nullptr || captureB->getCloseCount() != 1) {
        return 8;
    }
    if (manager.getHook()->getSnapshot()->m_entries.size() != 2) {
        return 9;
    }

    // remove everything
    if (store.remove(configA.m_id) != dlog::DLOG_E_OK ||
        store.remove(configC.m_id) != dlog::DLOG_E_OK) {
        return 10;
    }
    if (manager.reconfigure() != dlog::DLOG_E_OK) {
        return 11;
    }
    if (!manager.getActiveOutputs().empty() ||
        !manager.getHook()->getSnapshot()->m_entries.empty()) {
        return 12;
    }
    return 0;
}

TEST(DLogManager, Convergence) {
    int res = testConvergence();
    EXPECT_EQ(res, 0);
}

TEST(DLogManager, UnchangedTargetKeepsOutput) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);
    dlog::DLogTargetConfig config = makeSyslogConfig("A", "10.0.0.1", 514);
    ASSERT_EQ(store.create(config), dlog::DLOG_E_OK);

    TestManager manager;
    ASSERT_EQ(manager.setTargetStore(&store), dlog::DLOG_E_OK);
    dlog::DLogOutputPtr output = manager.getOutput(config.m_id);
    ASSERT_NE(output, nullptr);

    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_EQ(manager.getOutput(config.m_id), output);
    EXPECT_EQ(manager.getCreateCount(), 1u);
}

static int testFilterLevelChange() {
    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 1;
    }
    dlog::DLogTargetConfig config = makeSyslogConfig("A", "10.0.0.1", 514);
    if (store.create(config) != dlog::DLOG_E_OK) {
        return 2;
    }
    TestManager manager;
    if (manager.setTargetStore(&store) != dlog::DLOG_E_OK) {
        return 3;
    }
    dlog::DLogOutputPtr output = manager.getOutput(config.m_id);
    std::shared_ptr<TestCaptureOutput> capture = manager.getCapture(config.m_id);

    config.m_filterLevel = "error";
    if (store.update(config) != dlog::DLOG_E_OK || manager.reconfigure() != dlog::DLOG_E_OK) {
        return 4;
    }
    // no reconnect for a filter level change
    if (manager.getOutput(config.m_id) != output || manager.getCreateCount() != 1 ||
        capture->getCloseCount() != 0) {
        return 5;
    }

    // but the new level is in effect
    dlog::DLogDispatchHook* hook = manager.getHook();
    hook->fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_INFO, "filtered"));
    hook->fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_ERROR, "passed"));
    if (!capture->waitForRecords(1)) {
        return 6;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::vector<std::string> messages = capture->getMessages();
    if (messages.size() != 1 || messages[0] != "passed") {
        return 7;
    }
    return 0;
}

TEST(DLogManager, FilterLevelChange) {
    int res = testFilterLevelChange();
    EXPECT_EQ(res, 0);
}

TEST(DLogManager, HostChangeRecreatesOutput) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);
    dlog::DLogTargetConfig config = makeSyslogConfig("A", "10.0.0.1", 514);
    ASSERT_EQ(store.create(config), dlog::DLOG_E_OK);

    TestManager manager;
    ASSERT_EQ(manager.setTargetStore(&store), dlog::DLOG_E_OK);
    dlog::DLogOutputPtr output = manager.getOutput(config.m_id);
    std::shared_ptr<TestCaptureOutput> capture = manager.getCapture(config.m_id);

    config.m_host = "10.0.0.2";
    ASSERT_EQ(store.update(config), dlog::DLOG_E_OK);
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_NE(manager.getOutput(config.m_id), output);
    EXPECT_EQ(manager.getCreateCount(), 2u);
    EXPECT_EQ(capture->getCloseCount(), 1u);
}

TEST(DLogManager, CreationFailureSkipsTarget) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);
    dlog::DLogTargetConfig good = makeSyslogConfig("good", "10.0.0.1", 514);
    dlog::DLogTargetConfig bad = makeSyslogConfig("bad", "unreachable.invalid", 514);
    ASSERT_EQ(store.create(good), dlog::DLOG_E_OK);
    ASSERT_EQ(store.create(bad), dlog::DLOG_E_OK);

    TestManager manager;
    EXPECT_EQ(manager.setTargetStore(&store), dlog::DLOG_E_OK);
    EXPECT_TRUE(sameIds(manager.getActiveOutputs(), {good.m_id}));

    // retried on the next pass
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_EQ(manager.getCreateCount(), 3u);

    bad.m_host = "10.0.0.9";
    ASSERT_EQ(store.update(bad), dlog::DLOG_E_OK);
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_TRUE(sameIds(manager.getActiveOutputs(), {good.m_id, bad.m_id}));
}

TEST(DLogManager, UnknownTargetType) {
    TestManager manager;
    dlog::DLogTargetConfig config = makeSyslogConfig("odd", "10.0.0.1", 514);
    config.m_type = "kafka";
    dlog::DLogOutputPtr output;
    std::string errorMsg;
    EXPECT_EQ(manager.createTestOutput(config, output, &errorMsg), dlog::DLOG_E_INVALID_ARGUMENT);
    EXPECT_EQ(errorMsg, "unknown target type");
    EXPECT_EQ(output, nullptr);

    // rejected by validation before any output is created
    EXPECT_EQ(manager.testTargetConfig(config, &errorMsg), dlog::DLOG_E_INVALID_ARGUMENT);
    EXPECT_EQ(errorMsg, "invalid target type");
}

static int testLogAfterUnlock() {
    dlog::DLogLogger logger(nullptr);
    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 1;
    }
    dlog::DLogTargetConfig config = makeSyslogConfig("A", "10.0.0.1", 514);
    if (store.create(config) != dlog::DLOG_E_OK) {
        return 2;
    }

    TestManager manager;
    manager.attachLogger(&logger);
    if (manager.setTargetStore(&store) != dlog::DLOG_E_OK) {
        return 3;
    }

    // the summary line travels through the hook into the freshly published output
    std::shared_ptr<TestCaptureOutput> capture = manager.getCapture(config.m_id);
    if (capture == nullptr || !capture->waitForRecords(1)) {
        return 4;
    }
    std::vector<std::string> messages = capture->getMessages();
    if (std::find(messages.begin(), messages.end(), "Logging targets reconfigured") ==
        messages.end()) {
        return 5;
    }
    manager.detachLogger();
    return 0;
}

TEST(DLogManager, LogAfterUnlock) {
    int res = testLogAfterUnlock();
    EXPECT_EQ(res, 0);
}

#define DLOG_TEST_DEADLOCK_MILLIS 60000

static int testConcurrentLoggingAndReconfigure(dlog::DLogLogger& logger,
                                               dlog::DLogTargetStore& store,
                                               dlog::DLogTargetConfig& config,
                                               TestManager& manager) {
    std::atomic<bool> done(false);
    std::atomic<uint64_t> logCount(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.push_back(std::thread([&logger, &done, &logCount]() {
            while (!done.load()) {
                DLOG_INFO_EX(&logger, "request served");
                logCount.fetch_add(1, std::memory_order_relaxed);
            }
        }));
    }

    // alternate between reconnect-relevant and filter-only changes
    int res = 0;
    for (int i = 0; i < 30 && res == 0; ++i) {
        if (i % 2 == 0) {
            config.m_host = "10.0.0." + std::to_string(i + 1);
        } else {
            config.m_filterLevel = (config.m_filterLevel == "debug") ? "warn" : "debug";
        }
        if (store.update(config) != dlog::DLOG_E_OK) {
            res = 1;
        } else if (manager.reconfigure() != dlog::DLOG_E_OK) {
            res = 2;
        } else if (manager.getActiveOutputCount() != 1) {
            res = 3;
        }
    }
    done.store(true);
    for (std::thread& t : threads) {
        t.join();
    }
    if (res != 0) {
        return res;
    }
    if (logCount.load() == 0) {
        return 4;
    }
    if (manager.getCreateCount() != 16) {
        return 5;
    }
    return 0;
}

TEST(DLogManager, ConcurrentLoggingAndReconfigure) {
    dlog::DLogLogger logger(nullptr);
    logger.setLogLevel(dlog::DLEVEL_DEBUG);
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);
    dlog::DLogTargetConfig config = makeSyslogConfig("A", "10.0.0.1", 514);
    ASSERT_EQ(store.create(config), dlog::DLOG_E_OK);

    TestManager manager;
    manager.attachLogger(&logger);
    ASSERT_EQ(manager.setTargetStore(&store), dlog::DLOG_E_OK);

    // the scenario runs against a deadline, a deadlock fails the run instead of hanging it
    std::packaged_task<int()> task([&logger, &store, &config, &manager]() {
        return testConcurrentLoggingAndReconfigure(logger, store, config, manager);
    });
    std::future<int> result = task.get_future();
    std::thread runner(std::move(task));
    if (result.wait_for(std::chrono::milliseconds(DLOG_TEST_DEADLOCK_MILLIS)) !=
        std::future_status::ready) {
        fprintf(stderr, "Concurrent logging and reconfiguration did not finish within %u ms\n",
                (unsigned)DLOG_TEST_DEADLOCK_MILLIS);
        fflush(stderr);
        // threads are stuck and cannot be joined
        std::_Exit(1);
    }
    runner.join();
    EXPECT_EQ(result.get(), 0);
    manager.detachLogger();
}

TEST(DLogManager, CloseAndReopen) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);
    dlog::DLogTargetConfig configA = makeSyslogConfig("A", "10.0.0.1", 514);
    dlog::DLogTargetConfig configB = makeSyslogConfig("B", "10.0.0.2", 514);
    ASSERT_EQ(store.create(configA), dlog::DLOG_E_OK);
    ASSERT_EQ(store.create(configB), dlog::DLOG_E_OK);

    TestManager manager;
    ASSERT_EQ(manager.setTargetStore(&store), dlog::DLOG_E_OK);
    std::shared_ptr<TestCaptureOutput> captureA = manager.getCapture(configA.m_id);

    manager.closeOutput(configA.m_id);
    EXPECT_TRUE(sameIds(manager.getActiveOutputs(), {configB.m_id}));
    EXPECT_EQ(manager.getHook()->getSnapshot()->m_entries.size(), 1u);
    EXPECT_EQ(captureA->getCloseCount(), 1u);

    manager.close();
    EXPECT_TRUE(manager.getActiveOutputs().empty());
    EXPECT_TRUE(manager.getHook()->getSnapshot()->m_entries.empty());

    // reconfigure after close re-opens all enabled targets
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_TRUE(sameIds(manager.getActiveOutputs(), {configA.m_id, configB.m_id}));
}

TEST(DLogManager, LegacyFallback) {
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_SYSLOG_ENABLED, "yes");
    settings.set(DLOG_SETTING_SYSLOG_HOST, "10.0.0.1");
    settings.set(DLOG_SETTING_HTTP_ENABLED, "true");
    settings.set(DLOG_SETTING_HTTP_URL, "http://10.0.0.2/logs");

    TestManager manager;
    manager.setSettingsManager(&settings);
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_TRUE(sameIds(manager.getActiveOutputs(),
                        {DLOG_LEGACY_SYSLOG_TARGET_ID, DLOG_LEGACY_HTTP_TARGET_ID}));

    settings.set(DLOG_SETTING_HTTP_ENABLED, "false");
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_TRUE(sameIds(manager.getActiveOutputs(), {DLOG_LEGACY_SYSLOG_TARGET_ID}));
}

static int testInitTargetStore() {
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_SYSLOG_ENABLED, "true");
    settings.set(DLOG_SETTING_SYSLOG_HOST, "10.0.0.1");
    settings.set(DLOG_SETTING_SYSLOG_PORT, "1514");

    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 1;
    }
    TestManager manager;
    manager.setSettingsManager(&settings);
    if (manager.initTargetStore(&store) != dlog::DLOG_E_OK) {
        return 2;
    }
    std::vector<dlog::DLogTargetConfig> configs;
    if (store.list(configs) != dlog::DLOG_E_OK || configs.size() != 1) {
        return 3;
    }
    if (configs[0].m_name != DLOG_MIGRATED_SYSLOG_NAME || configs[0].m_port != 1514) {
        return 4;
    }
    if (!sameIds(manager.getActiveOutputs(), {configs[0].m_id})) {
        return 5;
    }

    // non-empty store, no second migration
    if (manager.initTargetStore(&store) != dlog::DLOG_E_OK) {
        return 6;
    }
    uint64_t targetCount = 0;
    if (store.count(targetCount) != dlog::DLOG_E_OK || targetCount != 1) {
        return 7;
    }
    return 0;
}

TEST(DLogManager, InitTargetStore) {
    int res = testInitTargetStore();
    EXPECT_EQ(res, 0);
}

static int testInitTargetStoreMigrationFailure() {
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_SYSLOG_ENABLED, "true");
    settings.set(DLOG_SETTING_SYSLOG_HOST, "10.0.0.1");
    settings.set(DLOG_SETTING_SYSLOG_PROTOCOL, "TCP");
    settings.set(DLOG_SETTING_HTTP_ENABLED, "true");
    settings.set(DLOG_SETTING_HTTP_URL, "http://10.0.0.2/logs");

    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 1;
    }
    TestManager manager;
    manager.setSettingsManager(&settings);
    if (manager.initTargetStore(&store) != dlog::DLOG_E_OK) {
        return 2;
    }

    // invalid syslog row skipped, HTTP row stored and reconciled
    std::vector<dlog::DLogTargetConfig> configs;
    if (store.list(configs) != dlog::DLOG_E_OK || configs.size() != 1) {
        return 3;
    }
    if (configs[0].m_name != DLOG_MIGRATED_HTTP_NAME) {
        return 4;
    }
    if (!sameIds(manager.getActiveOutputs(), {configs[0].m_id})) {
        return 5;
    }
    return 0;
}

TEST(DLogManager, InitTargetStoreMigrationFailure) {
    int res = testInitTargetStoreMigrationFailure();
    EXPECT_EQ(res, 0);
}

static int testUnparsableFilterLevel(const std::string& dbPath) {
    dlog::DLogTargetStore store;
    if (store.open(dbPath.c_str()) != dlog::DLOG_E_OK) {
        return 1;
    }
    dlog::DLogTargetConfig config = makeSyslogConfig("A", "10.0.0.1", 514);
    if (store.create(config) != dlog::DLOG_E_OK) {
        return 2;
    }

    // a row edited behind the store's back, bypassing validation
    sqlite3* db = nullptr;
    if (sqlite3_open(dbPath.c_str(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return 3;
    }
    int res = sqlite3_exec(db, "UPDATE logging_targets SET filter_level = 'verbose'", nullptr,
                           nullptr, nullptr);
    sqlite3_close(db);
    if (res != SQLITE_OK) {
        return 4;
    }

    TestManager manager;
    if (manager.setTargetStore(&store) != dlog::DLOG_E_OK) {
        return 5;
    }
    std::shared_ptr<TestCaptureOutput> capture = manager.getCapture(config.m_id);
    if (capture == nullptr) {
        return 6;
    }

    // treated as info
    dlog::DLogDispatchHook* hook = manager.getHook();
    hook->fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_DEBUG, "dropped"));
    hook->fire(std::make_shared<const dlog::DLogRecord>(dlog::DLEVEL_INFO, "kept"));
    if (!capture->waitForRecords(1)) {
        return 7;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::vector<std::string> messages = capture->getMessages();
    if (messages.size() != 1 || messages[0] != "kept") {
        return 8;
    }
    return 0;
}

TEST(DLogManager, UnparsableFilterLevel) {
    std::string dbPath = "/tmp/dlog_test_filter_" + std::to_string(getpid()) + ".db";
    int res = testUnparsableFilterLevel(dbPath);
    unlink(dbPath.c_str());
    EXPECT_EQ(res, 0);
}

TEST(DLogManager, LoggerSettings) {
    dlog::DLogLogger logger(nullptr);
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_LEVEL, "debug");
    settings.set(DLOG_SETTING_FORMAT, "json");
    settings.set(DLOG_SETTING_INCLUDE_CALLER, "true");

    TestManager manager;
    manager.attachLogger(&logger);
    manager.setSettingsManager(&settings);
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_EQ(logger.getLogLevel(), dlog::DLEVEL_DEBUG);
    EXPECT_EQ(logger.getFormat(), dlog::DLOG_FORMAT_JSON);
    EXPECT_TRUE(logger.getIncludeCaller());

    // an invalid level keeps the current one, a valid format still applies
    settings.set(DLOG_SETTING_LEVEL, "chatty");
    settings.set(DLOG_SETTING_FORMAT, "text");
    ASSERT_EQ(manager.reconfigure(), dlog::DLOG_E_OK);
    EXPECT_EQ(logger.getLogLevel(), dlog::DLEVEL_DEBUG);
    EXPECT_EQ(logger.getFormat(), dlog::DLOG_FORMAT_TEXT);
    manager.detachLogger();
}

static int testConnectivitySyslog() {
    TestSyslogServer server;
    if (!server.start()) {
        return 1;
    }
    dlog::DLogManager manager;
    dlog::DLogTargetConfig config = makeSyslogConfig("probe", "127.0.0.1", server.getPort());
    config.m_format = DLOG_SYSLOG_FORMAT_RFC5424;
    std::string errorMsg;
    if (manager.testTargetConfig(config, &errorMsg) != dlog::DLOG_E_OK) {
        fprintf(stderr, "Connectivity test failed: %s\n", errorMsg.c_str());
        return 2;
    }
    if (!server.waitForLines(1)) {
        return 3;
    }
    std::string line = server.getLines()[0];
    if (line.find(DLOG_TEST_RECORD_MSG) == std::string::npos) {
        return 4;
    }
    if (line.find("test=\"true\"") == std::string::npos ||
        line.find("target_name=\"probe\"") == std::string::npos ||
        line.find("target_type=\"syslog\"") == std::string::npos) {
        return 5;
    }
    // transient output only
    if (!manager.getActiveOutputs().empty()) {
        return 6;
    }
    return 0;
}

TEST(DLogManager, ConnectivitySyslog) {
    int res = testConnectivitySyslog();
    EXPECT_EQ(res, 0);
}

TEST(DLogManager, ConnectivityFailure) {
    int port = 0;
    {
        TestSyslogServer server;
        ASSERT_TRUE(server.start());
        port = server.getPort();
    }
    dlog::DLogManager manager;
    std::string errorMsg;
    EXPECT_EQ(manager.testTargetConfig(makeSyslogConfig("probe", "127.0.0.1", port), &errorMsg),
              dlog::DLOG_E_NET_ERROR);
    EXPECT_FALSE(errorMsg.empty());

    dlog::DLogTargetConfig invalid = makeSyslogConfig("probe", "127.0.0.1", 0);
    EXPECT_EQ(manager.testTargetConfig(invalid, &errorMsg), dlog::DLOG_E_INVALID_ARGUMENT);
    EXPECT_EQ(errorMsg, "port must be between 1 and 65535");
}

static int testConnectivityHttp() {
    TestWebhookServer server;
    if (!server.start()) {
        return 1;
    }
    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 2;
    }
    dlog::DLogTargetConfig config = makeHttpConfig("hook", server.getUrl());
    config.m_enabled = false;
    config.m_authToken = "t0k";
    if (store.create(config) != dlog::DLOG_E_OK) {
        return 3;
    }

    dlog::DLogManager manager;
    std::string errorMsg;
    if (manager.testTarget(config.m_id, &errorMsg) != dlog::DLOG_E_INVALID_STATE) {
        return 4;
    }
    if (manager.setTargetStore(&store) != dlog::DLOG_E_OK) {
        return 5;
    }
    if (manager.testTarget(config.m_id, &errorMsg) != dlog::DLOG_E_OK) {
        fprintf(stderr, "HTTP connectivity test failed: %s\n", errorMsg.c_str());
        return 6;
    }
    // delivered synchronously, before testTarget returns
    std::vector<std::string> bodies = server.getBodies();
    if (bodies.size() != 1) {
        return 7;
    }
    nlohmann::json batch = nlohmann::json::parse(bodies[0]);
    if (batch.size() != 1 || batch[0]["message"].get<std::string>() != DLOG_TEST_RECORD_MSG ||
        batch[0]["fields"]["test"].get<bool>() != true ||
        batch[0]["fields"]["target_type"].get<std::string>() != "http") {
        return 8;
    }
    if (server.getAuthHeaders()[0] != "Bearer t0k") {
        return 9;
    }

    // rejected delivery surfaces to the caller
    server.setResponseStatus(500);
    if (manager.testTarget(config.m_id, &errorMsg) != dlog::DLOG_E_HTTP_ERROR) {
        return 10;
    }
    if (manager.testTarget("no-such-id", &errorMsg) != dlog::DLOG_E_NOT_FOUND) {
        return 11;
    }
    return 0;
}

TEST(DLogManager, ConnectivityHttp) {
    int res = testConnectivityHttp();
    EXPECT_EQ(res, 0);
}

static int testEndToEnd() {
    TestSyslogServer server;
    if (!server.start()) {
        return 1;
    }
    dlog::DLogLogger logger(nullptr);
    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 2;
    }
    dlog::DLogTargetConfig config = makeSyslogConfig("collector", "127.0.0.1", server.getPort());
    config.m_filterLevel = "warn";
    if (store.create(config) != dlog::DLOG_E_OK) {
        return 3;
    }

    dlog::DLogManager manager;
    manager.attachLogger(&logger);
    if (manager.setTargetStore(&store) != dlog::DLOG_E_OK) {
        return 4;
    }
    DLOG_INFO_EX(&logger, "end to end info");
    DLOG_WARN_EX(&logger, "end to end warn");
    if (!server.waitForLines(1)) {
        return 5;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    std::vector<std::string> lines = server.getLines();
    if (lines.size() != 1 || lines[0].find("end to end warn") == std::string::npos) {
        return 6;
    }
    // warn severity with daemon facility
    if (lines[0].compare(0, 4, "<28>") != 0) {
        return 7;
    }
    manager.detachLogger();
    manager.close();
    return 0;
}

TEST(DLogManager, EndToEnd) {
    int res = testEndToEnd();
    EXPECT_EQ(res, 0);
}
