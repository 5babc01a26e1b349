#include "dlog_test_common.h"

static int testValidation() {
    struct ValidationCase {
        void (*m_mutate)(dlog::DLogTargetConfig&);
        const char* m_expectedMsg;
    };
    static const ValidationCase cases[] = {
        {[](dlog::DLogTargetConfig& c) { c.m_name.clear(); }, "target name is required"},
        {[](dlog::DLogTargetConfig& c) { c.m_type = "kafka"; }, "invalid target type"},
        {[](dlog::DLogTargetConfig& c) { c.m_host.clear(); }, "host is required for syslog targets"},
        {[](dlog::DLogTargetConfig& c) { c.m_port = 0; }, "port must be between 1 and 65535"},
        {[](dlog::DLogTargetConfig& c) { c.m_port = 65536; }, "port must be between 1 and 65535"},
        {[](dlog::DLogTargetConfig& c) { c.m_protocol = "sctp"; }, "invalid protocol"},
        {[](dlog::DLogTargetConfig& c) { c.m_format = "cef"; }, "invalid format"},
        {[](dlog::DLogTargetConfig& c) { c.m_filterLevel = "notice"; }, "invalid filter level"},
        {[](dlog::DLogTargetConfig& c) { c.m_filterLevel.clear(); }, "invalid filter level"}};

    int caseIndex = 0;
    for (const ValidationCase& validationCase : cases) {
        dlog::DLogTargetConfig config = makeSyslogConfig("s", "127.0.0.1", 514);
        validationCase.m_mutate(config);
        std::string errorMsg;
        dlog::DLogErrorCode rc = dlog::dlogValidateTargetConfig(config, &errorMsg);
        if (rc != dlog::DLOG_E_INVALID_ARGUMENT) {
            fprintf(stderr, "Validation case %d unexpectedly passed\n", caseIndex);
            return 1;
        }
        if (errorMsg.compare(validationCase.m_expectedMsg) != 0) {
            fprintf(stderr, "Validation case %d: expected '%s', got '%s'\n", caseIndex,
                    validationCase.m_expectedMsg, errorMsg.c_str());
            return 2;
        }
        ++caseIndex;
    }

    // HTTP targets need a URL, but no host or port
    dlog::DLogTargetConfig httpConfig = makeHttpConfig("h", "");
    std::string errorMsg;
    if (dlog::dlogValidateTargetConfig(httpConfig, &errorMsg) != dlog::DLOG_E_INVALID_ARGUMENT ||
        errorMsg.compare("URL is required for HTTP targets") != 0) {
        return 3;
    }
    httpConfig.m_url = "http://127.0.0.1:8080/logs";
    if (dlog::dlogValidateTargetConfig(httpConfig) != dlog::DLOG_E_OK) {
        return 4;
    }

    // first violation wins
    dlog::DLogTargetConfig config = makeSyslogConfig("", "", 0);
    if (dlog::dlogValidateTargetConfig(config, &errorMsg) != dlog::DLOG_E_INVALID_ARGUMENT ||
        errorMsg.compare("target name is required") != 0) {
        return 5;
    }
    return 0;
}

TEST(DLogStore, Validation) {
    int res = testValidation();
    EXPECT_EQ(res, 0);
}

TEST(DLogStore, CreateGetList) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);

    dlog::DLogTargetConfig syslogConfig = makeSyslogConfig("b-syslog", "10.0.0.1", 1514);
    syslogConfig.m_format = DLOG_SYSLOG_FORMAT_RFC5424;
    syslogConfig.m_filterLevel = "warn";
    ASSERT_EQ(store.create(syslogConfig), dlog::DLOG_E_OK);
    EXPECT_FALSE(syslogConfig.m_id.empty());
    EXPECT_GT(syslogConfig.m_createdAt, 0);
    EXPECT_EQ(syslogConfig.m_createdAt, syslogConfig.m_updatedAt);

    dlog::DLogTargetConfig httpConfig = makeHttpConfig("a-http", "https://logs.example.com/in");
    httpConfig.m_authToken = "secret";
    httpConfig.m_enabled = false;
    ASSERT_EQ(store.create(httpConfig), dlog::DLOG_E_OK);
    EXPECT_NE(httpConfig.m_id, syslogConfig.m_id);

    dlog::DLogTargetConfig loaded;
    ASSERT_EQ(store.get(syslogConfig.m_id, loaded), dlog::DLOG_E_OK);
    EXPECT_EQ(loaded.m_name, "b-syslog");
    EXPECT_EQ(loaded.m_type, DLOG_TARGET_TYPE_SYSLOG);
    EXPECT_EQ(loaded.m_host, "10.0.0.1");
    EXPECT_EQ(loaded.m_port, 1514);
    EXPECT_EQ(loaded.m_format, DLOG_SYSLOG_FORMAT_RFC5424);
    EXPECT_EQ(loaded.m_filterLevel, "warn");
    EXPECT_EQ(loaded.m_tag, "dlogtest");
    EXPECT_TRUE(loaded.m_enabled);
    // absent optional columns read back as empty/zero
    EXPECT_TRUE(loaded.m_url.empty());
    EXPECT_TRUE(loaded.m_tlsCA.empty());
    EXPECT_EQ(loaded.m_batchSize, 0);
    EXPECT_FALSE(dlog::dlogTargetConfigChanged(syslogConfig, loaded));

    std::vector<dlog::DLogTargetConfig> configs;
    ASSERT_EQ(store.list(configs), dlog::DLOG_E_OK);
    ASSERT_EQ(configs.size(), 2u);
    EXPECT_EQ(configs[0].m_name, "a-http");
    EXPECT_EQ(configs[0].m_authToken, "secret");
    EXPECT_EQ(configs[1].m_name, "b-syslog");

    ASSERT_EQ(store.listEnabled(configs), dlog::DLOG_E_OK);
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].m_id, syslogConfig.m_id);

    uint64_t targetCount = 0;
    ASSERT_EQ(store.count(targetCount), dlog::DLOG_E_OK);
    EXPECT_EQ(targetCount, 2u);

    std::string errorMsg;
    EXPECT_EQ(store.get("no-such-id", loaded, &errorMsg), dlog::DLOG_E_NOT_FOUND);
}

TEST(DLogStore, RejectInvalid) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);

    dlog::DLogTargetConfig config = makeSyslogConfig("bad", "10.0.0.1", 70000);
    std::string errorMsg;
    EXPECT_EQ(store.create(config, &errorMsg), dlog::DLOG_E_INVALID_ARGUMENT);
    EXPECT_EQ(errorMsg, "port must be between 1 and 65535");

    uint64_t targetCount = 1;
    ASSERT_EQ(store.count(targetCount), dlog::DLOG_E_OK);
    EXPECT_EQ(targetCount, 0u);
}

TEST(DLogStore, UniqueName) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);

    dlog::DLogTargetConfig first = makeSyslogConfig("collector", "10.0.0.1", 514);
    ASSERT_EQ(store.create(first), dlog::DLOG_E_OK);

    dlog::DLogTargetConfig second = makeSyslogConfig("collector", "10.0.0.2", 514);
    std::string errorMsg;
    EXPECT_EQ(store.create(second, &errorMsg), dlog::DLOG_E_ALREADY_EXISTS);

    // renaming another target into an existing name fails as well
    dlog::DLogTargetConfig third = makeSyslogConfig("other", "10.0.0.3", 514);
    ASSERT_EQ(store.create(third), dlog::DLOG_E_OK);
    third.m_name = "collector";
    EXPECT_EQ(store.update(third, &errorMsg), dlog::DLOG_E_ALREADY_EXISTS);

    std::vector<dlog::DLogTargetConfig> configs;
    ASSERT_EQ(store.list(configs), dlog::DLOG_E_OK);
    EXPECT_EQ(configs.size(), 2u);
}

TEST(DLogStore, UpdateDelete) {
    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);

    dlog::DLogTargetConfig config = makeSyslogConfig("collector", "10.0.0.1", 514);
    ASSERT_EQ(store.create(config), dlog::DLOG_E_OK);
    int64_t createdAt = config.m_createdAt;

    config.m_host = "10.0.0.9";
    config.m_filterLevel = "error";
    ASSERT_EQ(store.update(config), dlog::DLOG_E_OK);

    dlog::DLogTargetConfig loaded;
    ASSERT_EQ(store.get(config.m_id, loaded), dlog::DLOG_E_OK);
    EXPECT_EQ(loaded.m_host, "10.0.0.9");
    EXPECT_EQ(loaded.m_filterLevel, "error");
    EXPECT_EQ(loaded.m_createdAt, createdAt);
    EXPECT_GE(loaded.m_updatedAt, createdAt);

    dlog::DLogTargetConfig missing = makeSyslogConfig("ghost", "10.0.0.1", 514);
    missing.m_id = "no-such-id";
    std::string errorMsg;
    EXPECT_EQ(store.update(missing, &errorMsg), dlog::DLOG_E_NOT_FOUND);
    EXPECT_EQ(errorMsg, "logging target not found");

    ASSERT_EQ(store.remove(config.m_id), dlog::DLOG_E_OK);
    EXPECT_EQ(store.remove(config.m_id, &errorMsg), dlog::DLOG_E_NOT_FOUND);
    EXPECT_EQ(errorMsg, "logging target not found");
    EXPECT_EQ(store.get(config.m_id, loaded), dlog::DLOG_E_NOT_FOUND);
}

static int testMigration() {
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_SYSLOG_ENABLED, "true");
    settings.set(DLOG_SETTING_SYSLOG_HOST, "syslog.example.com");
    settings.set(DLOG_SETTING_SYSLOG_PROTOCOL, "udp");
    settings.set(DLOG_SETTING_HTTP_ENABLED, "true");
    settings.set(DLOG_SETTING_HTTP_URL, "https://hooks.example.com/logs");
    settings.set(DLOG_SETTING_HTTP_AUTH_TOKEN, "token-1");
    settings.set(DLOG_SETTING_HTTP_BATCH_SIZE, "25");

    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 1;
    }
    if (store.migrateFromLegacySettings(&settings) != dlog::DLOG_E_OK) {
        return 2;
    }

    std::vector<dlog::DLogTargetConfig> configs;
    if (store.list(configs) != dlog::DLOG_E_OK || configs.size() != 2) {
        return 3;
    }
    // ordered by name: "HTTP (migrated)" < "Syslog (migrated)"
    const dlog::DLogTargetConfig& httpConfig = configs[0];
    const dlog::DLogTargetConfig& syslogConfig = configs[1];
    if (httpConfig.m_name.compare(DLOG_MIGRATED_HTTP_NAME) != 0 ||
        syslogConfig.m_name.compare(DLOG_MIGRATED_SYSLOG_NAME) != 0) {
        return 4;
    }
    if (syslogConfig.m_host.compare("syslog.example.com") != 0 || syslogConfig.m_port != 514 ||
        syslogConfig.m_protocol.compare("udp") != 0 || syslogConfig.m_tag.compare("dlog") != 0 ||
        syslogConfig.m_format.compare("rfc3164") != 0 ||
        syslogConfig.m_filterLevel.compare("info") != 0 || !syslogConfig.m_enabled) {
        return 5;
    }
    if (httpConfig.m_url.compare("https://hooks.example.com/logs") != 0 ||
        httpConfig.m_authToken.compare("token-1") != 0 || httpConfig.m_batchSize != 25 ||
        httpConfig.m_flushIntervalSeconds != 10 || httpConfig.m_filterLevel.compare("info") != 0) {
        return 6;
    }

    // not guarded against re-invocation: clashing names are skipped, nothing is added
    if (store.migrateFromLegacySettings(&settings) != dlog::DLOG_E_OK) {
        return 7;
    }
    uint64_t targetCount = 0;
    if (store.count(targetCount) != dlog::DLOG_E_OK || targetCount != 2) {
        return 8;
    }
    return 0;
}

TEST(DLogStore, LegacyMigration) {
    int res = testMigration();
    EXPECT_EQ(res, 0);
}

static int testMigrationContinuesAfterFailure() {
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_SYSLOG_ENABLED, "true");
    settings.set(DLOG_SETTING_SYSLOG_HOST, "syslog.example.com");
    settings.set(DLOG_SETTING_SYSLOG_PROTOCOL, "TCP");
    settings.set(DLOG_SETTING_HTTP_ENABLED, "true");
    settings.set(DLOG_SETTING_HTTP_URL, "https://hooks.example.com/logs");

    dlog::DLogTargetStore store;
    if (store.open(":memory:") != dlog::DLOG_E_OK) {
        return 1;
    }
    // the syslog row fails validation (protocol is case sensitive), the HTTP row still migrates
    if (store.migrateFromLegacySettings(&settings) != dlog::DLOG_E_OK) {
        return 2;
    }
    std::vector<dlog::DLogTargetConfig> configs;
    if (store.list(configs) != dlog::DLOG_E_OK || configs.size() != 1) {
        return 3;
    }
    if (configs[0].m_name.compare(DLOG_MIGRATED_HTTP_NAME) != 0 ||
        configs[0].m_url.compare("https://hooks.example.com/logs") != 0) {
        return 4;
    }
    return 0;
}

TEST(DLogStore, LegacyMigrationContinuesAfterFailure) {
    int res = testMigrationContinuesAfterFailure();
    EXPECT_EQ(res, 0);
}

TEST(DLogStore, LegacyMigrationDefaultPort) {
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_SYSLOG_ENABLED, "true");
    settings.set(DLOG_SETTING_SYSLOG_HOST, "syslog.example.com");
    settings.set(DLOG_SETTING_SYSLOG_PORT, "0");

    std::vector<dlog::DLogTargetConfig> configs;
    dlog::DLogTargetStore::loadLegacyTargets(&settings, configs);
    ASSERT_EQ(configs.size(), 1u);
    EXPECT_EQ(configs[0].m_port, 514);
    EXPECT_EQ(dlog::dlogValidateTargetConfig(configs[0]), dlog::DLOG_E_OK);
}

TEST(DLogStore, LegacyMigrationSkipsDisabled) {
    dlog::DLogMapSettings settings;
    settings.set(DLOG_SETTING_SYSLOG_ENABLED, "false");
    settings.set(DLOG_SETTING_SYSLOG_HOST, "syslog.example.com");
    settings.set(DLOG_SETTING_HTTP_ENABLED, "true");

    std::vector<dlog::DLogTargetConfig> configs;
    dlog::DLogTargetStore::loadLegacyTargets(&settings, configs);
    // syslog disabled, HTTP enabled without URL
    EXPECT_TRUE(configs.empty());

    dlog::DLogTargetStore store;
    ASSERT_EQ(store.open(":memory:"), dlog::DLOG_E_OK);
    EXPECT_EQ(store.migrateFromLegacySettings(nullptr), dlog::DLOG_E_INVALID_ARGUMENT);
}
