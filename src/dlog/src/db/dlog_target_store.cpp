#include "db/dlog_target_store.h"

#include <ctime>

#include "dlog_common.h"
#include "dlog_report.h"

namespace dlog {

DLOG_DECLARE_REPORT_LOGGER(DLogTargetStore)

#define DLOG_TARGET_COLUMNS                                                                      \
    "id, name, type, enabled, protocol, host, port, tag, format, tls_enabled, tls_cert, "        \
    "tls_key, tls_ca, tls_skip_verify, filter_level, auth_token, url, batch_size, flush_interval, " \
    "created_at, updated_at"

static const char* CREATE_TABLE_SQL =
    "CREATE TABLE IF NOT EXISTS " DLOG_TARGET_TABLE_NAME
    " ("
    "id TEXT PRIMARY KEY, "
    "name TEXT NOT NULL UNIQUE, "
    "type TEXT NOT NULL, "
    "enabled INTEGER NOT NULL DEFAULT 1, "
    "protocol TEXT DEFAULT 'tcp', "
    "host TEXT, "
    "port INTEGER DEFAULT 514, "
    "tag TEXT DEFAULT 'dlog', "
    "format TEXT DEFAULT 'rfc3164', "
    "tls_enabled INTEGER NOT NULL DEFAULT 0, "
    "tls_cert TEXT, "
    "tls_key TEXT, "
    "tls_ca TEXT, "
    "tls_skip_verify INTEGER NOT NULL DEFAULT 0, "
    "filter_level TEXT DEFAULT 'info', "
    "auth_token TEXT, "
    "url TEXT, "
    "batch_size INTEGER, "
    "flush_interval INTEGER, "
    "created_at INTEGER NOT NULL, "
    "updated_at INTEGER NOT NULL)";

static const char* INSERT_SQL =
    "INSERT INTO " DLOG_TARGET_TABLE_NAME " (" DLOG_TARGET_COLUMNS
    ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, "
    "?19, ?20, ?21)";

// NOTE: parameter ?20 (created_at) is bound but not referenced
static const char* UPDATE_SQL =
    "UPDATE " DLOG_TARGET_TABLE_NAME
    " SET name = ?2, type = ?3, enabled = ?4, protocol = ?5, host = ?6, port = ?7, tag = ?8, "
    "format = ?9, tls_enabled = ?10, tls_cert = ?11, tls_key = ?12, tls_ca = ?13, "
    "tls_skip_verify = ?14, filter_level = ?15, auth_token = ?16, url = ?17, batch_size = ?18, "
    "flush_interval = ?19, updated_at = ?21 WHERE id = ?1";

static const char* SELECT_ALL_SQL =
    "SELECT " DLOG_TARGET_COLUMNS " FROM " DLOG_TARGET_TABLE_NAME " ORDER BY name";

static const char* SELECT_ENABLED_SQL = "SELECT " DLOG_TARGET_COLUMNS
                                        " FROM " DLOG_TARGET_TABLE_NAME
                                        " WHERE enabled = 1 ORDER BY name";

static const char* SELECT_BY_ID_SQL =
    "SELECT " DLOG_TARGET_COLUMNS " FROM " DLOG_TARGET_TABLE_NAME " WHERE id = ?1";

static const char* DELETE_SQL = "DELETE FROM " DLOG_TARGET_TABLE_NAME " WHERE id = ?1";

static const char* COUNT_SQL = "SELECT COUNT(*) FROM " DLOG_TARGET_TABLE_NAME;

static DLogErrorCode setError(DLogErrorCode rc, const std::string& msg, std::string* errorMsg) {
    if (errorMsg != nullptr) {
        *errorMsg = msg;
    }
    return rc;
}

// empty strings and zero integers are stored as NULL
static int bindOptionalText(sqlite3_stmt* stmt, int index, const std::string& value) {
    if (value.empty()) {
        return sqlite3_bind_null(stmt, index);
    }
    return sqlite3_bind_text(stmt, index, value.c_str(), (int)value.length(), SQLITE_TRANSIENT);
}

static int bindOptionalInt(sqlite3_stmt* stmt, int index, int64_t value) {
    if (value == 0) {
        return sqlite3_bind_null(stmt, index);
    }
    return sqlite3_bind_int64(stmt, index, (sqlite3_int64)value);
}

static std::string readText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (text == nullptr) {
        return "";
    }
    return std::string((const char*)text, (size_t)sqlite3_column_bytes(stmt, column));
}

class DLogStatementGuard {
public:
    DLogStatementGuard(sqlite3_stmt* stmt) : m_stmt(stmt) {}
    DLogStatementGuard(const DLogStatementGuard&) = delete;
    DLogStatementGuard(DLogStatementGuard&&) = delete;
    DLogStatementGuard& operator=(const DLogStatementGuard&) = delete;
    ~DLogStatementGuard() {
        if (m_stmt != nullptr) {
            sqlite3_finalize(m_stmt);
        }
    }

private:
    sqlite3_stmt* m_stmt;
};

DLogErrorCode DLogTargetStore::open(const char* filePath, std::string* errorMsg /* = nullptr */) {
    {
        std::unique_lock<std::mutex> lock(m_lock);
        if (m_db != nullptr) {
            return setError(DLOG_E_INVALID_STATE, "target store is already open", errorMsg);
        }

        // NOTE: SQLITE_OPEN_NOMUTEX is specified since all access is serialized by the store lock
        int res = sqlite3_open_v2(filePath, &m_db,
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                  nullptr);
        if (res != SQLITE_OK) {
            DLOG_REPORT_ERROR("Failed to open sqlite db at path %s: %s", filePath,
                              sqlite3_errstr(res));
            if (m_db != nullptr) {
                sqlite3_close_v2(m_db);
                m_db = nullptr;
            }
            return setError(DLOG_E_DB_ERROR,
                            std::string("failed to open target store: ") + sqlite3_errstr(res),
                            errorMsg);
        }
        sqlite3_busy_timeout(m_db, 5000);
        DLOG_REPORT_DEBUG("Opened target store at %s", filePath);
    }
    return initSchema(errorMsg);
}

DLogErrorCode DLogTargetStore::close() {
    std::unique_lock<std::mutex> lock(m_lock);
    if (m_db != nullptr) {
        int res = sqlite3_close_v2(m_db);
        if (res != SQLITE_OK) {
            DLOG_REPORT_ERROR("Failed to close sqlite connection: %s", sqlite3_errstr(res));
            return DLOG_E_DB_ERROR;
        }
        m_db = nullptr;
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::initSchema(std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    return execSql(CREATE_TABLE_SQL, errorMsg);
}

DLogErrorCode DLogTargetStore::list(std::vector<DLogTargetConfig>& configs,
                                    std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    return queryList(SELECT_ALL_SQL, configs, errorMsg);
}

DLogErrorCode DLogTargetStore::listEnabled(std::vector<DLogTargetConfig>& configs,
                                           std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    return queryList(SELECT_ENABLED_SQL, configs, errorMsg);
}

DLogErrorCode DLogTargetStore::get(const std::string& id, DLogTargetConfig& config,
                                   std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    sqlite3_stmt* stmt = nullptr;
    DLogErrorCode rc = prepare(SELECT_BY_ID_SQL, stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    DLogStatementGuard guard(stmt);
    int res = sqlite3_bind_text(stmt, 1, id.c_str(), (int)id.length(), SQLITE_TRANSIENT);
    if (res != SQLITE_OK) {
        return setDbError(res, "bind target id", errorMsg);
    }

    res = sqlite3_step(stmt);
    while (res == SQLITE_BUSY) {
        res = sqlite3_step(stmt);
    }
    if (res == SQLITE_ROW) {
        readRow(stmt, config);
        return DLOG_E_OK;
    }
    if (res == SQLITE_DONE) {
        return setError(DLOG_E_NOT_FOUND, "logging target not found", errorMsg);
    }
    return setDbError(res, "query target", errorMsg);
}

DLogErrorCode DLogTargetStore::create(DLogTargetConfig& config,
                                      std::string* errorMsg /* = nullptr */) {
    DLogErrorCode rc = dlogValidateTargetConfig(config, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }

    DLogTargetConfig newConfig = config;
    if (newConfig.m_id.empty()) {
        newConfig.m_id = generateUuid();
    }
    newConfig.m_createdAt = (int64_t)time(nullptr);
    newConfig.m_updatedAt = newConfig.m_createdAt;

    std::unique_lock<std::mutex> lock(m_lock);
    sqlite3_stmt* stmt = nullptr;
    rc = prepare(INSERT_SQL, stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    DLogStatementGuard guard(stmt);
    rc = bindConfig(stmt, newConfig, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    rc = execStatement(stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    DLOG_REPORT_DEBUG("Created logging target %s (%s)", newConfig.m_name.c_str(),
                      newConfig.m_id.c_str());
    config = newConfig;
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::update(DLogTargetConfig& config,
                                      std::string* errorMsg /* = nullptr */) {
    DLogErrorCode rc = dlogValidateTargetConfig(config, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }

    DLogTargetConfig newConfig = config;
    newConfig.m_updatedAt = (int64_t)time(nullptr);

    std::unique_lock<std::mutex> lock(m_lock);
    sqlite3_stmt* stmt = nullptr;
    rc = prepare(UPDATE_SQL, stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    DLogStatementGuard guard(stmt);
    rc = bindConfig(stmt, newConfig, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    rc = execStatement(stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    if (sqlite3_changes(m_db) == 0) {
        return setError(DLOG_E_NOT_FOUND, "logging target not found", errorMsg);
    }
    config = newConfig;
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::remove(const std::string& id,
                                      std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    sqlite3_stmt* stmt = nullptr;
    DLogErrorCode rc = prepare(DELETE_SQL, stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    DLogStatementGuard guard(stmt);
    int res = sqlite3_bind_text(stmt, 1, id.c_str(), (int)id.length(), SQLITE_TRANSIENT);
    if (res != SQLITE_OK) {
        return setDbError(res, "bind target id", errorMsg);
    }
    rc = execStatement(stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    if (sqlite3_changes(m_db) == 0) {
        return setError(DLOG_E_NOT_FOUND, "logging target not found", errorMsg);
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::count(uint64_t& targetCount, std::string* errorMsg /* = nullptr */) {
    std::unique_lock<std::mutex> lock(m_lock);
    sqlite3_stmt* stmt = nullptr;
    DLogErrorCode rc = prepare(COUNT_SQL, stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    DLogStatementGuard guard(stmt);
    int res = sqlite3_step(stmt);
    while (res == SQLITE_BUSY) {
        res = sqlite3_step(stmt);
    }
    if (res != SQLITE_ROW) {
        return setDbError(res, "count targets", errorMsg);
    }
    targetCount = (uint64_t)sqlite3_column_int64(stmt, 0);
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::migrateFromLegacySettings(const DLogSettingsReader* settings,
                                                         std::string* errorMsg /* = nullptr */) {
    if (settings == nullptr) {
        return setError(DLOG_E_INVALID_ARGUMENT, "settings manager not set", errorMsg);
    }
    std::vector<DLogTargetConfig> configs;
    loadLegacyTargets(settings, configs);
    for (DLogTargetConfig& config : configs) {
        std::string createError;
        DLogErrorCode rc = create(config, &createError);
        if (rc != DLOG_E_OK) {
            // a bad legacy row does not prevent migrating the others
            DLOG_REPORT_WARN("Failed to migrate legacy %s logging target: %s (%s)",
                             config.m_type.c_str(), createError.c_str(), dlogErrorCodeToString(rc));
            continue;
        }
        DLOG_REPORT_INFO("Migrated legacy %s logging target to '%s'", config.m_type.c_str(),
                         config.m_name.c_str());
    }
    return DLOG_E_OK;
}

void DLogTargetStore::loadLegacyTargets(const DLogSettingsReader* settings,
                                        std::vector<DLogTargetConfig>& configs) {
    if (settings == nullptr) {
        return;
    }

    bool syslogEnabled = false;
    std::string syslogHost;
    if (settings->getBool(DLOG_SETTING_SYSLOG_ENABLED, syslogEnabled) && syslogEnabled &&
        settings->get(DLOG_SETTING_SYSLOG_HOST, syslogHost) && !syslogHost.empty()) {
        DLogTargetConfig config;
        config.m_name = DLOG_MIGRATED_SYSLOG_NAME;
        config.m_type = DLOG_TARGET_TYPE_SYSLOG;
        config.m_enabled = true;
        config.m_host = syslogHost;
        int64_t port = DLOG_TARGET_DEFAULT_PORT;
        if (!settings->getInt(DLOG_SETTING_SYSLOG_PORT, port) || port == 0) {
            port = DLOG_TARGET_DEFAULT_PORT;
        }
        config.m_port = (int)port;
        if (!settings->get(DLOG_SETTING_SYSLOG_PROTOCOL, config.m_protocol) ||
            config.m_protocol.empty()) {
            config.m_protocol = DLOG_TARGET_DEFAULT_PROTOCOL;
        }
        if (!settings->get(DLOG_SETTING_SYSLOG_TAG, config.m_tag) || config.m_tag.empty()) {
            config.m_tag = DLOG_TARGET_DEFAULT_TAG;
        }
        config.m_format = DLOG_SYSLOG_FORMAT_RFC3164;
        config.m_filterLevel = DLOG_TARGET_DEFAULT_FILTER_LEVEL;
        configs.push_back(config);
    }

    bool httpEnabled = false;
    std::string httpUrl;
    if (settings->getBool(DLOG_SETTING_HTTP_ENABLED, httpEnabled) && httpEnabled &&
        settings->get(DLOG_SETTING_HTTP_URL, httpUrl) && !httpUrl.empty()) {
        DLogTargetConfig config;
        config.m_name = DLOG_MIGRATED_HTTP_NAME;
        config.m_type = DLOG_TARGET_TYPE_HTTP;
        config.m_enabled = true;
        config.m_protocol = "https";
        config.m_host = httpUrl;
        config.m_port = 443;
        config.m_format = DLOG_SYSLOG_FORMAT_RFC3164;
        config.m_filterLevel = DLOG_TARGET_DEFAULT_FILTER_LEVEL;
        config.m_url = httpUrl;
        (void)settings->get(DLOG_SETTING_HTTP_AUTH_TOKEN, config.m_authToken);
        int64_t batchSize = DLOG_TARGET_DEFAULT_BATCH_SIZE;
        if (!settings->getInt(DLOG_SETTING_HTTP_BATCH_SIZE, batchSize) || batchSize <= 0) {
            batchSize = DLOG_TARGET_DEFAULT_BATCH_SIZE;
        }
        config.m_batchSize = (int)batchSize;
        int64_t flushInterval = DLOG_TARGET_DEFAULT_FLUSH_INTERVAL_SECONDS;
        if (!settings->getInt(DLOG_SETTING_HTTP_FLUSH_INTERVAL, flushInterval) ||
            flushInterval <= 0) {
            flushInterval = DLOG_TARGET_DEFAULT_FLUSH_INTERVAL_SECONDS;
        }
        config.m_flushIntervalSeconds = (int)flushInterval;
        configs.push_back(config);
    }
}

DLogErrorCode DLogTargetStore::execSql(const char* sql, std::string* errorMsg) {
    if (m_db == nullptr) {
        return setError(DLOG_E_INVALID_STATE, "target store is not open", errorMsg);
    }
    char* errStr = nullptr;
    int res = sqlite3_exec(m_db, sql, nullptr, nullptr, &errStr);
    if (res != SQLITE_OK) {
        std::string reason = errStr != nullptr ? errStr : sqlite3_errstr(res);
        sqlite3_free(errStr);
        DLOG_REPORT_ERROR("Failed to execute sqlite statement '%s': %s", sql, reason.c_str());
        return setError(DLOG_E_DB_ERROR, reason, errorMsg);
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::prepare(const char* sql, sqlite3_stmt*& stmt,
                                       std::string* errorMsg) {
    if (m_db == nullptr) {
        return setError(DLOG_E_INVALID_STATE, "target store is not open", errorMsg);
    }
    int res = sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr);
    if (res != SQLITE_OK) {
        DLOG_REPORT_ERROR("Failed to prepare sqlite statement '%s': %s", sql,
                          sqlite3_errmsg(m_db));
        return setError(DLOG_E_DB_ERROR, sqlite3_errmsg(m_db), errorMsg);
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::queryList(const char* sql, std::vector<DLogTargetConfig>& configs,
                                         std::string* errorMsg) {
    sqlite3_stmt* stmt = nullptr;
    DLogErrorCode rc = prepare(sql, stmt, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    DLogStatementGuard guard(stmt);
    configs.clear();
    int res = sqlite3_step(stmt);
    while (res == SQLITE_ROW || res == SQLITE_BUSY) {
        if (res == SQLITE_ROW) {
            DLogTargetConfig config;
            readRow(stmt, config);
            configs.push_back(config);
        }
        res = sqlite3_step(stmt);
    }
    if (res != SQLITE_DONE) {
        return setDbError(res, "list targets", errorMsg);
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::bindConfig(sqlite3_stmt* stmt, const DLogTargetConfig& config,
                                          std::string* errorMsg) {
    int res = sqlite3_bind_text(stmt, 1, config.m_id.c_str(), (int)config.m_id.length(),
                                SQLITE_TRANSIENT);
    if (res == SQLITE_OK) {
        res = sqlite3_bind_text(stmt, 2, config.m_name.c_str(), (int)config.m_name.length(),
                                SQLITE_TRANSIENT);
    }
    if (res == SQLITE_OK) {
        res = sqlite3_bind_text(stmt, 3, config.m_type.c_str(), (int)config.m_type.length(),
                                SQLITE_TRANSIENT);
    }
    if (res == SQLITE_OK) res = sqlite3_bind_int(stmt, 4, config.m_enabled ? 1 : 0);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 5, config.m_protocol);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 6, config.m_host);
    if (res == SQLITE_OK) res = bindOptionalInt(stmt, 7, config.m_port);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 8, config.m_tag);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 9, config.m_format);
    if (res == SQLITE_OK) res = sqlite3_bind_int(stmt, 10, config.m_tlsEnabled ? 1 : 0);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 11, config.m_tlsCert);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 12, config.m_tlsKey);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 13, config.m_tlsCA);
    if (res == SQLITE_OK) res = sqlite3_bind_int(stmt, 14, config.m_tlsSkipVerify ? 1 : 0);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 15, config.m_filterLevel);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 16, config.m_authToken);
    if (res == SQLITE_OK) res = bindOptionalText(stmt, 17, config.m_url);
    if (res == SQLITE_OK) res = bindOptionalInt(stmt, 18, config.m_batchSize);
    if (res == SQLITE_OK) res = bindOptionalInt(stmt, 19, config.m_flushIntervalSeconds);
    if (res == SQLITE_OK) res = sqlite3_bind_int64(stmt, 20, (sqlite3_int64)config.m_createdAt);
    if (res == SQLITE_OK) res = sqlite3_bind_int64(stmt, 21, (sqlite3_int64)config.m_updatedAt);
    if (res != SQLITE_OK) {
        return setDbError(res, "bind target parameters", errorMsg);
    }
    return DLOG_E_OK;
}

DLogErrorCode DLogTargetStore::execStatement(sqlite3_stmt* stmt, std::string* errorMsg) {
    // execute statement, retry if busy, discard all returned data (there shouldn't be any, though)
    int res = sqlite3_step(stmt);
    while (res == SQLITE_BUSY) {
        res = sqlite3_step(stmt);
    }
    while (res == SQLITE_ROW) {
        res = sqlite3_step(stmt);
    }
    if (res == SQLITE_DONE) {
        return DLOG_E_OK;
    }
    int extRes = sqlite3_extended_errcode(m_db);
    if (extRes == SQLITE_CONSTRAINT_UNIQUE || extRes == SQLITE_CONSTRAINT_PRIMARYKEY) {
        std::string reason = sqlite3_errmsg(m_db);
        DLOG_REPORT_DEBUG("Rejected duplicate logging target: %s", reason.c_str());
        return setError(DLOG_E_ALREADY_EXISTS, "logging target already exists: " + reason,
                        errorMsg);
    }
    return setDbError(res, "execute statement", errorMsg);
}

void DLogTargetStore::readRow(sqlite3_stmt* stmt, DLogTargetConfig& config) {
    config.m_id = readText(stmt, 0);
    config.m_name = readText(stmt, 1);
    config.m_type = readText(stmt, 2);
    config.m_enabled = sqlite3_column_int(stmt, 3) != 0;
    config.m_protocol = readText(stmt, 4);
    config.m_host = readText(stmt, 5);
    config.m_port = sqlite3_column_int(stmt, 6);
    config.m_tag = readText(stmt, 7);
    config.m_format = readText(stmt, 8);
    config.m_tlsEnabled = sqlite3_column_int(stmt, 9) != 0;
    config.m_tlsCert = readText(stmt, 10);
    config.m_tlsKey = readText(stmt, 11);
    config.m_tlsCA = readText(stmt, 12);
    config.m_tlsSkipVerify = sqlite3_column_int(stmt, 13) != 0;
    config.m_filterLevel = readText(stmt, 14);
    config.m_authToken = readText(stmt, 15);
    config.m_url = readText(stmt, 16);
    config.m_batchSize = sqlite3_column_int(stmt, 17);
    config.m_flushIntervalSeconds = sqlite3_column_int(stmt, 18);
    config.m_createdAt = (int64_t)sqlite3_column_int64(stmt, 19);
    config.m_updatedAt = (int64_t)sqlite3_column_int64(stmt, 20);
}

DLogErrorCode DLogTargetStore::setDbError(int res, const char* what, std::string* errorMsg) {
    std::string reason = (m_db != nullptr) ? sqlite3_errmsg(m_db) : sqlite3_errstr(res);
    DLOG_REPORT_ERROR("Failed to %s: %s (%s)", what, reason.c_str(), sqlite3_errstr(res));
    return setError(DLOG_E_DB_ERROR, std::string("failed to ") + what + ": " + reason, errorMsg);
}

}  // namespace dlog
