#include "dlog_manager.h"

#include <algorithm>
#include <mutex>

#include "dlog_http_output.h"
#include "dlog_report.h"
#include "sys/dlog_syslog_output.h"

namespace dlog {

DLOG_DECLARE_REPORT_LOGGER(DLogManager)

static DLogErrorCode setError(DLogErrorCode rc, const std::string& msg, std::string* errorMsg) {
    if (errorMsg != nullptr) {
        *errorMsg = msg;
    }
    return rc;
}


DLogManager::DLogManager(const DLogParams& params /* = DLogParams() */)
    : m_params(params), m_settings(nullptr), m_logger(nullptr), m_store(nullptr) {}

DLogManager::~DLogManager() {
    detachLogger();
    close();
}

void DLogManager::setSettingsManager(DLogSettingsReader* settings) {
    std::unique_lock<std::shared_mutex> lock(m_lock);
    m_settings = settings;
}

void DLogManager::attachLogger(DLogLogger* logger) {
    std::unique_lock<std::shared_mutex> lock(m_lock);
    if (m_logger != nullptr) {
        m_logger->removeHook(&m_hook);
    }
    m_logger = logger;
    if (m_logger != nullptr) {
        m_logger->addHook(&m_hook);
    }
}

void DLogManager::detachLogger() {
    std::unique_lock<std::shared_mutex> lock(m_lock);
    if (m_logger != nullptr) {
        m_logger->removeHook(&m_hook);
        m_logger = nullptr;
    }
}

DLogErrorCode DLogManager::setTargetStore(DLogTargetStore* store,
                                          std::string* errorMsg /* = nullptr */) {
    {
        std::unique_lock<std::shared_mutex> lock(m_lock);
        m_store = store;
    }
    return reconfigure(errorMsg);
}

DLogErrorCode DLogManager::initTargetStore(DLogTargetStore* store,
                                           std::string* errorMsg /* = nullptr */) {
    if (store == nullptr) {
        return setError(DLOG_E_INVALID_ARGUMENT, "target store is null", errorMsg);
    }
    DLogSettingsReader* settings = nullptr;
    {
        std::unique_lock<std::shared_mutex> lock(m_lock);
        m_store = store;
        settings = m_settings;
    }

    // migrate only into an empty store
    if (settings != nullptr) {
        uint64_t targetCount = 0;
        std::string migrateError;
        DLogErrorCode rc = store->count(targetCount, &migrateError);
        if (rc == DLOG_E_OK && targetCount == 0) {
            rc = store->migrateFromLegacySettings(settings, &migrateError);
        }
        // migration failure is not fatal, whatever was stored still gets reconciled
        if (rc != DLOG_E_OK) {
            emitLog(DLEVEL_WARN, "Failed to migrate legacy logging settings",
                    {{"error", migrateError}});
        }
    }
    return reconfigure(errorMsg);
}

DLogErrorCode DLogManager::reconfigure(std::string* errorMsg /* = nullptr */) {
    applyLoggerSettings();

    std::vector<PendingLog> pendingLogs;
    size_t activeCount = 0;
    DLogErrorCode result = DLOG_E_OK;
    {
        // nothing may be logged while the write lock is held, since log records are routed back
        // through the dispatch hook
        DLOG_SCOPED_DISABLE_REPORT();
        std::unique_lock<std::shared_mutex> lock(m_lock);

        std::vector<DLogTargetConfig> configs;
        std::string loadError;
        result = loadDesiredConfigs(configs, &loadError);
        if (result != DLOG_E_OK) {
            pendingLogs.push_back(
                {DLEVEL_ERROR, "Failed to load logging targets", {{"error", loadError}}});
            setError(result, loadError, errorMsg);
        } else {
            ConfigMap desired;
            for (const DLogTargetConfig& config : configs) {
                desired[config.m_id] = config;
            }

            // close outputs of removed or disabled targets
            std::vector<std::string> removedIds;
            for (const auto& entry : m_outputs) {
                if (desired.find(entry.first) == desired.end()) {
                    removedIds.push_back(entry.first);
                }
            }
            for (const std::string& id : removedIds) {
                closeOutputLocked(id, pendingLogs);
            }

            for (const auto& entry : desired) {
                const DLogTargetConfig& config = entry.second;
                OutputMap::iterator outputItr = m_outputs.find(config.m_id);
                ConfigMap::iterator configItr = m_lastConfigs.find(config.m_id);
                if (outputItr != m_outputs.end() && configItr != m_lastConfigs.end() &&
                    !dlogTargetConfigChanged(configItr->second, config)) {
                    // filter level is applied without reconnecting
                    configItr->second = config;
                    continue;
                }
                if (outputItr != m_outputs.end()) {
                    closeOutputLocked(config.m_id, pendingLogs);
                }

                DLogOutputPtr output;
                std::string createError;
                DLogErrorCode rc = createOutput(config, output, &createError);
                if (rc != DLOG_E_OK) {
                    pendingLogs.push_back({DLEVEL_ERROR,
                                           "Failed to create logging target output",
                                           {{"target_id", config.m_id},
                                            {"target_name", config.m_name},
                                            {"target_type", config.m_type},
                                            {"error", createError}}});
                    continue;
                }

                std::shared_ptr<DLogAsyncOutput> asyncOutput =
                    std::make_shared<DLogAsyncOutput>(output, m_params.m_asyncQueueLimit);
                if (!asyncOutput->start()) {
                    (void)output->close();
                    pendingLogs.push_back({DLEVEL_ERROR,
                                           "Failed to start logging target dispatcher",
                                           {{"target_id", config.m_id},
                                            {"target_name", config.m_name}}});
                    continue;
                }
                m_outputs[config.m_id] = asyncOutput;
                m_lastConfigs[config.m_id] = config;
                pendingLogs.push_back({DLEVEL_DEBUG,
                                       "Logging target output created",
                                       {{"target_id", config.m_id},
                                        {"target_name", config.m_name},
                                        {"target_type", config.m_type}}});
            }
        }

        publishLocked();
        activeCount = m_outputs.size();
    }

    // write lock released, safe to log
    for (const PendingLog& pendingLog : pendingLogs) {
        emitLog(pendingLog.m_level, pendingLog.m_msg, pendingLog.m_fields);
    }
    if (result == DLOG_E_OK) {
        emitLog(DLEVEL_INFO, "Logging targets reconfigured", {{"active_targets", activeCount}});
    }
    return result;
}

DLogErrorCode DLogManager::testTarget(const std::string& id,
                                      std::string* errorMsg /* = nullptr */) {
    DLogTargetStore* store = nullptr;
    {
        std::shared_lock<std::shared_mutex> lock(m_lock);
        store = m_store;
    }
    if (store == nullptr) {
        return setError(DLOG_E_INVALID_STATE, "target store not set", errorMsg);
    }
    DLogTargetConfig config;
    DLogErrorCode rc = store->get(id, config, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }
    return testTargetConfig(config, errorMsg);
}

DLogErrorCode DLogManager::testTargetConfig(const DLogTargetConfig& config,
                                            std::string* errorMsg /* = nullptr */) {
    DLogErrorCode rc = dlogValidateTargetConfig(config, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }

    DLogOutputPtr output;
    rc = createOutput(config, output, errorMsg);
    if (rc != DLOG_E_OK) {
        return rc;
    }

    DLogRecord testRecord(
        DLEVEL_INFO, DLOG_TEST_RECORD_MSG,
        {{"test", true}, {"target_name", config.m_name}, {"target_type", config.m_type}});
    std::string writeError;
    DLogErrorCode writeRc = output->write(testRecord, &writeError);
    std::string closeError;
    DLogErrorCode closeRc = output->close(&closeError);
    if (writeRc != DLOG_E_OK) {
        return setError(writeRc, writeError, errorMsg);
    }
    if (closeRc != DLOG_E_OK) {
        return setError(closeRc, closeError, errorMsg);
    }
    return DLOG_E_OK;
}

std::vector<std::string> DLogManager::getActiveOutputs() {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(m_lock);
        ids.reserve(m_outputs.size());
        for (const auto& entry : m_outputs) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

uint32_t DLogManager::getActiveOutputCount() {
    std::shared_lock<std::shared_mutex> lock(m_lock);
    return (uint32_t)m_outputs.size();
}

DLogOutputPtr DLogManager::getOutput(const std::string& id) {
    std::shared_lock<std::shared_mutex> lock(m_lock);
    OutputMap::iterator itr = m_outputs.find(id);
    if (itr == m_outputs.end()) {
        return nullptr;
    }
    return itr->second->getOutput();
}

void DLogManager::closeOutput(const std::string& id) {
    std::vector<PendingLog> pendingLogs;
    {
        DLOG_SCOPED_DISABLE_REPORT();
        std::unique_lock<std::shared_mutex> lock(m_lock);
        closeOutputLocked(id, pendingLogs);
        publishLocked();
    }
    for (const PendingLog& pendingLog : pendingLogs) {
        emitLog(pendingLog.m_level, pendingLog.m_msg, pendingLog.m_fields);
    }
}

void DLogManager::close() {
    std::vector<PendingLog> pendingLogs;
    {
        DLOG_SCOPED_DISABLE_REPORT();
        std::unique_lock<std::shared_mutex> lock(m_lock);
        // unpublish first, so no record is submitted to an output being closed
        m_hook.publish(nullptr);
        std::vector<std::string> ids;
        for (const auto& entry : m_outputs) {
            ids.push_back(entry.first);
        }
        for (const std::string& id : ids) {
            closeOutputLocked(id, pendingLogs);
        }
        m_lastConfigs.clear();
    }
    for (const PendingLog& pendingLog : pendingLogs) {
        emitLog(pendingLog.m_level, pendingLog.m_msg, pendingLog.m_fields);
    }
}

DLogErrorCode DLogManager::createOutput(const DLogTargetConfig& config, DLogOutputPtr& output,
                                        std::string* errorMsg) {
    if (config.m_type.compare(DLOG_TARGET_TYPE_SYSLOG) == 0) {
        std::shared_ptr<DLogSyslogOutput> syslogOutput = std::make_shared<DLogSyslogOutput>(
            config, m_params.m_syslogFacility, m_params.m_connectTimeoutMillis);
        DLogErrorCode rc = syslogOutput->connect(errorMsg);
        if (rc != DLOG_E_OK) {
            return rc;
        }
        output = syslogOutput;
        return DLOG_E_OK;
    }

    if (config.m_type.compare(DLOG_TARGET_TYPE_HTTP) == 0) {
        uint32_t batchSize =
            config.m_batchSize > 0 ? (uint32_t)config.m_batchSize : m_params.m_defaultBatchSize;
        uint32_t flushIntervalSeconds = config.m_flushIntervalSeconds > 0
                                            ? (uint32_t)config.m_flushIntervalSeconds
                                            : m_params.m_defaultFlushIntervalSeconds;
        std::shared_ptr<DLogHttpOutput> httpOutput = std::make_shared<DLogHttpOutput>(
            config.m_name.c_str(), config.m_url, config.m_authToken, batchSize,
            flushIntervalSeconds, m_params.m_httpConfig);
        DLogErrorCode rc = httpOutput->start(errorMsg);
        if (rc != DLOG_E_OK) {
            return rc;
        }
        output = httpOutput;
        return DLOG_E_OK;
    }

    return setError(DLOG_E_INVALID_ARGUMENT, "unknown target type", errorMsg);
}

DLogErrorCode DLogManager::loadDesiredConfigs(std::vector<DLogTargetConfig>& configs,
                                              std::string* errorMsg) {
    if (m_store != nullptr) {
        return m_store->listEnabled(configs, errorMsg);
    }

    // no store yet, derive transient targets from legacy settings
    DLogTargetStore::loadLegacyTargets(m_settings, configs);
    for (DLogTargetConfig& config : configs) {
        config.m_id = (config.m_type.compare(DLOG_TARGET_TYPE_SYSLOG) == 0)
                          ? DLOG_LEGACY_SYSLOG_TARGET_ID
                          : DLOG_LEGACY_HTTP_TARGET_ID;
    }
    return DLOG_E_OK;
}

void DLogManager::applyLoggerSettings() {
    DLogSettingsReader* settings = nullptr;
    DLogLogger* logger = nullptr;
    {
        std::shared_lock<std::shared_mutex> lock(m_lock);
        settings = m_settings;
        logger = m_logger;
    }
    if (settings == nullptr || logger == nullptr) {
        return;
    }

    std::string value;
    if (settings->get(DLOG_SETTING_LEVEL, value) && !value.empty()) {
        DLogLevel logLevel = DLEVEL_INFO;
        if (dlogLevelFromStr(value.c_str(), logLevel)) {
            logger->setLogLevel(logLevel);
        } else {
            emitLog(DLEVEL_WARN, "Invalid log level setting, keeping current level",
                    {{"value", value}});
        }
    }
    if (settings->get(DLOG_SETTING_FORMAT, value) && !value.empty()) {
        DLogFormat format = DLOG_FORMAT_TEXT;
        if (dlogFormatFromStr(value.c_str(), format)) {
            logger->setFormat(format);
        } else {
            emitLog(DLEVEL_WARN, "Invalid log format setting, keeping current format",
                    {{"value", value}});
        }
    }
    bool includeCaller = false;
    if (settings->getBool(DLOG_SETTING_INCLUDE_CALLER, includeCaller)) {
        logger->setIncludeCaller(includeCaller);
    }
}

void DLogManager::closeOutputLocked(const std::string& id, std::vector<PendingLog>& pendingLogs) {
    OutputMap::iterator itr = m_outputs.find(id);
    if (itr != m_outputs.end()) {
        std::string closeError;
        if (itr->second->close(&closeError) != DLOG_E_OK) {
            pendingLogs.push_back({DLEVEL_WARN,
                                   "Failed to close logging target output",
                                   {{"target_id", id}, {"error", closeError}}});
        }
        m_outputs.erase(itr);
    }
    m_lastConfigs.erase(id);
}

void DLogManager::publishLocked() {
    // ordered by target id
    std::map<std::string, DLogDispatchEntry> orderedEntries;
    for (const auto& entry : m_outputs) {
        DLogLevel filterLevel = DLEVEL_INFO;
        ConfigMap::const_iterator configItr = m_lastConfigs.find(entry.first);
        if (configItr != m_lastConfigs.end()) {
            filterLevel = dlogLevelFromStrDefault(configItr->second.m_filterLevel.c_str());
        }
        orderedEntries[entry.first] = {entry.first, entry.second, filterLevel};
    }

    std::shared_ptr<DLogDispatchSnapshot> snapshot = std::make_shared<DLogDispatchSnapshot>();
    snapshot->m_entries.reserve(orderedEntries.size());
    for (const auto& entry : orderedEntries) {
        snapshot->m_entries.push_back(entry.second);
    }
    m_hook.publish(snapshot);
}

void DLogManager::emitLog(DLogLevel level, const std::string& msg, const nlohmann::json& fields) {
    DLogLogger* logger = nullptr;
    {
        std::shared_lock<std::shared_mutex> lock(m_lock);
        logger = m_logger;
    }
    nlohmann::json logFields = fields;
    logFields["component"] = "dlog.manager";
    if (logger != nullptr) {
        DLOG_FIELDS_EX(logger, level, logFields, msg);
    } else {
        DLOG_REPORT(level, "%s %s", msg.c_str(), fields.dump().c_str());
    }
}

}  // namespace dlog
