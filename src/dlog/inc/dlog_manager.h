#ifndef __DLOG_MANAGER_H__
#define __DLOG_MANAGER_H__

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "db/dlog_target_store.h"
#include "dlog_async_output.h"
#include "dlog_def.h"
#include "dlog_dispatch_hook.h"
#include "dlog_error.h"
#include "dlog_logger.h"
#include "dlog_params.h"
#include "dlog_settings.h"
#include "dlog_target_config.h"

/** @def Identifiers of targets derived from legacy settings when no store is attached. */
#define DLOG_LEGACY_SYSLOG_TARGET_ID "legacy-syslog"
#define DLOG_LEGACY_HTTP_TARGET_ID "legacy-http"

/** @def Message of the synthetic record sent by connectivity tests. */
#define DLOG_TEST_RECORD_MSG "dlog logging target connectivity test"

namespace dlog {

/**
 * @brief Owns the running outputs of all enabled logging targets. On each reconfiguration the
 * running set is reconciled against the target store, and a fresh dispatch snapshot is published
 * to the dispatch hook.
 */
class DLOG_API DLogManager {
public:
    DLogManager(const DLogParams& params = DLogParams());
    DLogManager(const DLogManager&) = delete;
    DLogManager(DLogManager&&) = delete;
    DLogManager& operator=(const DLogManager&) = delete;
    virtual ~DLogManager();

    /** @brief Sets the settings reader (legacy targets and host logger settings). */
    void setSettingsManager(DLogSettingsReader* settings);

    /**
     * @brief Registers the dispatch hook with the host logger. The logger also receives the
     * manager's own log lines and the host logger settings on each reconfiguration.
     */
    void attachLogger(DLogLogger* logger);

    /** @brief Unregisters the dispatch hook from the attached logger. */
    void detachLogger();

    /** @brief Attaches a target store and reconfigures. */
    DLogErrorCode setTargetStore(DLogTargetStore* store, std::string* errorMsg = nullptr);

    /**
     * @brief Attaches a target store, migrates legacy settings into it if the store is empty and
     * a settings reader is set, and then reconfigures. A failed migration is logged and does not
     * prevent reconfiguration.
     */
    DLogErrorCode initTargetStore(DLogTargetStore* store, std::string* errorMsg = nullptr);

    /**
     * @brief Reconciles the running outputs with the enabled targets and publishes a new dispatch
     * snapshot. Targets whose output cannot be created are skipped until the next call.
     * @return DLOG_E_OK unless the desired target list could not be loaded.
     */
    DLogErrorCode reconfigure(std::string* errorMsg = nullptr);

    /** @brief Sends a synthetic record through the stored target with the given id. */
    DLogErrorCode testTarget(const std::string& id, std::string* errorMsg = nullptr);

    /**
     * @brief Sends a synthetic record through a transient output built from an unsaved
     * configuration. The record is written synchronously and the output is closed afterwards.
     */
    DLogErrorCode testTargetConfig(const DLogTargetConfig& config,
                                   std::string* errorMsg = nullptr);

    /** @brief Retrieves the identifiers of all running outputs (sorted). */
    std::vector<std::string> getActiveOutputs();

    /** @brief Retrieves the number of running outputs. */
    uint32_t getActiveOutputCount();

    /** @brief Retrieves the running output of a target (null if none). */
    DLogOutputPtr getOutput(const std::string& id);

    /** @brief Closes the output of a single target and republishes the snapshot. */
    void closeOutput(const std::string& id);

    /** @brief Closes all outputs and publishes an empty snapshot. */
    void close();

    /** @brief Retrieves the dispatch hook to be registered with a host logger. */
    inline DLogDispatchHook* getHook() { return &m_hook; }

protected:
    /**
     * @brief Creates and connects (or starts) an output for a target.
     * @return DLOG_E_INVALID_ARGUMENT with "unknown target type" for unsupported types.
     */
    virtual DLogErrorCode createOutput(const DLogTargetConfig& config, DLogOutputPtr& output,
                                       std::string* errorMsg);

    inline const DLogParams& getParams() const { return m_params; }

private:
    typedef std::unordered_map<std::string, std::shared_ptr<DLogAsyncOutput>> OutputMap;
    typedef std::unordered_map<std::string, DLogTargetConfig> ConfigMap;

    /** @brief Log lines collected while holding the write lock. */
    struct PendingLog {
        DLogLevel m_level;
        std::string m_msg;
        nlohmann::json m_fields;
    };

    DLogParams m_params;
    DLogDispatchHook m_hook;
    DLogSettingsReader* m_settings;
    DLogLogger* m_logger;
    DLogTargetStore* m_store;

    std::shared_mutex m_lock;
    OutputMap m_outputs;
    ConfigMap m_lastConfigs;

    DLogErrorCode loadDesiredConfigs(std::vector<DLogTargetConfig>& configs,
                                     std::string* errorMsg);
    void applyLoggerSettings();
    void closeOutputLocked(const std::string& id, std::vector<PendingLog>& pendingLogs);
    void publishLocked();
    void emitLog(DLogLevel level, const std::string& msg, const nlohmann::json& fields);
};

}  // namespace dlog

#endif  // __DLOG_MANAGER_H__
