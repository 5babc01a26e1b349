#ifndef __DLOG_TARGET_STORE_H__
#define __DLOG_TARGET_STORE_H__

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "dlog_def.h"
#include "dlog_error.h"
#include "dlog_settings.h"
#include "dlog_target_config.h"

/** @def Name of the table holding logging targets. */
#define DLOG_TARGET_TABLE_NAME "logging_targets"

/** @def Names given to targets created from legacy settings. */
#define DLOG_MIGRATED_SYSLOG_NAME "Syslog (migrated)"
#define DLOG_MIGRATED_HTTP_NAME "HTTP (migrated)"

namespace dlog {

/** @brief Persisted registry of logging targets, backed by an SQLite database. */
class DLOG_API DLogTargetStore {
public:
    DLogTargetStore() : m_db(nullptr) {}
    DLogTargetStore(const DLogTargetStore&) = delete;
    DLogTargetStore(DLogTargetStore&&) = delete;
    DLogTargetStore& operator=(const DLogTargetStore&) = delete;
    ~DLogTargetStore() { (void)close(); }

    /**
     * @brief Opens (or creates) the database and makes sure the target table exists.
     * @param filePath The database file path (":memory:" for a private in-memory database).
     * @param[out] errorMsg Optionally receives failure description.
     */
    DLogErrorCode open(const char* filePath, std::string* errorMsg = nullptr);

    /** @brief Closes the database. */
    DLogErrorCode close();

    /** @brief Creates the target table if it does not exist. */
    DLogErrorCode initSchema(std::string* errorMsg = nullptr);

    /** @brief Lists all targets ordered by name. */
    DLogErrorCode list(std::vector<DLogTargetConfig>& configs, std::string* errorMsg = nullptr);

    /** @brief Lists enabled targets ordered by name. */
    DLogErrorCode listEnabled(std::vector<DLogTargetConfig>& configs,
                              std::string* errorMsg = nullptr);

    /** @brief Retrieves a target by id (DLOG_E_NOT_FOUND if there is none). */
    DLogErrorCode get(const std::string& id, DLogTargetConfig& config,
                      std::string* errorMsg = nullptr);

    /**
     * @brief Validates and persists a new target. An id is generated if none is given, and the
     * creation/update times are set.
     */
    DLogErrorCode create(DLogTargetConfig& config, std::string* errorMsg = nullptr);

    /** @brief Validates and updates an existing target (the update time is refreshed). */
    DLogErrorCode update(DLogTargetConfig& config, std::string* errorMsg = nullptr);

    /** @brief Deletes a target by id. */
    DLogErrorCode remove(const std::string& id, std::string* errorMsg = nullptr);

    /** @brief Retrieves the number of persisted targets. */
    DLogErrorCode count(uint64_t& targetCount, std::string* errorMsg = nullptr);

    /**
     * @brief Creates at most one syslog target and one HTTP target from legacy single-target
     * settings. A row that fails to be created is reported and skipped, and the remaining rows
     * are still migrated. The call is not guarded against repeated invocation. Callers are
     * expected to migrate only when the store is empty.
     * @return DLOG_E_OK unless no settings reader is given.
     */
    DLogErrorCode migrateFromLegacySettings(const DLogSettingsReader* settings,
                                            std::string* errorMsg = nullptr);

    /**
     * @brief Builds target configurations from legacy single-target settings (without ids or time
     * stamps). Disabled or incomplete legacy targets are skipped.
     */
    static void loadLegacyTargets(const DLogSettingsReader* settings,
                                  std::vector<DLogTargetConfig>& configs);

private:
    sqlite3* m_db;
    std::mutex m_lock;

    DLogErrorCode execSql(const char* sql, std::string* errorMsg);
    DLogErrorCode prepare(const char* sql, sqlite3_stmt*& stmt, std::string* errorMsg);
    DLogErrorCode queryList(const char* sql, std::vector<DLogTargetConfig>& configs,
                            std::string* errorMsg);
    DLogErrorCode bindConfig(sqlite3_stmt* stmt, const DLogTargetConfig& config,
                             std::string* errorMsg);
    DLogErrorCode execStatement(sqlite3_stmt* stmt, std::string* errorMsg);
    void readRow(sqlite3_stmt* stmt, DLogTargetConfig& config);
    DLogErrorCode setDbError(int res, const char* what, std::string* errorMsg);
};

}  // namespace dlog

#endif  // __DLOG_TARGET_STORE_H__
