#ifndef __DLOG_SETTINGS_H__
#define __DLOG_SETTINGS_H__

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "dlog_def.h"

/** @def Host logger settings (applied on every reconfiguration). */
#define DLOG_SETTING_LEVEL "logging.level"
#define DLOG_SETTING_FORMAT "logging.format"
#define DLOG_SETTING_INCLUDE_CALLER "logging.include_caller"

/** @def Legacy single syslog target settings. */
#define DLOG_SETTING_SYSLOG_ENABLED "logging.syslog_enabled"
#define DLOG_SETTING_SYSLOG_HOST "logging.syslog_host"
#define DLOG_SETTING_SYSLOG_PORT "logging.syslog_port"
#define DLOG_SETTING_SYSLOG_PROTOCOL "logging.syslog_protocol"
#define DLOG_SETTING_SYSLOG_TAG "logging.syslog_tag"

/** @def Legacy single HTTP target settings. */
#define DLOG_SETTING_HTTP_ENABLED "logging.http_enabled"
#define DLOG_SETTING_HTTP_URL "logging.http_url"
#define DLOG_SETTING_HTTP_AUTH_TOKEN "logging.http_auth_token"
#define DLOG_SETTING_HTTP_BATCH_SIZE "logging.http_batch_size"
#define DLOG_SETTING_HTTP_FLUSH_INTERVAL "logging.http_flush_interval"

namespace dlog {

/**
 * @brief Read-only access to the host's settings service. Each getter returns false if the key is
 * not defined (or cannot be converted to the requested type).
 */
class DLOG_API DLogSettingsReader {
public:
    virtual ~DLogSettingsReader() {}
    DLogSettingsReader(const DLogSettingsReader&) = delete;
    DLogSettingsReader(DLogSettingsReader&&) = delete;
    DLogSettingsReader& operator=(const DLogSettingsReader&) = delete;

    /** @brief Retrieves a string setting. */
    virtual bool get(const char* key, std::string& value) const = 0;

    /** @brief Retrieves an integer setting. By default parses the string setting. */
    virtual bool getInt(const char* key, int64_t& value) const;

    /**
     * @brief Retrieves a boolean setting. By default parses the string setting ("true", "yes",
     * "on", "1" are regarded as true, "false", "no", "off", "0" as false).
     */
    virtual bool getBool(const char* key, bool& value) const;

protected:
    DLogSettingsReader() {}
};

/** @brief In-memory settings store, for embedders without a settings service. */
class DLOG_API DLogMapSettings : public DLogSettingsReader {
public:
    DLogMapSettings() {}
    DLogMapSettings(const DLogMapSettings&) = delete;
    DLogMapSettings(DLogMapSettings&&) = delete;
    DLogMapSettings& operator=(const DLogMapSettings&) = delete;
    ~DLogMapSettings() final {}

    bool get(const char* key, std::string& value) const final;

    /** @brief Sets a setting value. */
    void set(const char* key, const std::string& value);

    /** @brief Removes a setting. */
    void remove(const char* key);

private:
    std::unordered_map<std::string, std::string> m_settings;
    mutable std::mutex m_lock;
};

}  // namespace dlog

#endif  // __DLOG_SETTINGS_H__
