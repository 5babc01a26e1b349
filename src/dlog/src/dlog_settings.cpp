#include "dlog_settings.h"

#include "dlog_common.h"

namespace dlog {

bool DLogSettingsReader::getInt(const char* key, int64_t& value) const {
    std::string strValue;
    if (!get(key, strValue)) {
        return false;
    }
    return parseInt64(strValue, value);
}

bool DLogSettingsReader::getBool(const char* key, bool& value) const {
    std::string strValue;
    if (!get(key, strValue)) {
        return false;
    }
    return parseBool(strValue, value);
}

bool DLogMapSettings::get(const char* key, std::string& value) const {
    std::unique_lock<std::mutex> lock(m_lock);
    auto itr = m_settings.find(key);
    if (itr == m_settings.end()) {
        return false;
    }
    value = itr->second;
    return true;
}

void DLogMapSettings::set(const char* key, const std::string& value) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_settings[key] = value;
}

void DLogMapSettings::remove(const char* key) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_settings.erase(key);
}

}  // namespace dlog
