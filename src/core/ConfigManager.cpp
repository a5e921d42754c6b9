#include "core/ConfigManager.h"
#include "core/LogManager.h"

#include <fstream>
#include <sstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace CamSync {

ConfigManager::ConfigManager() {
    m_config = getDefaultConfig();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

Result<void> ConfigManager::loadConfig(const std::string& filePath) {
    if (!fs::exists(filePath)) {
        return Error(ErrorCode::CONFIG_FILE_NOT_FOUND, "Config file not found", filePath);
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Error(ErrorCode::CONFIG_FILE_NOT_FOUND, "Failed to open config file", filePath);
    }

    nlohmann::json loaded = nlohmann::json::parse(file, nullptr, false);
    if (loaded.is_discarded() || !loaded.is_object()) {
        return Error(ErrorCode::CONFIG_PARSE_ERROR, "Config file is not a JSON object", filePath);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = mergeConfigs(getDefaultConfig(), loaded);
        m_configFilePath = filePath;
    }

    CAMSYNC_LOG_INFO(LogCategory::Config, "config_loaded", "Loaded configuration from " + filePath);
    return Result<void>();
}

Result<void> ConfigManager::saveConfig(const std::string& filePath) {
    std::string targetPath;
    std::string content;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targetPath = filePath.empty() ? m_configFilePath : filePath;
        content = m_config.dump(4);
    }

    if (targetPath.empty()) {
        return Error(ErrorCode::FS_INVALID_PATH, "No config file path specified");
    }

    std::ofstream file(targetPath);
    if (!file.is_open()) {
        return Error::writeFailed(targetPath);
    }

    file << content;
    file.flush();
    if (file.fail()) {
        return Error::writeFailed(targetPath);
    }
    return Result<void>();
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_number_integer()) {
        return value->get<int>();
    }
    return defaultValue;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_boolean()) {
        return value->get<bool>();
    }
    return defaultValue;
}

std::vector<std::string> ConfigManager::getArray(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    const nlohmann::json* value = navigateToKey(key);
    if (!value) return result;

    if (value->is_string()) {
        result.push_back(value->get<std::string>());
    } else if (value->is_array()) {
        for (const auto& item : *value) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

void ConfigManager::setInt(const std::string& key, int value) {
    setValue(key, nlohmann::json(value));
}

void ConfigManager::setValue(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    setValueAtKey(key, value);
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = getDefaultConfig();
    m_configFilePath.clear();
}

std::string ConfigManager::exportToJson(bool prettyPrint) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (prettyPrint) {
        return m_config.dump(4);
    }
    return m_config.dump();
}

Result<void> ConfigManager::importFromJson(const std::string& jsonString) {
    nlohmann::json imported = nlohmann::json::parse(jsonString, nullptr, false);
    if (imported.is_discarded() || !imported.is_object()) {
        return Error(ErrorCode::CONFIG_PARSE_ERROR, "Imported configuration is not a JSON object");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = mergeConfigs(getDefaultConfig(), imported);
    return Result<void>();
}

// Helper methods
nlohmann::json ConfigManager::getDefaultConfig() {
    return {
        {"auth", {
            {"username", ""},
            {"password", ""}
        }},
        {"refresh", {
            {"intervalSeconds", 30},
            {"parallel", false}
        }},
        {"clips", {
            {"maxPages", 10},
            {"cameraFilter", "all"},
            {"destination", "."}
        }},
        {"network", {
            {"timeoutSeconds", 10}
        }},
        {"log", {
            {"level", "INFO"},
            {"directory", ""},
            {"toFile", true},
            {"console", true},
            {"allowDuplicates", true}
        }}
    };
}

const nlohmann::json* ConfigManager::navigateToKey(const std::string& key) const {
    auto keys = splitKey(key);
    if (keys.empty()) return nullptr;

    const nlohmann::json* current = &m_config;
    for (const auto& k : keys) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(k);
        if (it == current->end()) return nullptr;
        current = &(*it);
    }
    return current;
}

void ConfigManager::setValueAtKey(const std::string& key, const nlohmann::json& value) {
    auto keys = splitKey(key);
    if (keys.empty()) return;

    nlohmann::json* current = &m_config;

    for (size_t i = 0; i < keys.size() - 1; ++i) {
        if (!current->contains(keys[i]) || !(*current)[keys[i]].is_object()) {
            (*current)[keys[i]] = nlohmann::json::object();
        }
        current = &(*current)[keys[i]];
    }

    (*current)[keys.back()] = value;
}

std::vector<std::string> ConfigManager::splitKey(const std::string& key) {
    std::vector<std::string> result;
    std::stringstream ss(key);
    std::string item;

    while (std::getline(ss, item, '.')) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

nlohmann::json ConfigManager::mergeConfigs(const nlohmann::json& base, const nlohmann::json& overlay) {
    nlohmann::json result = base;

    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (result.contains(key) && result[key].is_object() && value.is_object()) {
            result[key] = mergeConfigs(result[key], value);
        } else {
            result[key] = value;
        }
    }

    return result;
}

// Get specific configuration structures
ConfigManager::AuthConfig ConfigManager::getAuthConfig() const {
    AuthConfig config;
    config.username = getString("auth.username");
    config.password = getString("auth.password");
    return config;
}

ConfigManager::RefreshConfig ConfigManager::getRefreshConfig() const {
    RefreshConfig config;
    config.intervalSeconds = getInt("refresh.intervalSeconds", 30);
    config.parallel = getBool("refresh.parallel", false);
    return config;
}

ConfigManager::ClipConfig ConfigManager::getClipConfig() const {
    ClipConfig config;
    config.maxPages = getInt("clips.maxPages", 10);
    config.cameraFilter = getArray("clips.cameraFilter");
    if (config.cameraFilter.empty()) {
        config.cameraFilter.push_back("all");
    }
    config.destination = getString("clips.destination", ".");
    return config;
}

ConfigManager::NetworkConfig ConfigManager::getNetworkConfig() const {
    NetworkConfig config;
    config.timeoutSeconds = getInt("network.timeoutSeconds", 10);
    return config;
}

ConfigManager::LogConfig ConfigManager::getLogConfig() const {
    LogConfig config;
    config.level = getString("log.level", "INFO");
    config.directory = getString("log.directory");
    config.toFile = getBool("log.toFile", true);
    config.console = getBool("log.console", true);
    config.allowDuplicates = getBool("log.allowDuplicates", true);
    return config;
}

} // namespace CamSync
