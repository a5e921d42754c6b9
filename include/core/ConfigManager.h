#ifndef CAMSYNC_CONFIG_MANAGER_H
#define CAMSYNC_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

#include "core/Error.h"

namespace CamSync {

/**
 * Manages application configuration
 *
 * Values live in a JSON document addressed with dotted keys
 * ("refresh.intervalSeconds"). A loaded file is merged over the defaults.
 */
class ConfigManager {
public:
    // Singleton pattern
    static ConfigManager& getInstance();

    // Delete copy constructor and assignment
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Load configuration from file
     * @param filePath Path to configuration file
     * @return Error if the file is missing or not valid JSON
     */
    Result<void> loadConfig(const std::string& filePath);

    /**
     * Save configuration to file
     * @param filePath Path to save configuration (empty = last loaded path)
     */
    Result<void> saveConfig(const std::string& filePath = "");

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * Get array value
     * @return Array as vector of strings; a scalar string yields one element
     */
    std::vector<std::string> getArray(const std::string& key) const;

    void setInt(const std::string& key, int value);
    void setValue(const std::string& key, const nlohmann::json& value);

    /**
     * Reset to defaults
     */
    void resetToDefaults();

    /**
     * Current configuration as JSON text
     */
    std::string exportToJson(bool prettyPrint = true) const;

    /**
     * Import configuration from JSON string (merged over defaults)
     */
    Result<void> importFromJson(const std::string& jsonString);

    /**
     * Get default configuration
     */
    static nlohmann::json getDefaultConfig();

    /**
     * Merge configurations (second overrides first)
     */
    static nlohmann::json mergeConfigs(const nlohmann::json& base,
                                       const nlohmann::json& overlay);

    // Specific application configurations
    struct AuthConfig {
        std::string username;
        std::string password;
    };

    struct RefreshConfig {
        int intervalSeconds;
        bool parallel;
    };

    struct ClipConfig {
        int maxPages;
        std::vector<std::string> cameraFilter;
        std::string destination;
    };

    struct NetworkConfig {
        int timeoutSeconds;
    };

    struct LogConfig {
        std::string level;
        std::string directory;  // empty = LogManager default
        bool toFile;
        bool console;
        bool allowDuplicates;
    };

    AuthConfig getAuthConfig() const;
    RefreshConfig getRefreshConfig() const;
    ClipConfig getClipConfig() const;
    NetworkConfig getNetworkConfig() const;
    LogConfig getLogConfig() const;

private:
    ConfigManager();
    ~ConfigManager() = default;

    mutable std::mutex m_mutex;
    nlohmann::json m_config;
    std::string m_configFilePath;

    const nlohmann::json* navigateToKey(const std::string& key) const;
    void setValueAtKey(const std::string& key, const nlohmann::json& value);
    static std::vector<std::string> splitKey(const std::string& key);
};

} // namespace CamSync

#endif // CAMSYNC_CONFIG_MANAGER_H
