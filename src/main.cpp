/**
 * CamSync Application
 * Main entry point
 */

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <cstdlib>
#include <iomanip>
#include <filesystem>

#include <nlohmann/json.hpp>

#include "core/ConfigManager.h"
#include "core/LogManager.h"
#include "core/SessionManager.h"
#include "core/TimeUtils.h"
#include "monitor/MonitorClient.h"
#include "features/ClipArchiver.h"
#include "transport/CurlTransport.h"

// Version information
#define APP_NAME "CamSync"
#define APP_VERSION "1.0.0"
#define APP_DESCRIPTION "Camera network monitor and clip archiver"

/**
 * Options that apply to every command
 */
struct GlobalOptions {
    std::string configPath;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
};

/**
 * Default config location in the user's home directory
 */
std::string getDefaultConfigPath() {
    const char* home = std::getenv("HOME");
    return std::string(home ? home : "/tmp") + "/.camsync/config.json";
}

/**
 * Print application header
 */
void printHeader() {
    std::cout << "\n";
    std::cout << "=================================================\n";
    std::cout << " " << APP_NAME << " v" << APP_VERSION << "\n";
    std::cout << " " << APP_DESCRIPTION << "\n";
    std::cout << "=================================================\n\n";
}

/**
 * Print usage information
 */
void printUsage(const std::string& programName) {
    std::cout << "Usage: " << programName << " [--config FILE] [--verbose] <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  status      Log in and list networks and cameras\n";
    std::cout << "  refresh     Force a refresh of every network and list cameras\n";
    std::cout << "  download    Download recorded clips\n";
    std::cout << "  config      Show the effective configuration\n";
    std::cout << "  help        Show this help message\n";
    std::cout << "  version     Show version information\n\n";
    std::cout << "Credentials come from auth.username/auth.password in the config file\n";
    std::cout << "or the CAMSYNC_USERNAME/CAMSYNC_PASSWORD environment variables.\n";
    std::cout << "Use '" << programName << " <command> --help' for command-specific help.\n";
}

/**
 * Print version information
 */
void printVersion() {
    std::cout << APP_NAME << " version " << APP_VERSION << "\n";
    std::cout << "Built with libcurl and nlohmann/json\n";
}

/**
 * Load configuration and apply logging settings
 */
bool initializeConfig(const GlobalOptions& options) {
    CamSync::ConfigManager& config = CamSync::ConfigManager::getInstance();

    std::string path = options.configPath;
    bool explicitPath = !path.empty();
    if (!explicitPath) {
        path = getDefaultConfigPath();
    }

    std::error_code ec;
    if (explicitPath || std::filesystem::exists(path, ec)) {
        auto loaded = config.loadConfig(path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().toString() << "\n";
            return false;
        }
    }

    auto logConfig = config.getLogConfig();
    CamSync::LogManager& log = CamSync::LogManager::instance();
    log.setMinLevel(options.verbose ? CamSync::LogLevel::Debug
                                    : CamSync::LogManager::stringToLevel(logConfig.level));
    log.setConsoleOutput(logConfig.console);
    if (!logConfig.directory.empty()) {
        log.setLogDirectory(logConfig.directory);
    }
    log.setFileOutput(logConfig.toFile);
    return true;
}

/**
 * Credentials from config, overridden by the environment
 */
CamSync::Credentials loadCredentials() {
    auto auth = CamSync::ConfigManager::getInstance().getAuthConfig();
    CamSync::Credentials credentials{auth.username, auth.password};

    if (const char* user = std::getenv("CAMSYNC_USERNAME")) {
        credentials.username = user;
    }
    if (const char* password = std::getenv("CAMSYNC_PASSWORD")) {
        credentials.password = password;
    }
    return credentials;
}

/**
 * Log in and start every network
 */
bool startClient(CamSync::MonitorClient& client) {
    auto started = client.start(loadCredentials());
    if (!started) {
        std::cerr << "Login failed: " << started.error().toString() << "\n";
        return false;
    }
    return true;
}

void printDevices(CamSync::MonitorClient& client) {
    for (auto* coordinator : client.coordinators()) {
        std::cout << "Network: " << coordinator->name() << " (id " << coordinator->networkId() << ")"
                  << (coordinator->online() ? " online" : " offline");
        auto moduleId = coordinator->syncModuleId();
        if (moduleId) {
            std::cout << ", sync module " << moduleId.value();
        }
        std::cout << "\n";
        auto error = coordinator->lastRefreshError();
        if (error) {
            std::cout << "  Last refresh failed: " << error->toString() << "\n";
        }
    }

    auto view = client.devices();
    std::cout << "\nCameras (" << view.size() << "):\n";
    for (const auto& item : view) {
        const CamSync::DeviceState& device = item.second.value;
        std::cout << "  " << std::left << std::setw(20) << item.second.key
                  << " armed=" << (device.enabled ? "yes" : "no")
                  << " battery=" << (device.batteryState.empty() ? "?" : device.batteryState);
        auto celsius = device.temperatureC();
        if (celsius) {
            std::cout << " temp=" << device.temperature.value() << "F/" << celsius.value() << "C";
        }
        std::cout << "\n";
    }
}

/**
 * Handle status command
 */
int handleStatus(const std::vector<std::string>& args) {
    if (!args.empty() && args[0] == "--help") {
        std::cout << "Usage: camsync status\n";
        std::cout << "  Log in, start every onboarded network and list its cameras\n";
        return 0;
    }

    CamSync::CurlTransport transport;
    CamSync::MonitorClient client(&transport,
        CamSync::MonitorSettings::fromConfig(CamSync::ConfigManager::getInstance()));
    if (!startClient(client)) {
        return 1;
    }

    auto session = client.session().session();
    std::cout << "Region: " << session->region << " (" << session->regionId << ")\n";
    auto account = client.networks().account.accountId;
    std::cout << "Account: " << (account ? account.value() : "unknown") << "\n\n";
    printDevices(client);
    return 0;
}

/**
 * Handle refresh command
 */
int handleRefresh(const std::vector<std::string>& args) {
    if (!args.empty() && args[0] == "--help") {
        std::cout << "Usage: camsync refresh\n";
        std::cout << "  Start every network, then force a refresh including thumbnails\n";
        return 0;
    }

    CamSync::CurlTransport transport;
    CamSync::MonitorClient client(&transport,
        CamSync::MonitorSettings::fromConfig(CamSync::ConfigManager::getInstance()));
    if (!startClient(client)) {
        return 1;
    }

    client.refreshAll(true);
    printDevices(client);
    return 0;
}

/**
 * Handle config command
 */
int handleConfig(const std::vector<std::string>& args) {
    if (!args.empty() && args[0] == "--help") {
        std::cout << "Usage: camsync config\n";
        std::cout << "  Print the effective configuration (password masked)\n";
        return 0;
    }

    nlohmann::json effective = nlohmann::json::parse(
        CamSync::ConfigManager::getInstance().exportToJson(false));
    auto& password = effective["auth"]["password"];
    if (password.is_string() && !password.get<std::string>().empty()) {
        password = "********";
    }
    std::cout << effective.dump(4) << "\n";
    return 0;
}

/**
 * Handle download command
 */
int handleDownload(const std::vector<std::string>& args) {
    auto clipConfig = CamSync::ConfigManager::getInstance().getClipConfig();

    CamSync::ClipQuery query;
    query.destination = clipConfig.destination;
    query.maxPages = clipConfig.maxPages;
    std::vector<std::string> cameras;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help") {
            std::cout << "Usage: camsync download [options]\n";
            std::cout << "  --dest DIR      Destination directory (default: clips.destination)\n";
            std::cout << "  --since DATE    Only clips newer than DATE (epoch or date text)\n";
            std::cout << "  --camera NAME   Only this camera; repeatable (default: all)\n";
            std::cout << "  --pages N       Page limit (default: clips.maxPages)\n";
            return 0;
        }
        if (i + 1 >= args.size()) {
            std::cerr << "Missing value for " << arg << "\n";
            return 1;
        }
        const std::string& value = args[++i];
        if (arg == "--dest") {
            query.destination = value;
        } else if (arg == "--since") {
            query.since = CamSync::ClipSince(value);
        } else if (arg == "--camera") {
            cameras.push_back(value);
        } else if (arg == "--pages") {
            try {
                query.maxPages = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid page count: " << value << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }
    query.cameras = CamSync::CameraFilter::fromList(cameras.empty() ? clipConfig.cameraFilter : cameras);

    CamSync::CurlTransport transport;
    CamSync::MonitorClient client(&transport,
        CamSync::MonitorSettings::fromConfig(CamSync::ConfigManager::getInstance()));
    if (!startClient(client)) {
        return 1;
    }

    auto summary = client.downloadClips(query);
    if (!summary) {
        std::cerr << "Download failed: " << summary.error().toString() << "\n";
        return 1;
    }

    const auto& result = summary.value();
    std::cout << "Clips since " << result.since << ":\n";
    std::cout << "  Pages:      " << result.pagesFetched << "\n";
    std::cout << "  Downloaded: " << result.downloaded.size() << "\n";
    std::cout << "  Existing:   " << result.skippedExisting << "\n";
    std::cout << "  Deleted:    " << result.skippedDeleted << "\n";
    std::cout << "  Filtered:   " << result.skippedFiltered << "\n";
    std::cout << "  Malformed:  " << result.skippedMalformed << "\n";
    for (const auto& path : result.downloaded) {
        std::cout << "  + " << path << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    GlobalOptions options;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a file\n";
                return 1;
            }
            options.configPath = argv[++i];
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            break;
        }
    }

    // Check if a command was provided
    if (i >= argc) {
        printHeader();
        printUsage(argv[0]);
        return 1;
    }

    options.command = argv[i++];
    for (; i < argc; ++i) {
        options.args.push_back(argv[i]);
    }

    const std::string& command = options.command;
    if (command == "help" || command == "--help" || command == "-h") {
        printHeader();
        printUsage(argv[0]);
        return 0;
    }
    else if (command == "version" || command == "--version" || command == "-v") {
        printVersion();
        return 0;
    }

    if (!initializeConfig(options)) {
        return 1;
    }

    int status = 1;
    try {
        if (command == "status") {
            status = handleStatus(options.args);
        }
        else if (command == "refresh") {
            status = handleRefresh(options.args);
        }
        else if (command == "download") {
            status = handleDownload(options.args);
        }
        else if (command == "config") {
            status = handleConfig(options.args);
        }
        else {
            std::cerr << "Error: Unknown command '" << command << "'\n";
            std::cerr << "Use '" << argv[0] << " help' for usage information.\n";
        }
    } catch (const CamSync::ErrorException& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
    }

    CamSync::LogManager::instance().flush();
    return status;
}
