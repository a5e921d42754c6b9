#ifndef CAMSYNC_MONITOR_CLIENT_H
#define CAMSYNC_MONITOR_CLIENT_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <cstdint>

#include "core/Error.h"
#include "core/LogManager.h"
#include "core/SessionManager.h"
#include "monitor/DeviceState.h"
#include "monitor/DeviceRegistry.h"
#include "monitor/NetworkDirectory.h"
#include "monitor/SyncCoordinator.h"
#include "features/ClipArchiver.h"

namespace CamSync {

class ConfigManager;

struct MonitorSettings {
    int refreshIntervalSeconds = 30;
    bool parallelRefresh = false;
    int timeoutSeconds = 10;
    bool allowDuplicateLogs = true;

    static MonitorSettings fromConfig(const ConfigManager& config);
};

/**
 * MonitorClient - entry point tying the session, networks and devices
 *
 * Usage:
 *   CurlTransport transport;
 *   MonitorClient client(&transport, MonitorSettings::fromConfig(config));
 *   auto started = client.start({username, password});
 *   client.refreshAll();           // no-op inside the refresh interval
 *   auto view = client.devices();
 */
class MonitorClient {
public:
    using Clock = std::function<int64_t()>;

    /**
     * @param transport Non-owning; must outlive the client
     * @param clock Epoch seconds source (wall clock if empty)
     */
    explicit MonitorClient(Transport* transport,
                           MonitorSettings settings = MonitorSettings(),
                           Clock clock = nullptr);
    ~MonitorClient();

    MonitorClient(const MonitorClient&) = delete;
    MonitorClient& operator=(const MonitorClient&) = delete;

    /**
     * Log in, resolve networks, start one coordinator per onboarded
     * network and build the merged view
     *
     * A network whose initial refresh fails is kept with an empty cache.
     */
    Result<void> start(const Credentials& credentials);

    /**
     * Register a network by hand (coordinator is not started)
     */
    SyncCoordinator& addNetwork(const std::string& name, const std::string& networkId);

    // ==================== Refresh ====================

    /**
     * True once the refresh interval has passed since the last organic refresh
     */
    bool checkIfOkToUpdate() const;

    /**
     * Refresh every network if due (or forced) and rebuild the merged view
     *
     * An organic pass stamps the refresh clock when it finishes; forced
     * passes never move it.
     * @return true if a pass ran
     */
    bool refreshAll(bool forceCache = false);

    /**
     * Forget the last refresh time
     */
    void resetRefreshClock();

    std::optional<int64_t> lastRefresh() const;

    // ==================== State ====================

    MergedDeviceView devices() const;
    std::vector<SyncCoordinator*> coordinators() const;
    SyncCoordinator* coordinator(const std::string& networkName) const;
    const NetworkResolution& networks() const { return m_networks; }
    SessionManager& session() { return *m_session; }

    /**
     * Shared log repeat filter (null when duplicates are allowed)
     */
    std::shared_ptr<RepeatLogFilter> logFilter() const { return m_logFilter; }

    // ==================== Clips ====================

    /**
     * Download clips; an absent since defaults to the last refresh time
     */
    Result<ClipArchiveSummary> downloadClips(ClipQuery query);

private:
    MonitorSettings m_settings;
    Clock m_clock;
    std::shared_ptr<RepeatLogFilter> m_logFilter;
    Logger m_logger;

    std::unique_ptr<SessionManager> m_session;
    NetworkDirectory m_directory;
    DeviceRegistry m_registry;
    ClipArchiver m_archiver;

    NetworkResolution m_networks;
    std::vector<std::unique_ptr<SyncCoordinator>> m_coordinators;  // registration order

    mutable std::mutex m_mutex;
    std::optional<int64_t> m_lastRefresh;  // end of the last organic pass
    bool m_organicPassRunning = false;
    MergedDeviceView m_view;

    void refreshCoordinators(bool forceCache);
    void rebuildView();
};

} // namespace CamSync

#endif // CAMSYNC_MONITOR_CLIENT_H
