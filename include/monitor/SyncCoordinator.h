#ifndef CAMSYNC_SYNC_COORDINATOR_H
#define CAMSYNC_SYNC_COORDINATOR_H

#include <string>
#include <mutex>
#include <optional>

#include "core/Error.h"
#include "core/LogManager.h"
#include "core/SessionManager.h"
#include "monitor/DeviceState.h"

namespace CamSync {

enum class SyncState {
    Idle,
    Refreshing
};

/**
 * SyncCoordinator - keeps the device snapshot of one network
 *
 * The cache is replaced wholesale by every successful refresh; a failed
 * refresh leaves the previous one in place.
 */
class SyncCoordinator {
public:
    SyncCoordinator(SessionManager& session,
                    std::string name,
                    std::string networkId,
                    Logger logger = Logger(LogCategory::Sync));

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    /**
     * Fetch sync module status, then refresh with a forced image fetch
     *
     * A sync module status failure is logged and leaves the module
     * offline; the refresh result is returned.
     */
    Result<void> start();

    /**
     * Fetch the homescreen and rebuild this network's device cache
     * @param forceCache Re-download every thumbnail
     */
    Result<void> refresh(bool forceCache = false);

    // ==================== Accessors ====================

    DeviceCache devices() const;
    SyncState state() const;
    const std::string& name() const { return m_name; }
    const std::string& networkId() const { return m_networkId; }
    bool online() const;
    std::optional<std::string> syncModuleId() const;
    std::optional<Error> lastRefreshError() const;

private:
    SessionManager& m_session;
    std::string m_name;
    std::string m_networkId;
    Logger m_logger;

    mutable std::mutex m_mutex;
    SyncState m_state = SyncState::Idle;
    DeviceCache m_cache;
    bool m_online = false;
    std::optional<std::string> m_syncModuleId;
    std::optional<Error> m_lastError;

    Result<void> fetchSyncModuleStatus();
    Result<DeviceCache> buildCache(const std::string& body, bool forceCache, const DeviceCache& previous);
    void fetchThumbnail(DeviceState& device);
    void finishRefresh(std::optional<Error> error);
};

} // namespace CamSync

#endif // CAMSYNC_SYNC_COORDINATOR_H
