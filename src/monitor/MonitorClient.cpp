#include "monitor/MonitorClient.h"
#include "core/ConfigManager.h"
#include "core/TimeUtils.h"

#include <future>

namespace CamSync {

MonitorSettings MonitorSettings::fromConfig(const ConfigManager& config) {
    MonitorSettings settings;
    auto refresh = config.getRefreshConfig();
    settings.refreshIntervalSeconds = refresh.intervalSeconds;
    settings.parallelRefresh = refresh.parallel;
    settings.timeoutSeconds = config.getNetworkConfig().timeoutSeconds;
    settings.allowDuplicateLogs = config.getLogConfig().allowDuplicates;
    return settings;
}

namespace {
std::shared_ptr<RepeatLogFilter> makeFilter(const MonitorSettings& settings) {
    if (settings.allowDuplicateLogs) {
        return nullptr;
    }
    return std::make_shared<RepeatLogFilter>();
}
} // anonymous namespace

MonitorClient::MonitorClient(Transport* transport, MonitorSettings settings, Clock clock)
    : m_settings(settings),
      m_clock(clock ? std::move(clock) : Clock(TimeUtils::nowEpochSeconds)),
      m_logFilter(makeFilter(settings)),
      m_logger(LogCategory::Sync, m_logFilter),
      m_session(std::make_unique<SessionManager>(transport, Logger(LogCategory::Auth, m_logFilter))),
      m_directory(*m_session, m_logger),
      m_registry(m_logger),
      m_archiver(*m_session, Logger(LogCategory::Download, m_logFilter), m_clock) {
    m_session->setTimeoutSeconds(m_settings.timeoutSeconds);
}

MonitorClient::~MonitorClient() = default;

Result<void> MonitorClient::start(const Credentials& credentials) {
    Result<Session> session = m_session->authenticate(credentials);
    if (!session) {
        return session.error();
    }

    Result<NetworkResolution> resolution = m_directory.resolveNetworks(session.value());
    if (!resolution) {
        return resolution.error();
    }
    m_networks = resolution.value();

    m_coordinators.clear();
    for (const auto& network : m_networks.networks) {
        SyncCoordinator& coordinator = addNetwork(network.first, network.second);
        Result<void> started = coordinator.start();
        if (!started) {
            m_logger.warning("network_start_failed", "Network " + network.first +
                             " started without devices");
        }
    }

    rebuildView();
    m_logger.info("monitor_started", std::to_string(m_coordinators.size()) + " network(s) ready");
    return Result<void>();
}

SyncCoordinator& MonitorClient::addNetwork(const std::string& name, const std::string& networkId) {
    m_coordinators.push_back(std::make_unique<SyncCoordinator>(*m_session, name, networkId, m_logger));
    return *m_coordinators.back();
}

// ==================== Refresh ====================

bool MonitorClient::checkIfOkToUpdate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t last = m_lastRefresh.value_or(0);
    return m_clock() >= last + m_settings.refreshIntervalSeconds;
}

bool MonitorClient::refreshAll(bool forceCache) {
    if (!forceCache) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_organicPassRunning ||
            m_clock() < m_lastRefresh.value_or(0) + m_settings.refreshIntervalSeconds) {
            m_logger.debug("refresh_throttled", "Refresh interval not reached");
            return false;
        }
        m_organicPassRunning = true;
    }

    refreshCoordinators(forceCache);
    rebuildView();

    if (!forceCache) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastRefresh = m_clock();
        m_organicPassRunning = false;
    }
    return true;
}

void MonitorClient::refreshCoordinators(bool forceCache) {
    // Failed networks keep their last cache; the coordinator logs the cause
    int failures = 0;

    if (!m_settings.parallelRefresh || m_coordinators.size() < 2) {
        for (auto& coordinator : m_coordinators) {
            if (!coordinator->refresh(forceCache)) {
                ++failures;
            }
        }
    } else {
        std::vector<std::future<Result<void>>> tasks;
        tasks.reserve(m_coordinators.size());
        for (auto& coordinator : m_coordinators) {
            SyncCoordinator* target = coordinator.get();
            tasks.push_back(std::async(std::launch::async, [target, forceCache]() {
                return target->refresh(forceCache);
            }));
        }
        for (auto& task : tasks) {
            if (!task.get()) {
                ++failures;
            }
        }
    }

    if (failures > 0) {
        m_logger.warning("refresh_partial", std::to_string(failures) + " of " +
                         std::to_string(m_coordinators.size()) + " network(s) failed to refresh");
    }
}

void MonitorClient::rebuildView() {
    std::vector<DeviceCache> caches;
    caches.reserve(m_coordinators.size());
    for (const auto& coordinator : m_coordinators) {
        caches.push_back(coordinator->devices());
    }

    MergedDeviceView view = m_registry.mergeAll(caches);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_view = std::move(view);
}

void MonitorClient::resetRefreshClock() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastRefresh.reset();
}

std::optional<int64_t> MonitorClient::lastRefresh() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastRefresh;
}

// ==================== State ====================

MergedDeviceView MonitorClient::devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_view;
}

std::vector<SyncCoordinator*> MonitorClient::coordinators() const {
    std::vector<SyncCoordinator*> result;
    for (const auto& coordinator : m_coordinators) {
        result.push_back(coordinator.get());
    }
    return result;
}

SyncCoordinator* MonitorClient::coordinator(const std::string& networkName) const {
    for (const auto& coordinator : m_coordinators) {
        if (coordinator->name() == networkName) {
            return coordinator.get();
        }
    }
    return nullptr;
}

// ==================== Clips ====================

Result<ClipArchiveSummary> MonitorClient::downloadClips(ClipQuery query) {
    if (!query.since) {
        std::optional<int64_t> last = lastRefresh();
        if (last) {
            query.since = ClipSince(last.value());
        }
    }
    return m_archiver.downloadClips(query);
}

} // namespace CamSync
