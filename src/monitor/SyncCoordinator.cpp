#include "monitor/SyncCoordinator.h"

#include <sstream>
#include <iterator>
#include <nlohmann/json.hpp>

namespace CamSync {

SyncCoordinator::SyncCoordinator(SessionManager& session,
                                 std::string name,
                                 std::string networkId,
                                 Logger logger)
    : m_session(session),
      m_name(std::move(name)),
      m_networkId(std::move(networkId)),
      m_logger(logger.withNetwork(m_name)) {
}

Result<void> SyncCoordinator::start() {
    if (m_logger.filter()) {
        m_logger.filter()->reset();
    }

    Result<void> status = fetchSyncModuleStatus();
    if (!status) {
        m_logger.error("syncmodule_failed", "Could not get sync module status for " + m_name,
                       status.error().toString());
    }

    return refresh(true);
}

Result<void> SyncCoordinator::fetchSyncModuleStatus() {
    HttpRequest request = HttpRequest::get(m_session.urls().syncModules(m_networkId));
    Result<HttpResponse> response = m_session.authorizedRequest(request);
    if (!response) {
        return response.error();
    }
    if (!response.value().isSuccess()) {
        return Error::fromHttpStatus(response.value().statusCode, request.url);
    }

    nlohmann::json json = nlohmann::json::parse(response.value().body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Error::malformedResponse("sync module status is not a JSON object");
    }

    auto module = json.find("syncmodule");
    if (module == json.end() || !module->is_object()) {
        return Error::missingField("syncmodule");
    }

    std::optional<std::string> moduleId;
    auto id = module->find("id");
    if (id != module->end()) {
        if (id->is_string()) {
            moduleId = id->get<std::string>();
        } else if (id->is_number_integer()) {
            moduleId = std::to_string(id->get<long long>());
        }
    }
    auto status = module->find("status");
    bool online = status != module->end() && status->is_string() &&
                  status->get<std::string>() == "online";

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_syncModuleId = moduleId;
        m_online = online;
    }

    m_logger.debug("syncmodule_status", m_name + " sync module is " +
                   (online ? "online" : "offline"));
    return Result<void>();
}

Result<void> SyncCoordinator::refresh(bool forceCache) {
    DeviceCache previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = SyncState::Refreshing;
        previous = m_cache;
    }

    HttpRequest request = HttpRequest::get(m_session.urls().homescreen());
    Result<HttpResponse> response = m_session.authorizedRequest(request);
    if (!response) {
        m_logger.error("refresh_failed", "Could not refresh " + m_name, response.error().toString());
        finishRefresh(response.error());
        return response.error();
    }
    if (!response.value().isSuccess()) {
        Error error = Error::fromHttpStatus(response.value().statusCode, request.url);
        m_logger.error("refresh_failed", "Could not refresh " + m_name, error.toString());
        finishRefresh(error);
        return error;
    }

    Result<DeviceCache> cache = buildCache(response.value().body, forceCache, previous);
    if (!cache) {
        m_logger.error("refresh_failed", "Unusable homescreen for " + m_name,
                       cache.error().toString());
        finishRefresh(cache.error());
        return cache.error();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cache = std::move(cache.value());
    }
    finishRefresh(std::nullopt);

    m_logger.debug("refresh_done", "Refreshed " + m_name);
    return Result<void>();
}

Result<DeviceCache> SyncCoordinator::buildCache(const std::string& body, bool forceCache,
                                                const DeviceCache& previous) {
    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Error::malformedResponse("homescreen is not a JSON object");
    }

    auto cameras = json.find("cameras");
    if (cameras == json.end() || !cameras->is_array()) {
        return Error::missingField("cameras");
    }

    DeviceCache cache;
    for (const auto& entry : *cameras) {
        Result<DeviceState> parsed = DeviceState::fromJson(entry);
        if (!parsed) {
            m_logger.warning("camera_skipped", "Ignoring camera entry: " + parsed.error().message());
            continue;
        }

        DeviceState device = parsed.value();
        if (device.networkId != m_networkId) continue;

        const DeviceState* old = previous.find(device.name);
        bool thumbnailChanged = !old || old->thumbnailPath != device.thumbnailPath;
        if (forceCache || thumbnailChanged) {
            fetchThumbnail(device);
        } else {
            device.imageCache = old->imageCache;
        }
        if (device.lastClipAddress) {
            std::string path = device.lastClipAddress.value();
            if (path.front() != '/') path = "/" + path;
            device.lastClipAddress = m_session.urls().resource(path);
        } else if (old) {
            device.lastClipAddress = old->lastClipAddress;
        }

        cache.set(device.name, std::move(device));
    }
    return cache;
}

void SyncCoordinator::fetchThumbnail(DeviceState& device) {
    device.imageCache.clear();

    std::string resource = device.thumbnailResource();
    if (resource.empty()) {
        m_logger.warning("thumbnail_missing", "Could not find thumbnail for camera " + device.name);
        return;
    }

    std::ostringstream buffer;
    HttpRequest request = HttpRequest::get(m_session.urls().resource(resource));
    Result<void> result = m_session.authorizedDownload(request, buffer);
    if (!result) {
        m_logger.warning("thumbnail_failed", "Could not fetch thumbnail for " + device.name);
        return;
    }

    const std::string bytes = buffer.str();
    device.imageCache.assign(bytes.begin(), bytes.end());
}

void SyncCoordinator::finishRefresh(std::optional<Error> error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = SyncState::Idle;
    m_lastError = std::move(error);
}

DeviceCache SyncCoordinator::devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache;
}

SyncState SyncCoordinator::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool SyncCoordinator::online() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_online;
}

std::optional<std::string> SyncCoordinator::syncModuleId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_syncModuleId;
}

std::optional<Error> SyncCoordinator::lastRefreshError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

} // namespace CamSync
