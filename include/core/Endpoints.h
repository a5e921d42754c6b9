#ifndef CAMSYNC_ENDPOINTS_H
#define CAMSYNC_ENDPOINTS_H

#include <string>
#include <cstdint>

namespace CamSync {

/**
 * Service endpoints
 */
namespace Endpoints {

constexpr const char* BASE_DOMAIN = "immedia-semi.com";
constexpr const char* DEFAULT_HOST = "prod.immedia-semi.com";
constexpr const char* LOGIN_URL = "https://rest-prod.immedia-semi.com/login";
constexpr const char* LOGIN_BACKUP_URL = "https://rest-piri.immedia-semi.com/login";
constexpr const char* CLIENT_SPECIFIER = "iPhone 9.2 | 2.2 | 222";

// Used when a login response carries no region
constexpr const char* FALLBACK_REGION_ID = "piri";
constexpr const char* FALLBACK_REGION_NAME = "UNKNOWN";

} // namespace Endpoints

/**
 * Builds request URLs for one region
 */
class UrlBuilder {
public:
    explicit UrlBuilder(const std::string& regionId)
        : m_baseUrl("https://rest-" + regionId + "." + Endpoints::BASE_DOMAIN) {}

    /**
     * Use an explicit base URL (tests, proxies)
     */
    static UrlBuilder withBaseUrl(const std::string& baseUrl) {
        UrlBuilder builder("");
        builder.m_baseUrl = baseUrl;
        return builder;
    }

    const std::string& baseUrl() const { return m_baseUrl; }

    std::string networks() const { return m_baseUrl + "/networks"; }
    std::string homescreen() const { return m_baseUrl + "/homescreen"; }

    std::string syncModules(const std::string& networkId) const {
        return m_baseUrl + "/network/" + networkId + "/syncmodules";
    }

    std::string videosChanged(const std::string& since, int page) const {
        return m_baseUrl + "/api/v2/videos/changed?since=" + since + "&page=" + std::to_string(page);
    }

    /**
     * Absolute URL for a service-relative path ("/api/v2/.../clip.mp4")
     */
    std::string resource(const std::string& path) const { return m_baseUrl + path; }

private:
    std::string m_baseUrl;
};

} // namespace CamSync

#endif // CAMSYNC_ENDPOINTS_H
