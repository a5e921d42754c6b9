#ifndef CAMSYNC_SESSION_MANAGER_H
#define CAMSYNC_SESSION_MANAGER_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <cstdint>
#include <ostream>

#include "core/Error.h"
#include "core/Endpoints.h"
#include "core/LogManager.h"
#include "transport/Transport.h"

namespace CamSync {

/**
 * Account credentials
 */
struct Credentials {
    std::string username;
    std::string password;
};

/**
 * Per-request authentication header
 */
struct AuthHeader {
    std::string host;
    std::string token;

    HttpHeaders toHeaders() const {
        return {{"Host", host}, {"TOKEN_AUTH", token}};
    }
};

/**
 * Network entry as reported by the login response
 */
struct NetworkStatus {
    std::string id;
    std::string name;
    bool onboarded = false;
};

/**
 * Authenticated session
 *
 * Immutable once published; a re-login publishes a new Session with a
 * higher generation.
 */
struct Session {
    std::string authToken;
    std::string region;
    std::string regionId;
    std::string host;
    AuthHeader authHeader;
    std::string loginUrl;      // endpoint that accepted the login
    std::string baseUrl;       // REST base for this region
    uint64_t generation = 0;
    std::vector<NetworkStatus> networks;  // ordered by network id
};

/**
 * Handles login, re-authentication and authorized requests
 */
class SessionManager {
public:
    /**
     * @param transport Non-owning; must outlive the manager
     * @param logger Logging handle (category Auth by default)
     */
    explicit SessionManager(Transport* transport, Logger logger = Logger(LogCategory::Auth));
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Log in with username and password
     *
     * Tries the primary login endpoint, then the backup endpoint once if
     * the primary answers with a non-200 status. Transport failures are
     * returned unchanged.
     *
     * @param credentials Both fields must be non-empty
     * @return The new session, or AUTH_MISSING_USERNAME,
     *         AUTH_MISSING_PASSWORD, AUTH_LOGIN_REJECTED,
     *         DATA_MALFORMED_RESPONSE, DATA_MISSING_FIELD or a network error
     */
    Result<Session> authenticate(const Credentials& credentials);

    /**
     * Log in again with the stored credentials, starting at the endpoint
     * that accepted the previous login
     */
    Result<Session> reauthenticate();

    /**
     * Current auth header; absent before the first successful login
     */
    std::optional<AuthHeader> authHeader() const;

    /**
     * Current session snapshot (nullptr if not logged in)
     */
    std::shared_ptr<const Session> session() const;

    bool isLoggedIn() const;

    /**
     * Drop the session and forget the stored credentials
     */
    void logout();

    /**
     * Number of sessions published so far
     */
    uint64_t generation() const;

    /**
     * URL builder for the current session's region
     */
    UrlBuilder urls() const;

    /**
     * Send a request carrying the current auth header
     *
     * On HTTP 401 the session is refreshed once (unless another caller
     * already did) and the request is retried once.
     */
    Result<HttpResponse> authorizedRequest(HttpRequest request);

    /**
     * Stream a response body into sink with the current auth header
     *
     * Same 401 handling as authorizedRequest(). Non-2xx statuses are errors.
     */
    Result<void> authorizedDownload(HttpRequest request, std::ostream& sink);

    // ==================== Settings ====================

    void setTimeoutSeconds(int seconds) { m_timeoutSeconds = seconds; }
    int timeoutSeconds() const { return m_timeoutSeconds; }

    /**
     * Override the login endpoints (tests, proxies)
     */
    void setLoginUrls(const std::string& primary, const std::string& backup);

    /**
     * Use a fixed REST base instead of the region-derived one
     */
    void setBaseUrlOverride(const std::string& baseUrl) { m_baseUrlOverride = baseUrl; }

    /**
     * Caller-owned flag that aborts in-flight requests when set
     */
    void setAbortFlag(const std::atomic<bool>* abortFlag) { m_abortFlag = abortFlag; }

    /**
     * Parse a login response body into a session (no state change)
     */
    Result<Session> parseLoginResponse(const std::string& body) const;

private:
    Transport* m_transport;
    Logger m_logger;

    std::string m_loginUrl = Endpoints::LOGIN_URL;
    std::string m_backupLoginUrl = Endpoints::LOGIN_BACKUP_URL;
    std::string m_baseUrlOverride;
    int m_timeoutSeconds = 10;
    const std::atomic<bool>* m_abortFlag = nullptr;

    // Authentication state
    mutable std::mutex m_mutex;
    std::shared_ptr<const Session> m_session;
    std::optional<Credentials> m_credentials;
    uint64_t m_generation = 0;

    // Serializes re-logins triggered by concurrent 401s
    std::mutex m_reauthMutex;

    Result<Session> login(const Credentials& credentials,
                          const std::string& firstUrl,
                          const std::string& fallbackUrl);
    Result<HttpResponse> postLogin(const std::string& url, const Credentials& credentials);
    Result<std::shared_ptr<const Session>> refreshAfterUnauthorized(uint64_t staleGeneration);
    void prepare(HttpRequest& request, const Session& session) const;
};

} // namespace CamSync

#endif // CAMSYNC_SESSION_MANAGER_H
