#include "core/SessionManager.h"

#include <nlohmann/json.hpp>
#include <cstring>
#include <stdexcept>

namespace CamSync {

namespace {
// Overwrite a secret before releasing it
void secureErase(std::string& str) {
    if (!str.empty()) {
        volatile char* ptr = &str[0];
        std::memset(const_cast<char*>(ptr), 0, str.size());
    }
    str.clear();
    str.shrink_to_fit();
}

} // anonymous namespace

SessionManager::SessionManager(Transport* transport, Logger logger)
    : m_transport(transport), m_logger(std::move(logger)) {
    if (!m_transport) {
        throw std::runtime_error("Transport instance is null");
    }
}

SessionManager::~SessionManager() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_credentials) {
        secureErase(m_credentials->password);
    }
}

// ==================== Login ====================

Result<Session> SessionManager::authenticate(const Credentials& credentials) {
    if (credentials.username.empty()) {
        m_logger.error("login_rejected", "Username is missing");
        return Error(ErrorCode::AUTH_MISSING_USERNAME, "Username is missing");
    }
    if (credentials.password.empty()) {
        m_logger.error("login_rejected", "Password is missing");
        return Error(ErrorCode::AUTH_MISSING_PASSWORD, "Password is missing");
    }

    return login(credentials, m_loginUrl, m_backupLoginUrl);
}

Result<Session> SessionManager::reauthenticate() {
    std::optional<Credentials> credentials;
    std::string lastUrl;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        credentials = m_credentials;
        if (m_session) {
            lastUrl = m_session->loginUrl;
        }
    }

    if (!credentials) {
        return Error::notLoggedIn();
    }

    std::string firstUrl = lastUrl.empty() ? m_loginUrl : lastUrl;
    std::string fallbackUrl = (firstUrl == m_loginUrl) ? m_backupLoginUrl : m_loginUrl;

    m_logger.info("reauthenticate", "Refreshing auth token via " + firstUrl);
    return login(credentials.value(), firstUrl, fallbackUrl);
}

Result<Session> SessionManager::login(const Credentials& credentials,
                                      const std::string& firstUrl,
                                      const std::string& fallbackUrl) {
    std::string usedUrl = firstUrl;
    Result<HttpResponse> response = postLogin(firstUrl, credentials);
    if (!response) {
        m_logger.error("login_failed", "Login request failed", response.error().toString());
        return response.error();
    }

    if (response.value().statusCode != 200) {
        m_logger.debug("login_retry", "Received response code " +
                       std::to_string(response.value().statusCode) +
                       " during login, trying " + fallbackUrl);
        usedUrl = fallbackUrl;
        response = postLogin(fallbackUrl, credentials);
        if (!response) {
            m_logger.error("login_failed", "Backup login request failed", response.error().toString());
            return response.error();
        }
        if (response.value().statusCode != 200) {
            Error error(ErrorCode::AUTH_LOGIN_REJECTED, "Login rejected by service", usedUrl);
            error.withHttpStatus(response.value().statusCode);
            m_logger.error("login_failed", "Unable to login with " + credentials.username,
                           error.toString());
            return error;
        }
    }

    Result<Session> parsed = parseLoginResponse(response.value().body);
    if (!parsed) {
        m_logger.error("login_failed", "Login endpoint returned an unusable response",
                       parsed.error().toString());
        return parsed.error();
    }

    Session session = parsed.value();
    session.loginUrl = usedUrl;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session.generation = ++m_generation;
        m_session = std::make_shared<const Session>(session);
        if (m_credentials) {
            secureErase(m_credentials->password);
        }
        m_credentials = credentials;
    }

    m_logger.info("login_success", "Logged in to region " + session.regionId +
                  " (" + session.region + ")");
    return session;
}

Result<HttpResponse> SessionManager::postLogin(const std::string& url, const Credentials& credentials) {
    nlohmann::json body = {
        {"email", credentials.username},
        {"password", credentials.password},
        {"client_specifier", Endpoints::CLIENT_SPECIFIER}
    };

    HttpRequest request = HttpRequest::postJson(url, body.dump());
    request.headers["Host"] = Endpoints::DEFAULT_HOST;
    request.timeoutSeconds = m_timeoutSeconds;
    request.abortFlag = m_abortFlag;
    return m_transport->request(request);
}

Result<Session> SessionManager::parseLoginResponse(const std::string& body) const {
    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Error::malformedResponse("login response is not a JSON object");
    }

    Session session;

    auto region = json.find("region");
    if (region != json.end() && region->is_object() && region->size() == 1 &&
        region->begin().value().is_string()) {
        session.regionId = region->begin().key();
        session.region = region->begin().value().get<std::string>();
    } else {
        m_logger.warning("region_missing", "Could not extract region info.");
        session.regionId = Endpoints::FALLBACK_REGION_ID;
        session.region = Endpoints::FALLBACK_REGION_NAME;
    }

    auto authtoken = json.find("authtoken");
    if (authtoken == json.end() || !authtoken->is_object()) {
        return Error::missingField("authtoken");
    }
    auto token = authtoken->find("authtoken");
    if (token == authtoken->end() || !token->is_string() || token->get<std::string>().empty()) {
        return Error::missingField("authtoken.authtoken");
    }
    session.authToken = token->get<std::string>();

    auto networks = json.find("networks");
    if (networks != json.end() && networks->is_object()) {
        for (auto it = networks->begin(); it != networks->end(); ++it) {
            if (!it.value().is_object()) {
                m_logger.warning("network_skipped", "Ignoring malformed network entry " + it.key());
                continue;
            }
            auto name = it.value().find("name");
            if (name == it.value().end() || !name->is_string()) {
                m_logger.warning("network_skipped", "Ignoring network " + it.key() + " without a name");
                continue;
            }
            NetworkStatus status;
            status.id = it.key();
            status.name = name->get<std::string>();
            auto onboarded = it.value().find("onboarded");
            status.onboarded = onboarded != it.value().end() && onboarded->is_boolean() &&
                               onboarded->get<bool>();
            session.networks.push_back(status);
        }
    }

    session.host = session.regionId + "." + Endpoints::BASE_DOMAIN;
    session.authHeader = AuthHeader{session.host, session.authToken};
    session.baseUrl = m_baseUrlOverride.empty()
        ? UrlBuilder(session.regionId).baseUrl()
        : m_baseUrlOverride;
    return session;
}

// ==================== Session State ====================

std::optional<AuthHeader> SessionManager::authHeader() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) return std::nullopt;
    return m_session->authHeader;
}

std::shared_ptr<const Session> SessionManager::session() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session;
}

bool SessionManager::isLoggedIn() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session != nullptr;
}

void SessionManager::logout() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_session.reset();
    if (m_credentials) {
        secureErase(m_credentials->password);
        m_credentials.reset();
    }
    m_logger.info("logout", "Session cleared");
}

uint64_t SessionManager::generation() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

UrlBuilder SessionManager::urls() const {
    auto current = session();
    if (current) {
        return UrlBuilder::withBaseUrl(current->baseUrl);
    }
    if (!m_baseUrlOverride.empty()) {
        return UrlBuilder::withBaseUrl(m_baseUrlOverride);
    }
    return UrlBuilder(Endpoints::FALLBACK_REGION_ID);
}

void SessionManager::setLoginUrls(const std::string& primary, const std::string& backup) {
    m_loginUrl = primary;
    m_backupLoginUrl = backup;
}

// ==================== Authorized Requests ====================

void SessionManager::prepare(HttpRequest& request, const Session& session) const {
    for (const auto& header : session.authHeader.toHeaders()) {
        request.headers[header.first] = header.second;
    }
    if (request.timeoutSeconds <= 0) {
        request.timeoutSeconds = m_timeoutSeconds;
    }
    if (!request.abortFlag) {
        request.abortFlag = m_abortFlag;
    }
}

Result<std::shared_ptr<const Session>> SessionManager::refreshAfterUnauthorized(uint64_t staleGeneration) {
    std::lock_guard<std::mutex> reauthLock(m_reauthMutex);

    auto current = session();
    if (current && current->generation > staleGeneration) {
        // Someone else already logged in again while we waited
        return current;
    }

    Result<Session> refreshed = reauthenticate();
    if (!refreshed) {
        return refreshed.error();
    }
    return session();
}

Result<HttpResponse> SessionManager::authorizedRequest(HttpRequest request) {
    auto snapshot = session();
    if (!snapshot) {
        return Error::notLoggedIn();
    }

    prepare(request, *snapshot);
    Result<HttpResponse> response = m_transport->request(request);
    if (!response || response.value().statusCode != 401) {
        return response;
    }

    m_logger.info("token_rejected", "Auth token rejected for " + request.url + ", re-authenticating");
    auto refreshed = refreshAfterUnauthorized(snapshot->generation);
    if (!refreshed) {
        return refreshed.error();
    }

    prepare(request, *refreshed.value());
    return m_transport->request(request);
}

Result<void> SessionManager::authorizedDownload(HttpRequest request, std::ostream& sink) {
    auto snapshot = session();
    if (!snapshot) {
        return Error::notLoggedIn();
    }

    prepare(request, *snapshot);
    Result<HttpResponse> response = m_transport->download(request, sink);
    if (response) {
        return Result<void>();
    }
    if (response.error().httpStatus() != 401) {
        return response.error();
    }

    m_logger.info("token_rejected", "Auth token rejected for " + request.url + ", re-authenticating");
    auto refreshed = refreshAfterUnauthorized(snapshot->generation);
    if (!refreshed) {
        return refreshed.error();
    }

    prepare(request, *refreshed.value());
    response = m_transport->download(request, sink);
    if (!response) {
        return response.error();
    }
    return Result<void>();
}

} // namespace CamSync
