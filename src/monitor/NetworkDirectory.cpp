#include "monitor/NetworkDirectory.h"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace CamSync {

namespace {
std::string idToString(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return "";
}
} // anonymous namespace

NetworkDirectory::NetworkDirectory(SessionManager& session, Logger logger)
    : m_session(session), m_logger(std::move(logger)) {
}

NetworkMap NetworkDirectory::onboardedNetworks(const Session& session) {
    NetworkMap networks;
    for (const auto& status : session.networks) {
        if (status.onboarded) {
            networks.emplace_back(status.name, status.id);
        }
    }
    return networks;
}

Result<NetworkResolution> NetworkDirectory::resolveNetworks(const Session& session) {
    NetworkResolution resolution;
    resolution.networks = onboardedNetworks(session);

    HttpRequest request = HttpRequest::get(UrlBuilder::withBaseUrl(session.baseUrl).networks());
    Result<HttpResponse> response = m_session.authorizedRequest(request);
    if (!response) {
        m_logger.error("networks_failed", "Could not fetch network listing",
                       response.error().toString());
        return response.error();
    }
    if (!response.value().isSuccess()) {
        Error error = Error::fromHttpStatus(response.value().statusCode, request.url);
        m_logger.error("networks_failed", "Network listing rejected", error.toString());
        return error;
    }

    nlohmann::json json = nlohmann::json::parse(response.value().body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Error::malformedResponse("network listing is not a JSON object");
    }

    auto listing = json.find("networks");
    if (listing != json.end() && listing->is_array()) {
        for (const auto& entry : *listing) {
            if (!entry.is_object() || !entry.contains("id")) continue;

            std::string id = idToString(entry["id"]);
            bool onboarded = std::any_of(resolution.networks.begin(), resolution.networks.end(),
                [&id](const std::pair<std::string, std::string>& network) {
                    return network.second == id;
                });
            if (!onboarded) continue;

            auto account = entry.find("account_id");
            if (account != entry.end()) {
                std::string accountId = idToString(*account);
                if (!accountId.empty()) {
                    resolution.account.accountId = accountId;
                }
            }
            break;
        }
    }

    if (!resolution.account.accountId) {
        m_logger.warning("account_missing", "No account id found for onboarded networks");
    }

    m_logger.info("networks_resolved", std::to_string(resolution.networks.size()) +
                  " onboarded network(s)");
    return resolution;
}

} // namespace CamSync
