#ifndef CAMSYNC_NETWORK_DIRECTORY_H
#define CAMSYNC_NETWORK_DIRECTORY_H

#include <string>
#include <vector>
#include <utility>
#include <optional>

#include "core/Error.h"
#include "core/LogManager.h"
#include "core/SessionManager.h"

namespace CamSync {

/**
 * Onboarded networks as (name, id) pairs, in network id order
 */
using NetworkMap = std::vector<std::pair<std::string, std::string>>;

struct AccountContext {
    std::optional<std::string> accountId;
};

struct NetworkResolution {
    NetworkMap networks;
    AccountContext account;
};

/**
 * Resolves which networks should be polled after a login
 */
class NetworkDirectory {
public:
    explicit NetworkDirectory(SessionManager& session,
                              Logger logger = Logger(LogCategory::Sync));

    /**
     * Keep the onboarded networks of the session and look up the owning
     * account in the remote networks listing.
     *
     * @return Resolution, or the listing request's error
     */
    Result<NetworkResolution> resolveNetworks(const Session& session);

    /**
     * Onboarded networks of a session, without any request
     */
    static NetworkMap onboardedNetworks(const Session& session);

private:
    SessionManager& m_session;
    Logger m_logger;
};

} // namespace CamSync

#endif // CAMSYNC_NETWORK_DIRECTORY_H
