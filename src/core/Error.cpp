#include "core/Error.h"

namespace CamSync {

std::string Error::toString() const {
    if (isOk()) return "OK";

    std::string result = "[" + std::string(getCategoryName(category())) + "] ";
    result += m_message;
    if (m_httpStatus.has_value()) {
        result += " (HTTP " + std::to_string(m_httpStatus.value()) + ")";
    }
    if (!m_details.empty()) {
        result += " (" + m_details + ")";
    }
    return result;
}

Error Error::fromHttpStatus(int statusCode, const std::string& url) {
    std::string message;

    switch (statusCode) {
        case 400:
            message = "Bad request";
            break;

        case 401:
            message = "Unauthorized";
            break;

        case 403:
            message = "Forbidden";
            break;

        case 404:
            message = "Resource not found";
            break;

        case 408:
            message = "Request timed out";
            break;

        case 429:
            message = "Too many requests";
            break;

        case 500:
            message = "Internal server error";
            break;

        case 502:
        case 503:
        case 504:
            message = "Service temporarily unavailable";
            break;

        default:
            message = "Unexpected HTTP status";
            break;
    }

    Error error(ErrorCode::NETWORK_BAD_STATUS, message, url);
    error.withHttpStatus(statusCode);
    return error;
}

} // namespace CamSync
