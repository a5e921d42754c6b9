#ifndef CAMSYNC_ERROR_H
#define CAMSYNC_ERROR_H

#include <string>
#include <exception>
#include <optional>
#include <utility>

namespace CamSync {

/**
 * Error categories for CamSync operations
 */
enum class ErrorCategory {
    None = 0,          // No error
    Authentication,    // Credentials, login, session errors
    Network,           // Connection, timeout, HTTP status errors
    Data,              // Malformed or incomplete service payloads
    FileSystem,        // Local file access errors
    Validation,        // Input validation errors
    Configuration,     // Config file errors
    Internal,          // Internal/unexpected errors
};

/**
 * Common error codes across CamSync
 */
enum class ErrorCode {
    // Success
    OK = 0,

    // Authentication (100-199)
    AUTH_MISSING_USERNAME = 100,
    AUTH_MISSING_PASSWORD = 101,
    AUTH_LOGIN_REJECTED = 102,
    AUTH_NOT_LOGGED_IN = 103,

    // Network (200-299)
    NETWORK_CONNECTION_FAILED = 200,
    NETWORK_TIMEOUT = 201,
    NETWORK_SSL_ERROR = 202,
    NETWORK_BAD_STATUS = 203,

    // Data (300-399)
    DATA_MALFORMED_RESPONSE = 300,
    DATA_MISSING_FIELD = 301,

    // File System (400-499)
    FS_DIRECTORY_NOT_FOUND = 400,
    FS_INVALID_PATH = 401,
    FS_WRITE_ERROR = 402,

    // Validation (600-699)
    VALIDATION_INVALID_FORMAT = 600,

    // Configuration (700-799)
    CONFIG_FILE_NOT_FOUND = 700,
    CONFIG_PARSE_ERROR = 701,

    // Other (900-999)
    CANCELLED = 900,
    UNKNOWN_ERROR = 999,
};

/**
 * Get human-readable category name
 */
inline const char* getCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Authentication: return "Authentication";
        case ErrorCategory::Network: return "Network";
        case ErrorCategory::Data: return "Data";
        case ErrorCategory::FileSystem: return "FileSystem";
        case ErrorCategory::Validation: return "Validation";
        case ErrorCategory::Configuration: return "Configuration";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

/**
 * Get category for an error code
 */
inline ErrorCategory getCategoryForCode(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c == 0) return ErrorCategory::None;
    if (c >= 100 && c < 200) return ErrorCategory::Authentication;
    if (c >= 200 && c < 300) return ErrorCategory::Network;
    if (c >= 300 && c < 400) return ErrorCategory::Data;
    if (c >= 400 && c < 500) return ErrorCategory::FileSystem;
    if (c >= 600 && c < 700) return ErrorCategory::Validation;
    if (c >= 700 && c < 800) return ErrorCategory::Configuration;
    return ErrorCategory::Internal;
}

/**
 * Detailed error information
 *
 * Can be used as return type or with exceptions.
 * Supports conversion to bool for easy checking.
 */
class Error {
public:
    /**
     * Create success (no error)
     */
    Error() : m_code(ErrorCode::OK) {}

    /**
     * Create error with code and message
     */
    Error(ErrorCode code, const std::string& message)
        : m_code(code), m_message(message) {}

    /**
     * Create error with code, message, and details
     */
    Error(ErrorCode code, const std::string& message, const std::string& details)
        : m_code(code), m_message(message), m_details(details) {}

    bool isOk() const { return m_code == ErrorCode::OK; }
    bool isError() const { return m_code != ErrorCode::OK; }

    /**
     * Boolean conversion - true if no error
     */
    explicit operator bool() const { return isOk(); }

    // Accessors
    ErrorCode code() const { return m_code; }
    ErrorCategory category() const { return getCategoryForCode(m_code); }
    const std::string& message() const { return m_message; }
    const std::string& details() const { return m_details; }

    /**
     * Set additional details
     */
    Error& withDetails(const std::string& details) {
        m_details = details;
        return *this;
    }

    /**
     * Attach the HTTP status that produced this error
     */
    Error& withHttpStatus(int statusCode) {
        m_httpStatus = statusCode;
        return *this;
    }

    int httpStatus() const { return m_httpStatus.value_or(0); }
    bool hasHttpStatus() const { return m_httpStatus.has_value(); }

    /**
     * Network failures and cancellations may be retried by the caller.
     * Authentication, data and filesystem errors may not.
     */
    bool isRetryable() const {
        return category() == ErrorCategory::Network || m_code == ErrorCode::CANCELLED;
    }

    /**
     * Format full error string
     */
    std::string toString() const;

    // Factory methods for common errors
    static Error ok() { return Error(); }

    static Error notLoggedIn() {
        return Error(ErrorCode::AUTH_NOT_LOGGED_IN, "Not logged in");
    }

    static Error missingField(const std::string& field) {
        return Error(ErrorCode::DATA_MISSING_FIELD, "Missing field in response", field);
    }

    static Error malformedResponse(const std::string& reason) {
        return Error(ErrorCode::DATA_MALFORMED_RESPONSE, "Malformed response", reason);
    }

    static Error writeFailed(const std::string& path) {
        return Error(ErrorCode::FS_WRITE_ERROR, "Failed to write file", path);
    }

    static Error cancelled() {
        return Error(ErrorCode::CANCELLED, "Operation cancelled");
    }

    /**
     * Build an error for an unexpected HTTP status
     */
    static Error fromHttpStatus(int statusCode, const std::string& url);

private:
    ErrorCode m_code;
    std::string m_message;
    std::string m_details;
    std::optional<int> m_httpStatus;
};

/**
 * Exception wrapper for Error
 *
 * Use when exceptions are preferred over return codes.
 */
class ErrorException : public std::exception {
public:
    explicit ErrorException(const Error& error) : m_error(error) {
        m_what = m_error.toString();
    }

    ErrorException(ErrorCode code, const std::string& message)
        : m_error(code, message) {
        m_what = m_error.toString();
    }

    const char* what() const noexcept override {
        return m_what.c_str();
    }

    const Error& error() const { return m_error; }
    ErrorCode code() const { return m_error.code(); }

private:
    Error m_error;
    std::string m_what;
};

/**
 * Result type combining success value with possible error
 *
 * Example:
 *   Result<Session> session = sessionManager.authenticate(credentials);
 *   if (!session) {
 *       std::cerr << session.error().toString() << std::endl;
 *   }
 */
template<typename T>
class Result {
public:
    Result(const T& value) : m_value(value), m_error() {}
    Result(T&& value) : m_value(std::move(value)), m_error() {}

    Result(const Error& error) : m_value(std::nullopt), m_error(error) {}
    Result(Error&& error) : m_value(std::nullopt), m_error(std::move(error)) {}

    bool isOk() const { return m_value.has_value(); }
    bool isError() const { return !m_value.has_value(); }
    explicit operator bool() const { return isOk(); }

    /**
     * Get the value (throws if error)
     */
    const T& value() const {
        if (!m_value.has_value()) {
            throw ErrorException(m_error);
        }
        return m_value.value();
    }

    T& value() {
        if (!m_value.has_value()) {
            throw ErrorException(m_error);
        }
        return m_value.value();
    }

    T valueOr(const T& defaultValue) const {
        return m_value.value_or(defaultValue);
    }

    /**
     * Get the error (empty if success)
     */
    const Error& error() const { return m_error; }

private:
    std::optional<T> m_value;
    Error m_error;
};

/**
 * Specialization for void (operation without return value)
 */
template<>
class Result<void> {
public:
    Result() : m_error() {}
    Result(const Error& error) : m_error(error) {}

    bool isOk() const { return m_error.isOk(); }
    bool isError() const { return m_error.isError(); }
    explicit operator bool() const { return isOk(); }

    const Error& error() const { return m_error; }

private:
    Error m_error;
};

} // namespace CamSync

#endif // CAMSYNC_ERROR_H
