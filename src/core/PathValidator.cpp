#include "core/PathValidator.h"
#include "core/LogManager.h"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace CamSync {

namespace fs = std::filesystem;

const std::vector<std::string> PathValidator::TRAVERSAL_PATTERNS = {
    "../",
    "..\\",
    "%2e%2e/",    // URL encoded
    "%2e%2e\\",
    "..%2f",
    "..%5c",
    "%252e%252e", // Double URL encoded
};

bool PathValidator::containsNullByte(const std::string& path) {
    return path.find('\0') != std::string::npos;
}

bool PathValidator::containsTraversal(const std::string& path) {
    std::string lowerPath = path;
    std::transform(lowerPath.begin(), lowerPath.end(), lowerPath.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerPath == ".." || lowerPath == "%2e%2e") {
        return true;
    }

    for (const auto& pattern : TRAVERSAL_PATTERNS) {
        if (lowerPath.find(pattern) != std::string::npos) {
            return true;
        }
    }

    return false;
}

bool PathValidator::isSafeFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }

    if (containsNullByte(name)) {
        LogManager::instance().log(LogLevel::Warning, LogCategory::System,
            "isSafeFileName", "Null byte detected in file name");
        return false;
    }

    if (containsTraversal(name) || name.find_first_of("/\\") != std::string::npos) {
        LogManager::instance().log(LogLevel::Warning, LogCategory::System,
            "isSafeFileName", "Path separator or traversal in file name", name);
        return false;
    }

    return true;
}

bool PathValidator::isWithinBaseDir(const std::string& path, const std::string& baseDir) {
    if (path.empty() || baseDir.empty()) {
        return false;
    }

    std::error_code ec;
    fs::path canonicalBase = fs::weakly_canonical(baseDir, ec);
    if (ec) {
        LogManager::instance().log(LogLevel::Warning, LogCategory::System,
            "isWithinBaseDir", "Path validation error", ec.message());
        return false;
    }
    fs::path canonicalPath = fs::weakly_canonical(path, ec);
    if (ec) {
        LogManager::instance().log(LogLevel::Warning, LogCategory::System,
            "isWithinBaseDir", "Path validation error", ec.message());
        return false;
    }

    std::string baseStr = canonicalBase.string();
    std::string pathStr = canonicalPath.string();

    // Ensure base ends with separator for proper prefix matching
    if (!baseStr.empty() && baseStr.back() != fs::path::preferred_separator) {
        baseStr += fs::path::preferred_separator;
    }

    return pathStr.size() >= baseStr.size() &&
           pathStr.compare(0, baseStr.size(), baseStr) == 0;
}

Result<std::string> PathValidator::safeJoin(const std::string& base, const std::string& fileName) {
    if (!isSafeFileName(fileName)) {
        return Error(ErrorCode::FS_INVALID_PATH, "Unsafe file name", fileName);
    }

    fs::path result = fs::path(base) / fs::path(fileName);
    std::string resultStr = result.lexically_normal().string();

    if (!isWithinBaseDir(resultStr, base)) {
        return Error(ErrorCode::FS_INVALID_PATH, "Resulting path escapes base directory", resultStr);
    }

    return resultStr;
}

Result<void> PathValidator::ensureDirectory(const std::string& path) {
    if (path.empty() || containsNullByte(path)) {
        return Error(ErrorCode::FS_INVALID_PATH, "Invalid directory path", path);
    }

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return Result<void>();
    }

    fs::create_directories(path, ec);
    if (ec) {
        return Error(ErrorCode::FS_DIRECTORY_NOT_FOUND, "Failed to create directory",
                     path + ": " + ec.message());
    }
    return Result<void>();
}

} // namespace CamSync
