#ifndef CAMSYNC_PATH_VALIDATOR_H
#define CAMSYNC_PATH_VALIDATOR_H

#include <string>
#include <vector>
#include <filesystem>

#include "core/Error.h"

namespace CamSync {

/**
 * Centralized path validation for files built from service-provided names.
 *
 * Checks for:
 * - Directory traversal sequences (../)
 * - Path separators inside single file names
 * - Null bytes
 */
class PathValidator {
public:
    /**
     * Check if a single file name is safe to place inside a directory
     * @param name File name without directory part
     * @return true if name has no separators, traversal or null bytes
     */
    static bool isSafeFileName(const std::string& name);

    /**
     * Check if resolved path stays within base directory
     * Resolves symlinks and normalizes path before comparison
     */
    static bool isWithinBaseDir(const std::string& path, const std::string& baseDir);

    static bool containsNullByte(const std::string& path);

    /**
     * Check if path contains traversal sequences
     * @return true if path contains ../ or similar
     */
    static bool containsTraversal(const std::string& path);

    /**
     * Join a directory and a file name, validating the result
     * @return Joined path, or FS_INVALID_PATH if it would escape base
     */
    static Result<std::string> safeJoin(const std::string& base, const std::string& fileName);

    /**
     * Create directory (and parents) if missing
     */
    static Result<void> ensureDirectory(const std::string& path);

private:
    // Traversal patterns to check
    static const std::vector<std::string> TRAVERSAL_PATTERNS;
};

} // namespace CamSync

#endif // CAMSYNC_PATH_VALIDATOR_H
