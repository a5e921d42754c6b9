#ifndef CAMSYNC_CLIP_ARCHIVER_H
#define CAMSYNC_CLIP_ARCHIVER_H

#include <string>
#include <vector>
#include <set>
#include <variant>
#include <optional>
#include <functional>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "core/Error.h"
#include "core/LogManager.h"
#include "core/SessionManager.h"

namespace CamSync {

struct AllCameras {};

struct NamedCameras {
    std::set<std::string> names;
};

/**
 * Which cameras' clips to download
 */
class CameraFilter {
public:
    CameraFilter() : m_filter(AllCameras{}) {}

    static CameraFilter all() { return CameraFilter(); }
    static CameraFilter named(std::set<std::string> names);

    /**
     * Normalize a configured list; empty or containing "all" selects all
     */
    static CameraFilter fromList(const std::vector<std::string>& names);

    bool isAll() const { return std::holds_alternative<AllCameras>(m_filter); }
    bool matches(const std::string& cameraName) const;

    /**
     * Names of a Named filter (empty for All)
     */
    std::set<std::string> names() const;

private:
    std::variant<AllCameras, NamedCameras> m_filter;
};

/**
 * Start of the clip window: epoch seconds or free-form date text
 */
using ClipSince = std::variant<int64_t, std::string>;

struct ClipQuery {
    std::string destination = ".";
    std::optional<ClipSince> since;   // absent: now
    CameraFilter cameras;
    int maxPages = 10;                // pages 1 .. maxPages-1 are fetched
};

struct ClipArchiveSummary {
    std::string since;                // ISO time sent to the service
    int pagesFetched = 0;
    std::vector<std::string> downloaded;
    int skippedExisting = 0;
    int skippedDeleted = 0;
    int skippedFiltered = 0;
    int skippedMalformed = 0;
};

/**
 * Parsed entry of the clip index
 */
struct ClipRecord {
    std::string cameraName;
    std::string createdAt;
    bool deleted = false;
    std::string address;

    /**
     * @return DATA_MISSING_FIELD naming the first absent field
     */
    static Result<ClipRecord> fromJson(const nlohmann::json& video);

    std::string fileName() const { return cameraName + "_" + createdAt + ".mp4"; }
};

/**
 * ClipArchiver - downloads recorded clips into a local directory
 *
 * Walks the paginated "videos changed since" index and streams every
 * matching clip that is not on disk yet. Running it twice against the
 * same listing leaves the directory unchanged the second time.
 */
class ClipArchiver {
public:
    using Clock = std::function<int64_t()>;
    using ProgressCallback = std::function<void(const std::string& path)>;

    explicit ClipArchiver(SessionManager& session,
                          Logger logger = Logger(LogCategory::Download),
                          Clock clock = nullptr);

    /**
     * Download clips newer than query.since into query.destination
     *
     * @return Summary, or VALIDATION_INVALID_FORMAT for an unreadable
     *         since value, a page request error, or the error of the
     *         first failed download (its partial file is removed)
     */
    Result<ClipArchiveSummary> downloadClips(const ClipQuery& query);

    /**
     * Resolve a since value to epoch seconds
     */
    Result<int64_t> resolveSince(const std::optional<ClipSince>& since) const;

    /**
     * Called with the path of every finished download
     */
    void setProgressCallback(ProgressCallback callback) { m_progressCallback = std::move(callback); }

private:
    SessionManager& m_session;
    Logger m_logger;
    Clock m_clock;
    ProgressCallback m_progressCallback;

    enum class PageOutcome { Continue, Done };

    Result<PageOutcome> processPage(const UrlBuilder& urls, const std::string& since, int page,
                                    const ClipQuery& query, ClipArchiveSummary& summary);
    Result<void> processRecord(const UrlBuilder& urls, const nlohmann::json& video,
                               const ClipQuery& query, ClipArchiveSummary& summary);
    Result<void> downloadClip(const UrlBuilder& urls, const ClipRecord& record,
                              const std::string& path);
};

} // namespace CamSync

#endif // CAMSYNC_CLIP_ARCHIVER_H
