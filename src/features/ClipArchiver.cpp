/**
 * ClipArchiver Implementation
 * Paginated clip index walk with skip-if-present downloads
 */

#include "features/ClipArchiver.h"
#include "core/PathValidator.h"
#include "core/TimeUtils.h"

#include <fstream>
#include <filesystem>
#include <algorithm>

namespace fs = std::filesystem;

namespace CamSync {

// ==================== CameraFilter ====================

CameraFilter CameraFilter::named(std::set<std::string> names) {
    CameraFilter filter;
    filter.m_filter = NamedCameras{std::move(names)};
    return filter;
}

CameraFilter CameraFilter::fromList(const std::vector<std::string>& names) {
    if (names.empty() || std::find(names.begin(), names.end(), "all") != names.end()) {
        return all();
    }
    return named(std::set<std::string>(names.begin(), names.end()));
}

bool CameraFilter::matches(const std::string& cameraName) const {
    if (const auto* named = std::get_if<NamedCameras>(&m_filter)) {
        return named->names.count(cameraName) > 0;
    }
    return true;
}

std::set<std::string> CameraFilter::names() const {
    if (const auto* named = std::get_if<NamedCameras>(&m_filter)) {
        return named->names;
    }
    return {};
}

// ==================== ClipRecord ====================

Result<ClipRecord> ClipRecord::fromJson(const nlohmann::json& video) {
    if (!video.is_object()) {
        return Error::malformedResponse("clip entry is not an object");
    }

    ClipRecord record;
    auto createdAt = video.find("created_at");
    if (createdAt == video.end() || !createdAt->is_string()) {
        return Error::missingField("created_at");
    }
    auto cameraName = video.find("camera_name");
    if (cameraName == video.end() || !cameraName->is_string()) {
        return Error::missingField("camera_name");
    }
    auto deleted = video.find("deleted");
    if (deleted == video.end() ||
        !(deleted->is_boolean() || deleted->is_number() || deleted->is_null())) {
        return Error::missingField("deleted");
    }
    auto address = video.find("address");
    if (address == video.end() || !address->is_string()) {
        return Error::missingField("address");
    }

    record.createdAt = createdAt->get<std::string>();
    record.cameraName = cameraName->get<std::string>();
    if (deleted->is_boolean()) {
        record.deleted = deleted->get<bool>();
    } else {
        record.deleted = deleted->is_number() && deleted->get<double>() != 0.0;
    }
    record.address = address->get<std::string>();
    return record;
}

// ==================== ClipArchiver ====================

ClipArchiver::ClipArchiver(SessionManager& session, Logger logger, Clock clock)
    : m_session(session),
      m_logger(std::move(logger)),
      m_clock(clock ? std::move(clock) : Clock(TimeUtils::nowEpochSeconds)) {
}

Result<int64_t> ClipArchiver::resolveSince(const std::optional<ClipSince>& since) const {
    if (!since) {
        return m_clock();
    }
    if (const auto* epoch = std::get_if<int64_t>(&since.value())) {
        return *epoch;
    }

    const std::string& text = std::get<std::string>(since.value());
    std::optional<int64_t> parsed = TimeUtils::parseFuzzyDate(text, m_clock());
    if (!parsed) {
        return Error(ErrorCode::VALIDATION_INVALID_FORMAT, "Unrecognized date", text);
    }
    return parsed.value();
}

Result<ClipArchiveSummary> ClipArchiver::downloadClips(const ClipQuery& query) {
    if (m_logger.filter()) {
        m_logger.filter()->reset();
    }

    Result<int64_t> sinceEpoch = resolveSince(query.since);
    if (!sinceEpoch) {
        m_logger.error("clips_failed", "Invalid since value", sinceEpoch.error().toString());
        return sinceEpoch.error();
    }

    auto session = m_session.session();
    if (!session) {
        return Error::notLoggedIn();
    }

    Result<void> dir = PathValidator::ensureDirectory(query.destination);
    if (!dir) {
        m_logger.error("clips_failed", "Cannot use destination " + query.destination,
                       dir.error().toString());
        return dir.error();
    }

    ClipArchiveSummary summary;
    summary.since = TimeUtils::formatApiTime(sinceEpoch.value());
    UrlBuilder urls = UrlBuilder::withBaseUrl(session->baseUrl);

    m_logger.info("clips_start", "Downloading clips since " + summary.since +
                  " to " + query.destination);

    for (int page = 1; page < query.maxPages; ++page) {
        Result<PageOutcome> outcome = processPage(urls, summary.since, page, query, summary);
        if (!outcome) {
            return outcome.error();
        }
        if (outcome.value() == PageOutcome::Done) {
            break;
        }
    }

    m_logger.info("clips_done", "Downloaded " + std::to_string(summary.downloaded.size()) +
                  " clip(s), skipped " + std::to_string(summary.skippedExisting) + " existing");
    return summary;
}

Result<ClipArchiver::PageOutcome> ClipArchiver::processPage(const UrlBuilder& urls,
                                                            const std::string& since,
                                                            int page,
                                                            const ClipQuery& query,
                                                            ClipArchiveSummary& summary) {
    HttpRequest request = HttpRequest::get(urls.videosChanged(since, page));
    Result<HttpResponse> response = m_session.authorizedRequest(request);
    if (!response) {
        m_logger.error("page_failed", "Could not fetch clip page " + std::to_string(page),
                       response.error().toString());
        return response.error();
    }
    if (!response.value().isSuccess()) {
        Error error = Error::fromHttpStatus(response.value().statusCode, request.url);
        m_logger.error("page_failed", "Clip page " + std::to_string(page) + " rejected",
                       error.toString());
        return error;
    }

    nlohmann::json json = nlohmann::json::parse(response.value().body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        Error error = Error::malformedResponse("clip page " + std::to_string(page) +
                                               " is not a JSON object");
        m_logger.error("page_failed", error.message(), error.details());
        return error;
    }

    auto videos = json.find("videos");
    if (videos == json.end() || !videos->is_array() || videos->empty()) {
        m_logger.info("clips_exhausted", "No videos on page " + std::to_string(page));
        return PageOutcome::Done;
    }

    ++summary.pagesFetched;
    for (const auto& video : *videos) {
        Result<void> result = processRecord(urls, video, query, summary);
        if (!result) {
            return result.error();
        }
    }
    return PageOutcome::Continue;
}

Result<void> ClipArchiver::processRecord(const UrlBuilder& urls, const nlohmann::json& video,
                                         const ClipQuery& query, ClipArchiveSummary& summary) {
    Result<ClipRecord> parsed = ClipRecord::fromJson(video);
    if (!parsed) {
        ++summary.skippedMalformed;
        m_logger.warning("clip_skipped", "Missing clip information, skipping: " +
                         parsed.error().details());
        return Result<void>();
    }
    const ClipRecord& record = parsed.value();

    if (!query.cameras.matches(record.cameraName)) {
        ++summary.skippedFiltered;
        m_logger.debug("clip_filtered", "Skipping clip from " + record.cameraName);
        return Result<void>();
    }

    if (record.deleted) {
        ++summary.skippedDeleted;
        m_logger.debug("clip_deleted", "Skipping deleted clip " + record.fileName());
        return Result<void>();
    }

    if (!PathValidator::isSafeFileName(record.fileName())) {
        ++summary.skippedMalformed;
        m_logger.warning("clip_unsafe", "Skipping clip with unsafe camera name " + record.cameraName);
        return Result<void>();
    }

    Result<std::string> path = PathValidator::safeJoin(query.destination, record.fileName());
    if (!path) {
        ++summary.skippedMalformed;
        m_logger.warning("clip_unsafe", "Skipping clip outside destination: " + record.fileName());
        return Result<void>();
    }

    std::error_code ec;
    if (fs::exists(path.value(), ec)) {
        ++summary.skippedExisting;
        m_logger.info("clip_exists", path.value() + " already exists, skipping");
        return Result<void>();
    }

    Result<void> downloaded = downloadClip(urls, record, path.value());
    if (!downloaded) {
        return downloaded;
    }

    summary.downloaded.push_back(path.value());
    if (m_progressCallback) {
        m_progressCallback(path.value());
    }
    return Result<void>();
}

Result<void> ClipArchiver::downloadClip(const UrlBuilder& urls, const ClipRecord& record,
                                        const std::string& path) {
    m_logger.log(LogLevel::Info, "clip_download", "Saving " + record.address, "", path);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        Error error = Error::writeFailed(path);
        m_logger.error("clip_failed", "Cannot create clip file", error.toString());
        return error;
    }

    HttpRequest request = HttpRequest::get(urls.resource(record.address));
    Result<void> result = m_session.authorizedDownload(request, file);
    file.close();

    Error error = result.error();
    if (result && file.fail()) {
        error = Error::writeFailed(path);
    }

    if (error.isError()) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            m_logger.warning("clip_cleanup", "Could not remove partial file " + path);
        }
        m_logger.error("clip_failed", "Download of " + record.address + " failed", error.toString());
        return error;
    }
    return Result<void>();
}

} // namespace CamSync
