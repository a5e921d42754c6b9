#include "core/TimeUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <regex>
#include <utility>
#include <vector>

namespace CamSync {
namespace TimeUtils {

namespace {

struct DateParts {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    bool hasOffset = false;
    int offsetSeconds = 0;
};

const char* const MONTH_NAMES[] = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

// Accepts "jul", "july", "sept", "september"; 0 when not a month
int monthFromName(const std::string& word) {
    std::string lower = word;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.size() < 3) return 0;

    for (int i = 0; i < 12; ++i) {
        std::string name = MONTH_NAMES[i];
        if (name.compare(0, lower.size(), lower) == 0) {
            return i + 1;
        }
    }
    return 0;
}

int toInt(const std::ssub_match& match, int fallback = 0) {
    if (!match.matched || match.length() == 0) return fallback;
    return std::stoi(match.str());
}

bool inRange(const DateParts& p) {
    return p.year >= 1970 && p.month >= 1 && p.month <= 12 &&
           p.day >= 1 && p.day <= 31 && p.hour >= 0 && p.hour < 24 &&
           p.minute >= 0 && p.minute < 60 && p.second >= 0 && p.second <= 60;
}

// "Z", "+0200", "-05:30"
void applyOffset(const std::ssub_match& match, DateParts& parts) {
    if (!match.matched || match.length() == 0) return;

    std::string zone = match.str();
    parts.hasOffset = true;
    if (zone == "Z" || zone == "z") {
        parts.offsetSeconds = 0;
        return;
    }

    int sign = zone[0] == '-' ? -1 : 1;
    std::string digits;
    for (char c : zone) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    int hours = std::stoi(digits.substr(0, 2));
    int minutes = std::stoi(digits.substr(2, 2));
    parts.offsetSeconds = sign * (hours * 3600 + minutes * 60);
}

int64_t toEpoch(const DateParts& parts) {
    struct tm tmValue{};
    tmValue.tm_year = parts.year - 1900;
    tmValue.tm_mon = parts.month - 1;
    tmValue.tm_mday = parts.day;
    tmValue.tm_hour = parts.hour;
    tmValue.tm_min = parts.minute;
    tmValue.tm_sec = parts.second;

    if (parts.hasOffset) {
        return static_cast<int64_t>(timegm(&tmValue)) - parts.offsetSeconds;
    }

    tmValue.tm_isdst = -1;
    return static_cast<int64_t>(mktime(&tmValue));
}

struct Candidate {
    std::ptrdiff_t position;
    DateParts parts;
};

// Records the first match of pattern that builds a valid date
template <typename Build>
void collectFirst(const std::string& text, const std::regex& pattern, Build build,
                  std::vector<Candidate>& candidates) {
    for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
        DateParts parts = build(*it);
        if (inRange(parts)) {
            candidates.push_back({it->position(0), parts});
            return;
        }
    }
}

DateParts referenceDate(int64_t referenceEpoch) {
    time_t seconds = static_cast<time_t>(referenceEpoch);
    struct tm tmLocal;
    localtime_r(&seconds, &tmLocal);

    DateParts parts;
    parts.year = tmLocal.tm_year + 1900;
    parts.month = tmLocal.tm_mon + 1;
    parts.day = tmLocal.tm_mday;
    return parts;
}

} // anonymous namespace

int64_t nowEpochSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatApiTime(int64_t epochSeconds) {
    time_t seconds = static_cast<time_t>(epochSeconds);
    struct tm tmUtc;
    gmtime_r(&seconds, &tmUtc);

    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S+0000", &tmUtc);
    return buffer;
}

std::optional<int64_t> parseFuzzyDate(const std::string& text, int64_t referenceEpoch) {
    static const std::regex epochPattern(R"(^\s*(\d{9,10})\s*$)");
    static const std::regex isoPattern(
        R"((\d{4})[-/.](\d{1,2})[-/.](\d{1,2})(?:(?:T|\s+)(\d{1,2}):(\d{2})(?::(\d{2}))?(?:\.\d+)?)?\s*(Z|[+-]\d{2}:?\d{2})?)");
    static const std::regex slashPattern(
        R"((?:^|\D)(\d{1,2})/(\d{1,2})/(\d{4})(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?)");
    static const std::regex dayMonthPattern(
        R"((?:^|\D)(\d{1,2})\s+([A-Za-z]{3,9})\.?(?:,?\s+(\d{4}))?(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?)");
    static const std::regex monthDayPattern(
        R"(([A-Za-z]{3,9})\.?\s+(\d{1,2})(?!\d)(?:st|nd|rd|th)?(?:,?\s+(\d{4}))?(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?)");
    static const std::regex timePattern(
        R"((?:^|[^\d:])(\d{1,2}):(\d{2})(?::(\d{2}))?(?![\d:]))");

    std::smatch match;
    if (std::regex_match(text, match, epochPattern)) {
        return static_cast<int64_t>(std::stoll(match[1].str()));
    }

    const DateParts today = referenceDate(referenceEpoch);
    std::vector<Candidate> candidates;

    collectFirst(text, isoPattern, [](const std::smatch& m) {
        DateParts parts;
        parts.year = toInt(m[1]);
        parts.month = toInt(m[2]);
        parts.day = toInt(m[3]);
        parts.hour = toInt(m[4]);
        parts.minute = toInt(m[5]);
        parts.second = toInt(m[6]);
        applyOffset(m[7], parts);
        return parts;
    }, candidates);

    collectFirst(text, slashPattern, [](const std::smatch& m) {
        DateParts parts;
        parts.month = toInt(m[1]);
        parts.day = toInt(m[2]);
        if (parts.month > 12 && parts.day <= 12) {
            std::swap(parts.month, parts.day);
        }
        parts.year = toInt(m[3]);
        parts.hour = toInt(m[4]);
        parts.minute = toInt(m[5]);
        parts.second = toInt(m[6]);
        return parts;
    }, candidates);

    collectFirst(text, dayMonthPattern, [&today](const std::smatch& m) {
        DateParts parts;
        parts.day = toInt(m[1]);
        parts.month = monthFromName(m[2].str());
        parts.year = toInt(m[3], today.year);
        parts.hour = toInt(m[4]);
        parts.minute = toInt(m[5]);
        parts.second = toInt(m[6]);
        return parts;
    }, candidates);

    collectFirst(text, monthDayPattern, [&today](const std::smatch& m) {
        DateParts parts;
        parts.month = monthFromName(m[1].str());
        parts.day = toInt(m[2]);
        parts.year = toInt(m[3], today.year);
        parts.hour = toInt(m[4]);
        parts.minute = toInt(m[5]);
        parts.second = toInt(m[6]);
        return parts;
    }, candidates);

    // A bare time only counts when no date was found
    if (candidates.empty()) {
        collectFirst(text, timePattern, [&today](const std::smatch& m) {
            DateParts parts = today;
            parts.hour = toInt(m[1]);
            parts.minute = toInt(m[2]);
            parts.second = toInt(m[3]);
            return parts;
        }, candidates);
    }

    if (candidates.empty()) {
        return std::nullopt;
    }

    auto earliest = std::min_element(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.position < b.position; });
    return toEpoch(earliest->parts);
}

} // namespace TimeUtils
} // namespace CamSync
