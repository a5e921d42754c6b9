#ifndef CAMSYNC_TIME_UTILS_H
#define CAMSYNC_TIME_UTILS_H

#include <string>
#include <cstdint>
#include <optional>

namespace CamSync {
namespace TimeUtils {

/**
 * Current wall-clock time in whole seconds since the epoch
 */
int64_t nowEpochSeconds();

/**
 * Format an epoch timestamp the way the service expects "since" values,
 * e.g. "2018-07-28T12:33:00+0000" (always UTC).
 */
std::string formatApiTime(int64_t epochSeconds);

/**
 * Parse a date/time string permissively.
 *
 * The first recognizable date found anywhere in the text is used, so
 * "since 2018/07/28 12:33:00 please" parses. Supported shapes:
 *   YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD (optionally followed by
 *   [T ]HH:MM[:SS]), MM/DD/YYYY or DD/MM/YYYY [HH:MM[:SS]],
 *   "28 Jul [2018]", "Jul 28 [2018]" / "July 28, 2018", a bare
 *   HH:MM[:SS] and bare 9-10 digit epochs.
 * A slash date is read month first unless the first number cannot be a
 * month. A missing year, or a missing date for a bare time, is taken
 * from referenceEpoch. Times without an explicit zone are local time;
 * a trailing "Z" or "+HHMM"/"-HH:MM" offset is honored.
 *
 * @return Epoch seconds, or nullopt if nothing recognizable was found
 */
std::optional<int64_t> parseFuzzyDate(const std::string& text,
                                      int64_t referenceEpoch = nowEpochSeconds());

} // namespace TimeUtils
} // namespace CamSync

#endif // CAMSYNC_TIME_UTILS_H
