#ifndef CAMSYNC_DEVICE_STATE_H
#define CAMSYNC_DEVICE_STATE_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "core/Error.h"
#include "core/CaseInsensitiveMap.h"

namespace CamSync {

/**
 * Snapshot of one camera as reported by the homescreen listing
 */
struct DeviceState {
    std::string name;
    std::string deviceId;
    std::string networkId;
    std::string serial;
    bool enabled = false;              // motion detection armed
    std::string batteryState;
    std::optional<int> temperature;    // Fahrenheit
    std::string thumbnailPath;         // service-relative, without extension
    std::vector<uint8_t> imageCache;   // last fetched thumbnail
    std::optional<std::string> lastClipAddress;  // "clip" path; absolute once cached

    /**
     * Temperature in Celsius, rounded to the nearest degree
     */
    std::optional<int> temperatureC() const;

    /**
     * Relative URL of the thumbnail image ("/path.jpg"), empty if none
     */
    std::string thumbnailResource() const;

    /**
     * Build from one homescreen camera object
     * @return DATA_MISSING_FIELD if "id" or "name" is absent
     */
    static Result<DeviceState> fromJson(const nlohmann::json& camera);

    nlohmann::json toJson() const;
};

/**
 * Devices of one network, keyed by case-insensitive name
 */
using DeviceCache = CaseInsensitiveMap<DeviceState>;

/**
 * Devices of all networks after merging
 */
using MergedDeviceView = CaseInsensitiveMap<DeviceState>;

} // namespace CamSync

#endif // CAMSYNC_DEVICE_STATE_H
