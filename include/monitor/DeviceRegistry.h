#ifndef CAMSYNC_DEVICE_REGISTRY_H
#define CAMSYNC_DEVICE_REGISTRY_H

#include <vector>

#include "core/LogManager.h"
#include "monitor/DeviceState.h"

namespace CamSync {

/**
 * DeviceRegistry - merges per-network device caches into one view
 *
 * Caches are applied in the order given; on a case-insensitive name
 * collision the later cache wins and its spelling of the name is kept.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(Logger logger = Logger(LogCategory::Sync));

    MergedDeviceView mergeAll(const std::vector<DeviceCache>& orderedCaches) const;

private:
    Logger m_logger;
};

} // namespace CamSync

#endif // CAMSYNC_DEVICE_REGISTRY_H
