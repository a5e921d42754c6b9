#include "monitor/DeviceRegistry.h"

namespace CamSync {

DeviceRegistry::DeviceRegistry(Logger logger)
    : m_logger(std::move(logger)) {
}

MergedDeviceView DeviceRegistry::mergeAll(const std::vector<DeviceCache>& orderedCaches) const {
    MergedDeviceView view;
    for (const auto& cache : orderedCaches) {
        for (const auto& item : cache) {
            const DeviceState& device = item.second.value;
            if (!view.set(item.second.key, device)) {
                m_logger.debug("device_collision", "Camera " + item.second.key +
                               " from network " + device.networkId + " replaces an earlier entry");
            }
        }
    }
    return view;
}

} // namespace CamSync
