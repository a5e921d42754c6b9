#include "monitor/DeviceState.h"

#include <cmath>

namespace CamSync {

namespace {
std::string idToString(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return "";
}
} // anonymous namespace

std::optional<int> DeviceState::temperatureC() const {
    if (!temperature) return std::nullopt;
    double celsius = (temperature.value() - 32) / 9.0 * 5.0;
    return static_cast<int>(std::lround(celsius));
}

std::string DeviceState::thumbnailResource() const {
    if (thumbnailPath.empty()) return "";
    std::string path = thumbnailPath;
    if (path.front() != '/') {
        path = "/" + path;
    }
    return path + ".jpg";
}

Result<DeviceState> DeviceState::fromJson(const nlohmann::json& camera) {
    if (!camera.is_object()) {
        return Error::malformedResponse("camera entry is not an object");
    }

    auto id = camera.find("id");
    if (id == camera.end() || idToString(*id).empty()) {
        return Error::missingField("id");
    }
    auto name = camera.find("name");
    if (name == camera.end() || !name->is_string()) {
        return Error::missingField("name");
    }

    DeviceState state;
    state.deviceId = idToString(*id);
    state.name = name->get<std::string>();

    auto networkId = camera.find("network_id");
    if (networkId != camera.end()) {
        state.networkId = idToString(*networkId);
    }

    auto serial = camera.find("serial");
    if (serial != camera.end() && serial->is_string()) {
        state.serial = serial->get<std::string>();
    }

    auto enabled = camera.find("enabled");
    if (enabled != camera.end() && enabled->is_boolean()) {
        state.enabled = enabled->get<bool>();
    }

    auto battery = camera.find("battery_state");
    if (battery == camera.end()) {
        battery = camera.find("battery");
    }
    if (battery != camera.end() && battery->is_string()) {
        state.batteryState = battery->get<std::string>();
    }

    auto temperature = camera.find("temperature");
    if (temperature != camera.end() && temperature->is_number()) {
        state.temperature = static_cast<int>(std::lround(temperature->get<double>()));
    }

    auto thumbnail = camera.find("thumbnail");
    if (thumbnail != camera.end() && thumbnail->is_string()) {
        state.thumbnailPath = thumbnail->get<std::string>();
    }

    auto clip = camera.find("clip");
    if (clip != camera.end() && clip->is_string() && !clip->get<std::string>().empty()) {
        state.lastClipAddress = clip->get<std::string>();
    }

    return state;
}

nlohmann::json DeviceState::toJson() const {
    nlohmann::json json = {
        {"name", name},
        {"device_id", deviceId},
        {"network_id", networkId},
        {"serial", serial},
        {"enabled", enabled},
        {"battery", batteryState},
        {"thumbnail", thumbnailPath},
        {"image_cached", !imageCache.empty()}
    };
    json["temperature"] = temperature ? nlohmann::json(temperature.value()) : nlohmann::json();
    auto celsius = temperatureC();
    json["temperature_c"] = celsius ? nlohmann::json(celsius.value()) : nlohmann::json();
    if (lastClipAddress) {
        json["last_clip"] = lastClipAddress.value();
    }
    return json;
}

} // namespace CamSync
