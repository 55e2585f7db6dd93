#include "device_identity.h"
#include <chrono>

namespace xtrans {

const char* device_type_to_string(DeviceType type) {
    switch (type) {
        case DeviceType::MOBILE: return "mobile";
        case DeviceType::TABLET: return "tablet";
        case DeviceType::DESKTOP: return "desktop";
        default: return "desktop";
    }
}

DeviceType device_type_from_string(const std::string& name) {
    if (name == "mobile") return DeviceType::MOBILE;
    if (name == "tablet") return DeviceType::TABLET;
    return DeviceType::DESKTOP;
}

void DeviceIdentity::touch() {
    online = true;
    last_seen = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

nlohmann::json DeviceIdentity::to_json() const {
    nlohmann::json json;
    json["deviceId"] = device_id;
    json["deviceName"] = device_name;
    json["deviceType"] = device_type_to_string(device_type);
    json["platform"] = platform;
    json["browser"] = browser;
    json["ipAddress"] = ip_address;
    json["online"] = online;
    json["lastSeen"] = last_seen;
    return json;
}

std::optional<DeviceIdentity> DeviceIdentity::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }

    auto id_it = json.find("deviceId");
    if (id_it == json.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        return std::nullopt;
    }

    DeviceIdentity identity;
    identity.device_id = id_it->get<std::string>();

    try {
        identity.device_name = json.value("deviceName", "");
        identity.device_type = device_type_from_string(json.value("deviceType", "desktop"));
        identity.platform = json.value("platform", "");
        identity.browser = json.value("browser", "");
        identity.ip_address = json.value("ipAddress", "");
        identity.online = json.value("online", false);
        identity.last_seen = json.value("lastSeen", static_cast<int64_t>(0));
    } catch (const nlohmann::json::exception&) {
        // Wrong field types
        return std::nullopt;
    }

    return identity;
}

} // namespace xtrans
