#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cstdint>

namespace xtrans {

enum class DeviceType {
    MOBILE,
    TABLET,
    DESKTOP
};

const char* device_type_to_string(DeviceType type);
DeviceType device_type_from_string(const std::string& name);

/**
 * Identity of a device taking part in transfers.
 * Everything except device_name, online and last_seen is fixed once discovered.
 */
struct DeviceIdentity {
    std::string device_id;      // Opaque identifier
    std::string device_name;    // User-visible name
    DeviceType device_type;
    std::string platform;
    std::string browser;
    std::string ip_address;
    bool online;
    int64_t last_seen;          // Milliseconds since epoch

    DeviceIdentity() : device_type(DeviceType::DESKTOP), online(false), last_seen(0) {}
    DeviceIdentity(const std::string& id, const std::string& name)
        : device_id(id), device_name(name), device_type(DeviceType::DESKTOP),
          online(true), last_seen(0) {}

    bool is_valid() const { return !device_id.empty(); }

    /**
     * Mark the device as seen now and online.
     */
    void touch();

    nlohmann::json to_json() const;

    /**
     * Parse an identity, tolerating missing optional fields.
     * @return Identity, or nullopt if the JSON is not an object or has no deviceId
     */
    static std::optional<DeviceIdentity> from_json(const nlohmann::json& json);
};

} // namespace xtrans
