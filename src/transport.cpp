#include "transport.h"

namespace xtrans {

const char* transport_state_to_string(TransportState state) {
    switch (state) {
        case TransportState::NEW: return "new";
        case TransportState::CONNECTING: return "connecting";
        case TransportState::CONNECTED: return "connected";
        case TransportState::CHANNEL_OPEN: return "channel-open";
        case TransportState::FAILED: return "failed";
        case TransportState::CLOSED: return "closed";
        default: return "unknown";
    }
}

nlohmann::json SessionDescription::to_json() const {
    nlohmann::json json;
    json["type"] = type;
    json["sdp"] = sdp;
    return json;
}

std::optional<SessionDescription> SessionDescription::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }

    auto type_it = json.find("type");
    auto sdp_it = json.find("sdp");
    if (type_it == json.end() || sdp_it == json.end() ||
        !type_it->is_string() || !sdp_it->is_string()) {
        return std::nullopt;
    }

    SessionDescription description(type_it->get<std::string>(), sdp_it->get<std::string>());
    if (description.type != "offer" && description.type != "answer") {
        return std::nullopt;
    }
    return description;
}

std::optional<SessionDescription> SessionDescription::from_string(const std::string& text) {
    nlohmann::json json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return std::nullopt;
    }
    return from_json(json);
}

} // namespace xtrans
