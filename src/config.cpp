#include "config.h"
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

// Config module logging macros
#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace xtrans {

namespace {

TransportKind parse_kind(const nlohmann::json& value) {
    if (!value.is_string()) {
        throw std::invalid_argument("transport kind must be a string");
    }
    auto kind = transport_kind_from_string(value.get<std::string>());
    if (!kind) {
        throw std::invalid_argument("unknown transport kind '" + value.get<std::string>() + "'");
    }
    return *kind;
}

template <typename T>
void read_positive(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    bool in_range = false;
    if (it->is_number_unsigned()) {
        uint64_t value = it->get<uint64_t>();
        in_range = value > 0 && value <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    } else if (it->is_number_integer()) {
        int64_t value = it->get<int64_t>();
        in_range = value > 0 && static_cast<uint64_t>(value) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
    }
    if (!in_range) {
        throw std::invalid_argument(std::string(key) + " must be a positive integer no larger than " +
                                    std::to_string(std::numeric_limits<T>::max()));
    }
    target = it->get<T>();
}

std::vector<int> read_delays(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw std::invalid_argument("handshake_resend_delays_ms must be an array");
    }
    std::vector<int> delays;
    for (const auto& entry : value) {
        bool valid = false;
        if (entry.is_number_unsigned()) {
            valid = entry.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
        } else if (entry.is_number_integer()) {
            int64_t delay = entry.get<int64_t>();
            valid = delay >= 0 && delay <= std::numeric_limits<int>::max();
        }
        if (!valid) {
            throw std::invalid_argument("handshake_resend_delays_ms entries must be non-negative integers");
        }
        delays.push_back(entry.get<int>());
    }
    return delays;
}

std::string level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        default: return "info";
    }
}

} // namespace

nlohmann::json config_to_json(const XtransConfig& config) {
    nlohmann::json json;
    json["log_level"] = level_name(config.log_level);

    nlohmann::json strategy;
    strategy["preferred"] = transport_kind_to_string(config.strategy.preferred_kind);
    strategy["fallbacks"] = nlohmann::json::array();
    for (TransportKind kind : config.strategy.fallback_kinds) {
        strategy["fallbacks"].push_back(transport_kind_to_string(kind));
    }
    strategy["timeout_ms"] = config.strategy.connect_timeout_ms;
    strategy["retry_attempts"] = config.strategy.retry_attempts;
    json["strategy"] = strategy;

    const PeerTransportConfig& transport = config.transport;
    nlohmann::json transport_json;
    transport_json["chunk_size"] = transport.chunk_size;
    transport_json["max_buffered_amount"] = transport.max_buffered_amount;
    transport_json["pacing_threshold"] = transport.pacing_threshold;
    transport_json["backpressure_poll_interval_ms"] = transport.backpressure_poll_interval_ms;
    transport_json["pacing_delay_ms"] = transport.pacing_delay_ms;
    transport_json["accept_timeout_ms"] = transport.accept_timeout_ms;
    transport_json["receive_timeout_ms"] = transport.receive_timeout_ms;
    transport_json["ice_gathering_timeout_ms"] = transport.ice_gathering_timeout_ms;
    transport_json["handshake_resend_delays_ms"] = transport.handshake_resend_delays_ms;
    json["transport"] = transport_json;

    return json;
}

bool config_from_json(const nlohmann::json& json, XtransConfig& config, XtransError* error) {
    if (!json.is_object()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "configuration must be a JSON object");
        return false;
    }

    // Work on a copy so a bad document leaves the caller's config as it was
    XtransConfig result = config;

    try {
        auto level_it = json.find("log_level");
        if (level_it != json.end()) {
            if (!level_it->is_string() || !parse_log_level(level_it->get<std::string>(), result.log_level)) {
                throw std::invalid_argument("log_level must be one of debug, info, warn, error");
            }
        }

        auto strategy_it = json.find("strategy");
        if (strategy_it != json.end()) {
            const nlohmann::json& strategy = *strategy_it;
            if (!strategy.is_object()) {
                throw std::invalid_argument("strategy must be an object");
            }
            if (strategy.contains("preferred")) {
                result.strategy.preferred_kind = parse_kind(strategy["preferred"]);
            }
            if (strategy.contains("fallbacks")) {
                if (!strategy["fallbacks"].is_array()) {
                    throw std::invalid_argument("fallbacks must be an array");
                }
                result.strategy.fallback_kinds.clear();
                for (const auto& kind : strategy["fallbacks"]) {
                    result.strategy.fallback_kinds.push_back(parse_kind(kind));
                }
            }
            read_positive(strategy, "timeout_ms", result.strategy.connect_timeout_ms);
            read_positive(strategy, "retry_attempts", result.strategy.retry_attempts);
        }

        auto transport_it = json.find("transport");
        if (transport_it != json.end()) {
            const nlohmann::json& transport = *transport_it;
            if (!transport.is_object()) {
                throw std::invalid_argument("transport must be an object");
            }
            PeerTransportConfig& target = result.transport;
            read_positive(transport, "chunk_size", target.chunk_size);
            read_positive(transport, "max_buffered_amount", target.max_buffered_amount);
            read_positive(transport, "pacing_threshold", target.pacing_threshold);
            read_positive(transport, "backpressure_poll_interval_ms", target.backpressure_poll_interval_ms);
            read_positive(transport, "pacing_delay_ms", target.pacing_delay_ms);
            read_positive(transport, "accept_timeout_ms", target.accept_timeout_ms);
            read_positive(transport, "receive_timeout_ms", target.receive_timeout_ms);
            read_positive(transport, "ice_gathering_timeout_ms", target.ice_gathering_timeout_ms);
            if (transport.contains("handshake_resend_delays_ms")) {
                target.handshake_resend_delays_ms = read_delays(transport["handshake_resend_delays_ms"]);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, std::string("invalid configuration: ") + e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, std::string("invalid configuration: ") + e.what());
        return false;
    }

    config = result;
    return true;
}

bool load_config_from_file(const std::string& path, XtransConfig& config, XtransError* error) {
    std::ifstream file(path);
    if (!file) {
        LOG_CONFIG_ERROR("Cannot open configuration file " << path);
        set_error(error, XtransErrorCode::NOT_FOUND, "cannot open " + path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json json = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (json.is_discarded()) {
        LOG_CONFIG_ERROR("Configuration file " << path << " is not valid JSON");
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, path + " is not valid JSON");
        return false;
    }

    XtransError parse_error;
    if (!config_from_json(json, config, &parse_error)) {
        LOG_CONFIG_ERROR("Rejected configuration " << path << ": " << parse_error.message);
        set_error(error, parse_error.code, parse_error.message);
        return false;
    }

    LOG_CONFIG_INFO("Loaded configuration from " << path);
    return true;
}

bool save_config_to_file(const std::string& path, const XtransConfig& config, XtransError* error) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        LOG_CONFIG_ERROR("Cannot write configuration file " << path);
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "cannot write " + path);
        return false;
    }

    file << config_to_json(config).dump(4);
    if (!file) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "write to " + path + " failed");
        return false;
    }

    LOG_CONFIG_DEBUG("Saved configuration to " << path);
    return true;
}

} // namespace xtrans
