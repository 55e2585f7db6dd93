#pragma once

#include "hybrid_connection_manager.h"
#include "peer_transport.h"
#include "logger.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <string>

namespace xtrans {

/**
 * Settings of one xtrans instance, stored as JSON:
 * @code
 * {
 *   "log_level": "info",
 *   "strategy": {"preferred": "primary", "fallbacks": ["secondary"], "timeout_ms": 10000, "retry_attempts": 3},
 *   "transport": {"chunk_size": 16384, "max_buffered_amount": 16777216, ...}
 * }
 * @endcode
 */
struct XtransConfig {
    ConnectionStrategy strategy;
    PeerTransportConfig transport;
    LogLevel log_level = LogLevel::INFO;
};

nlohmann::json config_to_json(const XtransConfig& config);

/**
 * Apply a JSON document on top of config. Missing keys keep their current values,
 * unknown keys are ignored. On error config is left untouched.
 */
bool config_from_json(const nlohmann::json& json, XtransConfig& config, XtransError* error = nullptr);

bool load_config_from_file(const std::string& path, XtransConfig& config, XtransError* error = nullptr);
bool save_config_to_file(const std::string& path, const XtransConfig& config, XtransError* error = nullptr);

} // namespace xtrans
