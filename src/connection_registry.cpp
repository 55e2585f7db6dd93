#include "connection_registry.h"
#include "logger.h"

// ConnectionRegistry module logging macros
#define LOG_REGISTRY_DEBUG(message) LOG_DEBUG("registry", message)
#define LOG_REGISTRY_INFO(message)  LOG_INFO("registry", message)
#define LOG_REGISTRY_WARN(message)  LOG_WARN("registry", message)
#define LOG_REGISTRY_ERROR(message) LOG_ERROR("registry", message)

namespace xtrans {

const char* transport_kind_to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::PRIMARY: return "primary";
        case TransportKind::SECONDARY: return "secondary";
        default: return "unknown";
    }
}

std::optional<TransportKind> transport_kind_from_string(const std::string& name) {
    if (name == "primary") return TransportKind::PRIMARY;
    if (name == "secondary") return TransportKind::SECONDARY;
    return std::nullopt;
}

const char* connection_status_to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTING: return "connecting";
        case ConnectionStatus::CONNECTED: return "connected";
        case ConnectionStatus::FAILED: return "failed";
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        default: return "unknown";
    }
}

nlohmann::json ConnectionState::to_json() const {
    nlohmann::json json;
    json["type"] = transport_kind_to_string(transport_kind);
    json["status"] = connection_status_to_string(status);
    json["deviceId"] = device_id;
    if (latency_ms) {
        json["latency"] = *latency_ms;
    }
    json["lastActive"] = last_active;
    return json;
}

ConnectionRegistry::ConnectionRegistry() {
}

ConnectionRegistry::~ConnectionRegistry() {
    clear();
}

//=============================================================================
// Slot management
//=============================================================================

ConnectionRegistry::Slot* ConnectionRegistry::find_slot_locked(const SlotHandle& handle) {
    if (!handle.valid() || handle.index >= slots_.size()) {
        return nullptr;
    }
    Slot& slot = slots_[handle.index];
    if (!slot.occupied || slot.generation != handle.generation) {
        return nullptr;
    }
    return &slot;
}

const ConnectionRegistry::Slot* ConnectionRegistry::find_slot_locked(const SlotHandle& handle) const {
    if (!handle.valid() || handle.index >= slots_.size()) {
        return nullptr;
    }
    const Slot& slot = slots_[handle.index];
    if (!slot.occupied || slot.generation != handle.generation) {
        return nullptr;
    }
    return &slot;
}

size_t ConnectionRegistry::allocate_slot_locked() {
    if (!free_slots_.empty()) {
        size_t index = free_slots_.back();
        free_slots_.pop_back();
        return index;
    }
    slots_.emplace_back();
    return slots_.size() - 1;
}

void ConnectionRegistry::release_slot_locked(size_t index, std::vector<std::shared_ptr<PeerTransport>>& to_close) {
    Slot& slot = slots_[index];
    if (slot.transport) {
        to_close.push_back(std::move(slot.transport));
    }
    slot.transport.reset();
    slot.occupied = false;
    slot.provisional = false;
    slot.generation++;
    slot.state = ConnectionState();
    free_slots_.push_back(index);
}

void ConnectionRegistry::close_transports(std::vector<std::shared_ptr<PeerTransport>>& transports) {
    // Closing joins transport threads, which may be waiting to resolve a handle
    for (auto& transport : transports) {
        transport->close();
    }
    transports.clear();
}

bool ConnectionRegistry::is_valid_transition(ConnectionStatus from, ConnectionStatus to) {
    if (to == ConnectionStatus::DISCONNECTED) {
        return from != ConnectionStatus::DISCONNECTED;
    }
    if (from == ConnectionStatus::CONNECTING) {
        return to == ConnectionStatus::CONNECTED || to == ConnectionStatus::FAILED;
    }
    return false;
}

SlotHandle ConnectionRegistry::open_slot(const std::string& device_id, TransportKind kind, bool provisional) {
    std::vector<std::shared_ptr<PeerTransport>> to_close;
    SlotHandle handle;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t index;
        auto it = index_.find(device_id);
        if (it != index_.end()) {
            index = it->second;
            Slot& slot = slots_[index];
            if (slot.transport) {
                LOG_REGISTRY_INFO("Replacing transport of " << device_id);
                to_close.push_back(std::move(slot.transport));
                slot.transport.reset();
            }
            slot.generation++;
        } else {
            index = allocate_slot_locked();
            index_[device_id] = index;
        }

        Slot& slot = slots_[index];
        slot.occupied = true;
        slot.provisional = provisional;
        slot.state = ConnectionState();
        slot.state.device_id = device_id;
        slot.state.transport_kind = kind;
        slot.state.status = ConnectionStatus::CONNECTING;
        slot.state.last_active = current_time_ms();

        handle = SlotHandle(index, slot.generation);
    }

    close_transports(to_close);
    return handle;
}

bool ConnectionRegistry::attach_transport(const SlotHandle& handle, std::shared_ptr<PeerTransport> transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_slot_locked(handle);
    if (!slot) {
        return false;
    }
    slot->transport = std::move(transport);
    return true;
}

SlotHandle ConnectionRegistry::register_transport(const std::string& device_id, TransportKind kind,
                                                  std::shared_ptr<PeerTransport> transport, bool provisional) {
    SlotHandle handle = open_slot(device_id, kind, provisional);

    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_slot_locked(handle);
    if (!slot) {
        return SlotHandle();
    }
    slot->transport = std::move(transport);
    slot->state.status = ConnectionStatus::CONNECTED;
    slot->state.last_active = current_time_ms();
    LOG_REGISTRY_DEBUG("Registered " << device_id << " (" << transport_kind_to_string(kind)
                       << (provisional ? ", provisional" : "") << ")");
    return handle;
}

bool ConnectionRegistry::rekey(const std::string& from_id, const std::string& to_id, XtransError* error) {
    std::vector<std::shared_ptr<PeerTransport>> to_close;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto from_it = index_.find(from_id);
        if (from_it == index_.end()) {
            set_error(error, XtransErrorCode::NOT_FOUND, "no connection registered for " + from_id);
            return false;
        }
        if (to_id.empty()) {
            set_error(error, XtransErrorCode::INVALID_ARGUMENT, "cannot remap to an empty device id");
            return false;
        }
        if (from_id == to_id) {
            slots_[from_it->second].provisional = false;
            return true;
        }

        size_t index = from_it->second;

        auto to_it = index_.find(to_id);
        if (to_it != index_.end()) {
            LOG_REGISTRY_INFO("Remap of " << from_id << " replaces existing entry for " << to_id);
            release_slot_locked(to_it->second, to_close);
            index_.erase(to_it);
        }

        index_.erase(from_id);
        index_[to_id] = index;

        Slot& slot = slots_[index];
        slot.provisional = false;
        slot.state.device_id = to_id;
        slot.state.last_active = current_time_ms();

        auto handler_it = handlers_.find(from_id);
        if (handler_it != handlers_.end()) {
            handlers_[to_id] = std::move(handler_it->second);
            handlers_.erase(from_id);
        }

        LOG_REGISTRY_INFO("Remapped " << from_id << " -> " << to_id);
    }

    close_transports(to_close);
    return true;
}

std::optional<ConnectionState> ConnectionRegistry::set_status(const SlotHandle& handle, ConnectionStatus status,
                                                              std::optional<int64_t> latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_slot_locked(handle);
    if (!slot || !is_valid_transition(slot->state.status, status)) {
        return std::nullopt;
    }
    slot->state.status = status;
    if (latency_ms) {
        slot->state.latency_ms = latency_ms;
    }
    slot->state.last_active = current_time_ms();
    return slot->state;
}

std::optional<ConnectionState> ConnectionRegistry::set_status(const std::string& device_id, ConnectionStatus status) {
    SlotHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(device_id);
        if (it == index_.end()) {
            return std::nullopt;
        }
        handle = SlotHandle(it->second, slots_[it->second].generation);
    }
    return set_status(handle, status);
}

std::shared_ptr<PeerTransport> ConnectionRegistry::detach_transport(const SlotHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_slot_locked(handle);
    if (!slot) {
        return nullptr;
    }
    std::shared_ptr<PeerTransport> transport = std::move(slot->transport);
    slot->transport.reset();
    return transport;
}

std::shared_ptr<PeerTransport> ConnectionRegistry::detach_transport(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(device_id);
    if (it == index_.end()) {
        return nullptr;
    }
    Slot& slot = slots_[it->second];
    std::shared_ptr<PeerTransport> transport = std::move(slot.transport);
    slot.transport.reset();
    return transport;
}

bool ConnectionRegistry::remove(const std::string& device_id) {
    std::vector<std::shared_ptr<PeerTransport>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(device_id);
        if (it == index_.end()) {
            return false;
        }
        release_slot_locked(it->second, to_close);
        index_.erase(it);
        handlers_.erase(device_id);
    }
    close_transports(to_close);
    return true;
}

void ConnectionRegistry::clear() {
    std::vector<std::shared_ptr<PeerTransport>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : index_) {
            release_slot_locked(entry.second, to_close);
        }
        index_.clear();
        handlers_.clear();
    }
    close_transports(to_close);
}

//=============================================================================
// Lookups
//=============================================================================

std::shared_ptr<PeerTransport> ConnectionRegistry::get_transport(const std::string& device_id, XtransError* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(device_id);
    if (it == index_.end() || !slots_[it->second].transport) {
        set_error(error, XtransErrorCode::NOT_FOUND, "no transport registered for " + device_id);
        return nullptr;
    }
    return slots_[it->second].transport;
}

std::shared_ptr<PeerTransport> ConnectionRegistry::get_transport(const SlotHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Slot* slot = find_slot_locked(handle);
    return slot ? slot->transport : nullptr;
}

std::optional<ConnectionState> ConnectionRegistry::get_state(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(device_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return slots_[it->second].state;
}

std::optional<ConnectionState> ConnectionRegistry::get_state(const SlotHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Slot* slot = find_slot_locked(handle);
    if (!slot) {
        return std::nullopt;
    }
    return slot->state;
}

std::optional<std::string> ConnectionRegistry::resolve(const SlotHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Slot* slot = find_slot_locked(handle);
    if (!slot) {
        return std::nullopt;
    }
    return slot->state.device_id;
}

bool ConnectionRegistry::contains(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(device_id) != index_.end();
}

bool ConnectionRegistry::is_provisional(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(device_id);
    return it != index_.end() && slots_[it->second].provisional;
}

void ConnectionRegistry::touch(const SlotHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_slot_locked(handle);
    if (slot) {
        slot->state.last_active = current_time_ms();
    }
}

void ConnectionRegistry::set_message_handler(const std::string& device_id, DeviceMessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handler) {
        handlers_[device_id] = std::move(handler);
    } else {
        handlers_.erase(device_id);
    }
}

void ConnectionRegistry::clear_message_handler(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(device_id);
}

DeviceMessageHandler ConnectionRegistry::get_message_handler(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(device_id);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<ConnectionState> ConnectionRegistry::get_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionState> states;
    states.reserve(index_.size());
    for (const auto& entry : index_) {
        states.push_back(slots_[entry.second].state);
    }
    return states;
}

std::vector<ConnectionState> ConnectionRegistry::get_states(ConnectionStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionState> states;
    for (const auto& entry : index_) {
        if (slots_[entry.second].state.status == status) {
            states.push_back(slots_[entry.second].state);
        }
    }
    return states;
}

std::vector<std::string> ConnectionRegistry::get_device_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(index_.size());
    for (const auto& entry : index_) {
        ids.push_back(entry.first);
    }
    return ids;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace xtrans
