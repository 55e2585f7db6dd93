#pragma once

/**
 * @file connection_registry.h
 * @brief device id -> (PeerTransport, ConnectionState) with provisional-id remapping
 *
 * Entries live in an arena of slots. Callers that must follow an entry across a
 * remap (transport callbacks) hold a SlotHandle; a remap only moves the id -> slot
 * index, so handles keep resolving to the entry under its new id. Replacing a
 * transport or removing an entry bumps the slot generation and invalidates old handles.
 */

#include "peer_transport.h"
#include "messages.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xtrans {

enum class TransportKind {
    PRIMARY,
    SECONDARY
};

const char* transport_kind_to_string(TransportKind kind);
std::optional<TransportKind> transport_kind_from_string(const std::string& name);

enum class ConnectionStatus {
    CONNECTING,
    CONNECTED,
    FAILED,
    DISCONNECTED
};

const char* connection_status_to_string(ConnectionStatus status);

struct ConnectionState {
    TransportKind transport_kind;
    ConnectionStatus status;
    std::string device_id;
    std::optional<int64_t> latency_ms;
    int64_t last_active;    // Milliseconds since epoch

    ConnectionState()
        : transport_kind(TransportKind::PRIMARY), status(ConnectionStatus::CONNECTING), last_active(0) {}

    nlohmann::json to_json() const;
};

using DeviceMessageHandler = std::function<void(const std::string& device_id, const P2PMessage& message)>;

struct SlotHandle {
    size_t index;
    uint64_t generation;

    SlotHandle() : index(SIZE_MAX), generation(0) {}
    SlotHandle(size_t slot_index, uint64_t slot_generation) : index(slot_index), generation(slot_generation) {}

    bool valid() const { return index != SIZE_MAX; }
};

class ConnectionRegistry {
public:
    ConnectionRegistry();
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * Start a connection attempt for device_id: the entry is created or reset to
     * CONNECTING with no transport. A transport still attached to an existing entry is closed.
     * @param provisional true if device_id is a placeholder until the peer's handshake
     */
    SlotHandle open_slot(const std::string& device_id, TransportKind kind, bool provisional = false);

    /**
     * Attach the attempt's transport. Fails if the handle is stale.
     */
    bool attach_transport(const SlotHandle& handle, std::shared_ptr<PeerTransport> transport);

    /**
     * Register a transport as CONNECTED in one step. Last registration wins:
     * a transport already registered for device_id is closed.
     */
    SlotHandle register_transport(const std::string& device_id, TransportKind kind,
                                  std::shared_ptr<PeerTransport> transport, bool provisional = false);

    /**
     * Move an entry from one id to another. Transport, state and message handler follow it.
     * An entry already registered under to_id is replaced and its transport closed.
     * @return false with NOT_FOUND if from_id is not registered
     */
    bool rekey(const std::string& from_id, const std::string& to_id, XtransError* error = nullptr);

    /**
     * Apply a status transition. Within an attempt CONNECTING may only move to
     * CONNECTED or FAILED; DISCONNECTED is reachable from any status.
     * @return The updated state, or nullopt if the handle is stale or nothing changed
     */
    std::optional<ConnectionState> set_status(const SlotHandle& handle, ConnectionStatus status,
                                              std::optional<int64_t> latency_ms = std::nullopt);
    std::optional<ConnectionState> set_status(const std::string& device_id, ConnectionStatus status);

    /**
     * Take the transport out of an entry, keeping the entry and its state.
     */
    std::shared_ptr<PeerTransport> detach_transport(const SlotHandle& handle);
    std::shared_ptr<PeerTransport> detach_transport(const std::string& device_id);

    /**
     * Remove an entry entirely and close its transport.
     */
    bool remove(const std::string& device_id);

    /**
     * Close every transport and drop all entries.
     */
    void clear();

    /**
     * @return Transport registered under device_id, or nullptr with NOT_FOUND
     */
    std::shared_ptr<PeerTransport> get_transport(const std::string& device_id, XtransError* error = nullptr) const;
    std::shared_ptr<PeerTransport> get_transport(const SlotHandle& handle) const;

    std::optional<ConnectionState> get_state(const std::string& device_id) const;
    std::optional<ConnectionState> get_state(const SlotHandle& handle) const;

    /**
     * Current device id of the entry behind a handle
     */
    std::optional<std::string> resolve(const SlotHandle& handle) const;

    bool contains(const std::string& device_id) const;
    bool is_provisional(const std::string& device_id) const;

    /**
     * Record activity on the entry behind a handle.
     */
    void touch(const SlotHandle& handle);

    void set_message_handler(const std::string& device_id, DeviceMessageHandler handler);
    void clear_message_handler(const std::string& device_id);
    DeviceMessageHandler get_message_handler(const std::string& device_id) const;

    std::vector<ConnectionState> get_states() const;
    std::vector<ConnectionState> get_states(ConnectionStatus status) const;
    std::vector<std::string> get_device_ids() const;
    size_t size() const;

private:
    struct Slot {
        uint64_t generation = 1;
        bool occupied = false;
        bool provisional = false;
        ConnectionState state;
        std::shared_ptr<PeerTransport> transport;
    };

    Slot* find_slot_locked(const SlotHandle& handle);
    const Slot* find_slot_locked(const SlotHandle& handle) const;
    size_t allocate_slot_locked();
    void release_slot_locked(size_t index, std::vector<std::shared_ptr<PeerTransport>>& to_close);

    static bool is_valid_transition(ConnectionStatus from, ConnectionStatus to);
    static void close_transports(std::vector<std::shared_ptr<PeerTransport>>& transports);

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<size_t> free_slots_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, DeviceMessageHandler> handlers_;
};

} // namespace xtrans
