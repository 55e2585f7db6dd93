#pragma once

/**
 * @file hybrid_connection_manager.h
 * @brief Top-level orchestration of peer connections
 *
 * HybridConnectionManager picks a transport kind with ordered fallback, negotiates
 * through a SignalingChannel (or out-of-band codes for manual connections), keeps
 * every peer in a ConnectionRegistry, and dispatches inbound messages to per-device
 * handlers or to event listeners.
 *
 * Example:
 * @code
 * xtrans::HybridConnectionManager manager(factory, hub.create_channel("alice"));
 * manager.set_local_identity(xtrans::DeviceIdentity("alice", "Alice's laptop"));
 * manager.add_event_listener([](const xtrans::ConnectionEvent& event) { ... });
 * if (manager.connect_to_device("bob", bob_identity)) {
 *     manager.send_text("bob", "hello");
 * }
 * @endcode
 */

#include "connection_registry.h"
#include "peer_transport.h"
#include "transport.h"
#include "device_identity.h"
#include "messages.h"
#include "errors.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xtrans {

/**
 * Transport selection policy
 */
struct ConnectionStrategy {
    TransportKind preferred_kind = TransportKind::PRIMARY;
    std::vector<TransportKind> fallback_kinds = {TransportKind::SECONDARY};
    int connect_timeout_ms = 10000;     // Per attempt
    int retry_attempts = 3;             // Upper bound on kind attempts per connect call
};

enum class ConnectionEventType {
    CONNECTION_STATE_CHANGED,
    MESSAGE_RECEIVED,
    HANDSHAKE_RECEIVED
};

const char* connection_event_type_to_string(ConnectionEventType type);

struct ConnectionEvent {
    ConnectionEventType type;
    std::string device_id;
    std::optional<ConnectionState> state;       // CONNECTION_STATE_CHANGED
    std::optional<P2PMessage> message;          // MESSAGE_RECEIVED, HANDSHAKE_RECEIVED
    std::optional<DeviceIdentity> identity;     // HANDSHAKE_RECEIVED
    std::string previous_device_id;             // HANDSHAKE_RECEIVED that remapped a provisional id

    ConnectionEvent() : type(ConnectionEventType::CONNECTION_STATE_CHANGED) {}
};

using ConnectionEventListener = std::function<void(const ConnectionEvent& event)>;

/**
 * Builds the underlying transport for one connection attempt
 */
using TransportFactory = std::function<std::unique_ptr<Transport>(TransportKind kind, const std::string& device_id)>;

class HybridConnectionManager {
public:
    HybridConnectionManager(TransportFactory factory,
                            std::unique_ptr<SignalingChannel> signaling,
                            const ConnectionStrategy& strategy = ConnectionStrategy(),
                            const PeerTransportConfig& transport_config = PeerTransportConfig());
    /**
     * Closes every transport and waits for callbacks still running on transport
     * or signaling threads. Must not be called from one of those callbacks.
     */
    ~HybridConnectionManager();

    HybridConnectionManager(const HybridConnectionManager&) = delete;
    HybridConnectionManager& operator=(const HybridConnectionManager&) = delete;

    //=========================================================================
    // Identity
    //=========================================================================

    /**
     * Identity announced in handshakes. Applies to existing transports too.
     */
    void set_local_identity(const DeviceIdentity& identity);
    DeviceIdentity get_local_identity() const;

    /**
     * Re-send the handshake to every connected device.
     * @return Number of devices the handshake was sent to
     */
    size_t broadcast_identity_update();

    /**
     * Last identity seen for a device (from connect_to_device or a handshake)
     */
    std::optional<DeviceIdentity> get_device_identity(const std::string& device_id) const;

    //=========================================================================
    // Connections
    //=========================================================================

    /**
     * Connect to a device through the signaling channel. Reuses an existing
     * connected transport; otherwise tries the preferred kind, then each fallback
     * kind, bounded by retry_attempts.
     * @return true once connected; false with CONNECT_ALL_FAILED if every attempt failed
     */
    bool connect_to_device(const std::string& device_id, const DeviceIdentity& identity,
                           XtransError* error = nullptr);

    /**
     * Close the device's transport and mark it DISCONNECTED. No-op if already disconnected.
     */
    void disconnect(const std::string& device_id);

    /**
     * Manual connection, offering side: create an offer code to hand over out of band.
     * The connection is registered under provisional_id until the peer's handshake.
     * @return Offer code, or empty string on failure
     */
    std::string create_manual_connection(const std::string& provisional_id, XtransError* error = nullptr);

    /**
     * Manual connection, answering side: answer an offer code.
     * @return Answer code to hand back, or empty string on failure
     */
    std::string accept_manual_connection(const std::string& provisional_id, const std::string& offer_code,
                                         XtransError* error = nullptr);

    /**
     * Manual connection, offering side: apply the answer code and wait for the channel.
     */
    bool finalize_manual_connection(const std::string& provisional_id, const std::string& answer_code,
                                    XtransError* error = nullptr);

    //=========================================================================
    // Messaging
    //=========================================================================

    /**
     * Send a message to a device. Returns false (never throws) if nothing is registered for it.
     */
    bool send_message(const std::string& device_id, const P2PMessage& message, XtransError* error = nullptr);

    std::string send_text(const std::string& device_id, const std::string& content, XtransError* error = nullptr);

    bool send_file(const std::string& device_id, const FilePayload& file,
                   TransferProgressCallback progress = nullptr, XtransError* error = nullptr,
                   std::string* file_id_out = nullptr);

    /**
     * Accept an offered file and receive it.
     */
    std::optional<ReceivedFile> receive_file(const std::string& device_id, const std::string& file_id,
                                             const std::optional<FileMetadata>& metadata = std::nullopt,
                                             TransferProgressCallback progress = nullptr,
                                             XtransError* error = nullptr);

    bool reject_file(const std::string& device_id, const std::string& file_id, XtransError* error = nullptr);

    /**
     * Route a device's inbound messages to a handler instead of MESSAGE_RECEIVED events.
     * The registration follows the device across an identity remap.
     */
    void on_message(const std::string& device_id, DeviceMessageHandler handler);
    void off_message(const std::string& device_id);

    //=========================================================================
    // Events and queries
    //=========================================================================

    /**
     * @return Listener id for remove_event_listener
     */
    int add_event_listener(ConnectionEventListener listener);
    bool remove_event_listener(int listener_id);

    std::optional<ConnectionState> get_connection_state(const std::string& device_id) const;
    std::vector<ConnectionState> get_active_connections() const;

    const ConnectionStrategy& get_strategy() const { return strategy_; }
    const ConnectionRegistry& get_registry() const { return registry_; }

    /**
     * Handle a signal from the signaling channel (offer, answer or candidate).
     */
    void handle_signal(const std::string& from_device_id, const nlohmann::json& signal);

private:
    std::vector<TransportKind> plan_attempts() const;
    bool try_connection(const std::string& device_id, TransportKind kind, XtransError* error);

    std::shared_ptr<PeerTransport> create_peer(TransportKind kind, const std::string& device_id,
                                               const SlotHandle& handle, XtransError* error);
    void fail_attempt(const SlotHandle& handle);
    void complete_attempt(const SlotHandle& handle);

    void handle_offer(const std::string& from_device_id, TransportKind kind, const nlohmann::json& signal);
    void handle_answer(const std::string& from_device_id, TransportKind kind, const nlohmann::json& signal);
    void handle_candidate(const std::string& from_device_id, TransportKind kind, const nlohmann::json& signal);
    void buffer_early_candidate(const std::string& from_device_id, TransportKind kind, const std::string& candidate);
    std::vector<std::string> take_early_candidates(const std::string& from_device_id, TransportKind kind);

    void handle_peer_state(const SlotHandle& handle, PeerState state);
    void handle_peer_message(const SlotHandle& handle, const InboundMessage& inbound);
    void handle_local_candidate(const SlotHandle& handle, TransportKind kind, const std::string& candidate);

    bool send_signal(const std::string& to_device_id, const nlohmann::json& signal);
    nlohmann::json make_signal(const std::string& type, TransportKind kind) const;

    void publish_state(const ConnectionState& state);
    void emit(const ConnectionEvent& event);

    // Tracks callbacks entered from transport and signaling threads
    class CallbackScope;
    bool enter_callback();
    void leave_callback();

    TransportFactory factory_;
    ConnectionStrategy strategy_;
    PeerTransportConfig transport_config_;
    ConnectionRegistry registry_;

    std::unique_ptr<SignalingChannel> signaling_;
    std::mutex signaling_mutex_;

    mutable std::mutex mutex_;
    DeviceIdentity local_identity_;
    std::unordered_map<std::string, DeviceIdentity> known_devices_;
    std::unordered_map<std::string, SlotHandle> manual_attempts_;
    // Candidates received before the offer that creates their transport
    std::unordered_map<std::string, std::vector<std::pair<TransportKind, std::string>>> early_candidates_;

    std::mutex listeners_mutex_;
    std::map<int, ConnectionEventListener> listeners_;
    int next_listener_id_;

    std::atomic<bool> shutting_down_;
    std::mutex callbacks_mutex_;
    std::condition_variable callbacks_cv_;
    int active_callbacks_;
};

} // namespace xtrans
