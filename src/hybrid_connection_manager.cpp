#include "hybrid_connection_manager.h"
#include "signaling_codec.h"
#include "logger.h"
#include <algorithm>

// HybridConnectionManager module logging macros
#define LOG_MANAGER_DEBUG(message) LOG_DEBUG("manager", message)
#define LOG_MANAGER_INFO(message)  LOG_INFO("manager", message)
#define LOG_MANAGER_WARN(message)  LOG_WARN("manager", message)
#define LOG_MANAGER_ERROR(message) LOG_ERROR("manager", message)

namespace xtrans {

namespace {

// Per-device bound on candidates held before their offer arrives
const size_t MAX_EARLY_CANDIDATES = 32;

} // anonymous namespace

class HybridConnectionManager::CallbackScope {
public:
    explicit CallbackScope(HybridConnectionManager& manager)
        : manager_(manager), entered_(manager.enter_callback()) {}
    ~CallbackScope() {
        if (entered_) {
            manager_.leave_callback();
        }
    }

    CallbackScope(const CallbackScope&) = delete;
    CallbackScope& operator=(const CallbackScope&) = delete;

    bool entered() const { return entered_; }

private:
    HybridConnectionManager& manager_;
    bool entered_;
};

const char* connection_event_type_to_string(ConnectionEventType type) {
    switch (type) {
        case ConnectionEventType::CONNECTION_STATE_CHANGED: return "connectionStateChanged";
        case ConnectionEventType::MESSAGE_RECEIVED: return "messageReceived";
        case ConnectionEventType::HANDSHAKE_RECEIVED: return "handshakeReceived";
        default: return "unknown";
    }
}

HybridConnectionManager::HybridConnectionManager(TransportFactory factory,
                                                 std::unique_ptr<SignalingChannel> signaling,
                                                 const ConnectionStrategy& strategy,
                                                 const PeerTransportConfig& transport_config)
    : factory_(std::move(factory)),
      strategy_(strategy),
      transport_config_(transport_config),
      signaling_(std::move(signaling)),
      next_listener_id_(1),
      shutting_down_(false),
      active_callbacks_(0) {
    if (signaling_) {
        signaling_->set_signal_callback([this](const std::string& from, const nlohmann::json& signal) {
            CallbackScope scope(*this);
            if (scope.entered()) {
                handle_signal(from, signal);
            }
        });
    }
}

HybridConnectionManager::~HybridConnectionManager() {
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        shutting_down_.store(true);
    }

    registry_.clear();

    std::unique_ptr<SignalingChannel> signaling;
    {
        std::lock_guard<std::mutex> lock(signaling_mutex_);
        signaling = std::move(signaling_);
    }
    signaling.reset();

    // Transports closed from their own delivery thread (channel loss) are not
    // joined, so a callback can still be running there
    {
        std::unique_lock<std::mutex> lock(callbacks_mutex_);
        callbacks_cv_.wait(lock, [this] { return active_callbacks_ == 0; });
    }

    registry_.clear();
}

bool HybridConnectionManager::enter_callback() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    if (shutting_down_.load()) {
        return false;
    }
    active_callbacks_++;
    return true;
}

void HybridConnectionManager::leave_callback() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    if (--active_callbacks_ == 0) {
        callbacks_cv_.notify_all();
    }
}

//=============================================================================
// Identity
//=============================================================================

void HybridConnectionManager::set_local_identity(const DeviceIdentity& identity) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local_identity_ = identity;
    }

    for (const auto& device_id : registry_.get_device_ids()) {
        auto transport = registry_.get_transport(device_id);
        if (transport) {
            transport->set_local_identity(identity);
        }
    }
}

DeviceIdentity HybridConnectionManager::get_local_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_identity_;
}

size_t HybridConnectionManager::broadcast_identity_update() {
    DeviceIdentity identity = get_local_identity();
    size_t sent = 0;

    for (const auto& state : registry_.get_states(ConnectionStatus::CONNECTED)) {
        auto transport = registry_.get_transport(state.device_id);
        if (!transport) {
            continue;
        }
        transport->set_local_identity(identity);

        XtransError error;
        if (transport->send_handshake(&error)) {
            sent++;
        } else {
            LOG_MANAGER_WARN("Identity update to " << state.device_id << " failed: " << error.message);
        }
    }

    LOG_MANAGER_INFO("Broadcast identity '" << identity.device_name << "' to " << sent << " devices");
    return sent;
}

std::optional<DeviceIdentity> HybridConnectionManager::get_device_identity(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = known_devices_.find(device_id);
    if (it == known_devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

//=============================================================================
// Connections
//=============================================================================

std::vector<TransportKind> HybridConnectionManager::plan_attempts() const {
    std::vector<TransportKind> kinds;
    kinds.push_back(strategy_.preferred_kind);
    for (TransportKind kind : strategy_.fallback_kinds) {
        kinds.push_back(kind);
    }

    size_t limit = static_cast<size_t>(std::max(1, strategy_.retry_attempts));
    if (kinds.size() > limit) {
        kinds.resize(limit);
    }
    return kinds;
}

bool HybridConnectionManager::connect_to_device(const std::string& device_id, const DeviceIdentity& identity,
                                                XtransError* error) {
    if (device_id.empty()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "device id is empty");
        return false;
    }

    auto existing = registry_.get_state(device_id);
    if (existing && existing->status == ConnectionStatus::CONNECTED && registry_.get_transport(device_id)) {
        LOG_MANAGER_DEBUG("Reusing connection to " << device_id);
        return true;
    }

    if (identity.is_valid()) {
        std::lock_guard<std::mutex> lock(mutex_);
        known_devices_[device_id] = identity;
    }

    XtransError attempt_error;
    std::vector<TransportKind> kinds = plan_attempts();
    for (size_t i = 0; i < kinds.size(); ++i) {
        if (i > 0) {
            LOG_MANAGER_INFO("Falling back to " << transport_kind_to_string(kinds[i]) << " transport for " << device_id);
        }

        attempt_error = XtransError();
        if (try_connection(device_id, kinds[i], &attempt_error)) {
            return true;
        }

        LOG_MANAGER_WARN(transport_kind_to_string(kinds[i]) << " connection to " << device_id
                         << " failed: " << attempt_error.to_string());
    }

    LOG_MANAGER_ERROR("All transport kinds failed for " << device_id);
    set_error(error, XtransErrorCode::CONNECT_ALL_FAILED,
              "could not connect to " + device_id + " (last error: " + attempt_error.message + ")");
    return false;
}

bool HybridConnectionManager::try_connection(const std::string& device_id, TransportKind kind, XtransError* error) {
    if (get_local_identity().device_id.empty()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "local identity is not set");
        return false;
    }

    SlotHandle handle = registry_.open_slot(device_id, kind);
    auto connecting = registry_.get_state(handle);
    if (connecting) {
        publish_state(*connecting);
    }

    auto peer = create_peer(kind, device_id, handle, error);
    if (!peer) {
        fail_attempt(handle);
        return false;
    }

    SessionDescription offer = peer->create_offer(error);
    if (offer.empty()) {
        fail_attempt(handle);
        return false;
    }

    nlohmann::json signal = make_signal("offer", kind);
    signal["description"] = offer.to_json();
    if (!send_signal(device_id, signal)) {
        set_error(error, XtransErrorCode::CHANNEL_NOT_READY, "signaling channel refused the offer");
        fail_attempt(handle);
        return false;
    }

    if (!peer->wait_until_connected(std::chrono::milliseconds(strategy_.connect_timeout_ms), error)) {
        fail_attempt(handle);
        return false;
    }

    complete_attempt(handle);
    return true;
}

std::shared_ptr<PeerTransport> HybridConnectionManager::create_peer(TransportKind kind, const std::string& device_id,
                                                                    const SlotHandle& handle, XtransError* error) {
    std::unique_ptr<Transport> transport = factory_ ? factory_(kind, device_id) : nullptr;
    if (!transport) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT,
                  std::string("no ") + transport_kind_to_string(kind) + " transport available");
        return nullptr;
    }

    auto peer = PeerTransport::create(std::move(transport), transport_config_);
    if (!peer) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "could not create peer transport");
        return nullptr;
    }

    peer->set_local_identity(get_local_identity());
    peer->set_message_callback([this, handle](const InboundMessage& message) {
        CallbackScope scope(*this);
        if (scope.entered()) {
            handle_peer_message(handle, message);
        }
    });
    peer->set_state_callback([this, handle](PeerState state) {
        CallbackScope scope(*this);
        if (scope.entered()) {
            handle_peer_state(handle, state);
        }
    });
    peer->set_candidate_callback([this, handle, kind](const std::string& candidate) {
        CallbackScope scope(*this);
        if (scope.entered()) {
            handle_local_candidate(handle, kind, candidate);
        }
    });

    if (!registry_.attach_transport(handle, peer)) {
        set_error(error, XtransErrorCode::CLOSED, "connection attempt was superseded");
        peer->close();
        return nullptr;
    }
    return peer;
}

void HybridConnectionManager::fail_attempt(const SlotHandle& handle) {
    auto failed = registry_.set_status(handle, ConnectionStatus::FAILED);
    auto transport = registry_.detach_transport(handle);
    if (transport) {
        transport->close();
    }
    if (failed) {
        publish_state(*failed);
    }
}

void HybridConnectionManager::complete_attempt(const SlotHandle& handle) {
    auto current = registry_.get_state(handle);
    if (!current || current->status != ConnectionStatus::CONNECTING) {
        return;
    }

    // last_active holds the time the attempt was opened
    int64_t latency = std::max<int64_t>(0, current_time_ms() - current->last_active);
    auto connected = registry_.set_status(handle, ConnectionStatus::CONNECTED, latency);
    if (connected) {
        publish_state(*connected);
    }
}

void HybridConnectionManager::disconnect(const std::string& device_id) {
    auto state = registry_.get_state(device_id);
    if (!state) {
        return;
    }

    auto transport = registry_.detach_transport(device_id);
    if (transport) {
        transport->close();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_attempts_.erase(device_id);
        early_candidates_.erase(device_id);
    }

    auto disconnected = registry_.set_status(device_id, ConnectionStatus::DISCONNECTED);
    if (disconnected) {
        LOG_MANAGER_INFO("Disconnected from " << device_id);
        publish_state(*disconnected);
    }
}

//=============================================================================
// Manual connections
//=============================================================================

std::string HybridConnectionManager::create_manual_connection(const std::string& provisional_id, XtransError* error) {
    if (provisional_id.empty()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "provisional id is empty");
        return "";
    }

    TransportKind kind = strategy_.preferred_kind;
    SlotHandle handle = registry_.open_slot(provisional_id, kind, true);
    auto connecting = registry_.get_state(handle);
    if (connecting) {
        publish_state(*connecting);
    }

    auto peer = create_peer(kind, provisional_id, handle, error);
    if (!peer) {
        fail_attempt(handle);
        return "";
    }

    SessionDescription offer = peer->create_offline_offer(error);
    if (offer.empty()) {
        fail_attempt(handle);
        return "";
    }

    std::string code = SignalingCodec::compress(offer.to_string(), error);
    if (code.empty()) {
        fail_attempt(handle);
        return "";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_attempts_[provisional_id] = handle;
    }

    auto stats = SignalingCodec::get_compression_stats(offer.to_string(), code);
    LOG_MANAGER_INFO("Manual offer for " << provisional_id << ": " << stats.original_size << " -> "
                     << stats.compressed_size << " bytes");
    return code;
}

std::string HybridConnectionManager::accept_manual_connection(const std::string& provisional_id,
                                                              const std::string& offer_code,
                                                              XtransError* error) {
    if (provisional_id.empty()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "provisional id is empty");
        return "";
    }

    auto text = SignalingCodec::decompress(offer_code, error);
    if (!text) {
        return "";
    }
    auto offer = SessionDescription::from_string(*text);
    if (!offer || offer->type != "offer") {
        set_error(error, XtransErrorCode::DECODE_ERROR, "code does not carry an offer");
        return "";
    }

    TransportKind kind = strategy_.preferred_kind;
    SlotHandle handle = registry_.open_slot(provisional_id, kind, true);
    auto connecting = registry_.get_state(handle);
    if (connecting) {
        publish_state(*connecting);
    }

    auto peer = create_peer(kind, provisional_id, handle, error);
    if (!peer) {
        fail_attempt(handle);
        return "";
    }

    SessionDescription answer = peer->create_offline_answer(*offer, error);
    if (answer.empty()) {
        fail_attempt(handle);
        return "";
    }

    std::string code = SignalingCodec::compress(answer.to_string(), error);
    if (code.empty()) {
        fail_attempt(handle);
        return "";
    }

    LOG_MANAGER_INFO("Manual answer created for " << provisional_id);
    return code;
}

bool HybridConnectionManager::finalize_manual_connection(const std::string& provisional_id,
                                                          const std::string& answer_code,
                                                          XtransError* error) {
    SlotHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = manual_attempts_.find(provisional_id);
        if (it == manual_attempts_.end()) {
            set_error(error, XtransErrorCode::NOT_FOUND, "no manual connection pending for " + provisional_id);
            return false;
        }
        handle = it->second;
        manual_attempts_.erase(it);
    }

    auto peer = registry_.get_transport(handle);
    if (!peer) {
        set_error(error, XtransErrorCode::NOT_FOUND, "manual connection " + provisional_id + " is gone");
        return false;
    }

    auto text = SignalingCodec::decompress(answer_code, error);
    if (!text) {
        fail_attempt(handle);
        return false;
    }
    auto answer = SessionDescription::from_string(*text);
    if (!answer || answer->type != "answer") {
        set_error(error, XtransErrorCode::DECODE_ERROR, "code does not carry an answer");
        fail_attempt(handle);
        return false;
    }

    if (!peer->set_remote_description(*answer, error) ||
        !peer->wait_until_connected(std::chrono::milliseconds(strategy_.connect_timeout_ms), error)) {
        fail_attempt(handle);
        return false;
    }

    complete_attempt(handle);
    return true;
}

//=============================================================================
// Signaling
//=============================================================================

nlohmann::json HybridConnectionManager::make_signal(const std::string& type, TransportKind kind) const {
    nlohmann::json signal;
    signal["type"] = type;
    signal["kind"] = transport_kind_to_string(kind);
    signal["from"] = get_local_identity().device_id;
    return signal;
}

bool HybridConnectionManager::send_signal(const std::string& to_device_id, const nlohmann::json& signal) {
    std::lock_guard<std::mutex> lock(signaling_mutex_);
    if (!signaling_) {
        return false;
    }
    return signaling_->send_signal(to_device_id, signal);
}

void HybridConnectionManager::handle_signal(const std::string& from_device_id, const nlohmann::json& signal) {
    if (shutting_down_.load()) {
        return;
    }
    if (!signal.is_object() || !signal.contains("type") || !signal["type"].is_string()) {
        LOG_MANAGER_WARN("Ignoring malformed signal from " << from_device_id);
        return;
    }

    std::string type = signal["type"].get<std::string>();
    TransportKind kind = TransportKind::PRIMARY;
    if (signal.contains("kind") && signal["kind"].is_string()) {
        auto parsed = transport_kind_from_string(signal["kind"].get<std::string>());
        if (!parsed) {
            LOG_MANAGER_WARN("Ignoring signal with unknown transport kind from " << from_device_id);
            return;
        }
        kind = *parsed;
    }

    if (type == "offer") {
        handle_offer(from_device_id, kind, signal);
    } else if (type == "answer") {
        handle_answer(from_device_id, kind, signal);
    } else if (type == "candidate") {
        handle_candidate(from_device_id, kind, signal);
    } else {
        LOG_MANAGER_WARN("Ignoring unknown signal '" << type << "' from " << from_device_id);
    }
}

void HybridConnectionManager::handle_offer(const std::string& from_device_id, TransportKind kind,
                                           const nlohmann::json& signal) {
    auto description = signal.contains("description")
        ? SessionDescription::from_json(signal["description"]) : std::nullopt;
    if (!description || description->type != "offer") {
        LOG_MANAGER_WARN("Offer from " << from_device_id << " carries no usable description");
        return;
    }

    LOG_MANAGER_INFO("Incoming " << transport_kind_to_string(kind) << " connection from " << from_device_id);

    SlotHandle handle = registry_.open_slot(from_device_id, kind);
    auto connecting = registry_.get_state(handle);
    if (connecting) {
        publish_state(*connecting);
    }

    XtransError error;
    auto peer = create_peer(kind, from_device_id, handle, &error);
    if (!peer) {
        LOG_MANAGER_WARN("Cannot answer " << from_device_id << ": " << error.message);
        fail_attempt(handle);
        return;
    }

    // The initiator trickles candidates as soon as its offer exists, so some
    // may have arrived ahead of the offer itself
    for (const auto& candidate : take_early_candidates(from_device_id, kind)) {
        peer->add_remote_candidate(candidate);
    }

    SessionDescription answer = peer->create_answer(*description, &error);
    if (answer.empty()) {
        LOG_MANAGER_WARN("Cannot answer " << from_device_id << ": " << error.message);
        fail_attempt(handle);
        return;
    }

    nlohmann::json reply = make_signal("answer", kind);
    reply["description"] = answer.to_json();
    if (!send_signal(from_device_id, reply)) {
        LOG_MANAGER_WARN("Could not send answer to " << from_device_id);
        fail_attempt(handle);
    }
    // Connected is published from the transport's state callback
}

void HybridConnectionManager::handle_answer(const std::string& from_device_id, TransportKind kind,
                                            const nlohmann::json& signal) {
    auto state = registry_.get_state(from_device_id);
    auto peer = registry_.get_transport(from_device_id);
    if (!state || !peer || state->transport_kind != kind) {
        LOG_MANAGER_WARN("Unexpected " << transport_kind_to_string(kind) << " answer from " << from_device_id);
        return;
    }

    auto description = signal.contains("description")
        ? SessionDescription::from_json(signal["description"]) : std::nullopt;
    if (!description) {
        LOG_MANAGER_WARN("Answer from " << from_device_id << " carries no usable description");
        return;
    }

    XtransError error;
    if (!peer->set_remote_description(*description, &error)) {
        LOG_MANAGER_WARN("Answer from " << from_device_id << " rejected: " << error.message);
    }
}

void HybridConnectionManager::handle_candidate(const std::string& from_device_id, TransportKind kind,
                                               const nlohmann::json& signal) {
    if (!signal.contains("candidate") || !signal["candidate"].is_string()) {
        LOG_MANAGER_WARN("Candidate signal from " << from_device_id << " carries no candidate");
        return;
    }
    std::string candidate = signal["candidate"].get<std::string>();

    // Only a negotiation in progress takes candidates; anything else belongs to an offer still in flight
    auto state = registry_.get_state(from_device_id);
    auto peer = registry_.get_transport(from_device_id);
    if (!state || !peer || state->transport_kind != kind || state->status != ConnectionStatus::CONNECTING) {
        buffer_early_candidate(from_device_id, kind, candidate);
        return;
    }
    peer->add_remote_candidate(candidate);
}

void HybridConnectionManager::buffer_early_candidate(const std::string& from_device_id, TransportKind kind,
                                                     const std::string& candidate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& pending = early_candidates_[from_device_id];
    if (pending.size() >= MAX_EARLY_CANDIDATES) {
        LOG_MANAGER_DEBUG("Dropping candidate from " << from_device_id << ", too many are waiting for an offer");
        return;
    }
    LOG_MANAGER_DEBUG("Holding " << transport_kind_to_string(kind) << " candidate from " << from_device_id
                      << " until its offer arrives");
    pending.emplace_back(kind, candidate);
}

std::vector<std::string> HybridConnectionManager::take_early_candidates(const std::string& from_device_id,
                                                                        TransportKind kind) {
    std::vector<std::string> candidates;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = early_candidates_.find(from_device_id);
    if (it == early_candidates_.end()) {
        return candidates;
    }
    // Candidates of another kind belong to an attempt that was already abandoned
    for (const auto& entry : it->second) {
        if (entry.first == kind) {
            candidates.push_back(entry.second);
        }
    }
    early_candidates_.erase(it);
    return candidates;
}

void HybridConnectionManager::handle_local_candidate(const SlotHandle& handle, TransportKind kind,
                                                     const std::string& candidate) {
    auto device_id = registry_.resolve(handle);
    if (!device_id || registry_.is_provisional(*device_id)) {
        // Manual connections carry their candidates inside the codes
        return;
    }

    nlohmann::json signal = make_signal("candidate", kind);
    signal["candidate"] = candidate;
    if (!send_signal(*device_id, signal)) {
        LOG_MANAGER_DEBUG("Could not trickle candidate to " << *device_id);
    }
}

//=============================================================================
// Transport events
//=============================================================================

void HybridConnectionManager::handle_peer_state(const SlotHandle& handle, PeerState state) {
    if (shutting_down_.load()) {
        return;
    }

    if (state == PeerState::CONNECTED) {
        complete_attempt(handle);
        return;
    }
    if (state != PeerState::FAILED && state != PeerState::CLOSED) {
        return;
    }

    auto current = registry_.get_state(handle);
    if (!current) {
        return;
    }

    if (current->status == ConnectionStatus::CONNECTING) {
        fail_attempt(handle);
        return;
    }

    if (current->status == ConnectionStatus::CONNECTED) {
        LOG_MANAGER_INFO("Channel to " << current->device_id << " lost (" << peer_state_to_string(state) << ")");
        auto transport = registry_.detach_transport(handle);
        if (transport) {
            transport->close();
        }
        auto disconnected = registry_.set_status(handle, ConnectionStatus::DISCONNECTED);
        if (disconnected) {
            publish_state(*disconnected);
        }
    }
}

void HybridConnectionManager::handle_peer_message(const SlotHandle& handle, const InboundMessage& inbound) {
    auto device_id = registry_.resolve(handle);
    if (!device_id) {
        LOG_MANAGER_DEBUG("Dropping message from a replaced transport");
        return;
    }
    registry_.touch(handle);

    P2PMessage message = P2PMessage::from_inbound(inbound);

    if (inbound.kind == P2PMessageKind::HANDSHAKE) {
        auto identity = DeviceIdentity::from_json(message.data);
        if (!identity) {
            LOG_MANAGER_WARN("Handshake from " << *device_id << " without a usable identity");
        } else {
            identity->touch();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                known_devices_[identity->device_id] = *identity;
            }

            if (registry_.is_provisional(*device_id)) {
                std::string previous_id = *device_id;
                XtransError error;
                if (registry_.rekey(previous_id, identity->device_id, &error)) {
                    auto transport = registry_.get_transport(handle);
                    if (transport) {
                        transport->mark_identity_remapped();
                    }

                    ConnectionEvent event;
                    event.type = ConnectionEventType::HANDSHAKE_RECEIVED;
                    event.device_id = identity->device_id;
                    event.previous_device_id = previous_id;
                    event.identity = identity;
                    event.message = message;
                    emit(event);

                    auto remapped = registry_.get_state(handle);
                    if (remapped) {
                        publish_state(*remapped);
                    }
                    return;
                }
                LOG_MANAGER_WARN("Remap of " << previous_id << " failed: " << error.message);
            }

            ConnectionEvent event;
            event.type = ConnectionEventType::HANDSHAKE_RECEIVED;
            event.device_id = *device_id;
            event.identity = identity;
            event.message = message;
            emit(event);
        }
    }

    DeviceMessageHandler handler = registry_.get_message_handler(*device_id);
    if (handler) {
        try {
            handler(*device_id, message);
        } catch (const std::exception& e) {
            LOG_MANAGER_ERROR("Message handler for " << *device_id << " failed: " << e.what());
        } catch (...) {
            LOG_MANAGER_ERROR("Message handler for " << *device_id << " failed with an unknown exception");
        }
        return;
    }

    ConnectionEvent event;
    event.type = ConnectionEventType::MESSAGE_RECEIVED;
    event.device_id = *device_id;
    event.message = std::move(message);
    emit(event);
}

//=============================================================================
// Messaging
//=============================================================================

bool HybridConnectionManager::send_message(const std::string& device_id, const P2PMessage& message,
                                           XtransError* error) {
    auto transport = registry_.get_transport(device_id, error);
    if (!transport) {
        LOG_MANAGER_WARN("No transport for " << device_id << ", dropping "
                         << p2p_message_kind_to_string(message.kind) << " message");
        return false;
    }
    return transport->send_message(message, error);
}

std::string HybridConnectionManager::send_text(const std::string& device_id, const std::string& content,
                                               XtransError* error) {
    auto transport = registry_.get_transport(device_id, error);
    if (!transport) {
        return "";
    }
    return transport->send_text(content, error);
}

bool HybridConnectionManager::send_file(const std::string& device_id, const FilePayload& file,
                                        TransferProgressCallback progress, XtransError* error,
                                        std::string* file_id_out) {
    auto transport = registry_.get_transport(device_id, error);
    if (!transport) {
        return false;
    }
    return transport->send_file(file, std::move(progress), error, file_id_out);
}

std::optional<ReceivedFile> HybridConnectionManager::receive_file(const std::string& device_id,
                                                                  const std::string& file_id,
                                                                  const std::optional<FileMetadata>& metadata,
                                                                  TransferProgressCallback progress,
                                                                  XtransError* error) {
    auto transport = registry_.get_transport(device_id, error);
    if (!transport) {
        return std::nullopt;
    }

    // The session must exist before the sender sees FileAccept
    if (!transport->begin_receive(file_id, metadata, std::move(progress))) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "already receiving " + file_id);
        return std::nullopt;
    }
    if (!transport->accept_file(file_id, error)) {
        transport->abort_receive(file_id);
        return std::nullopt;
    }
    return transport->wait_receive(file_id, error);
}

bool HybridConnectionManager::reject_file(const std::string& device_id, const std::string& file_id,
                                          XtransError* error) {
    auto transport = registry_.get_transport(device_id, error);
    if (!transport) {
        return false;
    }
    return transport->reject_file(file_id, error);
}

void HybridConnectionManager::on_message(const std::string& device_id, DeviceMessageHandler handler) {
    registry_.set_message_handler(device_id, std::move(handler));
}

void HybridConnectionManager::off_message(const std::string& device_id) {
    registry_.clear_message_handler(device_id);
}

//=============================================================================
// Events and queries
//=============================================================================

int HybridConnectionManager::add_event_listener(ConnectionEventListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

bool HybridConnectionManager::remove_event_listener(int listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.erase(listener_id) > 0;
}

void HybridConnectionManager::publish_state(const ConnectionState& state) {
    LOG_MANAGER_INFO(state.device_id << " " << connection_status_to_string(state.status)
                     << " (" << transport_kind_to_string(state.transport_kind) << ")");

    ConnectionEvent event;
    event.type = ConnectionEventType::CONNECTION_STATE_CHANGED;
    event.device_id = state.device_id;
    event.state = state;
    emit(event);
}

void HybridConnectionManager::emit(const ConnectionEvent& event) {
    std::vector<ConnectionEventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            LOG_MANAGER_ERROR("Event listener failed on " << connection_event_type_to_string(event.type)
                              << " for " << event.device_id << ": " << e.what());
        } catch (...) {
            LOG_MANAGER_ERROR("Event listener failed on " << connection_event_type_to_string(event.type)
                              << " for " << event.device_id << " with an unknown exception");
        }
    }
}

std::optional<ConnectionState> HybridConnectionManager::get_connection_state(const std::string& device_id) const {
    return registry_.get_state(device_id);
}

std::vector<ConnectionState> HybridConnectionManager::get_active_connections() const {
    return registry_.get_states(ConnectionStatus::CONNECTED);
}

} // namespace xtrans
