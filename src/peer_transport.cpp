#include "peer_transport.h"
#include "packet_framer.h"
#include "logger.h"
#include <algorithm>

// PeerTransport module logging macros
#define LOG_PEER_DEBUG(message) LOG_DEBUG("peer", message)
#define LOG_PEER_INFO(message)  LOG_INFO("peer", message)
#define LOG_PEER_WARN(message)  LOG_WARN("peer", message)
#define LOG_PEER_ERROR(message) LOG_ERROR("peer", message)

namespace xtrans {

const char* peer_state_to_string(PeerState state) {
    switch (state) {
        case PeerState::NEW: return "new";
        case PeerState::CONNECTING: return "connecting";
        case PeerState::CONNECTED: return "connected";
        case PeerState::FAILED: return "failed";
        case PeerState::CLOSED: return "closed";
        default: return "unknown";
    }
}

namespace {

double average_rate(uint64_t bytes, std::chrono::steady_clock::time_point started) {
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return elapsed > 0 ? static_cast<double>(bytes) / elapsed : 0.0;
}

} // namespace

//=============================================================================
// Construction and lifetime
//=============================================================================

std::shared_ptr<PeerTransport> PeerTransport::create(std::unique_ptr<Transport> transport,
                                                     const PeerTransportConfig& config) {
    if (!transport) {
        LOG_PEER_ERROR("Cannot create a peer transport without an underlying transport");
        return nullptr;
    }

    std::shared_ptr<PeerTransport> peer(new PeerTransport(std::move(transport), config));
    std::weak_ptr<PeerTransport> weak_peer = peer;

    peer->transport_->set_message_callback([weak_peer](const ChannelMessage& message) {
        if (auto self = weak_peer.lock()) {
            self->handle_channel_message(message);
        }
    });
    peer->transport_->set_state_callback([weak_peer](TransportState state) {
        if (auto self = weak_peer.lock()) {
            self->handle_transport_state(state);
        }
    });
    peer->transport_->set_candidate_callback([weak_peer](const std::string& candidate) {
        if (auto self = weak_peer.lock()) {
            self->handle_local_candidate(candidate);
        }
    });

    return peer;
}

PeerTransport::PeerTransport(std::unique_ptr<Transport> transport, const PeerTransportConfig& config)
    : transport_(std::move(transport)),
      config_(config),
      state_(PeerState::NEW),
      closed_(false),
      remote_description_set_(false),
      identity_remapped_(false),
      handshake_started_(false) {
    if (config_.chunk_size == 0) {
        config_.chunk_size = PeerTransportConfig().chunk_size;
    }
}

PeerTransport::~PeerTransport() {
    close();
}

void PeerTransport::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        state_ = PeerState::CLOSED;
        cv_.notify_all();
    }

    shutdown_all_threads();
    transport_->close();
    join_all_active_threads();

    LOG_PEER_DEBUG("Peer transport closed");
}

PeerState PeerTransport::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t PeerTransport::buffered_amount() const {
    return transport_->buffered_amount();
}

bool PeerTransport::is_terminal_locked() const {
    return closed_ || state_ == PeerState::FAILED || state_ == PeerState::CLOSED;
}

bool PeerTransport::sleep_unless_closed(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return is_terminal_locked(); });
}

//=============================================================================
// Negotiation
//=============================================================================

SessionDescription PeerTransport::create_offer(XtransError* error) {
    return transport_->create_offer(error);
}

SessionDescription PeerTransport::create_answer(const SessionDescription& remote_offer, XtransError* error) {
    SessionDescription answer = transport_->create_answer(remote_offer, error);
    if (answer.empty()) {
        return answer;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_description_set_ = true;
    }
    flush_remote_candidates();
    return answer;
}

SessionDescription PeerTransport::create_offline_offer(XtransError* error) {
    SessionDescription offer = create_offer(error);
    if (offer.empty()) {
        return offer;
    }
    return gathered_description(offer, error);
}

SessionDescription PeerTransport::create_offline_answer(const SessionDescription& remote_offer, XtransError* error) {
    SessionDescription answer = create_answer(remote_offer, error);
    if (answer.empty()) {
        return answer;
    }
    return gathered_description(answer, error);
}

SessionDescription PeerTransport::gathered_description(const SessionDescription& initial, XtransError* error) {
    if (!wait_for_gathering(error)) {
        return SessionDescription();
    }
    SessionDescription current = transport_->local_description();
    return current.empty() ? initial : current;
}

bool PeerTransport::set_remote_description(const SessionDescription& answer, XtransError* error) {
    if (!transport_->set_remote_description(answer, error)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_description_set_ = true;
    }
    flush_remote_candidates();
    return true;
}

bool PeerTransport::add_remote_candidate(const std::string& candidate) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (!remote_description_set_) {
            pending_candidates_.push_back(candidate);
            return true;
        }
    }
    return transport_->add_candidate(candidate);
}

void PeerTransport::flush_remote_candidates() {
    std::vector<std::string> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        candidates.swap(pending_candidates_);
    }
    for (const auto& candidate : candidates) {
        if (!transport_->add_candidate(candidate)) {
            LOG_PEER_WARN("Queued remote candidate was rejected: " << candidate);
        }
    }
}

bool PeerTransport::wait_for_gathering(XtransError* error) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool gathered = cv_.wait_for(lock, std::chrono::milliseconds(config_.ice_gathering_timeout_ms), [this] {
        return closed_ || transport_->is_gathering_complete();
    });

    if (closed_) {
        set_error(error, XtransErrorCode::CLOSED, "transport closed during candidate gathering");
        return false;
    }
    if (!gathered) {
        LOG_PEER_DEBUG("Candidate gathering still running after " << config_.ice_gathering_timeout_ms
                       << "ms, using the description gathered so far");
    }
    return true;
}

bool PeerTransport::wait_until_connected(std::chrono::milliseconds timeout, XtransError* error) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = cv_.wait_for(lock, timeout, [this] {
        return state_ == PeerState::CONNECTED || is_terminal_locked();
    });

    if (state_ == PeerState::CONNECTED) {
        return true;
    }
    if (!settled) {
        set_error(error, XtransErrorCode::CHANNEL_NOT_READY,
                  "channel did not open within " + std::to_string(timeout.count()) + "ms");
    } else if (closed_) {
        set_error(error, XtransErrorCode::CLOSED, "transport closed while connecting");
    } else {
        set_error(error, XtransErrorCode::CHANNEL_NOT_READY,
                  std::string("connection ") + peer_state_to_string(state_));
    }
    return false;
}

//=============================================================================
// Transport events
//=============================================================================

void PeerTransport::handle_transport_state(TransportState state) {
    PeerState new_state;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }

        switch (state) {
            case TransportState::CONNECTING:
                if (state_ == PeerState::NEW) {
                    state_ = PeerState::CONNECTING;
                    changed = true;
                }
                break;
            case TransportState::CHANNEL_OPEN:
                if (state_ == PeerState::NEW || state_ == PeerState::CONNECTING) {
                    state_ = PeerState::CONNECTED;
                    changed = true;
                }
                break;
            case TransportState::FAILED:
                if (!is_terminal_locked()) {
                    state_ = PeerState::FAILED;
                    changed = true;
                }
                break;
            case TransportState::CLOSED:
                if (!is_terminal_locked()) {
                    state_ = PeerState::CLOSED;
                    changed = true;
                }
                break;
            case TransportState::NEW:
            case TransportState::CONNECTED:
                // Negotiated but the channel is not usable yet
                break;
        }

        new_state = state_;
        cv_.notify_all();
    }

    if (!changed) {
        return;
    }

    LOG_PEER_INFO("Peer transport " << peer_state_to_string(new_state)
                  << " (transport " << transport_state_to_string(state) << ")");

    if (new_state == PeerState::CONNECTED) {
        start_handshake_resends();
    }

    PeerStateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = state_callback_;
    }
    if (callback) {
        try {
            callback(new_state);
        } catch (const std::exception& e) {
            LOG_PEER_ERROR("Exception in state callback: " << e.what());
        } catch (...) {
            LOG_PEER_ERROR("Unknown exception in state callback");
        }
    }
}

void PeerTransport::handle_local_candidate(const std::string& candidate) {
    if (candidate.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
        return;
    }

    PeerCandidateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = candidate_callback_;
    }
    if (callback) {
        try {
            callback(candidate);
        } catch (const std::exception& e) {
            LOG_PEER_ERROR("Exception in candidate callback: " << e.what());
        } catch (...) {
            LOG_PEER_ERROR("Unknown exception in candidate callback");
        }
    }
}

void PeerTransport::handle_channel_message(const ChannelMessage& message) {
    InboundMessage inbound = parse_inbound_message(message);

    if (inbound.protocol && handle_protocol_message(*inbound.protocol)) {
        return;
    }

    if (inbound.kind == P2PMessageKind::HANDSHAKE) {
        auto data = inbound.json.find("data");
        if (data != inbound.json.end()) {
            auto identity = DeviceIdentity::from_json(*data);
            if (identity) {
                std::lock_guard<std::mutex> lock(mutex_);
                remote_identity_ = identity;
            } else {
                LOG_PEER_WARN("Handshake without a usable identity");
            }
        }
    }

    PeerMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callback = message_callback_;
    }
    if (!callback) {
        LOG_PEER_DEBUG("No message callback, dropping " << p2p_message_kind_to_string(inbound.kind) << " message");
        return;
    }

    try {
        callback(inbound);
    } catch (const std::exception& e) {
        LOG_PEER_ERROR("Exception in message callback: " << e.what());
    } catch (...) {
        LOG_PEER_ERROR("Unknown exception in message callback");
    }
}

bool PeerTransport::handle_protocol_message(const DataMessage& message) {
    switch (message.type) {
        case DataMessageType::CHUNK:
            return handle_chunk(message);

        case DataMessageType::METADATA: {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = receive_sessions_.find(message.file_id);
            if (it != receive_sessions_.end()) {
                if (!it->second->metadata) {
                    it->second->metadata = message.metadata;
                }
            } else {
                announced_metadata_[message.file_id] = message.metadata;
            }
            LOG_PEER_INFO("File offered: " << message.metadata.name << " (" << message.metadata.size
                          << " bytes, " << message.metadata.chunk_count << " chunks, id " << message.file_id << ")");
            // Still forwarded so the application can decide to accept
            return false;
        }

        case DataMessageType::END: {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = receive_sessions_.find(message.file_id);
            if (it == receive_sessions_.end()) {
                return false;
            }
            it->second->complete = true;
            cv_.notify_all();
            return true;
        }

        case DataMessageType::FILE_ACCEPT:
        case DataMessageType::FILE_REJECT: {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = send_sessions_.find(message.file_id);
            if (it == send_sessions_.end()) {
                return false;
            }
            auto& session = it->second;
            if (!session->answered) {
                session->answered = true;
                session->accepted = message.type == DataMessageType::FILE_ACCEPT;
            } else if (message.type == DataMessageType::FILE_REJECT) {
                session->cancelled = true;
            }
            cv_.notify_all();
            return true;
        }

        case DataMessageType::FILE_CANCEL: {
            std::lock_guard<std::mutex> lock(mutex_);
            bool found = false;

            auto send_it = send_sessions_.find(message.file_id);
            if (send_it != send_sessions_.end()) {
                send_it->second->answered = true;
                send_it->second->cancelled = true;
                found = true;
            }

            auto receive_it = receive_sessions_.find(message.file_id);
            if (receive_it != receive_sessions_.end()) {
                receive_it->second->cancelled = true;
                found = true;
            }

            announced_metadata_.erase(message.file_id);
            cv_.notify_all();
            return found;
        }

        case DataMessageType::TEXT:
        case DataMessageType::ACK:
            return false;
    }
    return false;
}

bool PeerTransport::handle_chunk(const DataMessage& message) {
    TransferProgressCallback progress;
    uint64_t received = 0;
    uint64_t total = 0;
    double rate = 0.0;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::shared_ptr<ReceiveSession> session;
        if (message.file_id.empty()) {
            // Unframed bytes belong to the only open session, if there is exactly one
            if (receive_sessions_.size() != 1) {
                LOG_PEER_DEBUG("Unframed chunk with " << receive_sessions_.size() << " open sessions");
                return false;
            }
            session = receive_sessions_.begin()->second;
        } else {
            auto it = receive_sessions_.find(message.file_id);
            if (it == receive_sessions_.end()) {
                LOG_PEER_DEBUG("Chunk " << message.chunk_index << " for unknown file " << message.file_id);
                return false;
            }
            session = it->second;
        }

        if (session->complete || session->cancelled) {
            return true;
        }

        session->data.insert(session->data.end(), message.data.begin(), message.data.end());
        session->chunk_count++;

        progress = session->progress;
        received = session->data.size();
        total = session->metadata ? session->metadata->size : 0;
        rate = average_rate(received, session->started);
    }

    LOG_PEER_DEBUG("Chunk " << message.chunk_index << " for " << message.file_id
                   << " (" << message.data.size() << " bytes)");

    if (progress) {
        try {
            progress(received, total, rate);
        } catch (const std::exception& e) {
            LOG_PEER_ERROR("Exception in receive progress callback: " << e.what());
        } catch (...) {
            LOG_PEER_ERROR("Unknown exception in receive progress callback");
        }
    }
    return true;
}

//=============================================================================
// Messaging
//=============================================================================

bool PeerTransport::send_raw(const ChannelMessage& message, XtransError* error) {
    PeerState state = get_state();
    if (state != PeerState::CONNECTED) {
        set_error(error, XtransErrorCode::CHANNEL_NOT_READY,
                  std::string("channel is not open (") + peer_state_to_string(state) + ")");
        return false;
    }
    if (!transport_->send(message)) {
        set_error(error, XtransErrorCode::CHANNEL_NOT_READY, "transport refused the message");
        return false;
    }
    return true;
}

bool PeerTransport::send_data_message(const DataMessage& message, XtransError* error) {
    return send_raw(ChannelMessage::from_text(message.to_json().dump()), error);
}

bool PeerTransport::send_envelope(const P2PMessage& message, XtransError* error) {
    return send_raw(ChannelMessage::from_text(message.to_json().dump()), error);
}

std::string PeerTransport::send_text(const std::string& content, XtransError* error) {
    std::string message_id = generate_message_id();
    if (!send_data_message(DataMessage::make_text(message_id, content, current_time_ms()), error)) {
        return "";
    }
    return message_id;
}

bool PeerTransport::send_message(const P2PMessage& message, XtransError* error) {
    switch (message.kind) {
        case P2PMessageKind::TEXT: {
            std::string content;
            if (message.data.is_string()) {
                content = message.data.get<std::string>();
            } else if (message.data.is_object() && message.data.contains("content") &&
                       message.data["content"].is_string()) {
                content = message.data["content"].get<std::string>();
            } else {
                content = message.data.dump();
            }
            return !send_text(content, error).empty();
        }

        case P2PMessageKind::FILE:
            if (!message.file) {
                set_error(error, XtransErrorCode::INVALID_ARGUMENT, "file message without file content");
                return false;
            }
            return send_file(*message.file, nullptr, error);

        case P2PMessageKind::CONTROL:
        case P2PMessageKind::HANDSHAKE:
            return send_envelope(message, error);
    }
    return false;
}

//=============================================================================
// File send
//=============================================================================

bool PeerTransport::send_file(const FilePayload& file, TransferProgressCallback progress,
                              XtransError* error, std::string* file_id_out) {
    if (!is_connected()) {
        set_error(error, XtransErrorCode::CHANNEL_NOT_READY, "channel is not open");
        return false;
    }

    FileMetadata metadata;
    metadata.file_id = generate_file_id();
    metadata.name = file.name;
    metadata.size = file.data.size();
    metadata.mime_type = file.mime_type;
    metadata.chunk_count = static_cast<uint32_t>((file.data.size() + config_.chunk_size - 1) / config_.chunk_size);

    const std::string file_id = metadata.file_id;
    if (file_id_out) {
        *file_id_out = file_id;
    }

    auto session = std::make_shared<SendSession>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        send_sessions_[file_id] = session;
    }

    auto finish = [this, &file_id](bool result) {
        std::lock_guard<std::mutex> lock(mutex_);
        send_sessions_.erase(file_id);
        return result;
    };

    LOG_PEER_INFO("Offering file " << file.name << " (" << metadata.size << " bytes, "
                  << metadata.chunk_count << " chunks, id " << file_id << ")");

    if (!send_data_message(DataMessage::make_metadata(metadata), error)) {
        return finish(false);
    }

    // Wait for the receiver's decision
    bool answered;
    bool accepted;
    bool terminal;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        answered = cv_.wait_for(lock, std::chrono::milliseconds(config_.accept_timeout_ms), [this, &session] {
            return session->answered || is_terminal_locked();
        });
        answered = session->answered;
        accepted = session->accepted && !session->cancelled;
        terminal = is_terminal_locked();
    }

    if (!answered) {
        if (terminal) {
            set_error(error, XtransErrorCode::CLOSED, "transport closed while waiting for accept");
            return finish(false);
        }
        LOG_PEER_WARN("No answer for file " << file_id << " within " << config_.accept_timeout_ms << "ms, cancelling");
        XtransError cancel_error;
        if (!send_data_message(DataMessage::make_file_cancel(file_id), &cancel_error)) {
            LOG_PEER_WARN("Could not send cancel for " << file_id << ": " << cancel_error.message);
        }
        set_error(error, XtransErrorCode::ACCEPT_TIMEOUT, "receiver did not accept file " + file_id);
        return finish(false);
    }

    if (!accepted) {
        LOG_PEER_INFO("File " << file_id << " rejected by receiver");
        set_error(error, XtransErrorCode::REJECTED, "receiver rejected file " + file_id);
        return finish(false);
    }

    const uint64_t total = file.data.size();
    const auto started = std::chrono::steady_clock::now();
    uint64_t offset = 0;
    uint32_t chunk_index = 0;

    while (offset < total) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (session->cancelled) {
                LOG_PEER_INFO("Transfer of " << file_id << " cancelled by receiver after " << offset << " bytes");
                set_error(error, XtransErrorCode::REJECTED, "receiver cancelled file " + file_id);
                return finish(false);
            }
        }

        // Backpressure gate
        while (transport_->buffered_amount() > config_.max_buffered_amount) {
            if (!sleep_unless_closed(std::chrono::milliseconds(config_.backpressure_poll_interval_ms))) {
                set_error(error, XtransErrorCode::CHANNEL_NOT_READY, "channel lost while waiting for buffer to drain");
                return finish(false);
            }
        }

        size_t length = static_cast<size_t>(std::min<uint64_t>(config_.chunk_size, total - offset));
        std::vector<uint8_t> frame = PacketFramer::encode(file_id, chunk_index, file.data.data() + offset, length, error);
        if (frame.empty()) {
            return finish(false);
        }
        if (!send_raw(ChannelMessage::from_binary(std::move(frame)), error)) {
            LOG_PEER_WARN("Transfer of " << file_id << " aborted at chunk " << chunk_index);
            return finish(false);
        }

        offset += length;
        chunk_index++;

        if (progress) {
            try {
                progress(offset, total, average_rate(offset, started));
            } catch (const std::exception& e) {
                LOG_PEER_ERROR("Exception in send progress callback: " << e.what());
            } catch (...) {
                LOG_PEER_ERROR("Unknown exception in send progress callback");
            }
        }

        if (transport_->buffered_amount() > config_.pacing_threshold) {
            sleep_unless_closed(std::chrono::milliseconds(config_.pacing_delay_ms));
        }
    }

    if (!send_data_message(DataMessage::make_end(file_id), error)) {
        return finish(false);
    }

    LOG_PEER_INFO("Sent file " << file.name << " (" << total << " bytes in " << chunk_index << " chunks)");
    return finish(true);
}

//=============================================================================
// File receive
//=============================================================================

bool PeerTransport::begin_receive(const std::string& file_id, const std::optional<FileMetadata>& metadata,
                                  TransferProgressCallback progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (receive_sessions_.find(file_id) != receive_sessions_.end()) {
        return false;
    }

    auto session = std::make_shared<ReceiveSession>();
    if (metadata) {
        session->metadata = metadata;
    } else {
        auto it = announced_metadata_.find(file_id);
        if (it != announced_metadata_.end()) {
            session->metadata = it->second;
        }
    }
    announced_metadata_.erase(file_id);

    session->progress = std::move(progress);
    session->started = std::chrono::steady_clock::now();
    session->deadline = session->started + std::chrono::milliseconds(config_.receive_timeout_ms);
    receive_sessions_[file_id] = session;

    LOG_PEER_DEBUG("Receive session opened for " << file_id);
    return true;
}

std::optional<ReceivedFile> PeerTransport::wait_receive(const std::string& file_id, XtransError* error) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = receive_sessions_.find(file_id);
    if (it == receive_sessions_.end()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "no receive session for " + file_id);
        return std::nullopt;
    }
    auto session = it->second;

    cv_.wait_until(lock, session->deadline, [this, &session] {
        return session->complete || session->cancelled || is_terminal_locked();
    });
    receive_sessions_.erase(file_id);

    if (session->complete) {
        ReceivedFile result;
        if (session->metadata) {
            result.metadata = *session->metadata;
        } else {
            result.metadata.file_id = file_id;
            result.metadata.size = session->data.size();
            result.metadata.chunk_count = session->chunk_count;
        }
        result.data = std::move(session->data);

        if (result.data.size() != result.metadata.size) {
            LOG_PEER_WARN("File " << file_id << " assembled " << result.data.size()
                          << " bytes, metadata announced " << result.metadata.size);
        }
        LOG_PEER_INFO("Received file " << result.metadata.name << " (" << result.data.size() << " bytes)");
        return result;
    }

    if (session->cancelled) {
        set_error(error, XtransErrorCode::REJECTED, "sender cancelled file " + file_id);
    } else if (is_terminal_locked()) {
        set_error(error, XtransErrorCode::CLOSED, "transport closed while receiving " + file_id);
    } else {
        LOG_PEER_WARN("Receive of " << file_id << " timed out after " << config_.receive_timeout_ms << "ms");
        set_error(error, XtransErrorCode::TRANSFER_TIMEOUT, "file " + file_id + " did not complete in time");
    }
    return std::nullopt;
}

std::optional<ReceivedFile> PeerTransport::receive_file(const std::string& file_id,
                                                        const std::optional<FileMetadata>& metadata,
                                                        TransferProgressCallback progress,
                                                        XtransError* error) {
    if (!begin_receive(file_id, metadata, std::move(progress))) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "already receiving " + file_id);
        return std::nullopt;
    }
    return wait_receive(file_id, error);
}

void PeerTransport::abort_receive(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    receive_sessions_.erase(file_id);
}

bool PeerTransport::accept_file(const std::string& file_id, XtransError* error) {
    return send_data_message(DataMessage::make_file_accept(file_id), error);
}

bool PeerTransport::reject_file(const std::string& file_id, XtransError* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        announced_metadata_.erase(file_id);
    }
    return send_data_message(DataMessage::make_file_reject(file_id), error);
}

std::optional<FileMetadata> PeerTransport::get_announced_metadata(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = announced_metadata_.find(file_id);
    if (it == announced_metadata_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PeerTransport::get_active_receive_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receive_sessions_.size();
}

size_t PeerTransport::get_active_send_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return send_sessions_.size();
}

//=============================================================================
// Handshake
//=============================================================================

void PeerTransport::set_local_identity(const DeviceIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_identity_ = identity;
}

bool PeerTransport::send_handshake(XtransError* error) {
    std::optional<DeviceIdentity> identity;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        identity = local_identity_;
    }
    if (!identity) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "no local identity to announce");
        return false;
    }
    return send_envelope(P2PMessage::make(P2PMessageKind::HANDSHAKE, identity->to_json()), error);
}

void PeerTransport::mark_identity_remapped() {
    std::lock_guard<std::mutex> lock(mutex_);
    identity_remapped_ = true;
}

bool PeerTransport::is_identity_remapped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identity_remapped_;
}

std::optional<DeviceIdentity> PeerTransport::get_remote_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_identity_;
}

void PeerTransport::start_handshake_resends() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handshake_started_) {
            return;
        }
        handshake_started_ = true;
    }

    std::vector<int> delays = config_.handshake_resend_delays_ms;
    add_managed_thread(std::thread([this, delays]() {
        XtransError error;
        if (!send_handshake(&error)) {
            LOG_PEER_DEBUG("Handshake not sent: " << error.message);
        }

        auto started = std::chrono::steady_clock::now();
        for (int delay : delays) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                started + std::chrono::milliseconds(delay) - std::chrono::steady_clock::now());
            if (remaining.count() > 0 && wait_for_shutdown(remaining)) {
                return;
            }
            if (is_shutdown_requested()) {
                return;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (identity_remapped_ || state_ != PeerState::CONNECTED) {
                    LOG_PEER_DEBUG("Skipping handshake re-send");
                    return;
                }
            }

            error = XtransError();
            if (!send_handshake(&error)) {
                LOG_PEER_WARN("Handshake re-send failed: " << error.message);
            }
        }
    }), "handshake-resend");
}

//=============================================================================
// Callbacks
//=============================================================================

void PeerTransport::set_message_callback(PeerMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    message_callback_ = std::move(callback);
}

void PeerTransport::set_state_callback(PeerStateCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    state_callback_ = std::move(callback);
}

void PeerTransport::set_candidate_callback(PeerCandidateCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    candidate_callback_ = std::move(callback);
}

} // namespace xtrans
