#pragma once

/**
 * @file peer_transport.h
 * @brief One reliable ordered channel to one remote peer plus the file/text/handshake protocol over it
 *
 * PeerTransport drives a Transport through offer/answer negotiation and runs the
 * chunk protocol on the resulting channel:
 * - sender: Metadata, wait for FileAccept/FileReject, framed chunks with backpressure, End
 * - receiver: sessions keyed by file id collect chunks until End
 * - handshake: local identity sent on connect and re-sent on a schedule
 *
 * Blocking operations (gathering, accept wait, backpressure, receive) wait on a
 * condition variable and return early with CLOSED when the transport is closed.
 */

#include "transport.h"
#include "messages.h"
#include "device_identity.h"
#include "threadmanager.h"
#include "errors.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xtrans {

enum class PeerState {
    NEW,
    CONNECTING,
    CONNECTED,  // Channel open and usable
    FAILED,
    CLOSED
};

const char* peer_state_to_string(PeerState state);

/**
 * Timing and sizing knobs of the transfer protocol
 */
struct PeerTransportConfig {
    size_t chunk_size = 16 * 1024;
    size_t max_buffered_amount = 16 * 1024 * 1024;     // Backpressure gate
    size_t pacing_threshold = 1024 * 1024;             // Pacing delay above this
    int backpressure_poll_interval_ms = 50;
    int pacing_delay_ms = 10;
    int accept_timeout_ms = 60000;
    int receive_timeout_ms = 300000;
    int ice_gathering_timeout_ms = 2000;
    std::vector<int> handshake_resend_delays_ms = {1000, 3000};   // Offsets from the first handshake
};

/**
 * Transfer progress: bytes done, total bytes, average rate in bytes per second
 */
using TransferProgressCallback = std::function<void(uint64_t bytes_done, uint64_t total_bytes, double rate)>;

using PeerMessageCallback = std::function<void(const InboundMessage& message)>;
using PeerStateCallback = std::function<void(PeerState state)>;
using PeerCandidateCallback = std::function<void(const std::string& candidate)>;

class PeerTransport : public ThreadManager {
public:
    /**
     * Take ownership of a transport and wire its callbacks.
     */
    static std::shared_ptr<PeerTransport> create(std::unique_ptr<Transport> transport,
                                                 const PeerTransportConfig& config = PeerTransportConfig());
    ~PeerTransport() override;

    PeerTransport(const PeerTransport&) = delete;
    PeerTransport& operator=(const PeerTransport&) = delete;

    //=========================================================================
    // Negotiation
    //=========================================================================

    /**
     * Create the local offer. Candidates trickle through the candidate callback afterwards.
     * @return Offer, or empty description on failure
     */
    SessionDescription create_offer(XtransError* error = nullptr);

    /**
     * Apply a remote offer and create the answer. Candidates trickle as for offers.
     */
    SessionDescription create_answer(const SessionDescription& remote_offer, XtransError* error = nullptr);

    /**
     * Offer for out-of-band exchange: waits for candidate gathering (up to
     * ice_gathering_timeout_ms) and returns the local description with the
     * gathered candidates in it.
     */
    SessionDescription create_offline_offer(XtransError* error = nullptr);

    /**
     * Answer for out-of-band exchange, complete with gathered candidates.
     */
    SessionDescription create_offline_answer(const SessionDescription& remote_offer, XtransError* error = nullptr);

    bool set_remote_description(const SessionDescription& answer, XtransError* error = nullptr);

    /**
     * Apply a remote candidate, or queue it until a remote description exists.
     */
    bool add_remote_candidate(const std::string& candidate);

    /**
     * Block until the channel is open, the transport fails, or the timeout expires.
     */
    bool wait_until_connected(std::chrono::milliseconds timeout, XtransError* error = nullptr);

    PeerState get_state() const;
    bool is_connected() const { return get_state() == PeerState::CONNECTED; }

    //=========================================================================
    // Messaging
    //=========================================================================

    /**
     * Send a text message.
     * @return Message id, or empty string on failure
     */
    std::string send_text(const std::string& content, XtransError* error = nullptr);

    bool send_data_message(const DataMessage& message, XtransError* error = nullptr);
    bool send_envelope(const P2PMessage& message, XtransError* error = nullptr);

    /**
     * Send an envelope by kind: TEXT goes out as a text message, FILE runs the
     * file send protocol, CONTROL and HANDSHAKE go out as JSON envelopes.
     */
    bool send_message(const P2PMessage& message, XtransError* error = nullptr);

    //=========================================================================
    // File transfer
    //=========================================================================

    /**
     * Run the send protocol for one file. Blocks until End is sent or the transfer fails.
     * @param file_id_out Receives the generated file id
     */
    bool send_file(const FilePayload& file, TransferProgressCallback progress = nullptr,
                   XtransError* error = nullptr, std::string* file_id_out = nullptr);

    /**
     * Open a receive session. Metadata may be supplied by the caller, taken from an
     * earlier Metadata message, or arrive later. The receive timeout starts here.
     * @return false if a session for file_id is already open
     */
    bool begin_receive(const std::string& file_id,
                       const std::optional<FileMetadata>& metadata = std::nullopt,
                       TransferProgressCallback progress = nullptr);

    /**
     * Wait for the session opened by begin_receive to finish and assemble its payload.
     */
    std::optional<ReceivedFile> wait_receive(const std::string& file_id, XtransError* error = nullptr);

    /**
     * begin_receive followed by wait_receive
     */
    std::optional<ReceivedFile> receive_file(const std::string& file_id,
                                             const std::optional<FileMetadata>& metadata = std::nullopt,
                                             TransferProgressCallback progress = nullptr,
                                             XtransError* error = nullptr);

    /**
     * Drop a receive session without waiting for it.
     */
    void abort_receive(const std::string& file_id);

    bool accept_file(const std::string& file_id, XtransError* error = nullptr);
    bool reject_file(const std::string& file_id, XtransError* error = nullptr);

    /**
     * Metadata announced by the peer for a file nobody is receiving yet
     */
    std::optional<FileMetadata> get_announced_metadata(const std::string& file_id) const;

    size_t get_active_receive_count() const;
    size_t get_active_send_count() const;

    //=========================================================================
    // Handshake
    //=========================================================================

    void set_local_identity(const DeviceIdentity& identity);

    /**
     * Send a Handshake with the local identity now.
     */
    bool send_handshake(XtransError* error = nullptr);

    /**
     * Stop pending handshake re-sends; the peer's identity is known.
     */
    void mark_identity_remapped();
    bool is_identity_remapped() const;

    std::optional<DeviceIdentity> get_remote_identity() const;

    //=========================================================================
    // Callbacks and lifetime
    //=========================================================================

    /**
     * Inbound messages not consumed by a send or receive session.
     */
    void set_message_callback(PeerMessageCallback callback);
    void set_state_callback(PeerStateCallback callback);

    /**
     * Local candidates to trickle to the peer.
     */
    void set_candidate_callback(PeerCandidateCallback callback);

    /**
     * Close the transport. Pending waits return CLOSED. No state callback is invoked.
     */
    void close();

    size_t buffered_amount() const;
    const PeerTransportConfig& get_config() const { return config_; }

private:
    struct SendSession {
        bool answered = false;
        bool accepted = false;
        bool cancelled = false;
    };

    struct ReceiveSession {
        std::optional<FileMetadata> metadata;
        std::vector<uint8_t> data;
        uint32_t chunk_count = 0;
        bool complete = false;
        bool cancelled = false;
        TransferProgressCallback progress;
        std::chrono::steady_clock::time_point started;
        std::chrono::steady_clock::time_point deadline;
    };

    PeerTransport(std::unique_ptr<Transport> transport, const PeerTransportConfig& config);

    void handle_channel_message(const ChannelMessage& message);
    void handle_transport_state(TransportState state);
    void handle_local_candidate(const std::string& candidate);

    // Returns true if a session consumed the message
    bool handle_protocol_message(const DataMessage& message);
    bool handle_chunk(const DataMessage& message);

    bool wait_for_gathering(XtransError* error);
    SessionDescription gathered_description(const SessionDescription& initial, XtransError* error);
    void flush_remote_candidates();
    bool send_raw(const ChannelMessage& message, XtransError* error);
    bool is_terminal_locked() const;
    bool sleep_unless_closed(std::chrono::milliseconds duration);
    void start_handshake_resends();

    std::unique_ptr<Transport> transport_;
    PeerTransportConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    PeerState state_;
    bool closed_;
    bool remote_description_set_;
    std::vector<std::string> pending_candidates_;

    std::unordered_map<std::string, std::shared_ptr<SendSession>> send_sessions_;
    std::unordered_map<std::string, std::shared_ptr<ReceiveSession>> receive_sessions_;
    std::unordered_map<std::string, FileMetadata> announced_metadata_;

    std::optional<DeviceIdentity> local_identity_;
    std::optional<DeviceIdentity> remote_identity_;
    bool identity_remapped_;
    bool handshake_started_;

    mutable std::mutex callbacks_mutex_;
    PeerMessageCallback message_callback_;
    PeerStateCallback state_callback_;
    PeerCandidateCallback candidate_callback_;
};

} // namespace xtrans
