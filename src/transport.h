#pragma once

/**
 * @file transport.h
 * @brief Capability interface of a real-time transport substrate
 *
 * A Transport negotiates one connection through an offer/answer exchange
 * (plus trickled candidates) and then carries a reliable ordered channel.
 * PeerTransport drives it; implementations may deliver callbacks on any thread.
 */

#include "messages.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <cstddef>

namespace xtrans {

enum class TransportState {
    NEW,            // Nothing negotiated yet
    CONNECTING,     // Offer/answer in progress
    CONNECTED,      // Negotiation complete, data path not yet usable
    CHANNEL_OPEN,   // Channel ready for send()
    FAILED,         // Negotiation or channel failed
    CLOSED          // Closed locally or by the peer
};

const char* transport_state_to_string(TransportState state);

/**
 * Offer or answer payload exchanged through signaling
 */
struct SessionDescription {
    std::string type;   // "offer" or "answer"
    std::string sdp;

    SessionDescription() = default;
    SessionDescription(const std::string& description_type, const std::string& sdp_text)
        : type(description_type), sdp(sdp_text) {}

    bool empty() const { return sdp.empty(); }

    nlohmann::json to_json() const;
    std::string to_string() const { return to_json().dump(); }

    static std::optional<SessionDescription> from_json(const nlohmann::json& json);
    static std::optional<SessionDescription> from_string(const std::string& text);
};

using TransportMessageCallback = std::function<void(const ChannelMessage&)>;
using TransportStateCallback = std::function<void(TransportState)>;
// An empty candidate marks the end of local gathering
using TransportCandidateCallback = std::function<void(const std::string& candidate)>;

class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Create the local offer. Candidates may keep trickling through the candidate callback.
     * @return Offer, or empty description on failure
     */
    virtual SessionDescription create_offer(XtransError* error = nullptr) = 0;

    /**
     * Apply a remote offer and create the local answer.
     * @return Answer, or empty description on failure
     */
    virtual SessionDescription create_answer(const SessionDescription& remote_offer,
                                             XtransError* error = nullptr) = 0;

    /**
     * Apply the remote answer (offering side).
     */
    virtual bool set_remote_description(const SessionDescription& description,
                                        XtransError* error = nullptr) = 0;

    virtual bool add_candidate(const std::string& candidate) = 0;

    /**
     * Whether local candidate gathering has finished.
     */
    virtual bool is_gathering_complete() const = 0;

    /**
     * Current local offer or answer, including every candidate gathered so far.
     * @return Empty description before create_offer()/create_answer()
     */
    virtual SessionDescription local_description() const = 0;

    /**
     * Queue a message on the channel.
     * @return false if the channel is not open
     */
    virtual bool send(const ChannelMessage& message) = 0;

    /**
     * Bytes queued by send() that the peer has not yet consumed.
     */
    virtual size_t buffered_amount() const = 0;

    virtual void set_message_callback(TransportMessageCallback callback) = 0;
    virtual void set_state_callback(TransportStateCallback callback) = 0;
    virtual void set_candidate_callback(TransportCandidateCallback callback) = 0;

    virtual void close() = 0;

    virtual TransportState get_state() const = 0;
};

using SignalCallback = std::function<void(const std::string& from_device_id, const nlohmann::json& signal)>;

/**
 * Relay for offer/answer/candidate payloads between devices.
 * Payloads are opaque to the channel; delivery may happen on any thread.
 */
class SignalingChannel {
public:
    virtual ~SignalingChannel() = default;

    virtual bool send_signal(const std::string& to_device_id, const nlohmann::json& signal) = 0;
    virtual void set_signal_callback(SignalCallback callback) = 0;
};

} // namespace xtrans
