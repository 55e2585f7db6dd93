#pragma once

/**
 * @file loopback_transport.h
 * @brief In-process Transport and SignalingChannel implementations
 *
 * LoopbackTransport endpoints created on the same LoopbackNetwork negotiate with
 * line-oriented SDP carrying a session token, then exchange messages in order.
 * Every endpoint delivers its inbound events (state changes, candidates, messages)
 * on its own delivery thread, like a browser event loop would.
 */

#include "transport.h"
#include "threadmanager.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <thread>
#include <unordered_map>

namespace xtrans {

class LoopbackEndpoint;

/**
 * Rendezvous point for loopback sessions
 */
class LoopbackNetwork {
public:
    LoopbackNetwork();
    ~LoopbackNetwork();

    /**
     * Mark an endpoint unreachable. Sessions involving it fail once the
     * answer is applied, the way ICE fails without a usable candidate pair.
     */
    void set_reachable(const std::string& endpoint_name, bool reachable);
    bool is_reachable(const std::string& endpoint_name) const;

    size_t get_pending_session_count() const;

private:
    friend class LoopbackTransport;

    struct Session {
        std::weak_ptr<LoopbackEndpoint> offerer;
        std::weak_ptr<LoopbackEndpoint> answerer;
    };

    std::string open_session(const std::shared_ptr<LoopbackEndpoint>& offerer);
    std::shared_ptr<LoopbackEndpoint> join_session(const std::string& token,
                                                   const std::shared_ptr<LoopbackEndpoint>& answerer);
    std::shared_ptr<LoopbackEndpoint> complete_session(const std::string& token);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::set<std::string> unreachable_;
    uint64_t next_session_;
};

/**
 * Transport implementation over a LoopbackNetwork
 */
class LoopbackTransport : public Transport {
public:
    LoopbackTransport(std::shared_ptr<LoopbackNetwork> network, const std::string& endpoint_name);
    ~LoopbackTransport() override;

    SessionDescription create_offer(XtransError* error = nullptr) override;
    SessionDescription create_answer(const SessionDescription& remote_offer,
                                     XtransError* error = nullptr) override;
    bool set_remote_description(const SessionDescription& description,
                                XtransError* error = nullptr) override;
    bool add_candidate(const std::string& candidate) override;
    bool is_gathering_complete() const override;
    SessionDescription local_description() const override;

    bool send(const ChannelMessage& message) override;
    size_t buffered_amount() const override;

    void set_message_callback(TransportMessageCallback callback) override;
    void set_state_callback(TransportStateCallback callback) override;
    void set_candidate_callback(TransportCandidateCallback callback) override;

    void close() override;
    TransportState get_state() const override;

    const std::string& get_endpoint_name() const { return endpoint_name_; }

    // Test hooks

    /**
     * Hold inbound delivery. Messages sent by the peer stay counted in its buffered amount.
     */
    void set_delivery_paused(bool paused);

    /**
     * Deliver a message as if the peer had sent it.
     */
    void inject_message(const ChannelMessage& message);

    size_t get_remote_candidate_count() const;

private:
    std::string build_description(const std::string& type, const std::vector<std::string>& gathered) const;
    bool stop_delivery_thread();

    std::shared_ptr<LoopbackNetwork> network_;
    std::string endpoint_name_;
    std::shared_ptr<LoopbackEndpoint> endpoint_;
    std::thread delivery_thread_;
    std::string session_token_;
    bool offering_;
    bool closed_;
    mutable std::mutex mutex_;
};

/**
 * In-process signaling relay. Signals are dispatched asynchronously, in order,
 * on the hub's dispatcher thread.
 */
class LoopbackSignalingHub : public ThreadManager {
public:
    LoopbackSignalingHub();
    ~LoopbackSignalingHub() override;

    /**
     * Create the signaling channel of a device. The hub must outlive the channel.
     */
    std::unique_ptr<SignalingChannel> create_channel(const std::string& device_id);

    /**
     * Wait until every queued signal has been dispatched.
     */
    bool wait_idle(std::chrono::milliseconds timeout);

    uint64_t get_dispatched_count() const { return dispatched_count_.load(); }
    uint64_t get_dropped_count() const { return dropped_count_.load(); }

private:
    class Channel;

    struct Envelope {
        std::string from;
        std::string to;
        nlohmann::json signal;
    };

    bool post(const std::string& from, const std::string& to, const nlohmann::json& signal);
    void register_device(const std::string& device_id, SignalCallback callback);
    void unregister_device(const std::string& device_id);
    void dispatch_loop();

    std::deque<Envelope> queue_;
    std::unordered_map<std::string, std::shared_ptr<SignalCallback>> devices_;
    std::mutex devices_mutex_;
    std::condition_variable idle_cv_;
    bool dispatching_;
    std::string current_target_;
    std::thread::id dispatcher_id_;
    std::atomic<uint64_t> dispatched_count_;
    std::atomic<uint64_t> dropped_count_;
};

} // namespace xtrans
