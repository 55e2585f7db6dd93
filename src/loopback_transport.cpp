#include "loopback_transport.h"
#include "logger.h"
#include <functional>
#include <sstream>

// Loopback module logging macros
#define LOG_LOOPBACK_DEBUG(message) LOG_DEBUG("loopback", message)
#define LOG_LOOPBACK_INFO(message)  LOG_INFO("loopback", message)
#define LOG_LOOPBACK_WARN(message)  LOG_WARN("loopback", message)
#define LOG_LOOPBACK_ERROR(message) LOG_ERROR("loopback", message)

namespace xtrans {

//=============================================================================
// LoopbackEndpoint
//=============================================================================

/**
 * State shared between a LoopbackTransport, its delivery thread and its peer.
 */
class LoopbackEndpoint {
public:
    struct Event {
        enum class Kind { STATE, CANDIDATE, MESSAGE };

        Kind kind;
        TransportState state;
        std::string candidate;
        ChannelMessage message;
        std::shared_ptr<std::atomic<size_t>> sender_buffered;

        Event() : kind(Kind::STATE), state(TransportState::NEW) {}
    };

    explicit LoopbackEndpoint(const std::string& endpoint_name)
        : name(endpoint_name),
          state(TransportState::NEW),
          gathering_complete(false),
          buffered(std::make_shared<std::atomic<size_t>>(0)),
          remote_candidates(0),
          paused_(false),
          stopped_(false) {}

    const std::string name;
    std::atomic<TransportState> state;
    std::atomic<bool> gathering_complete;
    std::shared_ptr<std::atomic<size_t>> buffered;   // Sent by this endpoint, not yet delivered
    std::atomic<size_t> remote_candidates;

    bool enqueue(Event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!stopped_) {
                queue_.push_back(std::move(event));
                cv_.notify_one();
                return true;
            }
        }
        release(event);
        return false;
    }

    void enqueue_state(TransportState new_state) {
        Event event;
        event.kind = Event::Kind::STATE;
        event.state = new_state;
        enqueue(std::move(event));
    }

    void enqueue_candidate(const std::string& candidate) {
        Event event;
        event.kind = Event::Kind::CANDIDATE;
        event.candidate = candidate;
        enqueue(std::move(event));
    }

    // Local candidates whose gathering has been reported
    std::vector<std::string> get_gathered_candidates() {
        std::lock_guard<std::mutex> lock(mutex_);
        return gathered_;
    }

    void set_paused(bool paused) {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = paused;
        cv_.notify_one();
    }

    void stop() {
        std::deque<Event> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            dropped.swap(queue_);
            cv_.notify_one();
        }
        for (auto& event : dropped) {
            release(event);
        }
    }

    std::shared_ptr<LoopbackEndpoint> get_peer() {
        std::lock_guard<std::mutex> lock(mutex_);
        return peer_.lock();
    }

    void set_peer(const std::shared_ptr<LoopbackEndpoint>& peer) {
        std::lock_guard<std::mutex> lock(mutex_);
        peer_ = peer;
    }

    void set_message_callback(TransportMessageCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        message_callback_ = std::move(callback);
    }

    void set_state_callback(TransportStateCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_callback_ = std::move(callback);
    }

    void set_candidate_callback(TransportCandidateCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        candidate_callback_ = std::move(callback);
    }

    void run() {
        LOG_LOOPBACK_DEBUG("Delivery thread started for " << name);

        while (true) {
            Event event;
            TransportMessageCallback message_callback;
            TransportStateCallback state_callback;
            TransportCandidateCallback candidate_callback;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopped_ || (!paused_ && !queue_.empty()); });
                if (stopped_) {
                    break;
                }
                event = std::move(queue_.front());
                queue_.pop_front();
                message_callback = message_callback_;
                state_callback = state_callback_;
                candidate_callback = candidate_callback_;
            }

            try {
                switch (event.kind) {
                    case Event::Kind::STATE:
                        state.store(event.state);
                        LOG_LOOPBACK_DEBUG(name << " -> " << transport_state_to_string(event.state));
                        if (state_callback) {
                            state_callback(event.state);
                        }
                        break;
                    case Event::Kind::CANDIDATE:
                        if (event.candidate.empty()) {
                            gathering_complete.store(true);
                        } else {
                            std::lock_guard<std::mutex> lock(mutex_);
                            gathered_.push_back(event.candidate);
                        }
                        if (candidate_callback) {
                            candidate_callback(event.candidate);
                        }
                        break;
                    case Event::Kind::MESSAGE:
                        if (message_callback) {
                            message_callback(event.message);
                        }
                        break;
                }
            } catch (const std::exception& e) {
                LOG_LOOPBACK_ERROR("Callback failed on " << name << ": " << e.what());
            } catch (...) {
                LOG_LOOPBACK_ERROR("Callback failed on " << name << " with an unknown exception");
            }

            release(event);
        }

        LOG_LOOPBACK_DEBUG("Delivery thread stopped for " << name);
    }

private:
    // Consumed or dropped messages no longer count against the sender
    static void release(const Event& event) {
        if (event.kind == Event::Kind::MESSAGE && event.sender_buffered) {
            event.sender_buffered->fetch_sub(event.message.size());
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool paused_;
    bool stopped_;
    std::weak_ptr<LoopbackEndpoint> peer_;
    std::vector<std::string> gathered_;
    TransportMessageCallback message_callback_;
    TransportStateCallback state_callback_;
    TransportCandidateCallback candidate_callback_;
};

namespace {

std::string find_attribute(const std::string& sdp, const std::string& attribute) {
    std::string prefix = "a=" + attribute + ":";
    std::istringstream stream(sdp);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.compare(0, prefix.size(), prefix) == 0) {
            return line.substr(prefix.size());
        }
    }
    return "";
}

uint16_t endpoint_port(const std::string& name) {
    return static_cast<uint16_t>(49152 + std::hash<std::string>{}(name) % 16384);
}

// Server-reflexive candidate, reported after the host candidates like a STUN binding result
std::string reflexive_candidate(uint16_t port) {
    return "candidate:4 1 udp 1686052607 203.0.113.7 " + std::to_string(port) +
           " typ srflx raddr 127.0.0.1 rport " + std::to_string(port);
}

} // namespace

//=============================================================================
// LoopbackNetwork
//=============================================================================

LoopbackNetwork::LoopbackNetwork() : next_session_(1) {
}

LoopbackNetwork::~LoopbackNetwork() = default;

void LoopbackNetwork::set_reachable(const std::string& endpoint_name, bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reachable) {
        unreachable_.erase(endpoint_name);
    } else {
        unreachable_.insert(endpoint_name);
    }
}

bool LoopbackNetwork::is_reachable(const std::string& endpoint_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unreachable_.find(endpoint_name) == unreachable_.end();
}

size_t LoopbackNetwork::get_pending_session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::string LoopbackNetwork::open_session(const std::shared_ptr<LoopbackEndpoint>& offerer) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string token = "lb" + std::to_string(next_session_++);
    sessions_[token].offerer = offerer;
    return token;
}

std::shared_ptr<LoopbackEndpoint> LoopbackNetwork::join_session(const std::string& token,
                                                                const std::shared_ptr<LoopbackEndpoint>& answerer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(token);
    if (it == sessions_.end() || !it->second.answerer.expired()) {
        return nullptr;
    }
    auto offerer = it->second.offerer.lock();
    if (!offerer) {
        sessions_.erase(it);
        return nullptr;
    }
    it->second.answerer = answerer;
    return offerer;
}

std::shared_ptr<LoopbackEndpoint> LoopbackNetwork::complete_session(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto answerer = it->second.answerer.lock();
    sessions_.erase(it);
    return answerer;
}

//=============================================================================
// LoopbackTransport
//=============================================================================

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackNetwork> network, const std::string& endpoint_name)
    : network_(std::move(network)),
      endpoint_name_(endpoint_name),
      endpoint_(std::make_shared<LoopbackEndpoint>(endpoint_name)),
      offering_(false),
      closed_(false) {
    std::shared_ptr<LoopbackEndpoint> endpoint = endpoint_;
    delivery_thread_ = std::thread([endpoint]() { endpoint->run(); });
}

LoopbackTransport::~LoopbackTransport() {
    close();
}

std::string LoopbackTransport::build_description(const std::string& type,
                                                 const std::vector<std::string>& gathered) const {
    uint16_t port = endpoint_port(endpoint_name_);

    std::ostringstream sdp;
    sdp << "v=0\r\n"
        << "o=- " << session_token_ << " 2 IN IP4 127.0.0.1\r\n"
        << "s=-\r\n"
        << "t=0 0\r\n"
        << "a=group:BUNDLE 0\r\n"
        << "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
        << "c=IN IP4 0.0.0.0\r\n"
        << "a=setup:" << (type == "offer" ? "actpass" : "active") << "\r\n"
        << "a=mid:0\r\n"
        << "a=xtrans-session:" << session_token_ << "\r\n"
        << "a=xtrans-endpoint:" << endpoint_name_ << "\r\n"
        << "a=candidate:1 1 udp 2122260223 127.0.0.1 " << port << " typ host generation 0\r\n"
        << "a=candidate:2 1 udp 2122194687 10.0.0.2 " << port << " typ host generation 0\r\n"
        << "a=candidate:3 1 tcp 1518280447 127.0.0.1 9 typ host tcptype active generation 0\r\n";
    for (const auto& candidate : gathered) {
        sdp << (candidate.compare(0, 2, "a=") == 0 ? "" : "a=") << candidate << "\r\n";
    }
    sdp << "a=sctp-port:5000\r\n"
        << "a=max-message-size:262144\r\n";
    return sdp.str();
}

SessionDescription LoopbackTransport::create_offer(XtransError* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !session_token_.empty()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT,
                  closed_ ? "transport is closed" : "negotiation already started");
        return SessionDescription();
    }

    session_token_ = network_->open_session(endpoint_);
    offering_ = true;

    endpoint_->enqueue_state(TransportState::CONNECTING);
    endpoint_->enqueue_candidate(reflexive_candidate(endpoint_port(endpoint_name_)));
    endpoint_->enqueue_candidate("");

    LOG_LOOPBACK_DEBUG(endpoint_name_ << " created offer for session " << session_token_);
    return SessionDescription("offer", build_description("offer", {}));
}

SessionDescription LoopbackTransport::create_answer(const SessionDescription& remote_offer, XtransError* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !session_token_.empty()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT,
                  closed_ ? "transport is closed" : "negotiation already started");
        return SessionDescription();
    }
    if (remote_offer.type != "offer") {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "expected an offer, got '" + remote_offer.type + "'");
        return SessionDescription();
    }

    std::string token = find_attribute(remote_offer.sdp, "xtrans-session");
    if (token.empty()) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "offer carries no loopback session");
        return SessionDescription();
    }

    if (!network_->join_session(token, endpoint_)) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "unknown loopback session " + token);
        return SessionDescription();
    }

    session_token_ = token;
    offering_ = false;

    endpoint_->enqueue_state(TransportState::CONNECTING);
    endpoint_->enqueue_candidate(reflexive_candidate(endpoint_port(endpoint_name_)));
    endpoint_->enqueue_candidate("");

    LOG_LOOPBACK_DEBUG(endpoint_name_ << " answered session " << session_token_);
    return SessionDescription("answer", build_description("answer", {}));
}

bool LoopbackTransport::set_remote_description(const SessionDescription& description, XtransError* error) {
    std::string token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            set_error(error, XtransErrorCode::CLOSED, "transport is closed");
            return false;
        }
        if (!offering_ || description.type != "answer") {
            set_error(error, XtransErrorCode::INVALID_ARGUMENT, "remote description must answer a local offer");
            return false;
        }
        token = find_attribute(description.sdp, "xtrans-session");
        if (token != session_token_) {
            set_error(error, XtransErrorCode::INVALID_ARGUMENT, "answer belongs to another session");
            return false;
        }
    }

    auto answerer = network_->complete_session(token);
    if (!answerer) {
        set_error(error, XtransErrorCode::INVALID_ARGUMENT, "session " + token + " is no longer pending");
        return false;
    }

    if (!network_->is_reachable(endpoint_name_) || !network_->is_reachable(answerer->name)) {
        LOG_LOOPBACK_INFO("Session " << token << " between " << endpoint_name_ << " and "
                          << answerer->name << " has no usable path");
        endpoint_->enqueue_state(TransportState::FAILED);
        answerer->enqueue_state(TransportState::FAILED);
        return true;
    }

    endpoint_->set_peer(answerer);
    answerer->set_peer(endpoint_);

    endpoint_->enqueue_state(TransportState::CONNECTED);
    answerer->enqueue_state(TransportState::CONNECTED);
    endpoint_->enqueue_state(TransportState::CHANNEL_OPEN);
    answerer->enqueue_state(TransportState::CHANNEL_OPEN);

    LOG_LOOPBACK_DEBUG("Session " << token << " linked " << endpoint_name_ << " <-> " << answerer->name);
    return true;
}

bool LoopbackTransport::add_candidate(const std::string& candidate) {
    if (candidate.empty()) {
        return true;
    }
    if (candidate.compare(0, 10, "candidate:") != 0 && candidate.compare(0, 12, "a=candidate:") != 0) {
        LOG_LOOPBACK_WARN(endpoint_name_ << " ignoring malformed candidate: " << candidate);
        return false;
    }
    endpoint_->remote_candidates.fetch_add(1);
    return true;
}

bool LoopbackTransport::is_gathering_complete() const {
    return endpoint_->gathering_complete.load();
}

SessionDescription LoopbackTransport::local_description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_token_.empty()) {
        return SessionDescription();
    }
    const char* type = offering_ ? "offer" : "answer";
    return SessionDescription(type, build_description(type, endpoint_->get_gathered_candidates()));
}

bool LoopbackTransport::send(const ChannelMessage& message) {
    if (endpoint_->state.load() != TransportState::CHANNEL_OPEN) {
        return false;
    }

    auto peer = endpoint_->get_peer();
    if (!peer) {
        return false;
    }

    LoopbackEndpoint::Event event;
    event.kind = LoopbackEndpoint::Event::Kind::MESSAGE;
    event.message = message;
    event.sender_buffered = endpoint_->buffered;

    endpoint_->buffered->fetch_add(message.size());
    return peer->enqueue(std::move(event));
}

size_t LoopbackTransport::buffered_amount() const {
    return endpoint_->buffered->load();
}

void LoopbackTransport::set_message_callback(TransportMessageCallback callback) {
    endpoint_->set_message_callback(std::move(callback));
}

void LoopbackTransport::set_state_callback(TransportStateCallback callback) {
    endpoint_->set_state_callback(std::move(callback));
}

void LoopbackTransport::set_candidate_callback(TransportCandidateCallback callback) {
    endpoint_->set_candidate_callback(std::move(callback));
}

void LoopbackTransport::close() {
    std::string pending_token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        if (offering_) {
            pending_token = session_token_;
        }
    }

    if (!pending_token.empty()) {
        // Drop an offer nobody answered
        network_->complete_session(pending_token);
    }

    auto peer = endpoint_->get_peer();
    if (peer) {
        peer->enqueue_state(TransportState::CLOSED);
    }

    stop_delivery_thread();
    endpoint_->state.store(TransportState::CLOSED);
    LOG_LOOPBACK_DEBUG(endpoint_name_ << " closed");
}

TransportState LoopbackTransport::get_state() const {
    return endpoint_->state.load();
}

void LoopbackTransport::set_delivery_paused(bool paused) {
    endpoint_->set_paused(paused);
}

void LoopbackTransport::inject_message(const ChannelMessage& message) {
    LoopbackEndpoint::Event event;
    event.kind = LoopbackEndpoint::Event::Kind::MESSAGE;
    event.message = message;
    endpoint_->enqueue(std::move(event));
}

size_t LoopbackTransport::get_remote_candidate_count() const {
    return endpoint_->remote_candidates.load();
}

bool LoopbackTransport::stop_delivery_thread() {
    endpoint_->stop();

    if (!delivery_thread_.joinable()) {
        return false;
    }
    if (delivery_thread_.get_id() == std::this_thread::get_id()) {
        // Closed from one of our own callbacks; the thread holds the endpoint alive
        delivery_thread_.detach();
    } else {
        delivery_thread_.join();
    }
    return true;
}

//=============================================================================
// LoopbackSignalingHub
//=============================================================================

class LoopbackSignalingHub::Channel : public SignalingChannel {
public:
    Channel(LoopbackSignalingHub* hub, const std::string& device_id)
        : hub_(hub), device_id_(device_id) {}

    ~Channel() override {
        hub_->unregister_device(device_id_);
    }

    bool send_signal(const std::string& to_device_id, const nlohmann::json& signal) override {
        return hub_->post(device_id_, to_device_id, signal);
    }

    void set_signal_callback(SignalCallback callback) override {
        hub_->register_device(device_id_, std::move(callback));
    }

private:
    LoopbackSignalingHub* hub_;
    std::string device_id_;
};

LoopbackSignalingHub::LoopbackSignalingHub()
    : dispatching_(false), dispatched_count_(0), dropped_count_(0) {
    add_managed_thread(std::thread([this]() { dispatch_loop(); }), "signaling-dispatch");
}

LoopbackSignalingHub::~LoopbackSignalingHub() {
    shutdown_all_threads();
    join_all_active_threads();
}

std::unique_ptr<SignalingChannel> LoopbackSignalingHub::create_channel(const std::string& device_id) {
    return std::unique_ptr<SignalingChannel>(new Channel(this, device_id));
}

bool LoopbackSignalingHub::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !dispatching_; });
}

bool LoopbackSignalingHub::post(const std::string& from, const std::string& to, const nlohmann::json& signal) {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (is_shutdown_requested()) {
        return false;
    }
    queue_.push_back(Envelope{from, to, signal});
    shutdown_cv_.notify_all();
    return true;
}

void LoopbackSignalingHub::register_device(const std::string& device_id, SignalCallback callback) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    devices_[device_id] = std::make_shared<SignalCallback>(std::move(callback));
}

void LoopbackSignalingHub::unregister_device(const std::string& device_id) {
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        devices_.erase(device_id);
    }

    // Let an in-flight delivery to this device finish before its owner goes away
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    if (dispatcher_id_ == std::this_thread::get_id()) {
        return;
    }
    idle_cv_.wait(lock, [this, &device_id] { return !dispatching_ || current_target_ != device_id; });
}

void LoopbackSignalingHub::dispatch_loop() {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        dispatcher_id_ = std::this_thread::get_id();
    }

    while (true) {
        Envelope envelope;
        {
            std::unique_lock<std::mutex> lock(shutdown_mutex_);
            dispatching_ = false;
            current_target_.clear();
            idle_cv_.notify_all();

            shutdown_cv_.wait(lock, [this] { return is_shutdown_requested() || !queue_.empty(); });
            if (is_shutdown_requested()) {
                break;
            }

            envelope = std::move(queue_.front());
            queue_.pop_front();
            dispatching_ = true;
            current_target_ = envelope.to;
        }

        std::shared_ptr<SignalCallback> callback;
        {
            std::lock_guard<std::mutex> lock(devices_mutex_);
            auto it = devices_.find(envelope.to);
            if (it != devices_.end()) {
                callback = it->second;
            }
        }

        if (!callback || !*callback) {
            dropped_count_.fetch_add(1);
            LOG_LOOPBACK_WARN("Dropping signal from " << envelope.from << " to unknown device " << envelope.to);
            continue;
        }

        try {
            (*callback)(envelope.from, envelope.signal);
        } catch (const std::exception& e) {
            LOG_LOOPBACK_ERROR("Signal handler of " << envelope.to << " failed: " << e.what());
        } catch (...) {
            LOG_LOOPBACK_ERROR("Signal handler of " << envelope.to << " failed with an unknown exception");
        }
        dispatched_count_.fetch_add(1);
    }

    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    dispatching_ = false;
    current_target_.clear();
    idle_cv_.notify_all();
}

} // namespace xtrans
