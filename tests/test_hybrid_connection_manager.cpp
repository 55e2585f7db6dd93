#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "hybrid_connection_manager.h"
#include "loopback_transport.h"
#include "signaling_codec.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace xtrans;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

namespace {

class MockSignalingChannel : public SignalingChannel {
public:
    MOCK_METHOD(bool, send_signal, (const std::string& to_device_id, const nlohmann::json& signal), (override));
    MOCK_METHOD(void, set_signal_callback, (SignalCallback callback), (override));
};

MATCHER_P(IsOfferOfKind, kind, "") {
    return arg.is_object() && arg.value("type", "") == "offer" && arg.value("kind", "") == kind &&
           arg.value("from", "") == "dave" && arg.contains("description");
}

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

class EventLog {
public:
    void attach(HybridConnectionManager& manager) {
        manager.add_event_listener([this](const ConnectionEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });
    }

    std::vector<ConnectionEvent> of_type(ConnectionEventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ConnectionEvent> found;
        for (const auto& event : events_) {
            if (event.type == type) {
                found.push_back(event);
            }
        }
        return found;
    }

    bool saw_status(const std::string& device_id, ConnectionStatus status) {
        for (const auto& event : of_type(ConnectionEventType::CONNECTION_STATE_CHANGED)) {
            if (event.device_id == device_id && event.state && event.state->status == status) {
                return true;
            }
        }
        return false;
    }

    std::optional<ConnectionEvent> find_text(const std::string& content) {
        for (const auto& event : of_type(ConnectionEventType::MESSAGE_RECEIVED)) {
            if (event.message && event.message->kind == P2PMessageKind::TEXT &&
                event.message->protocol && event.message->protocol->content == content) {
                return event;
            }
        }
        return std::nullopt;
    }

    std::optional<FileMetadata> find_metadata(const std::string& name) {
        for (const auto& event : of_type(ConnectionEventType::MESSAGE_RECEIVED)) {
            if (event.message && event.message->protocol &&
                event.message->protocol->type == DataMessageType::METADATA &&
                event.message->protocol->metadata.name == name) {
                return event.message->protocol->metadata;
            }
        }
        return std::nullopt;
    }

private:
    std::mutex mutex_;
    std::vector<ConnectionEvent> events_;
};

std::vector<uint8_t> make_payload(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i * 13 + 5);
    }
    return data;
}

} // namespace

class HybridConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<LoopbackNetwork>();

        strategy_.connect_timeout_ms = 2000;

        transport_config_.chunk_size = 4096;
        transport_config_.accept_timeout_ms = 5000;
        transport_config_.receive_timeout_ms = 5000;
        transport_config_.ice_gathering_timeout_ms = 500;
        transport_config_.handshake_resend_delays_ms.clear();

        alice_ = make_manager("alice");
        bob_ = make_manager("bob");
        alice_events_.attach(*alice_);
        bob_events_.attach(*bob_);

        alice_identity_ = DeviceIdentity("alice", "Alice's laptop");
        bob_identity_ = DeviceIdentity("bob", "Bob's phone");
        bob_identity_.device_type = DeviceType::MOBILE;
        alice_->set_local_identity(alice_identity_);
        bob_->set_local_identity(bob_identity_);
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
    }

    std::unique_ptr<HybridConnectionManager> make_manager(const std::string& local_id) {
        auto network = network_;
        TransportFactory factory = [this, network, local_id](TransportKind kind, const std::string&) {
            auto transport = new LoopbackTransport(network, local_id + ":" + transport_kind_to_string(kind));
            std::lock_guard<std::mutex> lock(transports_mutex_);
            latest_transport_[local_id] = transport;
            return std::unique_ptr<Transport>(transport);
        };
        return std::unique_ptr<HybridConnectionManager>(
            new HybridConnectionManager(factory, hub_.create_channel(local_id), strategy_, transport_config_));
    }

    // Valid while the manager keeps the connection open
    LoopbackTransport* latest_transport(const std::string& local_id) {
        std::lock_guard<std::mutex> lock(transports_mutex_);
        auto it = latest_transport_.find(local_id);
        return it == latest_transport_.end() ? nullptr : it->second;
    }

    bool bob_sees_alice_connected() {
        return wait_until([this] {
            auto state = bob_->get_connection_state("alice");
            return state && state->status == ConnectionStatus::CONNECTED;
        });
    }

    std::shared_ptr<LoopbackNetwork> network_;
    std::mutex transports_mutex_;
    std::map<std::string, LoopbackTransport*> latest_transport_;
    LoopbackSignalingHub hub_;
    ConnectionStrategy strategy_;
    PeerTransportConfig transport_config_;
    std::unique_ptr<HybridConnectionManager> alice_;
    std::unique_ptr<HybridConnectionManager> bob_;
    EventLog alice_events_;
    EventLog bob_events_;
    DeviceIdentity alice_identity_;
    DeviceIdentity bob_identity_;
};

//=============================================================================
// Connections
//=============================================================================

TEST_F(HybridConnectionManagerTest, ConnectsOverPreferredKind) {
    XtransError error;
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_, &error)) << error.to_string();

    auto state = alice_->get_connection_state("bob");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, ConnectionStatus::CONNECTED);
    EXPECT_EQ(state->transport_kind, TransportKind::PRIMARY);
    EXPECT_TRUE(state->latency_ms.has_value());

    EXPECT_TRUE(alice_events_.saw_status("bob", ConnectionStatus::CONNECTING));
    EXPECT_TRUE(alice_events_.saw_status("bob", ConnectionStatus::CONNECTED));
    EXPECT_EQ(alice_->get_active_connections().size(), 1u);

    // The responder publishes its side once the channel opens
    ASSERT_TRUE(bob_sees_alice_connected());
    EXPECT_TRUE(wait_until([this] { return bob_events_.saw_status("alice", ConnectionStatus::CONNECTED); }));
    EXPECT_EQ(bob_->get_connection_state("alice")->transport_kind, TransportKind::PRIMARY);
}

TEST_F(HybridConnectionManagerTest, FallsBackWhenPreferredKindFails) {
    network_->set_reachable("bob:primary", false);

    XtransError error;
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_, &error)) << error.to_string();

    auto state = alice_->get_connection_state("bob");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, ConnectionStatus::CONNECTED);
    EXPECT_EQ(state->transport_kind, TransportKind::SECONDARY);
    EXPECT_TRUE(alice_events_.saw_status("bob", ConnectionStatus::FAILED));

    ASSERT_TRUE(bob_sees_alice_connected());
    EXPECT_EQ(bob_->get_connection_state("alice")->transport_kind, TransportKind::SECONDARY);
}

TEST_F(HybridConnectionManagerTest, AllKindsFailing) {
    network_->set_reachable("bob:primary", false);
    network_->set_reachable("bob:secondary", false);

    XtransError error;
    EXPECT_FALSE(alice_->connect_to_device("bob", bob_identity_, &error));
    EXPECT_EQ(error.code, XtransErrorCode::CONNECT_ALL_FAILED);

    auto state = alice_->get_connection_state("bob");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, ConnectionStatus::FAILED);
    EXPECT_TRUE(alice_->get_active_connections().empty());
}

TEST_F(HybridConnectionManagerTest, RetryAttemptsBoundFallbacks) {
    strategy_.retry_attempts = 1;
    auto carol = make_manager("carol");
    carol->set_local_identity(DeviceIdentity("carol", "Carol's tablet"));
    network_->set_reachable("bob:primary", false);

    XtransError error;
    EXPECT_FALSE(carol->connect_to_device("bob", bob_identity_, &error));
    EXPECT_EQ(error.code, XtransErrorCode::CONNECT_ALL_FAILED);
    EXPECT_EQ(carol->get_connection_state("bob")->transport_kind, TransportKind::PRIMARY);
}

TEST_F(HybridConnectionManagerTest, ConnectRequiresIds) {
    XtransError error;
    EXPECT_FALSE(alice_->connect_to_device("", bob_identity_, &error));
    EXPECT_EQ(error.code, XtransErrorCode::INVALID_ARGUMENT);

    auto anonymous = make_manager("anonymous");
    error = XtransError();
    EXPECT_FALSE(anonymous->connect_to_device("bob", bob_identity_, &error));
    EXPECT_EQ(error.code, XtransErrorCode::CONNECT_ALL_FAILED);
}

TEST_F(HybridConnectionManagerTest, ReusesEstablishedConnection) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    size_t connecting = 0;
    for (const auto& event : alice_events_.of_type(ConnectionEventType::CONNECTION_STATE_CHANGED)) {
        if (event.state && event.state->status == ConnectionStatus::CONNECTING) {
            connecting++;
        }
    }

    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));

    size_t after = 0;
    for (const auto& event : alice_events_.of_type(ConnectionEventType::CONNECTION_STATE_CHANGED)) {
        if (event.state && event.state->status == ConnectionStatus::CONNECTING) {
            after++;
        }
    }
    EXPECT_EQ(after, connecting);
    EXPECT_EQ(alice_->get_active_connections().size(), 1u);
}

TEST_F(HybridConnectionManagerTest, TrickledCandidatesReachBothSides) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    LoopbackTransport* responder = latest_transport("bob");
    LoopbackTransport* initiator = latest_transport("alice");
    ASSERT_NE(responder, nullptr);
    ASSERT_NE(initiator, nullptr);
    EXPECT_TRUE(wait_until([responder] { return responder->get_remote_candidate_count() >= 1; }));
    EXPECT_TRUE(wait_until([initiator] { return initiator->get_remote_candidate_count() >= 1; }));
}

TEST_F(HybridConnectionManagerTest, CandidateAheadOfOfferIsKept) {
    LoopbackTransport carol(network_, "carol:primary");
    SessionDescription offer = carol.create_offer();
    ASSERT_FALSE(offer.empty());

    nlohmann::json candidate = {{"type", "candidate"}, {"kind", "primary"}, {"from", "carol"},
                                {"candidate", "candidate:1 1 udp 2130706431 127.0.0.1 40001 typ host"}};
    bob_->handle_signal("carol", candidate);
    // A candidate for another kind is not applied to the primary transport
    candidate["kind"] = "secondary";
    bob_->handle_signal("carol", candidate);
    EXPECT_EQ(bob_->get_registry().size(), 0u);

    nlohmann::json signal = {{"type", "offer"}, {"kind", "primary"}, {"from", "carol"}};
    signal["description"] = offer.to_json();
    bob_->handle_signal("carol", signal);

    ASSERT_TRUE(bob_->get_connection_state("carol").has_value());
    LoopbackTransport* responder = latest_transport("bob");
    ASSERT_NE(responder, nullptr);
    EXPECT_EQ(responder->get_remote_candidate_count(), 1u);
}

TEST_F(HybridConnectionManagerTest, DisconnectIsIdempotent) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    alice_->disconnect("bob");
    alice_->disconnect("bob");
    alice_->disconnect("nobody");

    EXPECT_EQ(alice_->get_connection_state("bob")->status, ConnectionStatus::DISCONNECTED);
    EXPECT_TRUE(alice_->get_active_connections().empty());

    // The peer notices the closed channel
    EXPECT_TRUE(wait_until([this] {
        auto state = bob_->get_connection_state("alice");
        return state && state->status == ConnectionStatus::DISCONNECTED;
    }));

    XtransError error;
    EXPECT_TRUE(alice_->send_text("bob", "after disconnect", &error).empty());
    EXPECT_EQ(error.code, XtransErrorCode::NOT_FOUND);

    // A later connect starts over
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    EXPECT_EQ(alice_->get_connection_state("bob")->status, ConnectionStatus::CONNECTED);
}

//=============================================================================
// Messaging
//=============================================================================

TEST_F(HybridConnectionManagerTest, SendToUnknownDeviceFails) {
    XtransError error;
    EXPECT_TRUE(alice_->send_text("ghost", "hello?", &error).empty());
    EXPECT_EQ(error.code, XtransErrorCode::NOT_FOUND);

    error = XtransError();
    EXPECT_FALSE(alice_->send_message("ghost", P2PMessage::make(P2PMessageKind::CONTROL, {{"a", 1}}), &error));
    EXPECT_EQ(error.code, XtransErrorCode::NOT_FOUND);

    error = XtransError();
    EXPECT_FALSE(alice_->send_file("ghost", FilePayload("x.bin", "", make_payload(10)), nullptr, &error));
    EXPECT_EQ(error.code, XtransErrorCode::NOT_FOUND);

    error = XtransError();
    EXPECT_FALSE(alice_->receive_file("ghost", "file-1", std::nullopt, nullptr, &error).has_value());
    EXPECT_EQ(error.code, XtransErrorCode::NOT_FOUND);

    error = XtransError();
    EXPECT_FALSE(alice_->reject_file("ghost", "file-1", &error));
    EXPECT_EQ(error.code, XtransErrorCode::NOT_FOUND);
}

TEST_F(HybridConnectionManagerTest, TextArrivesAsMessageEvent) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    XtransError error;
    std::string id = alice_->send_text("bob", "hello bob", &error);
    ASSERT_FALSE(id.empty()) << error.to_string();

    ASSERT_TRUE(wait_until([this] { return bob_events_.find_text("hello bob").has_value(); }));
    auto event = bob_events_.find_text("hello bob");
    EXPECT_EQ(event->device_id, "alice");
    EXPECT_EQ(event->message->id, id);
}

TEST_F(HybridConnectionManagerTest, PerDeviceHandlerTakesMessages) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    std::mutex mutex;
    std::vector<std::string> texts;
    bob_->on_message("alice", [&](const std::string& device_id, const P2PMessage& message) {
        if (message.kind == P2PMessageKind::TEXT && message.protocol) {
            std::lock_guard<std::mutex> lock(mutex);
            texts.push_back(device_id + ":" + message.protocol->content);
        }
    });

    ASSERT_FALSE(alice_->send_text("bob", "to the handler").empty());
    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return texts.size() == 1;
    }));
    EXPECT_EQ(texts[0], "alice:to the handler");
    EXPECT_FALSE(bob_events_.find_text("to the handler").has_value());

    // Without the handler messages go back to the event listeners
    bob_->off_message("alice");
    ASSERT_FALSE(alice_->send_text("bob", "to the listeners").empty());
    EXPECT_TRUE(wait_until([this] { return bob_events_.find_text("to the listeners").has_value(); }));
}

TEST_F(HybridConnectionManagerTest, ThrowingListenerDoesNotStopOthers) {
    bob_->add_event_listener([](const ConnectionEvent&) {
        throw std::runtime_error("listener failure");
    });
    bob_->add_event_listener([](const ConnectionEvent&) {
        throw 42;
    });
    alice_->add_event_listener([](const ConnectionEvent&) {
        throw 42;
    });
    EventLog late;
    late.attach(*bob_);

    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());
    ASSERT_FALSE(alice_->send_text("bob", "still delivered").empty());

    EXPECT_TRUE(wait_until([&late] { return late.find_text("still delivered").has_value(); }));
    EXPECT_TRUE(alice_events_.saw_status("bob", ConnectionStatus::CONNECTED));
}

TEST_F(HybridConnectionManagerTest, ThrowingHandlerKeepsChannelOpen) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    std::atomic<int> calls(0);
    bob_->on_message("alice", [&calls](const std::string&, const P2PMessage& message) {
        if (message.kind == P2PMessageKind::TEXT) {
            calls++;
        }
        throw 42;
    });

    ASSERT_FALSE(alice_->send_text("bob", "first").empty());
    ASSERT_FALSE(alice_->send_text("bob", "second").empty());
    EXPECT_TRUE(wait_until([&calls] { return calls.load() == 2; }));
    EXPECT_EQ(bob_->get_connection_state("alice")->status, ConnectionStatus::CONNECTED);
}

TEST_F(HybridConnectionManagerTest, DestructionWaitsForRunningListener) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    std::atomic<bool> running(false);
    std::atomic<bool> finished(false);
    alice_->add_event_listener([&running, &finished](const ConnectionEvent& event) {
        if (event.device_id == "bob" && event.state && event.state->status == ConnectionStatus::DISCONNECTED) {
            running = true;
            std::this_thread::sleep_for(300ms);
            finished = true;
        }
    });

    // Closing bob drops alice's channel, which alice handles on its delivery thread
    bob_.reset();
    ASSERT_TRUE(wait_until([&running] { return running.load(); }));
    alice_.reset();
    EXPECT_TRUE(finished.load());
}

TEST_F(HybridConnectionManagerTest, RemovedListenerStopsReceiving) {
    std::atomic<int> calls(0);
    int id = alice_->add_event_listener([&calls](const ConnectionEvent&) { calls++; });
    EXPECT_TRUE(alice_->remove_event_listener(id));
    EXPECT_FALSE(alice_->remove_event_listener(id));

    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(HybridConnectionManagerTest, FileTransfer) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    std::vector<uint8_t> data = make_payload(30 * 1024 + 3);
    std::atomic<bool> sent(false);
    XtransError send_error;
    std::string file_id;

    std::thread sender([&]() {
        sent = alice_->send_file("bob", FilePayload("photo.jpg", "image/jpeg", data), nullptr,
                                 &send_error, &file_id);
    });

    std::optional<FileMetadata> metadata;
    ASSERT_TRUE(wait_until([&] {
        metadata = bob_events_.find_metadata("photo.jpg");
        return metadata.has_value();
    }));
    EXPECT_EQ(metadata->size, data.size());
    EXPECT_EQ(metadata->mime_type, "image/jpeg");

    uint64_t last_done = 0;
    XtransError receive_error;
    auto received = bob_->receive_file("alice", metadata->file_id, metadata,
        [&last_done](uint64_t done, uint64_t, double) { last_done = done; }, &receive_error);
    sender.join();

    ASSERT_TRUE(received.has_value()) << receive_error.to_string();
    EXPECT_TRUE(sent.load()) << send_error.to_string();
    EXPECT_EQ(received->data, data);
    EXPECT_EQ(received->metadata.name, "photo.jpg");
    EXPECT_EQ(last_done, data.size());
    EXPECT_EQ(file_id, metadata->file_id);
}

TEST_F(HybridConnectionManagerTest, RejectedFile) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    std::atomic<bool> sent(true);
    XtransError send_error;
    std::thread sender([&]() {
        sent = alice_->send_file("bob", FilePayload("spam.exe", "", make_payload(1024)), nullptr, &send_error);
    });

    std::optional<FileMetadata> metadata;
    ASSERT_TRUE(wait_until([&] {
        metadata = bob_events_.find_metadata("spam.exe");
        return metadata.has_value();
    }));
    EXPECT_TRUE(bob_->reject_file("alice", metadata->file_id));
    sender.join();

    EXPECT_FALSE(sent.load());
    EXPECT_EQ(send_error.code, XtransErrorCode::REJECTED);
}

//=============================================================================
// Identity
//=============================================================================

TEST_F(HybridConnectionManagerTest, HandshakeSharesIdentity) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));

    ASSERT_TRUE(wait_until([this] {
        return !bob_events_.of_type(ConnectionEventType::HANDSHAKE_RECEIVED).empty();
    }));
    auto handshake = bob_events_.of_type(ConnectionEventType::HANDSHAKE_RECEIVED)[0];
    EXPECT_EQ(handshake.device_id, "alice");
    EXPECT_TRUE(handshake.previous_device_id.empty());
    ASSERT_TRUE(handshake.identity.has_value());
    EXPECT_EQ(handshake.identity->device_name, "Alice's laptop");

    auto known = bob_->get_device_identity("alice");
    ASSERT_TRUE(known.has_value());
    EXPECT_TRUE(known->online);
    EXPECT_GT(known->last_seen, 0);

    // The connect call registers the identity it was given
    ASSERT_TRUE(alice_->get_device_identity("bob").has_value());
    EXPECT_EQ(alice_->get_device_identity("bob")->device_type, DeviceType::MOBILE);
    EXPECT_FALSE(alice_->get_device_identity("carol").has_value());
}

TEST_F(HybridConnectionManagerTest, BroadcastIdentityUpdate) {
    ASSERT_TRUE(alice_->connect_to_device("bob", bob_identity_));
    ASSERT_TRUE(bob_sees_alice_connected());

    DeviceIdentity renamed("alice", "Alice's desktop");
    alice_->set_local_identity(renamed);
    EXPECT_EQ(alice_->get_local_identity().device_name, "Alice's desktop");
    EXPECT_EQ(alice_->broadcast_identity_update(), 1u);

    EXPECT_TRUE(wait_until([this] {
        auto known = bob_->get_device_identity("alice");
        return known && known->device_name == "Alice's desktop";
    }));
}

//=============================================================================
// Manual connections
//=============================================================================

TEST_F(HybridConnectionManagerTest, ManualConnectionRemapsProvisionalIds) {
    XtransError error;
    std::string offer_code = alice_->create_manual_connection("manual-temp-1", &error);
    ASSERT_FALSE(offer_code.empty()) << error.to_string();
    EXPECT_EQ(offer_code.rfind("X1:", 0), 0u);
    EXPECT_EQ(alice_->get_connection_state("manual-temp-1")->status, ConnectionStatus::CONNECTING);

    std::string answer_code = bob_->accept_manual_connection("manual-temp-2", offer_code, &error);
    ASSERT_FALSE(answer_code.empty()) << error.to_string();

    ASSERT_TRUE(alice_->finalize_manual_connection("manual-temp-1", answer_code, &error)) << error.to_string();

    // Handshakes replace the provisional ids on both sides
    ASSERT_TRUE(wait_until([this] {
        auto state = alice_->get_connection_state("bob");
        return state && state->status == ConnectionStatus::CONNECTED;
    }));
    ASSERT_TRUE(bob_sees_alice_connected());
    EXPECT_FALSE(alice_->get_connection_state("manual-temp-1").has_value());
    EXPECT_FALSE(bob_->get_connection_state("manual-temp-2").has_value());

    std::optional<ConnectionEvent> remap;
    for (const auto& event : alice_events_.of_type(ConnectionEventType::HANDSHAKE_RECEIVED)) {
        if (!event.previous_device_id.empty()) {
            remap = event;
        }
    }
    ASSERT_TRUE(remap.has_value());
    EXPECT_EQ(remap->device_id, "bob");
    EXPECT_EQ(remap->previous_device_id, "manual-temp-1");
    EXPECT_EQ(remap->identity->device_name, "Bob's phone");

    // The remapped connection carries traffic under the real id
    ASSERT_FALSE(alice_->send_text("bob", "manual hello").empty());
    ASSERT_TRUE(wait_until([this] { return bob_events_.find_text("manual hello").has_value(); }));
    EXPECT_EQ(bob_events_.find_text("manual hello")->device_id, "alice");
}

TEST_F(HybridConnectionManagerTest, ManualCodesCarryGatheredCandidates) {
    std::string offer_code = alice_->create_manual_connection("manual-temp-1");
    ASSERT_FALSE(offer_code.empty());
    auto offer_text = SignalingCodec::decompress(offer_code);
    ASSERT_TRUE(offer_text.has_value());
    auto offer = SessionDescription::from_string(*offer_text);
    ASSERT_TRUE(offer.has_value());
    EXPECT_NE(offer->sdp.find("typ srflx"), std::string::npos);

    std::string answer_code = bob_->accept_manual_connection("manual-temp-2", offer_code);
    ASSERT_FALSE(answer_code.empty());
    auto answer_text = SignalingCodec::decompress(answer_code);
    ASSERT_TRUE(answer_text.has_value());
    auto answer = SessionDescription::from_string(*answer_text);
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(answer->type, "answer");
    EXPECT_NE(answer->sdp.find("typ srflx"), std::string::npos);
}

TEST_F(HybridConnectionManagerTest, ManualConnectionErrors) {
    XtransError error;
    EXPECT_TRUE(alice_->create_manual_connection("", &error).empty());
    EXPECT_EQ(error.code, XtransErrorCode::INVALID_ARGUMENT);

    error = XtransError();
    EXPECT_TRUE(bob_->accept_manual_connection("manual-temp-2", "not a code", &error).empty());
    EXPECT_EQ(error.code, XtransErrorCode::DECODE_ERROR);

    error = XtransError();
    EXPECT_FALSE(alice_->finalize_manual_connection("manual-temp-9", "X1:AAAA", &error));
    EXPECT_EQ(error.code, XtransErrorCode::NOT_FOUND);

    // An offer code handed back as an answer is refused
    std::string offer_code = alice_->create_manual_connection("manual-temp-1");
    ASSERT_FALSE(offer_code.empty());
    EXPECT_FALSE(bob_->accept_manual_connection("manual-temp-2", offer_code).empty());
    error = XtransError();
    EXPECT_FALSE(alice_->finalize_manual_connection("manual-temp-1", offer_code, &error));
    EXPECT_EQ(error.code, XtransErrorCode::DECODE_ERROR);
    EXPECT_EQ(alice_->get_connection_state("manual-temp-1")->status, ConnectionStatus::FAILED);
}

TEST_F(HybridConnectionManagerTest, IgnoresMalformedSignals) {
    alice_->handle_signal("bob", nlohmann::json::array());
    alice_->handle_signal("bob", {{"type", 7}});
    alice_->handle_signal("bob", {{"type", "offer"}, {"kind", "pigeon"}});
    alice_->handle_signal("bob", {{"type", "offer"}});
    alice_->handle_signal("bob", {{"type", "answer"}, {"kind", "primary"}});
    alice_->handle_signal("bob", {{"type", "bogus"}});

    EXPECT_FALSE(alice_->get_connection_state("bob").has_value());
    EXPECT_EQ(alice_->get_registry().size(), 0u);
}

TEST(HybridConnectionManagerSignalingTest, RefusedOffersExhaustEveryKind) {
    auto network = std::make_shared<LoopbackNetwork>();
    std::unique_ptr<MockSignalingChannel> signaling(new MockSignalingChannel());

    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*signaling, set_signal_callback(_)).Times(1);
        EXPECT_CALL(*signaling, send_signal("bob", IsOfferOfKind("primary"))).WillOnce(Return(false));
        EXPECT_CALL(*signaling, send_signal("bob", IsOfferOfKind("secondary"))).WillOnce(Return(false));
    }

    PeerTransportConfig transport_config;
    transport_config.ice_gathering_timeout_ms = 200;
    TransportFactory factory = [network](TransportKind kind, const std::string&) {
        return std::unique_ptr<Transport>(
            new LoopbackTransport(network, std::string("dave:") + transport_kind_to_string(kind)));
    };

    HybridConnectionManager manager(factory, std::move(signaling), ConnectionStrategy(), transport_config);
    manager.set_local_identity(DeviceIdentity("dave", "Dave's desktop"));

    XtransError error;
    EXPECT_FALSE(manager.connect_to_device("bob", DeviceIdentity("bob", "Bob's phone"), &error));
    EXPECT_EQ(error.code, XtransErrorCode::CONNECT_ALL_FAILED);
    EXPECT_EQ(manager.get_connection_state("bob")->status, ConnectionStatus::FAILED);
    EXPECT_EQ(network->get_pending_session_count(), 0u);
}
