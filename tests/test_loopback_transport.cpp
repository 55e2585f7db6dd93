#include <gtest/gtest.h>
#include "loopback_transport.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace xtrans;
using namespace std::chrono_literals;

namespace {

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

struct Recorder {
    std::mutex mutex;
    std::vector<TransportState> states;
    std::vector<std::string> candidates;
    std::vector<ChannelMessage> messages;

    void attach(Transport& transport) {
        transport.set_state_callback([this](TransportState state) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(state);
        });
        transport.set_candidate_callback([this](const std::string& candidate) {
            std::lock_guard<std::mutex> lock(mutex);
            candidates.push_back(candidate);
        });
        transport.set_message_callback([this](const ChannelMessage& message) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(message);
        });
    }

    size_t message_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

    bool saw_state(TransportState state) {
        std::lock_guard<std::mutex> lock(mutex);
        for (TransportState s : states) {
            if (s == state) {
                return true;
            }
        }
        return false;
    }
};

} // namespace

class LoopbackTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<LoopbackNetwork>();
        alice_.reset(new LoopbackTransport(network_, "alice"));
        bob_.reset(new LoopbackTransport(network_, "bob"));
        alice_events_.attach(*alice_);
        bob_events_.attach(*bob_);
    }

    void TearDown() override {
        alice_.reset();
        bob_.reset();
    }

    bool negotiate() {
        SessionDescription offer = alice_->create_offer();
        if (offer.empty()) {
            return false;
        }
        SessionDescription answer = bob_->create_answer(offer);
        if (answer.empty()) {
            return false;
        }
        return alice_->set_remote_description(answer);
    }

    std::shared_ptr<LoopbackNetwork> network_;
    std::unique_ptr<LoopbackTransport> alice_;
    std::unique_ptr<LoopbackTransport> bob_;
    Recorder alice_events_;
    Recorder bob_events_;
};

TEST_F(LoopbackTransportTest, OfferDescribesSession) {
    SessionDescription offer = alice_->create_offer();

    EXPECT_EQ(offer.type, "offer");
    EXPECT_NE(offer.sdp.find("a=xtrans-session:lb"), std::string::npos);
    EXPECT_NE(offer.sdp.find("a=xtrans-endpoint:alice"), std::string::npos);
    EXPECT_NE(offer.sdp.find("typ host"), std::string::npos);
    EXPECT_EQ(network_->get_pending_session_count(), 1u);

    EXPECT_TRUE(wait_until([this] { return alice_->is_gathering_complete(); }));
    EXPECT_TRUE(alice_events_.saw_state(TransportState::CONNECTING));

    // Trickled server-reflexive candidate, then end of gathering
    std::lock_guard<std::mutex> lock(alice_events_.mutex);
    ASSERT_EQ(alice_events_.candidates.size(), 2u);
    EXPECT_NE(alice_events_.candidates[0].find("typ srflx"), std::string::npos);
    EXPECT_TRUE(alice_events_.candidates[1].empty());
}

TEST_F(LoopbackTransportTest, LocalDescriptionIncludesGatheredCandidates) {
    EXPECT_TRUE(alice_->local_description().empty());

    SessionDescription offer = alice_->create_offer();
    ASSERT_TRUE(wait_until([this] { return alice_->is_gathering_complete(); }));

    SessionDescription gathered = alice_->local_description();
    EXPECT_EQ(gathered.type, "offer");
    EXPECT_NE(gathered.sdp.find("a=candidate:4 1 udp 1686052607 203.0.113.7"), std::string::npos);
    EXPECT_NE(gathered.sdp.find("a=xtrans-session:lb"), std::string::npos);
    EXPECT_EQ(offer.sdp.find("typ srflx"), std::string::npos);

    SessionDescription answer = bob_->create_answer(offer);
    ASSERT_FALSE(answer.empty());
    ASSERT_TRUE(wait_until([this] { return bob_->is_gathering_complete(); }));
    EXPECT_EQ(bob_->local_description().type, "answer");
    EXPECT_NE(bob_->local_description().sdp.find("typ srflx"), std::string::npos);
}

TEST_F(LoopbackTransportTest, NegotiationOpensChannel) {
    ASSERT_TRUE(negotiate());

    EXPECT_TRUE(wait_until([this] { return alice_->get_state() == TransportState::CHANNEL_OPEN; }));
    EXPECT_TRUE(wait_until([this] { return bob_->get_state() == TransportState::CHANNEL_OPEN; }));
    EXPECT_EQ(network_->get_pending_session_count(), 0u);
    EXPECT_TRUE(bob_events_.saw_state(TransportState::CONNECTED));
}

TEST_F(LoopbackTransportTest, MessagesArriveInOrder) {
    ASSERT_TRUE(negotiate());
    ASSERT_TRUE(wait_until([this] { return alice_->get_state() == TransportState::CHANNEL_OPEN; }));

    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(alice_->send(ChannelMessage::from_text("m" + std::to_string(i))));
    }
    ASSERT_TRUE(alice_->send(ChannelMessage::from_binary({1, 2, 3})));

    ASSERT_TRUE(wait_until([this] { return bob_events_.message_count() == 201; }));

    std::lock_guard<std::mutex> lock(bob_events_.mutex);
    for (int i = 0; i < 200; ++i) {
        EXPECT_FALSE(bob_events_.messages[i].binary);
        EXPECT_EQ(bob_events_.messages[i].text, "m" + std::to_string(i));
    }
    EXPECT_TRUE(bob_events_.messages[200].binary);
    EXPECT_EQ(bob_events_.messages[200].bytes, std::vector<uint8_t>({1, 2, 3}));
}

TEST_F(LoopbackTransportTest, SendBeforeOpenFails) {
    EXPECT_FALSE(alice_->send(ChannelMessage::from_text("too early")));
}

TEST_F(LoopbackTransportTest, BufferedAmountTracksUndeliveredBytes) {
    ASSERT_TRUE(negotiate());
    ASSERT_TRUE(wait_until([this] { return bob_->get_state() == TransportState::CHANNEL_OPEN; }));

    bob_->set_delivery_paused(true);
    ASSERT_TRUE(alice_->send(ChannelMessage::from_binary(std::vector<uint8_t>(1000, 7))));
    ASSERT_TRUE(alice_->send(ChannelMessage::from_text("12345")));
    EXPECT_EQ(alice_->buffered_amount(), 1005u);

    bob_->set_delivery_paused(false);
    EXPECT_TRUE(wait_until([this] { return alice_->buffered_amount() == 0; }));
    EXPECT_TRUE(wait_until([this] { return bob_events_.message_count() == 2; }));
}

TEST_F(LoopbackTransportTest, UnreachableEndpointFails) {
    network_->set_reachable("bob", false);
    EXPECT_FALSE(network_->is_reachable("bob"));

    ASSERT_TRUE(negotiate());

    EXPECT_TRUE(wait_until([this] { return alice_->get_state() == TransportState::FAILED; }));
    EXPECT_TRUE(wait_until([this] { return bob_->get_state() == TransportState::FAILED; }));
    EXPECT_FALSE(alice_->send(ChannelMessage::from_text("nobody home")));
}

TEST_F(LoopbackTransportTest, CloseNotifiesPeer) {
    ASSERT_TRUE(negotiate());
    ASSERT_TRUE(wait_until([this] { return bob_->get_state() == TransportState::CHANNEL_OPEN; }));

    alice_->close();
    alice_->close();

    EXPECT_EQ(alice_->get_state(), TransportState::CLOSED);
    EXPECT_TRUE(wait_until([this] { return bob_->get_state() == TransportState::CLOSED; }));
    EXPECT_FALSE(alice_->send(ChannelMessage::from_text("gone")));
    EXPECT_FALSE(bob_->send(ChannelMessage::from_text("gone")));
}

TEST_F(LoopbackTransportTest, ClosingUnansweredOfferDropsSession) {
    alice_->create_offer();
    EXPECT_EQ(network_->get_pending_session_count(), 1u);

    alice_->close();
    EXPECT_EQ(network_->get_pending_session_count(), 0u);
}

TEST_F(LoopbackTransportTest, RejectsInvalidNegotiation) {
    XtransError error;

    EXPECT_TRUE(bob_->create_answer(SessionDescription("answer", "v=0\r\n"), &error).empty());
    EXPECT_EQ(error.code, XtransErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE(bob_->create_answer(SessionDescription("offer", "v=0\r\na=xtrans-session:lb999\r\n")).empty());

    SessionDescription offer = alice_->create_offer();
    EXPECT_TRUE(alice_->create_offer().empty());
    EXPECT_FALSE(alice_->set_remote_description(offer));
}

TEST_F(LoopbackTransportTest, RemoteCandidates) {
    EXPECT_TRUE(alice_->add_candidate("candidate:1 1 udp 2122260223 127.0.0.1 5000 typ host"));
    EXPECT_TRUE(alice_->add_candidate("a=candidate:2 1 udp 2122260223 10.0.0.1 5000 typ host"));
    EXPECT_TRUE(alice_->add_candidate(""));
    EXPECT_FALSE(alice_->add_candidate("garbage"));
    EXPECT_EQ(alice_->get_remote_candidate_count(), 2u);
}

TEST(LoopbackSignalingHubTest, DeliversSignalsInOrder) {
    LoopbackSignalingHub hub;
    auto alice = hub.create_channel("alice");
    auto bob = hub.create_channel("bob");

    std::mutex mutex;
    std::vector<std::string> received;
    bob->set_signal_callback([&](const std::string& from, const nlohmann::json& signal) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(from + ":" + signal["type"].get<std::string>());
    });

    EXPECT_TRUE(alice->send_signal("bob", {{"type", "offer"}}));
    EXPECT_TRUE(alice->send_signal("bob", {{"type", "candidate"}}));
    ASSERT_TRUE(hub.wait_idle(2000ms));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], "alice:offer");
    EXPECT_EQ(received[1], "alice:candidate");
    EXPECT_EQ(hub.get_dispatched_count(), 2u);
}

TEST(LoopbackSignalingHubTest, DropsSignalsToUnknownDevice) {
    LoopbackSignalingHub hub;
    auto alice = hub.create_channel("alice");

    EXPECT_TRUE(alice->send_signal("carol", {{"type", "offer"}}));
    ASSERT_TRUE(hub.wait_idle(2000ms));

    EXPECT_EQ(hub.get_dropped_count(), 1u);
    EXPECT_EQ(hub.get_dispatched_count(), 0u);
}

TEST(LoopbackSignalingHubTest, DestroyedChannelStopsReceiving) {
    LoopbackSignalingHub hub;
    auto alice = hub.create_channel("alice");
    auto bob = hub.create_channel("bob");

    std::atomic<int> count(0);
    bob->set_signal_callback([&](const std::string&, const nlohmann::json&) { count++; });
    bob.reset();

    alice->send_signal("bob", {{"type", "offer"}});
    ASSERT_TRUE(hub.wait_idle(2000ms));

    EXPECT_EQ(count.load(), 0);
    EXPECT_EQ(hub.get_dropped_count(), 1u);
}
