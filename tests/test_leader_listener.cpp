#include <gtest/gtest.h>
#include <instance/leader_listener.hpp>
#include <core/utils.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include "test_helpers.hpp"

using namespace std::chrono_literals;

namespace {

CommandHandler joining_handler() {
    return make_sync_handler([](const Argv& args, InputStream& in) {
        CommandResult r;
        r.output = join(args, " ") + read_all(in);
        return r;
    });
}

bool wait_for_phase(const LeaderListener& listener, ListenerPhase phase) {
    for (int i = 0; i < 100; ++i) {
        if (listener.phase() == phase) return true;
        platform::sleep_ms(50);
    }
    return false;
}

} // namespace

class LeaderListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.drain_timeout_ms = 2000;
        auto opened = LeaderListener::open(options_);
        ASSERT_TRUE(opened.is_ok()) << opened.error;
        listener_ = std::move(opened.value);
    }

    InstanceOptions options_;
    std::unique_ptr<LeaderListener> listener_;
};

TEST_F(LeaderListenerTest, BindsEphemeralPort) {
    EXPECT_GT(listener_->port(), 0);
    EXPECT_LE(listener_->port(), 65535);
    EXPECT_EQ(listener_->phase(), ListenerPhase::Publishing);
}

TEST_F(LeaderListenerTest, ServesSequentialFollowers) {
    ASSERT_TRUE(listener_->serve(joining_handler()).is_ok());
    EXPECT_EQ(listener_->phase(), ListenerPhase::Accepting);

    auto first = send_command(listener_->port(), {"a", "b"}, "");
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.output, std::optional<std::string>("a b"));

    auto second = send_command(listener_->port(), {"cat:"}, "xyz");
    ASSERT_TRUE(second.is_ok()) << second.error;
    EXPECT_EQ(second.value.output, std::optional<std::string>("cat:xyz"));
}

TEST_F(LeaderListenerTest, ServesConcurrentFollowers) {
    ASSERT_TRUE(listener_->serve(joining_handler()).is_ok());

    constexpr int N = 8;
    std::vector<std::string> outputs(N);
    std::vector<std::thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            auto r = send_command(listener_->port(), {std::to_string(i)}, "!");
            if (r.is_ok() && r.value.output) outputs[i] = *r.value.output;
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < N; ++i) {
        EXPECT_EQ(outputs[i], std::to_string(i) + "!");
    }
    EXPECT_TRUE(listener_->wait_connections(5s));
}

TEST_F(LeaderListenerTest, TruncatedConnectionDoesNotAffectOthers) {
    ASSERT_TRUE(listener_->serve(joining_handler()).is_ok());

    {
        auto conn = platform::connect_loopback(listener_->port());
        ASSERT_TRUE(conn.is_ok()) << conn.error;
        platform::SocketHandle broken(conn.value);
        auto w = platform::send_all(broken.get(), be32(3).data(), 4);
        EXPECT_TRUE(w.is_ok());
        // Closed mid-request.
    }

    auto r = send_command(listener_->port(), {"still", "fine"}, "");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.code, 0);
    EXPECT_EQ(r.value.output, std::optional<std::string>("still fine"));
}

TEST_F(LeaderListenerTest, MalformedThenWellFormed) {
    ASSERT_TRUE(listener_->serve(joining_handler()).is_ok());

    auto bad = send_raw(listener_->port(), be32(-7));
    ASSERT_TRUE(bad.is_ok()) << bad.error;
    EXPECT_EQ(bad.value.code, CODE_ERROR);

    auto good = send_command(listener_->port(), {"ok"}, "");
    ASSERT_TRUE(good.is_ok()) << good.error;
    EXPECT_EQ(good.value.code, 0);
}

TEST_F(LeaderListenerTest, StopIsIdempotent) {
    ASSERT_TRUE(listener_->serve(joining_handler()).is_ok());
    listener_->stop();
    listener_->stop();
    EXPECT_TRUE(listener_->is_stopping());
    EXPECT_TRUE(wait_for_phase(*listener_, ListenerPhase::Stopped));
    listener_->stop();
    EXPECT_EQ(listener_->phase(), ListenerPhase::Stopped);
}

TEST_F(LeaderListenerTest, StopBeforeServe) {
    listener_->stop();
    EXPECT_EQ(listener_->phase(), ListenerPhase::Stopped);
    EXPECT_TRUE(listener_->serve(joining_handler()).is_ok());
    EXPECT_EQ(listener_->phase(), ListenerPhase::Stopped);
}

TEST_F(LeaderListenerTest, StoppedListenerRefusesConnections) {
    ASSERT_TRUE(listener_->serve(joining_handler()).is_ok());
    listener_->stop();
    ASSERT_TRUE(wait_for_phase(*listener_, ListenerPhase::Stopped));

    // A follower must not get a handshake it will never see answered.
    auto conn = platform::connect_loopback(listener_->port());
    if (conn.is_ok()) platform::close_socket(conn.value);
    EXPECT_TRUE(conn.is_err());
}

TEST_F(LeaderListenerTest, StopBeforeServeRefusesConnections) {
    listener_->stop();
    auto conn = platform::connect_loopback(listener_->port());
    if (conn.is_ok()) platform::close_socket(conn.value);
    EXPECT_TRUE(conn.is_err());
}

TEST(ListenerStateTest, StopWithoutAcceptorClosesSocket) {
    auto listening = platform::listen_loopback(1);
    ASSERT_TRUE(listening.is_ok()) << listening.error;
    ListenerState state(listening.value);

    state.request_stop();
    EXPECT_EQ(state.socket(), SOLOIST_INVALID_SOCKET);
    EXPECT_EQ(state.phase(), ListenerPhase::Stopped);
    state.request_stop();
    state.close_listener();
    EXPECT_EQ(state.socket(), SOLOIST_INVALID_SOCKET);
}

TEST(ListenerStateTest, StopWhileAcceptingLeavesCloseToAcceptor) {
    auto listening = platform::listen_loopback(1);
    ASSERT_TRUE(listening.is_ok()) << listening.error;
    ListenerState state(listening.value);
    state.set_phase(ListenerPhase::Accepting);

    state.request_stop();
    EXPECT_EQ(state.phase(), ListenerPhase::Stopping);
    EXPECT_NE(state.socket(), SOLOIST_INVALID_SOCKET);
    state.close_listener();
    EXPECT_EQ(state.socket(), SOLOIST_INVALID_SOCKET);
}

TEST_F(LeaderListenerTest, ServeTwiceFails) {
    ASSERT_TRUE(listener_->serve(joining_handler()).is_ok());
    EXPECT_TRUE(listener_->serve(joining_handler()).is_err());
}

TEST(ListenerPhaseName, Names) {
    EXPECT_STREQ(phase_name(ListenerPhase::Electing), "electing");
    EXPECT_STREQ(phase_name(ListenerPhase::Accepting), "accepting");
    EXPECT_STREQ(phase_name(ListenerPhase::Stopped), "stopped");
}
