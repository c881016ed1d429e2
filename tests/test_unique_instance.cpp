#include <gtest/gtest.h>
#include <instance/unique_instance.hpp>
#include <core/utils.hpp>
#include <csignal>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include "test_helpers.hpp"

#ifndef _WIN32
#  include <signal.h>
#  include <sys/resource.h>
#  include <unistd.h>
#endif

using namespace std::chrono_literals;

namespace {

// What the leader's handler saw, per call.
struct Recorder {
    std::mutex mutex;
    std::vector<Argv> args;
    std::vector<std::string> stdin_data;

    void add(const Argv& a, const std::string& in) {
        std::lock_guard<std::mutex> lock(mutex);
        args.push_back(a);
        stdin_data.push_back(in);
    }
    std::size_t calls() {
        std::lock_guard<std::mutex> lock(mutex);
        return args.size();
    }
};

// echo / cat / result <code> <text> / quiet / boom
CommandHandler recording_handler(std::shared_ptr<Recorder> recorder) {
    return make_sync_handler([recorder](const Argv& args, InputStream& in) {
        std::string data = read_all(in);
        recorder->add(args, data);

        CommandResult r;
        if (args.empty() || args[0] == "quiet") return r;
        if (args[0] == "boom") throw std::runtime_error("boom");
        if (args[0] == "result" && args.size() == 3) {
            r.code = safe_stoi(args[1]);
            r.output = args[2];
        } else if (args[0] == "cat") {
            r.output = data;
        } else {
            r.output = join(args, " ");
        }
        return r;
    });
}

std::shared_future<void> ready_now() {
    std::promise<void> p;
    p.set_value();
    return p.get_future().share();
}

struct CapturedStreams {
    std::ostringstream out;
    std::ostringstream err;

    SystemStreams with_input(const std::string& data) {
        SystemStreams s;
        s.in = std::make_shared<MemoryInputStream>(data);
        s.out = &out;
        s.err = &err;
        return s;
    }
};

} // namespace

class UniqueInstanceTest : public TempDirTest {
protected:
    InstanceOptions options() const {
        InstanceOptions opts;
        opts.lock_dir = dir_;
        opts.install_exit_hook = false;
        opts.drain_timeout_ms = 2000;
        return opts;
    }

    // Start a leader and wait until it serves followers.
    std::unique_ptr<UniqueInstance> start_leader(const Argv& args = {"quiet"}) {
        auto leader = std::make_unique<UniqueInstance>("app", options());
        auto launch = leader->start(recording_handler(recorder_), args, ready_now(),
                                    leader_streams_.with_input(""));
        EXPECT_TRUE(launch.is_ok()) << launch.error;
        if (launch.is_err()) return nullptr;
        EXPECT_EQ(launch.value.role, Role::Leader);
        EXPECT_EQ(launch.value.done.wait_for(5s), std::future_status::ready);
        return leader;
    }

    Result<Launch> run_follower(const Argv& args, const std::string& stdin_data,
                                CapturedStreams& streams) {
        UniqueInstance follower("app", options());
        return follower.start(recording_handler(recorder_), args, ready_now(),
                              streams.with_input(stdin_data));
    }

    std::shared_ptr<Recorder> recorder_ = std::make_shared<Recorder>();
    CapturedStreams leader_streams_;
};

TEST_F(UniqueInstanceTest, LeaderRunsItsOwnCommand) {
    auto leader = start_leader({"echo", "hi"});
    ASSERT_TRUE(leader);
    EXPECT_TRUE(leader->is_leader());
    EXPECT_EQ(leader->phase(), ListenerPhase::Accepting);
    EXPECT_GT(leader->port(), 0);
    EXPECT_TRUE(fs::exists(leader->lock_path()));
    EXPECT_EQ(leader->lock_path(), dir_ / ".app");

    EXPECT_EQ(leader_streams_.out.str(), "echo hi\n");
    EXPECT_EQ(recorder_->calls(), 1u);
}

TEST_F(UniqueInstanceTest, FollowerForwardsArgsAndStdin) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);

    CapturedStreams streams;
    auto launch = run_follower({"--flag", "value"}, "hello\n", streams);
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_EQ(launch.value.role, Role::Follower);
    EXPECT_EQ(launch.value.exit_code, 0);
    EXPECT_EQ(streams.out.str(), "--flag value\n");

    ASSERT_EQ(recorder_->calls(), 2u);
    EXPECT_EQ(recorder_->args[1], (Argv{"--flag", "value"}));
    EXPECT_EQ(recorder_->stdin_data[1], "hello\n");
}

TEST_F(UniqueInstanceTest, ResultCodeAndOutputRoundTrip) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);

    CapturedStreams streams;
    auto launch = run_follower({"result", "3", "done"}, "", streams);
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_EQ(launch.value.exit_code, 3);
    EXPECT_EQ(streams.out.str(), "");
    EXPECT_EQ(streams.err.str(), "done\n");
}

TEST_F(UniqueInstanceTest, EmptyArgvAndEmptyStdin) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);

    CapturedStreams streams;
    auto launch = run_follower({}, "", streams);
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_EQ(launch.value.exit_code, 0);
    EXPECT_EQ(streams.out.str(), "");
    EXPECT_EQ(streams.err.str(), "");

    ASSERT_EQ(recorder_->calls(), 2u);
    EXPECT_TRUE(recorder_->args[1].empty());
    EXPECT_EQ(recorder_->stdin_data[1], "");
}

TEST_F(UniqueInstanceTest, LargeStdin) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);

    std::string big(1 << 20, 'z');
    big[12345] = '\n';
    CapturedStreams streams;
    auto launch = run_follower({"cat"}, big, streams);
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_EQ(launch.value.exit_code, 0);
    EXPECT_EQ(streams.out.str(), big + "\n");
}

TEST_F(UniqueInstanceTest, HandlerFailureReachesFollower) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);

    CapturedStreams streams;
    auto launch = run_follower({"boom"}, "", streams);
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_EQ(launch.value.exit_code, CODE_CMD_ERROR);
    EXPECT_EQ(streams.err.str(), "Failed to process arguments: boom\n");
}

TEST_F(UniqueInstanceTest, ReadyGatesLocalCommand) {
    std::promise<void> ready;
    UniqueInstance leader("app", options());
    auto launch = leader.start(recording_handler(recorder_), {"quiet"},
                               ready.get_future().share(), leader_streams_.with_input(""));
    ASSERT_TRUE(launch.is_ok()) << launch.error;

    EXPECT_EQ(launch.value.done.wait_for(100ms), std::future_status::timeout);
    EXPECT_EQ(recorder_->calls(), 0u);
    EXPECT_EQ(leader.phase(), ListenerPhase::Publishing);

    ready.set_value();
    ASSERT_EQ(launch.value.done.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(recorder_->calls(), 1u);
    EXPECT_EQ(leader.phase(), ListenerPhase::Accepting);
}

TEST_F(UniqueInstanceTest, ReadyFailureFailsLaunchWithoutServing) {
    std::promise<void> ready;
    ready.set_exception(std::make_exception_ptr(std::runtime_error("not ready")));

    UniqueInstance leader("app", options());
    auto launch = leader.start(recording_handler(recorder_), {"quiet"},
                               ready.get_future().share(), leader_streams_.with_input(""));
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_THROW(launch.value.done.get(), std::runtime_error);
    EXPECT_EQ(recorder_->calls(), 0u);
    EXPECT_EQ(leader.phase(), ListenerPhase::Publishing);
}

TEST_F(UniqueInstanceTest, LocalFailureStillServesFollowers) {
    UniqueInstance leader("app", options());
    auto launch = leader.start(recording_handler(recorder_), {"boom"}, ready_now(),
                               leader_streams_.with_input(""));
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_THROW(launch.value.done.get(), std::runtime_error);
    EXPECT_EQ(leader.phase(), ListenerPhase::Accepting);

    CapturedStreams streams;
    auto follower = run_follower({"echo", "after"}, "", streams);
    ASSERT_TRUE(follower.is_ok()) << follower.error;
    EXPECT_EQ(streams.out.str(), "echo after\n");
}

TEST_F(UniqueInstanceTest, StoppedLeaderRefusesFollowers) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);
    leader->stop();
    leader->stop();
    EXPECT_TRUE(leader->is_stopping());

    CapturedStreams streams;
    auto launch = run_follower({"echo", "late"}, "", streams);
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_EQ(launch.value.exit_code, CODE_ERROR);
    EXPECT_EQ(streams.err.str().rfind("Failed to execute command on unique instance: ", 0), 0u);
    EXPECT_EQ(recorder_->calls(), 1u);
}

TEST_F(UniqueInstanceTest, ShutdownHandsOverLeadership) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);
    auto path = leader->lock_path();

    leader->shutdown();
    leader->shutdown();
    EXPECT_FALSE(fs::exists(path));

    auto next = start_leader();
    ASSERT_TRUE(next);
    EXPECT_TRUE(next->is_leader());
}

TEST_F(UniqueInstanceTest, StartTwiceFails) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);
    auto again = leader->start(recording_handler(recorder_), {}, ready_now(),
                               leader_streams_.with_input(""));
    EXPECT_TRUE(again.is_err());
}

TEST_F(UniqueInstanceTest, FollowerWithoutInputStream) {
    auto leader = start_leader();
    ASSERT_TRUE(leader);

    CapturedStreams captured;
    SystemStreams streams;
    streams.out = &captured.out;
    streams.err = &captured.err;
    UniqueInstance follower("app", options());
    auto launch = follower.start(recording_handler(recorder_), {"cat"}, ready_now(), streams);
    ASSERT_TRUE(launch.is_ok()) << launch.error;
    EXPECT_EQ(launch.value.exit_code, 0);
    // Empty output reads back as no output: nothing printed.
    EXPECT_EQ(captured.out.str(), "");
}

TEST_F(UniqueInstanceTest, ProcessEntryExitsOnStartFailure) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    // A regular file where the lock directory should be.
    auto blocker = dir_ / "not-a-dir";
    { std::ofstream(blocker) << "x"; }

    auto opts = options();
    opts.lock_dir = blocker;
    EXPECT_EXIT({
        UniqueInstance instance("app", opts);
        CapturedStreams streams;
        start_unique_instance(instance, recording_handler(recorder_), {}, ready_now(),
                              streams.with_input(""));
    }, ::testing::ExitedWithCode(CODE_ERROR), "");
}

#ifndef _WIN32

namespace {

volatile std::sig_atomic_t g_embedder_saw_term = 0;

void embedder_term_handler(int) {
    g_embedder_saw_term = 1;
}

// Next launch for `app` in `dir`: true if it gets its role within two seconds.
bool next_launch_elected(const InstanceOptions& opts, Role expected) {
    auto next = std::async(std::launch::async, [opts] {
        auto lock = LockCoordinator::acquire("app", opts);
        Role role = lock.is_ok() ? lock.value->role() : Role::Follower;
        bool ok = lock.is_ok();
        if (ok) ok = lock.value->release().is_ok();
        return ok ? static_cast<int>(role) : -1;
    });
    if (next.wait_for(2s) != std::future_status::ready) return false;
    return next.get() == static_cast<int>(expected);
}

} // namespace

TEST_F(UniqueInstanceTest, FailedLeaderStartReleasesLocks) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        // Leave exactly one free descriptor: the lock file opens, the
        // listening socket cannot.
        int lowest = dup(2);
        close(lowest);
        struct rlimit saved;
        getrlimit(RLIMIT_NOFILE, &saved);
        struct rlimit tight = saved;
        tight.rlim_cur = static_cast<rlim_t>(lowest + 1);
        setrlimit(RLIMIT_NOFILE, &tight);

        UniqueInstance leader("app", options());
        auto launch = leader.start(recording_handler(recorder_), {"quiet"}, ready_now(),
                                   leader_streams_.with_input(""));
        setrlimit(RLIMIT_NOFILE, &saved);

        bool ok = launch.is_err() && !leader.is_leader() &&
                  !fs::exists(leader.lock_path()) &&
                  next_launch_elected(options(), Role::Leader);
        std::_Exit(ok ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}

TEST_F(UniqueInstanceTest, SurvivedSignalKeepsLeadership) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        signal(SIGTERM, embedder_term_handler);

        auto opts = options();
        opts.install_exit_hook = true;
        UniqueInstance leader("app", opts);
        auto launch = leader.start(recording_handler(recorder_), {"quiet"}, ready_now(),
                                   leader_streams_.with_input(""));
        bool ok = launch.is_ok() && launch.value.done.wait_for(5s) == std::future_status::ready;

        raise(SIGTERM);
        ok = ok && g_embedder_saw_term == 1 && fs::exists(leader.lock_path()) &&
             next_launch_elected(opts, Role::Follower);
        std::_Exit(ok ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}

#endif
