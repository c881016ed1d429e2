#include <gtest/gtest.h>
#include <platform/exit_hook.hpp>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include "test_helpers.hpp"

#ifndef _WIN32
#  include <signal.h>
#endif

TEST(ExitHook, CleanupsRunOnce) {
    int a = 0;
    int b = 0;
    platform::register_exit_cleanup([&a] { ++a; });
    platform::register_exit_cleanup([&b] { ++b; });

    platform::run_exit_cleanups();
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);

    platform::run_exit_cleanups();
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);
}

TEST(ExitHook, UnregisteredCleanupIsSkipped) {
    int kept = 0;
    int dropped = 0;
    platform::register_exit_cleanup([&kept] { ++kept; });
    int id = platform::register_exit_cleanup([&dropped] { ++dropped; });
    platform::unregister_exit_cleanup(id);
    platform::unregister_exit_cleanup(id);

    platform::run_exit_cleanups();
    EXPECT_EQ(kept, 1);
    EXPECT_EQ(dropped, 0);
}

TEST(ExitHook, IdsAreDistinct) {
    int first = platform::register_exit_cleanup([] {});
    int second = platform::register_exit_cleanup([] {});
    EXPECT_NE(first, second);
    platform::unregister_exit_cleanup(first);
    platform::unregister_exit_cleanup(second);
}

TEST(ExitHook, OverlongPathIsRefused) {
    EXPECT_EQ(platform::register_signal_cleanup(std::string(8192, 'x')), -1);
}

#ifndef _WIN32

// Signal handlers are process-wide: every case below installs them in a
// forked child only.
class SignalCleanupTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        GTEST_FLAG_SET(death_test_style, "fast");
        path_ = dir_ / ".app";
        std::ofstream(path_) << "lock";
    }

    fs::path path_;
};

namespace {

volatile std::sig_atomic_t g_own_handler_ran = 0;

void own_handler(int) {
    g_own_handler_ran = 1;
}

} // namespace

TEST_F(SignalCleanupTest, DefaultActionRemovesFile) {
    EXPECT_EXIT({
        platform::register_signal_cleanup(path_.string());
        raise(SIGTERM);
    }, ::testing::KilledBySignal(SIGTERM), "");
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(SignalCleanupTest, ClearedSlotKeepsFile) {
    EXPECT_EXIT({
        int slot = platform::register_signal_cleanup(path_.string());
        platform::clear_signal_cleanup(slot);
        raise(SIGINT);
    }, ::testing::KilledBySignal(SIGINT), "");
    EXPECT_TRUE(fs::exists(path_));
}

TEST_F(SignalCleanupTest, EmbedderHandlerKeepsFile) {
    // The process survives the signal, so the lock file must stay.
    EXPECT_EXIT({
        signal(SIGTERM, own_handler);
        platform::register_signal_cleanup(path_.string());
        raise(SIGTERM);
        bool ok = g_own_handler_ran == 1 && fs::exists(path_);
        std::_Exit(ok ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
    EXPECT_TRUE(fs::exists(path_));
}

TEST_F(SignalCleanupTest, IgnoredSignalKeepsFile) {
    EXPECT_EXIT({
        signal(SIGHUP, SIG_IGN);
        platform::register_signal_cleanup(path_.string());
        raise(SIGHUP);
        std::_Exit(fs::exists(path_) ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}

#endif
