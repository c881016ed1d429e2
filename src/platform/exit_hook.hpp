#pragma once

#include <functional>
#include <string>

namespace platform {

// Run `fn` once when the process exits normally (return from main / exit()).
// Returns an id for unregister_exit_cleanup().
int register_exit_cleanup(std::function<void()> fn);

// Drop a cleanup that has already run or is no longer wanted.
void unregister_exit_cleanup(int id);

// Run every registered cleanup now, each at most once.
void run_exit_cleanups();

// On SIGINT / SIGTERM / SIGHUP, unlink `path` before the default action kills
// the process. A handler that was installed before (or SIG_IGN) is chained to
// instead and the file is left alone, since the process keeps running. Only
// async-signal-safe calls run in the handler, so this is limited to deleting
// files. Returns a slot for clear_signal_cleanup(), or -1
// if the path is too long or all slots are taken.
int register_signal_cleanup(const std::string& path);

// Stop unlinking the path of `slot`. Must be called before the file can be
// recreated by someone else.
void clear_signal_cleanup(int slot);

} // namespace platform
