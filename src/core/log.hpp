#pragma once

#include <string>

// Debug log file. Defaults to <temp>/soloist_debug.log.
std::string soloist_log_path();

// Redirect the debug log. An empty path restores the default.
void set_log_path(const std::string& path);

// Append a timestamped line to the debug log. Safe to call from any thread;
// failures to open the file are ignored.
void soloist_log(const std::string& msg);
