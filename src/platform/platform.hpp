#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Current process id, for log lines.
long process_id();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
