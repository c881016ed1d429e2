#pragma once

#include <string>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Tunables of the instance coordinator. Every field has a usable default, so
// embedders only set what they care about.
struct InstanceOptions {
    fs::path lock_dir;                                   // empty = user home
    int backlog = DEFAULT_SERVER_BACKLOG;
    int drain_timeout_ms = DEFAULT_DRAIN_TIMEOUT_MS;
    std::size_t pump_buffer_size = DEFAULT_PUMP_BUFFER_SIZE;
    std::size_t max_string_bytes = DEFAULT_MAX_STRING_BYTES;
    std::string log_file;                                // empty = keep current log path
    bool install_exit_hook = true;

    // lock_dir, or the home directory when unset.
    fs::path resolved_lock_dir() const;
};

// Load options from a YAML file. Missing file -> defaults; missing keys keep
// their defaults; malformed YAML or out-of-range values -> error.
Result<InstanceOptions> load_options(const fs::path& path);

// Get paths
fs::path get_global_config_dir();
fs::path default_options_path();
