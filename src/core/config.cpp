#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path InstanceOptions::resolved_lock_dir() const {
    return lock_dir.empty() ? platform::home_dir() : lock_dir;
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".soloist";
}

fs::path default_options_path() {
    return get_global_config_dir() / "config.yaml";
}

// Value of `key`, or fallback when absent. A value of the wrong type throws.
template <typename T>
static T get_or(const YAML::Node& root, const char* key, T fallback) {
    YAML::Node node = root[key];
    if (!node || node.IsNull()) return fallback;
    return node.as<T>();
}

static Result<void> check_positive(const char* key, long long v) {
    if (v <= 0) {
        return Result<void>::Err(fmt::format("Invalid '{}': must be positive, got {}", key, v));
    }
    return Result<void>::Ok();
}

Result<InstanceOptions> load_options(const fs::path& path) {
    InstanceOptions opts;

    if (!fs::exists(path)) {
        return Result<InstanceOptions>::Ok(opts);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<InstanceOptions>::Ok(opts);
        }
        if (!root.IsMap()) {
            return Result<InstanceOptions>::Err(
                fmt::format("Failed to parse options {}: top level is not a map", path.string()));
        }

        opts.lock_dir = get_or<std::string>(root, "lock_dir", "");
        opts.backlog = get_or(root, "backlog", opts.backlog);
        opts.drain_timeout_ms = get_or(root, "drain_timeout_ms", opts.drain_timeout_ms);
        long long pump = get_or(root, "pump_buffer_size",
                                static_cast<long long>(opts.pump_buffer_size));
        long long max_str = get_or(root, "max_string_bytes",
                                   static_cast<long long>(opts.max_string_bytes));
        opts.log_file = get_or(root, "log_file", opts.log_file);
        opts.install_exit_hook = get_or(root, "install_exit_hook", opts.install_exit_hook);

        for (auto r : {check_positive("backlog", opts.backlog),
                       check_positive("pump_buffer_size", pump),
                       check_positive("max_string_bytes", max_str)}) {
            if (r.is_err()) return Result<InstanceOptions>::Err(r.error);
        }
        if (opts.drain_timeout_ms < 0) {
            return Result<InstanceOptions>::Err(
                fmt::format("Invalid 'drain_timeout_ms': must not be negative, got {}",
                            opts.drain_timeout_ms));
        }
        opts.pump_buffer_size = static_cast<std::size_t>(pump);
        opts.max_string_bytes = static_cast<std::size_t>(max_str);

        return Result<InstanceOptions>::Ok(opts);
    } catch (const std::exception& e) {
        return Result<InstanceOptions>::Err(
            fmt::format("Failed to parse options {}: {}", path.string(), e.what()));
    }
}
