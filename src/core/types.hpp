#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one command: exit code plus optional captured text.
struct CommandResult {
    int code = 0;
    std::optional<std::string> output;

    bool success() const { return code == 0; }
};

// Which side of the election this process ended up on.
enum class Role {
    Leader,
    Follower,
};

inline const char* role_name(Role role) {
    return role == Role::Leader ? "leader" : "follower";
}

using Argv = std::vector<std::string>;
