#pragma once

// Length-prefixed binary encoding of the forwarding protocol.
//
//   request:  int32 argc, then argc x (int32 len, len bytes UTF-8)
//   result:   int32 code, int32 len, len bytes UTF-8 (len 0 = no output)
//
// All integers are big-endian. The type of each field is implied by its
// position; nothing is tagged.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "streams.hpp"

// ── Buffer level ─────────────────────────────────────────────

std::array<char, INT_SIZE> encode_int32_be(int32_t value);
int32_t decode_int32_be(const char* bytes);

// ── Stream level ─────────────────────────────────────────────

// Read exactly n bytes; fails if the stream ends first.
Result<std::string> read_exact(InputStream& in, std::size_t n);

Result<int32_t> read_int32_be(InputStream& in);
Result<void> write_int32_be(OutputStream& out, int32_t value);

// Length-prefixed string. A negative length or one above max_bytes is malformed.
Result<std::string> read_string(InputStream& in, std::size_t max_bytes = DEFAULT_MAX_STRING_BYTES);
Result<void> write_string(OutputStream& out, const std::string& s);

// Like read_string, but an empty string or any failure means "no output".
// Used for the trailing output of a result, where the peer may already be gone.
std::optional<std::string> read_optional_string(InputStream& in,
                                                std::size_t max_bytes = DEFAULT_MAX_STRING_BYTES);

// ── Messages ─────────────────────────────────────────────────

Result<void> write_request(OutputStream& out, const Argv& args);
Result<Argv> read_request(InputStream& in, std::size_t max_bytes = DEFAULT_MAX_STRING_BYTES);

Result<void> write_result(OutputStream& out, const CommandResult& result);
Result<CommandResult> read_result(InputStream& in, std::size_t max_bytes = DEFAULT_MAX_STRING_BYTES);
