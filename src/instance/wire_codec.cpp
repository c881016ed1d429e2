#include "wire_codec.hpp"
#include <fmt/format.h>
#include <limits>

std::array<char, INT_SIZE> encode_int32_be(int32_t value) {
    auto u = static_cast<uint32_t>(value);
    return {
        static_cast<char>((u >> 24) & 0xFF),
        static_cast<char>((u >> 16) & 0xFF),
        static_cast<char>((u >> 8) & 0xFF),
        static_cast<char>(u & 0xFF),
    };
}

int32_t decode_int32_be(const char* bytes) {
    const auto* b = reinterpret_cast<const unsigned char*>(bytes);
    uint32_t u = (static_cast<uint32_t>(b[0]) << 24) |
                 (static_cast<uint32_t>(b[1]) << 16) |
                 (static_cast<uint32_t>(b[2]) << 8) |
                 static_cast<uint32_t>(b[3]);
    return static_cast<int32_t>(u);
}

Result<std::string> read_exact(InputStream& in, std::size_t n) {
    std::string data(n, '\0');
    std::size_t got = 0;
    while (got < n) {
        auto r = in.read(&data[got], n - got);
        if (r.is_err()) {
            return Result<std::string>::Err(r.error);
        }
        if (r.value == 0) {
            return Result<std::string>::Err(fmt::format("Read={} expected={}", got, n));
        }
        got += r.value;
    }
    return Result<std::string>::Ok(std::move(data));
}

Result<int32_t> read_int32_be(InputStream& in) {
    auto r = read_exact(in, INT_SIZE);
    if (r.is_err()) return Result<int32_t>::Err(r.error);
    return Result<int32_t>::Ok(decode_int32_be(r.value.data()));
}

Result<void> write_int32_be(OutputStream& out, int32_t value) {
    auto bytes = encode_int32_be(value);
    return out.write(bytes.data(), bytes.size());
}

Result<std::string> read_string(InputStream& in, std::size_t max_bytes) {
    auto len = read_int32_be(in);
    if (len.is_err()) return Result<std::string>::Err(len.error);
    if (len.value < 0 || static_cast<std::size_t>(len.value) > max_bytes) {
        return Result<std::string>::Err(fmt::format("Malformed string length {}", len.value));
    }
    return read_exact(in, static_cast<std::size_t>(len.value));
}

Result<void> write_string(OutputStream& out, const std::string& s) {
    if (s.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        return Result<void>::Err(fmt::format("String too long to encode ({} bytes)", s.size()));
    }
    auto r = write_int32_be(out, static_cast<int32_t>(s.size()));
    if (r.is_err() || s.empty()) return r;
    return out.write(s.data(), s.size());
}

std::optional<std::string> read_optional_string(InputStream& in, std::size_t max_bytes) {
    auto r = read_string(in, max_bytes);
    if (r.is_err() || r.value.empty()) return std::nullopt;
    return std::move(r.value);
}

Result<void> write_request(OutputStream& out, const Argv& args) {
    if (args.size() > static_cast<std::size_t>(MAX_ARGC)) {
        return Result<void>::Err(fmt::format("Too many arguments ({})", args.size()));
    }
    auto r = write_int32_be(out, static_cast<int32_t>(args.size()));
    if (r.is_err()) return r;
    for (const auto& arg : args) {
        r = write_string(out, arg);
        if (r.is_err()) return r;
    }
    return Result<void>::Ok();
}

Result<Argv> read_request(InputStream& in, std::size_t max_bytes) {
    auto argc = read_int32_be(in);
    if (argc.is_err()) return Result<Argv>::Err(argc.error);
    if (argc.value < 0 || argc.value > MAX_ARGC) {
        return Result<Argv>::Err(fmt::format("Malformed argument count {}", argc.value));
    }

    Argv args;
    args.reserve(static_cast<std::size_t>(argc.value));
    for (int32_t i = 0; i < argc.value; ++i) {
        auto s = read_string(in, max_bytes);
        if (s.is_err()) {
            return Result<Argv>::Err(fmt::format("argument {}/{}: {}", i + 1, argc.value, s.error));
        }
        args.push_back(std::move(s.value));
    }
    return Result<Argv>::Ok(std::move(args));
}

Result<void> write_result(OutputStream& out, const CommandResult& result) {
    auto r = write_int32_be(out, result.code);
    if (r.is_err()) return r;
    return write_string(out, result.output.value_or(""));
}

Result<CommandResult> read_result(InputStream& in, std::size_t max_bytes) {
    auto code = read_int32_be(in);
    if (code.is_err()) return Result<CommandResult>::Err(code.error);

    CommandResult result;
    result.code = code.value;
    result.output = read_optional_string(in, max_bytes);
    return Result<CommandResult>::Ok(std::move(result));
}
