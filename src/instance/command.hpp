#pragma once

#include <functional>
#include <future>
#include <iosfwd>
#include <memory>
#include <core/types.hpp>
#include "streams.hpp"

// Application entry point for one command.
//
// Receives the argument vector and the command's stdin: the caller's own
// stdin for the leader's local command, the forwarded bytes of the connection
// for a follower's. The stream stays valid until the returned future is
// ready. May be invoked concurrently from several connection threads.
using CommandHandler = std::function<std::future<CommandResult>(const Argv&, InputStream&)>;

// Blocking flavour of a handler.
using SyncCommandHandler = std::function<CommandResult(const Argv&, InputStream&)>;

// Wrap a blocking handler. It runs on the calling thread; anything it throws
// is stored in the returned future.
CommandHandler make_sync_handler(SyncCommandHandler fn);

// Where a process reads its input and prints command output. Replaceable so
// embedders (and tests) can capture output.
struct SystemStreams {
    std::shared_ptr<InputStream> in;
    std::ostream* out = nullptr;
    std::ostream* err = nullptr;

    // stdin, std::cout, std::cerr
    static SystemStreams standard();
};

// Print result output, if any, on out (code 0) or err (any other code).
void print_result_output(const CommandResult& result, const SystemStreams& streams);
