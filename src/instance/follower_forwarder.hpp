#pragma once

#include <core/config.hpp>
#include <core/types.hpp>
#include "command.hpp"

// Send args and stdin to the leader listening on port, print its output and
// return its exit code. Any failure on the way is printed to streams.err and
// reported as CODE_ERROR.
int forward_command(int port, const Argv& args,
                    const SystemStreams& streams,
                    const InstanceOptions& options);
