#pragma once

#include <core/config.hpp>
#include <core/types.hpp>
#include "command.hpp"
#include "streams.hpp"

class ListenerState;

// Run the handler and wait for its result. A throw, a failed future or an
// invalid future all turn into CODE_CMD_ERROR with the message as output.
CommandResult invoke_handler(const CommandHandler& handler, const Argv& args, InputStream& in);

// Serve one follower connection: read its request, run the handler with the
// rest of the connection as stdin, write back the result, then close.
// Failures stay inside this connection; they are logged, never thrown.
void handle_connection(SharedSocket sock,
                       const CommandHandler& handler,
                       const ListenerState& state,
                       const InstanceOptions& options);
