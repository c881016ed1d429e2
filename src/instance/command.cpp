#include "command.hpp"
#include <iostream>

CommandHandler make_sync_handler(SyncCommandHandler fn) {
    return [fn = std::move(fn)](const Argv& args, InputStream& in) {
        std::promise<CommandResult> promise;
        try {
            promise.set_value(fn(args, in));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        return promise.get_future();
    };
}

SystemStreams SystemStreams::standard() {
    SystemStreams streams;
    streams.in = standard_input();
    streams.out = &std::cout;
    streams.err = &std::cerr;
    return streams;
}

void print_result_output(const CommandResult& result, const SystemStreams& streams) {
    if (!result.output) return;

    std::ostream* os = result.code == 0 ? streams.out : streams.err;
    if (!os) return;
    *os << *result.output << "\n";
    os->flush();
}
