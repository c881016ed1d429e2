#include <chrono>
#include <future>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <cli/theme.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <instance/unique_instance.hpp>

namespace {

const char* DEFAULT_APP_ID = "soloist.demo";
const char* VERSION = "0.1.0";

// Fired by the "stop" command, from whichever thread runs it.
struct StopSignal {
    std::promise<void> promise;
    std::once_flag once;

    void fire() {
        std::call_once(once, [this] { promise.set_value(); });
    }
};

std::string read_all(InputStream& in) {
    std::string data;
    char buf[4096];
    while (true) {
        auto n = in.read(buf, sizeof(buf));
        if (n.is_err()) throw std::runtime_error(n.error);
        if (n.value == 0) break;
        data.append(buf, n.value);
    }
    return data;
}

CommandResult dispatch(const Argv& args, InputStream& in, StopSignal& stop) {
    CommandResult result;
    if (args.empty()) {
        result.output = "leader ready";
        return result;
    }

    const std::string& cmd = args[0];
    if (cmd == "echo") {
        result.output = join(Argv(args.begin() + 1, args.end()), " ");
    } else if (cmd == "cat") {
        result.output = read_all(in);
    } else if (cmd == "exit") {
        const int invalid = std::numeric_limits<int>::min();
        int code = args.size() == 2 ? safe_stoi(args[1], invalid) : invalid;
        if (code == invalid) {
            result.code = 2;
            result.output = "usage: exit <n>";
        } else {
            result.code = code;
        }
    } else if (cmd == "stop") {
        stop.fire();
        result.output = "stopping";
    } else if (cmd == "fail") {
        throw std::runtime_error("fail requested");
    } else {
        result.code = 2;
        result.output = "unknown command: " + cmd;
    }
    return result;
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage("soloist", "[cmd]", "Run cmd in the leader (starting it if needed)");
    std::cout << theme::section("Commands");
    std::cout << theme::usage("echo", "<words>", "Print words");
    std::cout << theme::usage("cat", "", "Print stdin");
    std::cout << theme::usage("exit", "<n>", "Exit with code n");
    std::cout << theme::usage("stop", "", "Stop the leader");
    std::cout << theme::usage("fail", "", "Make the command throw");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    soloist --app-id <id> [cmd]   Use another instance\n"
              << "    soloist --version             Show version\n"
              << "    soloist --help                Show this help"
              << theme::color::RESET << "\n\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        Argv args(argv + 1, argv + argc);

        if (!args.empty() && args[0] == "--version") {
            std::cout << theme::brown("soloist") << theme::dim(std::string(" version ") + VERSION) << "\n";
            return 0;
        }
        if (!args.empty() && args[0] == "--help") {
            print_usage();
            return 0;
        }

        std::string app_id = DEFAULT_APP_ID;
        if (!args.empty() && args[0] == "--app-id") {
            if (args.size() < 2) {
                std::cerr << theme::fail("Missing value for --app-id.");
                return 1;
            }
            app_id = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        auto options = load_options(default_options_path());
        if (options.is_err()) {
            std::cerr << theme::fail(options.error);
            return CODE_ERROR;
        }

        auto stop = std::make_shared<StopSignal>();
        auto stopped = stop->promise.get_future();

        UniqueInstance instance(app_id, options.value);
        auto handler = make_sync_handler([stop](const Argv& a, InputStream& in) {
            return dispatch(a, in, *stop);
        });

        std::promise<void> ready;
        ready.set_value();

        // Followers never come back from here.
        auto done = start_unique_instance(instance, handler, args, ready.get_future().share());

        int exit_code = CODE_SUCCESS;
        try {
            done.get();
        } catch (const std::exception& e) {
            std::cerr << theme::fail(e.what());
            exit_code = CODE_CMD_ERROR;
        }

        stopped.wait();
        instance.stop();
        instance.wait_connections(std::chrono::milliseconds(options.value.drain_timeout_ms));
        instance.shutdown();
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
