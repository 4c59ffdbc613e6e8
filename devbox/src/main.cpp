#include "clock.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "events.hpp"
#include "instance_lifecycle.hpp"
#include "lambda_client.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <string>
#include <vector>

// Global token so the signal handler can interrupt a backoff or poll wait
CancellationToken cancel_token;

// Async-signal-safe: no logging or locking here.
void signal_handler(int) {
    cancel_token.request_cancel();
}

void print_usage() {
    spdlog::info("Usage: devbox <up|wait|down|ssh|list> [key=value ...]");
    spdlog::info("  up    launch an instance (retrying on capacity shortage) and wait until it is ready");
    spdlog::info("  wait  wait until instance_id is ready");
    spdlog::info("  down  terminate instance_id");
    spdlog::info("  ssh   print the ssh command for instance_id");
    spdlog::info("  list  list instances, or instance types with resource=instance-types");
}

int main(int argc, char** argv) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (argc < 2) {
        print_usage();
        return kExitFailure;
    }

    const std::string command = argv[1];
    const std::vector<std::string> overrides(argv + 2, argv + argc);

    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.apply_overrides(overrides);

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::debug("Log level set to '{}'", config.log_level);

        config.validate(command);

        // 3. Register signal handlers for cancellation
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Wire the engine and run the command
        LambdaClient client(config);
        SteadyClock clock;
        LoggingEventSink events;
        InstanceLifecycle lifecycle(client, clock, events);

        int exit_code = run_command(command, config, lifecycle, cancel_token);
        if (cancel_token.is_cancelled()) {
            spdlog::warn("Interrupted, {} cancelled", command);
        }
        return exit_code;

    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return kExitFailure;
    }
}
