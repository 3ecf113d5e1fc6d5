#include "config.hpp"
#include "agent_process.hpp"
#include "debouncer.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "flush_stats.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <optional>
#include <fcntl.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

static std::atomic<bool> g_shutdown{false};
static int g_shutdown_pipe[2] = {-1, -1};

// Wakes both reader loops. Async-signal-safe.
static void request_shutdown() {
    if (g_shutdown.exchange(true)) return;
    char b = 0;
    [[maybe_unused]] ssize_t n = ::write(g_shutdown_pipe[1], &b, 1);
}

static void signal_handler(int /*sig*/) {
    request_shutdown();
}

static void print_usage() {
    std::cerr << "Usage: decaf [options] [--] AGENT_COMMAND [ARGS...]\n"
              << "\n"
              << "Runs AGENT_COMMAND as an ACP agent and relays its stdio to ours,\n"
              << "coalescing agent_message_chunk text into one chunk per interval.\n"
              << "\n"
              << "Options:\n"
              << "  -i, --interval MS    Flush interval in milliseconds (default: "
              << decaf::kDefaultIntervalMs << ")\n"
              << "  -v, --verbose        Log every flush and a summary on exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "A bare number before the agent command is taken as the interval.\n"
              << "The agent command may itself be another ACP proxy.\n"
              << "\n"
              << "Environment variables:\n"
              << "  DECAF_CONFIG         Config file (default: ~/.decaf/config.json)\n"
              << "  DECAF_INTERVAL_MS    Flush interval in milliseconds\n"
              << "  DECAF_VERBOSE        Set to 1 for verbose logging\n";
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::optional<uint32_t> interval_ms;
    bool verbose = false;
    std::vector<std::string> agent_command;

    int i = 1;
    for (; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-i") == 0 || std::strcmp(argv[i], "--interval") == 0) {
            uint32_t value = 0;
            if (i + 1 >= argc || !decaf::parse_positive_uint(argv[i + 1], value)) {
                std::cerr << "Error: " << argv[i] << " needs a positive number of milliseconds\n";
                return 1;
            }
            interval_ms = value;
            i++;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--") == 0) {
            i++;
            break;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            uint32_t value = 0;
            if (!interval_ms && decaf::parse_positive_uint(argv[i], value)) {
                interval_ms = value;
                continue;
            }
            break;
        }
    }
    for (; i < argc; i++) {
        agent_command.emplace_back(argv[i]);
    }

    auto config = decaf::Config::load();

    // Override config with CLI args
    if (interval_ms) config.interval_ms = *interval_ms;
    if (verbose) config.verbose = true;
    if (!agent_command.empty()) config.agent_command = std::move(agent_command);

    if (config.agent_command.empty()) {
        std::cerr << "Error: no agent command given\n";
        print_usage();
        return 1;
    }

    if (::pipe2(g_shutdown_pipe, O_CLOEXEC) != 0) {
        std::cerr << "Error: failed to create shutdown pipe\n";
        return 1;
    }
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    decaf::AgentProcess agent(config.agent_command);
    std::string error;
    if (!agent.start(error)) {
        std::cerr << "[agent] " << error << "\n";
        return 1;
    }

    decaf::FdSink to_client(STDOUT_FILENO, "client");
    decaf::FdSink to_agent(agent.stdin_fd(), "agent");

    decaf::EventBus bus;
    decaf::FlushStats stats;
    stats.subscribe_events(bus);

    if (config.verbose) {
        decaf::subscribe<decaf::TextFlushedEvent>(bus,
            [](const decaf::TextFlushedEvent& ev) {
                std::cerr << "[decaf] Flushed " << ev.bytes << " bytes for session "
                          << ev.session_id << " (" << ev.reason << ")\n";
            });
    }

    std::atomic<bool> failed{false};
    std::atomic<bool> agent_closed{false};

    decaf::Debouncer debouncer(config.interval(), to_client, to_agent);
    debouncer.set_event_bus(&bus);
    debouncer.set_error_handler([&failed](const std::string& err) {
        std::cerr << "[decaf] Timed flush failed: " << err << "\n";
        failed.store(true);
        request_shutdown();
    });
    debouncer.start();

    std::cerr << "[decaf] Relaying " << config.agent_command[0]
              << " (pid " << agent.pid() << "), flushing every "
              << config.interval_ms << " ms\n";

    // Agent -> client: the router path, one message at a time
    std::thread agent_thread([&]() {
        decaf::LineReader reader(agent.stdout_fd(), g_shutdown_pipe[0]);
        try {
            decaf::pump_messages(reader, "agent",
                [&debouncer](const nlohmann::json& message) {
                    debouncer.handle_agent_message(message);
                });
            if (!g_shutdown.load()) agent_closed.store(true);
        } catch (const std::exception& e) {
            std::cerr << "[decaf] Forwarding to client failed: " << e.what() << "\n";
            failed.store(true);
        }
        request_shutdown();
    });

    // Client -> agent
    decaf::LineReader client_reader(STDIN_FILENO, g_shutdown_pipe[0]);
    try {
        decaf::pump_messages(client_reader, "client",
            [&debouncer](const nlohmann::json& message) {
                debouncer.handle_client_message(message);
            });
    } catch (const std::exception& e) {
        std::cerr << "[decaf] Forwarding to agent failed: " << e.what() << "\n";
        failed.store(true);
    }
    request_shutdown();

    agent_thread.join();
    debouncer.stop();
    int agent_status = agent.stop();

    if (config.verbose) {
        std::cerr << "[decaf] " << stats.summary() << "\n";
    }
    std::cerr << "[decaf] Shutting down.\n";

    ::close(g_shutdown_pipe[0]);
    ::close(g_shutdown_pipe[1]);

    if (failed.load()) return 1;
    if (agent_closed.load()) return agent_status < 0 ? 1 : agent_status;
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
