/// mcpbridge: serves MCP over stdio, forwarding to a backend socket.
/// Usage: ./mcpbridge --backend-addr unix:/tmp/mcpbridge-backend.sock
/// stdout carries protocol lines only; logs go to stderr.

#include <mcpbridge/mcpbridge.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::atomic<bool> g_cancelled{false};
std::atomic<mcpbridge::StdioTransport*> g_transport{nullptr};

void signal_handler(int) {
    g_cancelled = true;
    if (auto* t = g_transport.load()) t->shutdown();
}

// Publishes the transport to the signal handler for its lifetime.
struct TransportRegistration {
    explicit TransportRegistration(mcpbridge::StdioTransport& t) { g_transport = &t; }
    ~TransportRegistration() { g_transport = nullptr; }
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLI::App app{"mcpbridge - MCP stdio to backend bridge"};

    std::string backend_addr = "unix:/tmp/mcpbridge-backend.sock";
    std::string log_level = "warn";
    std::string server_name = "mcpbridge";
    bool no_prompts = false;
    size_t max_line_bytes = mcpbridge::StdioTransport::Options{}.max_line_bytes;
    int64_t io_timeout_ms = 0;

    app.add_option("--backend-addr", backend_addr, "Backend address (unix:<path> or host:port)")
        ->envname("MCPBRIDGE_BACKEND_ADDR");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, off)")
        ->envname("MCPBRIDGE_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app.add_option("--server-name", server_name, "Name reported in the initialize reply");
    app.add_flag("--no-prompts", no_prompts, "Do not advertise or route prompts");
    app.add_option("--max-line-bytes", max_line_bytes, "Longest accepted input line")
        ->check(CLI::PositiveNumber);
    app.add_option("--io-timeout-ms", io_timeout_ms, "Backend round trip timeout, 0 for none")
        ->check(CLI::NonNegativeNumber);
    CLI11_PARSE(app, argc, argv);

    try {
        // Dedicated stderr logger so stdout only carries protocol lines
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("mcpbridge", stderr_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(log_level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        mcpbridge::SocketBackend::Options bopts;
        bopts.address = backend_addr;
        bopts.io_timeout = std::chrono::milliseconds(io_timeout_ms);
        mcpbridge::SocketBackend backend{bopts};

        mcpbridge::StdioTransport::Options topts;
        topts.max_line_bytes = max_line_bytes;
        mcpbridge::StdioTransport transport{topts};
        TransportRegistration registration{transport};

        mcpbridge::Bridge::Options opts;
        opts.server_info.name = server_name;
        opts.advertise_prompts = !no_prompts;
        mcpbridge::Bridge bridge{backend, std::move(opts)};

        spdlog::info("mcpbridge v{} (protocol {}), backend {}", mcpbridge::LIBRARY_VERSION,
                     mcpbridge::PROTOCOL_VERSION, backend_addr);

        bridge.serve(transport, g_cancelled);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
