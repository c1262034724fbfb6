#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include "transport/handler_registry.hpp"
#include "transport/server.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

// ANSI escape codes
namespace term {
    constexpr const char* RESET  = "\033[0m";
    constexpr const char* BOLD   = "\033[1m";
    constexpr const char* DIM    = "\033[2m";
    constexpr const char* CYAN   = "\033[36m";
    constexpr const char* GREEN  = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* RED    = "\033[31m";
}

// Global server pointer for signal handling
static asap::transport::AsapServer* g_server = nullptr;

static void signal_handler(int signum) {
    (void)signum;
    if (g_server) {
        g_server->shutdown();
    }
}

static void print_status(const asap::wire::Manifest& manifest,
                         const asap::transport::AsapServer& server) {
    const auto& config = server.config();
    std::cout << "\n    " << term::CYAN << term::BOLD << "ASAP AGENT" << term::RESET << "\n";
    std::cout << "    " << term::DIM << "─────────────────────────────────────────" << term::RESET << "\n";
    std::cout << "    Agent       " << term::GREEN << manifest.id << term::RESET << "\n";
    std::cout << "    Name        " << manifest.name << " v" << manifest.version << "\n";
    std::cout << "    Listening   " << term::YELLOW << config.host << ":" << server.port()
              << term::RESET << "\n";
    std::cout << "    Workers     " << server.config().effective_max_threads() << "\n";
    std::cout << "    " << term::DIM << "Press Ctrl+C to shutdown" << term::RESET << "\n\n";
}

static asap::wire::Manifest build_manifest(const asap::transport::ServerConfig& config) {
    using asap::util::env_string;

    std::string public_host = config.host == "0.0.0.0" ? "localhost" : config.host;
    std::string default_endpoint = fmt::format("http://{}:{}/asap", public_host, config.port);

    asap::wire::Manifest manifest;
    manifest.id = env_string("ASAP_AGENT_ID", "urn:asap:agent:echo-agent");
    manifest.name = env_string("ASAP_AGENT_NAME", "Echo Agent");
    manifest.version = env_string("ASAP_AGENT_VERSION", "0.1.0");
    manifest.description = "Echoes task input back as the task result";
    manifest.capabilities.skills.push_back({"echo", "Echo back the input", std::nullopt, std::nullopt});
    manifest.endpoints.asap = env_string("ASAP_AGENT_ENDPOINT", default_endpoint);
    return manifest;
}

int main(int argc, char** argv) {
    asap::util::load_dotenv();

    auto config = asap::transport::ServerConfig::from_env();
    if (argc > 1) {
        int port = std::atoi(argv[1]);
        if (port < 0 || port > 65535) {
            std::cerr << "Invalid port: " << argv[1] << "\n";
            return 1;
        }
        config.port = static_cast<uint16_t>(port);
    }

    asap::util::init_logger(asap::util::log_level_from_string(config.log_level));

    asap::wire::Manifest manifest;
    try {
        manifest = build_manifest(config);
        // Round-trip through the validator so a bad ASAP_AGENT_ID fails early
        manifest = asap::wire::Manifest::from_json(manifest.to_json());
    } catch (const std::exception& e) {
        spdlog::error("Invalid agent manifest: {}", e.what());
        return 1;
    }

    auto registry = asap::transport::make_default_registry();
    asap::transport::AsapServer server(manifest, *registry, config);

    if (!server.init()) {
        std::cout << "\n    " << term::BOLD << term::RED << "✗" << term::RESET
                  << "  Failed to initialize server\n\n";
        return 1;
    }

    g_server = &server;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    print_status(manifest, server);

    // Blocks until Ctrl+C
    server.run();
    g_server = nullptr;

    std::cout << "\n    " << term::YELLOW << "⟳" << term::RESET
              << "  Shutting down gracefully...\n\n";
    return 0;
}
