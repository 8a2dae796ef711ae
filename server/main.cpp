// ============================================================
// server/main.cpp -- jxrelay daemon entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "relay_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static RelayServer* g_server = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_server) g_server->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <config_dir> <ip> <port> [options]\n"
        << "\n"
        << "  config_dir             directory holding settings.json\n"
        << "  ip                     IP address to listen on (0.0.0.0 for all interfaces)\n"
        << "  port                   TCP port for relay clients (e.g. 7400)\n"
        << "\nOptions:\n"
        << "  --session-timeout-s N  drop chunked sessions idle for N seconds (default: 60)\n"
        << "  --no-compress          refuse zstd-compressed chunk pieces\n"
        << "  --verbose              enable debug logging\n"
        << "  --log-file PATH        also append log lines to PATH\n"
        << "  --error-log PATH       append protocol and forwarding failures to PATH\n"
        << "\nCompleted artifacts are POSTed to http://<host>:<port>/caido-ingest\n"
        << "as configured in settings.json (default localhost:3333).\n"
        << "\nExample:\n"
        << "  " << prog << " ~/.jxrelay 127.0.0.1 7400\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    cfg.config_dir = argv[1];
    cfg.listen_ip  = argv[2];
    int port_int   = std::atoi(argv[3]);
    long timeout_s = DEFAULT_SESSION_TIMEOUT_MS / 1000;
    std::string log_file;
    std::string error_log;
    bool verbose = false;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--session-timeout-s") == 0 && i + 1 < argc) {
            timeout_s = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-compress") == 0) {
            cfg.use_compress = false;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--error-log") == 0 && i + 1 < argc) {
            error_log = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (cfg.config_dir.empty()) {
        std::cerr << "ERROR: Invalid config_dir\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (timeout_s < 1 || timeout_s > 24 * 3600) {
        std::cerr << "ERROR: --session-timeout-s must be 1-86400\n";
        return 1;
    }

    cfg.listen_port        = (u16)port_int;
    cfg.session_timeout_ms = (u32)timeout_s * 1000u;

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << log_file << "\n";
        return 1;
    }
    Logger::get().set_relay_error_file(error_log);

    try {
        RelayServer server(std::move(cfg));
        g_server = &server;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = server.run();
        g_server = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_server = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
