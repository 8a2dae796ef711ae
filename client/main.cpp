// ============================================================
// client/main.cpp -- jxrelay_send entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <ip> <port> <command> [args] [options]\n"
        << "\n"
        << "  ip              jxrelay_server IP address\n"
        << "  port            jxrelay_server TCP port\n"
        << "\nCommands:\n"
        << "  send <url> <request_file> <response_file>     relay one pair\n"
        << "  capture <url> <request_file> <response_file>  relay unless the daemon's\n"
        << "                                                settings filter it out\n"
        << "  fetch <url>                                   daemon GETs url, result is relayed\n"
        << "  get-settings                                  print the daemon's settings\n"
        << "  set-settings key=value...                     keys: port host filterInScope enabled\n"
        << "\nOptions:\n"
        << "  --chunk-kb N       chunk threshold in KB (default: 500)\n"
        << "  --no-compress      do not offer zstd for chunk pieces\n"
        << "  --in-scope yes|no  scope of the capture (capture only, default: yes)\n"
        << "  --verbose          enable debug logging\n"
        << "  --log-file PATH    also append log lines to PATH\n"
        << "\nExamples:\n"
        << "  " << prog << " 127.0.0.1 7400 send https://example.com/app.js req.txt resp.txt\n"
        << "  " << prog << " 127.0.0.1 7400 set-settings port=3333 enabled=true\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ClientConfig cfg;
    cfg.relay_host = argv[1];
    int port_int   = std::atoi(argv[2]);
    std::string command = argv[3];

    std::vector<std::string> args;
    long chunk_kb = DEFAULT_CHUNK_THRESHOLD / 1024;
    bool in_scope = true;
    bool verbose  = false;
    std::string log_file;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--chunk-kb") == 0 && i + 1 < argc) {
            chunk_kb = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-compress") == 0) {
            cfg.use_compress = false;
        } else if (std::strcmp(argv[i], "--in-scope") == 0 && i + 1 < argc) {
            std::string v = utils::to_lower(argv[++i]);
            if (v == "yes")     in_scope = true;
            else if (v == "no") in_scope = false;
            else {
                std::cerr << "ERROR: --in-scope takes yes or no\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            args.push_back(argv[i]);
        }
    }

    if (!utils::validate_ip(cfg.relay_host)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.relay_host << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (chunk_kb < 1 || (u64)chunk_kb * 1024u > MAX_CHUNK_THRESHOLD) {
        std::cerr << "ERROR: --chunk-kb must be 1-" << (MAX_CHUNK_THRESHOLD / 1024) << "\n";
        return 1;
    }

    size_t want_args = 0;
    if (command == "send" || command == "capture")                  want_args = 3;
    else if (command == "fetch")                                    want_args = 1;
    else if (command == "get-settings")                             want_args = 0;
    else if (command == "set-settings" && !args.empty())            want_args = args.size();
    else {
        print_usage(argv[0]);
        return 1;
    }
    if (args.size() != want_args) {
        std::cerr << "ERROR: wrong number of arguments for " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    cfg.relay_port      = (u16)port_int;
    cfg.chunk_threshold = (u32)chunk_kb * 1024u;

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::WARN);
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << log_file << "\n";
        return 1;
    }

    try {
        ClientApp app(std::move(cfg));

        if (command == "send")         return app.cmd_send(args[0], args[1], args[2]);
        if (command == "capture")      return app.cmd_capture(args[0], args[1], args[2], in_scope);
        if (command == "fetch")        return app.cmd_fetch(args[0]);
        if (command == "get-settings") return app.cmd_get_settings();
        return app.cmd_set_settings(args);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
