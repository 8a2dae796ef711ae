// ============================================================
// client_app.cpp
// ============================================================

#include "client_app.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <cstdlib>

namespace {

Result<std::string> read_whole_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return Result<std::string>::fail("Cannot open " + path);
    }
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return Result<std::string>::fail("Read error on " + path);
    }
    return Result<std::string>::ok(std::move(data));
}

bool parse_bool(std::string v, bool& out) {
    v = utils::to_lower(v);
    if (v == "true" || v == "yes" || v == "1")  { out = true;  return true; }
    if (v == "false" || v == "no" || v == "0")  { out = false; return true; }
    return false;
}

} // namespace

bool should_relay(const Settings& settings, bool in_scope) {
    if (!settings.enabled) return false;
    if (settings.filter_in_scope && !in_scope) return false;
    return true;
}

Result<Settings> apply_settings_assignments(Settings base,
                                            const std::vector<std::string>& assignments)
{
    for (const auto& a : assignments) {
        size_t eq = a.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Result<Settings>::fail("Expected key=value, got '" + a + "'");
        }
        std::string key   = a.substr(0, eq);
        std::string value = a.substr(eq + 1);

        if (key == "port") {
            char* end = nullptr;
            long p = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || !end || *end != '\0' || !utils::validate_port((int)p)) {
                return Result<Settings>::fail("Invalid port: " + value);
            }
            base.port = (u16)p;
        } else if (key == "host") {
            if (value.empty()) return Result<Settings>::fail("Empty host");
            base.host = value;
        } else if (key == "filterInScope") {
            if (!parse_bool(value, base.filter_in_scope)) {
                return Result<Settings>::fail("Invalid boolean for filterInScope: " + value);
            }
        } else if (key == "enabled") {
            if (!parse_bool(value, base.enabled)) {
                return Result<Settings>::fail("Invalid boolean for enabled: " + value);
            }
        } else {
            return Result<Settings>::fail("Unknown setting: " + key);
        }
    }
    return Result<Settings>::ok(std::move(base));
}

ClientApp::ClientApp(ClientConfig config)
    : config_(std::move(config))
    , channel_(config_.relay_host, config_.relay_port, config_.use_compress)
    , sender_(channel_, config_.chunk_threshold)
{}

int ClientApp::relay(const Artifact& artifact) {
    Result<void> r = sender_.send(artifact);
    if (!r) {
        std::cerr << "Failed to send response: " << r.error << "\n";
        return RC_FAILED;
    }
    std::cout << "Sent " << artifact.url << " ("
              << utils::format_bytes(artifact.total_size()) << ")\n";
    return RC_OK;
}

int ClientApp::load_and_relay(const std::string& url, const std::string& request_file,
                              const std::string& response_file)
{
    Result<std::string> req = read_whole_file(request_file);
    if (!req) {
        std::cerr << "ERROR: " << req.error << "\n";
        return RC_FAILED;
    }
    Result<std::string> resp = read_whole_file(response_file);
    if (!resp) {
        std::cerr << "ERROR: " << resp.error << "\n";
        return RC_FAILED;
    }

    Artifact artifact;
    artifact.url      = url;
    artifact.request  = std::move(req.data);
    artifact.response = std::move(resp.data);
    return relay(artifact);
}

int ClientApp::cmd_send(const std::string& url, const std::string& request_file,
                        const std::string& response_file)
{
    return load_and_relay(url, request_file, response_file);
}

int ClientApp::cmd_capture(const std::string& url, const std::string& request_file,
                           const std::string& response_file, bool in_scope)
{
    Result<Settings> s = channel_.get_settings();
    if (!s) {
        std::cerr << "Failed to read settings: " << s.error << "\n";
        return RC_FAILED;
    }
    if (!should_relay(s.data, in_scope)) {
        LOG_INFO("Skipped " + url + (s.data.enabled ? " (out of scope)" : " (relay disabled)"));
        return RC_OK;
    }
    return load_and_relay(url, request_file, response_file);
}

int ClientApp::cmd_fetch(const std::string& url) {
    Result<FetchedResource> f = channel_.fetch_url(url);
    if (!f) {
        std::cerr << f.error << "\n";
        return RC_FAILED;
    }
    Artifact artifact;
    artifact.url      = url;
    artifact.request  = std::move(f.data.request_raw);
    artifact.response = std::move(f.data.response_raw);
    return relay(artifact);
}

int ClientApp::cmd_get_settings() {
    Result<Settings> s = channel_.get_settings();
    if (!s) {
        std::cerr << "Failed to read settings: " << s.error << "\n";
        return RC_FAILED;
    }
    std::cout << settings_to_json(s.data) << "\n";
    return RC_OK;
}

int ClientApp::cmd_set_settings(const std::vector<std::string>& assignments) {
    Result<Settings> current = channel_.get_settings();
    if (!current) {
        std::cerr << "Failed to read settings: " << current.error << "\n";
        return RC_FAILED;
    }
    Result<Settings> wanted = apply_settings_assignments(current.data, assignments);
    if (!wanted) {
        std::cerr << "ERROR: " << wanted.error << "\n";
        return RC_FAILED;
    }
    Result<Settings> saved = channel_.save_settings(wanted.data);
    if (!saved) {
        std::cerr << saved.error << "\n";
        return RC_FAILED;
    }
    std::cout << settings_to_json(saved.data) << "\n";
    return RC_OK;
}
