// ============================================================
// settings.cpp
// ============================================================

#include "settings.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

void to_json(nlohmann::json& j, const Settings& s) {
    j = nlohmann::json{
        {"port", s.port},
        {"host", s.host},
        {"filterInScope", s.filter_in_scope},
        {"enabled", s.enabled},
    };
}

// Missing keys keep their defaults; present keys must have the right type.
void from_json(const nlohmann::json& j, Settings& s) {
    if (!j.is_object()) {
        throw std::runtime_error("settings must be a JSON object");
    }
    if (j.contains("port")) {
        int port = j.at("port").get<int>();
        if (port < 1 || port > 65535) {
            throw std::runtime_error("port out of range: " + std::to_string(port));
        }
        s.port = (u16)port;
    }
    if (j.contains("host"))          j.at("host").get_to(s.host);
    if (j.contains("filterInScope")) j.at("filterInScope").get_to(s.filter_in_scope);
    if (j.contains("enabled"))       j.at("enabled").get_to(s.enabled);
}

std::string settings_to_json(const Settings& s) {
    nlohmann::json j = s;
    return j.dump(2);
}

Settings settings_from_json(const std::string& text) {
    try {
        return nlohmann::json::parse(text).get<Settings>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("invalid settings JSON: ") + e.what());
    }
}

SettingsStore::SettingsStore(const std::string& config_dir)
    : path_((fs::path(config_dir) / "settings.json").string())
{}

Settings SettingsStore::load() const {
    LOG_DEBUG("Loading settings from " + path_);

    std::ifstream f(path_);
    if (!f) {
        LOG_INFO("No settings at " + path_ + ", using defaults");
        return Settings{};
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    try {
        return settings_from_json(ss.str());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read settings: " + std::string(e.what()));
        return Settings{};
    }
}

Result<Settings> SettingsStore::save(const Settings& settings) {
    std::string tmp_path = path_ + ".tmp";
    try {
        fs::path dir = fs::path(path_).parent_path();
        if (!dir.empty()) {
            fs::create_directories(dir);
        }

        {
            std::ofstream f(tmp_path, std::ios::trunc);
            if (!f) {
                throw std::runtime_error("cannot open " + tmp_path + " for writing");
            }
            f << settings_to_json(settings);
            f.flush();
            if (!f) {
                throw std::runtime_error("write to " + tmp_path + " failed");
            }
        }
        fs::rename(tmp_path, path_);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        LOG_ERROR("Failed to save settings: " + std::string(e.what()));
        return Result<Settings>::fail("Failed to save settings: " + std::string(e.what()));
    }

    LOG_INFO("Settings saved to " + path_);
    {
        std::lock_guard<std::mutex> lk(cache_mutex_);
        cached_ = std::make_shared<const Settings>(settings);
    }
    return Result<Settings>::ok(settings);
}

std::shared_ptr<const Settings> SettingsStore::current() {
    {
        std::lock_guard<std::mutex> lk(cache_mutex_);
        if (cached_) return cached_;
    }
    // Load outside the lock; a save() that lands meanwhile takes precedence
    auto loaded = std::make_shared<const Settings>(load());
    std::lock_guard<std::mutex> lk(cache_mutex_);
    if (!cached_) cached_ = loaded;
    return cached_;
}
