#pragma once

// ============================================================
// settings.hpp -- Persisted relay settings (settings.json)
// ============================================================

#include "platform.hpp"
#include "result.hpp"
#include <string>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

struct Settings {
    u16         port{3333};
    std::string host{"localhost"};
    bool        filter_in_scope{true};
    bool        enabled{true};

    bool operator==(const Settings& o) const {
        return port == o.port && host == o.host &&
               filter_in_scope == o.filter_in_scope && enabled == o.enabled;
    }
    bool operator!=(const Settings& o) const { return !(*this == o); }
};

// JSON keys: port, host, filterInScope, enabled
void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);

std::string settings_to_json(const Settings& s);

// Throws std::runtime_error when the text is not a valid settings object
Settings settings_from_json(const std::string& text);

// Owns the on-disk settings file and the process-wide cached copy.
//
// The cache holds an immutable snapshot; readers take a shared_ptr and keep
// using it even if save() swaps in a newer one (last write wins).
class SettingsStore {
public:
    explicit SettingsStore(const std::string& config_dir);

    const std::string& path() const { return path_; }

    // Read the file. Never fails: absent or unparsable files yield defaults.
    Settings load() const;

    // Write atomically (temp file + rename), then replace the cached snapshot
    Result<Settings> save(const Settings& settings);

    // Cached snapshot, loaded from disk on first use
    std::shared_ptr<const Settings> current();

private:
    std::string path_;

    std::mutex                      cache_mutex_;
    std::shared_ptr<const Settings> cached_;
};
