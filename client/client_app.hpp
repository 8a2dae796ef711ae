#pragma once

// ============================================================
// client_app.hpp -- jxrelay_send: relays captures to the daemon
//   and drives its fetch and settings RPCs
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/settings.hpp"
#include "../common/result.hpp"
#include "relay_channel.hpp"
#include "chunk_sender.hpp"
#include <string>
#include <vector>

struct ClientConfig {
    std::string relay_host{"127.0.0.1"};
    u16         relay_port{0};
    u32         chunk_threshold{DEFAULT_CHUNK_THRESHOLD};
    bool        use_compress{true};
};

// Capture gate: nothing is relayed while disabled, and out-of-scope
// captures are dropped while filterInScope is on.
bool should_relay(const Settings& settings, bool in_scope);

// Apply "key=value" assignments (port, host, filterInScope, enabled) on top
// of base. Booleans accept true/false/yes/no/1/0.
Result<Settings> apply_settings_assignments(Settings base,
                                            const std::vector<std::string>& assignments);

// Exit codes of the cmd_* operations
enum ClientExit : int {
    RC_OK       = 0,
    RC_FAILED   = 3,   // the relay, the sink or a local file reported an error
};

class ClientApp {
public:
    explicit ClientApp(ClientConfig config);

    // Relay one request/response pair read from files. Never gated.
    int cmd_send(const std::string& url, const std::string& request_file,
                 const std::string& response_file);

    // Same as send, but subject to the daemon's capture gate
    int cmd_capture(const std::string& url, const std::string& request_file,
                    const std::string& response_file, bool in_scope);

    // Daemon fetches url, then the result is relayed like a capture
    int cmd_fetch(const std::string& url);

    int cmd_get_settings();
    int cmd_set_settings(const std::vector<std::string>& assignments);

    TcpRelayChannel& channel() { return channel_; }

private:
    ClientConfig    config_;
    TcpRelayChannel channel_;
    ChunkSender     sender_;

    int relay(const Artifact& artifact);
    int load_and_relay(const std::string& url, const std::string& request_file,
                       const std::string& response_file);
};
