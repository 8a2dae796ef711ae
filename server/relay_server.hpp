#pragma once

// ============================================================
// relay_server.hpp -- jxrelay daemon
//   Listens on a port and serves any number of concurrent sender
//   connections over the framed relay RPC.
//
// Concurrency model:
//   accept_loop()      -> accepts one socket at a time, spawns a
//                         connection thread per socket.
//   connection thread  -> HELLO/HELLO_ACK, then a request/reply loop
//                         until the peer disconnects or stop().
//   Shared state (session table, settings cache) lives in the
//   SessionReassembler and SettingsStore owned here; both lock
//   internally.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/settings.hpp"
#include "../common/http_client.hpp"
#include "ingest_forwarder.hpp"
#include "resource_fetcher.hpp"
#include "session_reassembler.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>

struct ServerConfig {
    std::string config_dir;
    std::string listen_ip{"127.0.0.1"};
    u16         listen_port{0};       // 0 = ephemeral, see RelayServer::port()
    bool        use_compress{true};
    u32         session_timeout_ms{DEFAULT_SESSION_TIMEOUT_MS};
};

class RelayServer {
public:
    // http: outbound transport for the ingestion sink and resource fetches;
    // a TcpHttpTransport when null.
    explicit RelayServer(ServerConfig config,
                         std::unique_ptr<HttpTransport> http = nullptr);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // Bind and listen; throws on failure
    void start();

    // Blocks until stop() is called. Calls start() if it has not run yet.
    int run();

    // Unblocks run(), which then closes every connection. Safe to call
    // from a signal handler.
    void stop();

    // Bound port, valid after start()
    u16 port() const { return port_; }

    SettingsStore&      settings()    { return settings_; }
    SessionReassembler& reassembler() { return reassembler_; }

private:
    ServerConfig                   config_;
    std::unique_ptr<HttpTransport> http_;
    SettingsStore                  settings_;
    IngestForwarder                forwarder_;
    ResourceFetcher                fetcher_;
    SessionReassembler             reassembler_;

    TcpSocket         listen_sock_;
    u16               port_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};

    // Connection threads by id; finished ids are joined on the next accept
    std::mutex                                conn_mutex_;
    std::unordered_map<u64, std::thread>      conn_threads_;
    std::unordered_map<u64, TcpSocket*>       conn_sockets_;
    std::vector<u64>                          finished_conns_;
    u64                                       next_conn_id_{1};

    void accept_loop();
    void connection_thread(u64 conn_id, TcpSocket sock);

    // HELLO/HELLO_ACK; returns false when the peer is not a relay client
    bool do_hello(TcpSocket& sock, u16& agreed_caps);

    // Answer one request frame. Faults in the request become RESULT_ERR;
    // only transport errors escape.
    void dispatch(TcpSocket& sock, const FrameHeader& hdr,
                  const std::vector<u8>& payload, u16 agreed_caps);

    void reply_ok(TcpSocket& sock, const std::vector<u8>& payload);
    void reply_err(TcpSocket& sock, const std::string& message);

    void shutdown_connections();
    void reap_finished();
    void join_all();
};
