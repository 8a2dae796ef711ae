// ============================================================
// relay_server.cpp -- jxrelay daemon implementation
// ============================================================

#include "relay_server.hpp"
#include "../common/protocol_io.hpp"
#include "../common/relay_codec.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <cstring>

namespace {

constexpr int HELLO_TIMEOUT_MS = 8000;

std::unique_ptr<HttpTransport> default_transport(std::unique_ptr<HttpTransport> http) {
    if (http) return http;
    return std::make_unique<TcpHttpTransport>();
}

} // namespace

RelayServer::RelayServer(ServerConfig config, std::unique_ptr<HttpTransport> http)
    : config_(std::move(config))
    , http_(default_transport(std::move(http)))
    , settings_(config_.config_dir)
    , forwarder_(settings_, *http_)
    , fetcher_(*http_)
    , reassembler_(forwarder_, std::chrono::milliseconds(config_.session_timeout_ms))
{}

RelayServer::~RelayServer() {
    stop();
    shutdown_connections();
    join_all();
}

void RelayServer::start() {
    if (started_.load()) return;
    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    port_ = listen_sock_.local_port();
    running_.store(true);
    started_.store(true);

    LOG_INFO("jxrelay listening on " + config_.listen_ip + ":" + std::to_string(port_) +
             " (settings: " + settings_.path() + ", session timeout " +
             std::to_string(config_.session_timeout_ms / 1000) + " s" +
             (config_.use_compress ? ", zstd" : "") + ")");
}

int RelayServer::run() {
    start();
    accept_loop();
    shutdown_connections();
    join_all();
    listen_sock_.close();
    LOG_INFO("jxrelay stopped");
    return 0;
}

// No locks here: stop() runs from signal handlers. run() takes down the
// connection sockets once accept_loop() has returned.
void RelayServer::stop() {
    if (!running_.exchange(false)) return;
    listen_sock_.shutdown();
}

void RelayServer::shutdown_connections() {
    std::lock_guard<std::mutex> lk(conn_mutex_);
    for (auto& kv : conn_sockets_) {
        kv.second->shutdown();
    }
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop; every accepted socket gets its own thread.
// ---------------------------------------------------------------
void RelayServer::accept_loop() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (!running_.load()) break;
            sock.tune();
            LOG_DEBUG("Accepted connection from " + sock.peer_addr());

            reap_finished();
            std::lock_guard<std::mutex> lk(conn_mutex_);
            u64 id = next_conn_id_++;
            conn_threads_.emplace(id, std::thread(
                [this, id, s = std::move(sock)]() mutable {
                    connection_thread(id, std::move(s));
                }));
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

void RelayServer::connection_thread(u64 conn_id, TcpSocket sock) {
    std::string peer = sock.peer_addr();
    {
        std::lock_guard<std::mutex> lk(conn_mutex_);
        conn_sockets_[conn_id] = &sock;
        // stop() may have run between accept and registration
        if (!running_.load()) sock.shutdown();
    }

    try {
        u16 caps = 0;
        if (do_hello(sock, caps)) {
            LOG_DEBUG("Relay client " + peer + " caps=" + std::to_string(caps));
            FrameHeader hdr{};
            std::vector<u8> payload;
            while (running_.load() && sock.read_frame(hdr, payload)) {
                dispatch(sock, hdr, payload, caps);
            }
        }
    } catch (const std::exception& e) {
        if (running_.load()) {
            LOG_WARN("Connection " + peer + " dropped: " + e.what());
        }
    }

    std::lock_guard<std::mutex> lk(conn_mutex_);
    conn_sockets_.erase(conn_id);
    finished_conns_.push_back(conn_id);
}

bool RelayServer::do_hello(TcpSocket& sock, u16& agreed_caps) {
    sock.set_recv_timeout_ms(HELLO_TIMEOUT_MS);

    FrameHeader hdr{};
    std::vector<u8> payload;
    if (!sock.read_frame(hdr, payload)) return false;

    if ((MsgType)hdr.msg_type != MsgType::MT_HELLO || payload.size() != sizeof(Hello)) {
        LOG_WARN("Expected HELLO from " + sock.peer_addr() + ", got " +
                 msg_type_name((MsgType)hdr.msg_type));
        return false;
    }
    Hello hello{};
    std::memcpy(&hello, payload.data(), sizeof(Hello));
    proto::decode_hello(hello);
    if (!hello_valid_magic(hello) || hello.version != JXRELAY_VERSION) {
        LOG_WARN("Bad HELLO magic/version from " + sock.peer_addr());
        return false;
    }

    u16 ours = config_.use_compress ? (u16)CAP_COMPRESS : (u16)0;
    agreed_caps = hello.capabilities & ours;

    HelloAck ack{};
    ack.capabilities    = agreed_caps;
    ack.max_payload_len = MAX_PAYLOAD_LEN;
    proto::encode_hello_ack(ack);
    sock.write_frame(MsgType::MT_HELLO_ACK, 0, &ack, sizeof(ack));

    sock.set_recv_timeout_ms(0);
    return true;
}

void RelayServer::dispatch(TcpSocket& sock, const FrameHeader& hdr,
                           const std::vector<u8>& payload, u16 agreed_caps)
{
    MsgType type = (MsgType)hdr.msg_type;
    LOG_DEBUG(std::string("<- ") + msg_type_name(type) + " " + std::to_string(payload.size()) + " B");

    try {
        switch (type) {
        case MsgType::MT_PING:
            sock.write_frame(MsgType::MT_PONG, 0, nullptr, 0);
            return;

        case MsgType::MT_SUBMIT_DIRECT: {
            Artifact artifact = codec::decode_artifact(payload);
            Result<void> r = forwarder_.forward(artifact);
            if (r) {
                LOG_INFO("Relayed " + artifact.url + " (" +
                         utils::format_bytes(artifact.total_size()) + ")");
                reply_ok(sock, {});
            } else {
                reply_err(sock, r.error);
            }
            return;
        }

        case MsgType::MT_SUBMIT_CHUNK: {
            Chunk chunk = codec::decode_chunk(payload, (agreed_caps & CAP_COMPRESS) != 0);
            Result<ChunkAck> r = reassembler_.submit_chunk(chunk);
            if (r) reply_ok(sock, codec::encode_chunk_ack(r.data));
            else   reply_err(sock, r.error);
            return;
        }

        case MsgType::MT_FETCH_URL: {
            std::string url = codec::decode_string(payload);
            Result<FetchedResource> r = fetcher_.fetch_url(url);
            if (r) reply_ok(sock, codec::encode_fetched(r.data));
            else   reply_err(sock, r.error);
            return;
        }

        case MsgType::MT_GET_SETTINGS:
            reply_ok(sock, codec::encode_string(settings_to_json(settings_.load())));
            return;

        case MsgType::MT_SAVE_SETTINGS: {
            Settings wanted = settings_from_json(codec::decode_string(payload));
            Result<Settings> r = settings_.save(wanted);
            if (r) reply_ok(sock, codec::encode_string(settings_to_json(r.data)));
            else   reply_err(sock, r.error);
            return;
        }

        default:
            Logger::get().relay_error(std::string("unexpected ") + msg_type_name(type) +
                                      " from " + sock.peer_addr());
            reply_err(sock, std::string("Unexpected message type ") + msg_type_name(type));
            return;
        }
    } catch (const ProtocolError& e) {
        Logger::get().relay_error(std::string(msg_type_name(type)) + " from " +
                                  sock.peer_addr() + ": " + e.what());
        reply_err(sock, e.what());
    } catch (const std::exception& e) {
        // encode-side failures (reply too large, bad settings text)
        LOG_ERROR(std::string(msg_type_name(type)) + ": " + e.what());
        reply_err(sock, e.what());
    }
}

void RelayServer::reply_ok(TcpSocket& sock, const std::vector<u8>& payload) {
    sock.write_frame(MsgType::MT_RESULT_OK, payload);
}

void RelayServer::reply_err(TcpSocket& sock, const std::string& message) {
    sock.write_frame(MsgType::MT_RESULT_ERR, codec::encode_string(message));
}

void RelayServer::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lk(conn_mutex_);
        for (u64 id : finished_conns_) {
            auto it = conn_threads_.find(id);
            if (it == conn_threads_.end()) continue;
            done.push_back(std::move(it->second));
            conn_threads_.erase(it);
        }
        finished_conns_.clear();
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void RelayServer::join_all() {
    std::vector<std::thread> all;
    {
        std::lock_guard<std::mutex> lk(conn_mutex_);
        for (auto& kv : conn_threads_) all.push_back(std::move(kv.second));
        conn_threads_.clear();
        finished_conns_.clear();
    }
    for (auto& t : all) {
        if (t.joinable()) t.join();
    }
}
