// ============================================================
// relay_channel.cpp
// ============================================================

#include "relay_channel.hpp"
#include "../common/protocol_io.hpp"
#include "../common/relay_codec.hpp"
#include "../common/logger.hpp"
#include <cstring>

namespace {

constexpr int HELLO_TIMEOUT_MS = 8000;

} // namespace

TcpRelayChannel::TcpRelayChannel(std::string host, u16 port, bool want_compress)
    : host_(std::move(host))
    , port_(port)
    , want_compress_(want_compress)
{}

void TcpRelayChannel::connect_locked() {
    TcpSocket sock;
    sock.connect(host_, port_);
    sock.set_recv_timeout_ms(HELLO_TIMEOUT_MS);

    Hello hello{};
    hello_init(hello, want_compress_ ? (u16)CAP_COMPRESS : (u16)0);
    proto::encode_hello(hello);
    sock.write_frame(MsgType::MT_HELLO, 0, &hello, sizeof(hello));

    FrameHeader hdr{};
    std::vector<u8> payload;
    if (!sock.read_frame(hdr, payload)) {
        throw std::runtime_error("Relay closed the connection during HELLO");
    }
    if ((MsgType)hdr.msg_type != MsgType::MT_HELLO_ACK || payload.size() != sizeof(HelloAck)) {
        throw ProtocolError(std::string("Expected HELLO_ACK, got ") +
                            msg_type_name((MsgType)hdr.msg_type));
    }
    HelloAck ack{};
    std::memcpy(&ack, payload.data(), sizeof(HelloAck));
    proto::decode_hello_ack(ack);

    sock.set_recv_timeout_ms(0);
    sock_        = std::move(sock);
    agreed_caps_ = ack.capabilities;
    LOG_DEBUG("Connected to relay " + host_ + ":" + std::to_string(port_) +
              " caps=" + std::to_string(agreed_caps_));
}

Result<std::vector<u8>> TcpRelayChannel::call(MsgType type, const std::vector<u8>& payload,
                                              MsgType expected_reply)
{
    std::lock_guard<std::mutex> lk(mutex_);
    try {
        if (!sock_.is_valid()) connect_locked();

        sock_.write_frame(type, payload);

        FrameHeader hdr{};
        std::vector<u8> reply;
        if (!sock_.read_frame(hdr, reply)) {
            throw std::runtime_error("Relay closed the connection");
        }

        MsgType got = (MsgType)hdr.msg_type;
        if (got == MsgType::MT_RESULT_ERR) {
            return Result<std::vector<u8>>::fail(codec::decode_string(reply));
        }
        if (got != expected_reply) {
            throw ProtocolError(std::string("Unexpected reply ") + msg_type_name(got) +
                                " to " + msg_type_name(type));
        }
        return Result<std::vector<u8>>::ok(std::move(reply));
    } catch (const std::exception& e) {
        sock_.close();
        agreed_caps_ = 0;
        Logger::get().relay_error(std::string(msg_type_name(type)) + " to " + host_ + ":" +
                                  std::to_string(port_) + ": " + e.what());
        return Result<std::vector<u8>>::fail("Relay call failed: " + std::string(e.what()));
    }
}

Result<void> TcpRelayChannel::submit_direct(const Artifact& artifact) {
    std::vector<u8> payload;
    try {
        payload = codec::encode_artifact(artifact);
    } catch (const std::exception& e) {
        return Result<void>::fail(e.what());
    }
    Result<std::vector<u8>> r = call(MsgType::MT_SUBMIT_DIRECT, payload);
    if (!r) return forward_failure<void>(r);
    return Result<void>::ok();
}

Result<ChunkAck> TcpRelayChannel::submit_chunk(const Chunk& chunk) {
    std::vector<u8> payload;
    try {
        bool compress;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (!sock_.is_valid()) connect_locked();
            compress = (agreed_caps_ & CAP_COMPRESS) != 0;
        }
        payload = codec::encode_chunk(chunk, compress);
    } catch (const std::exception& e) {
        return Result<ChunkAck>::fail("Relay call failed: " + std::string(e.what()));
    }

    Result<std::vector<u8>> r = call(MsgType::MT_SUBMIT_CHUNK, payload);
    if (!r) return forward_failure<ChunkAck>(r);
    try {
        return Result<ChunkAck>::ok(codec::decode_chunk_ack(r.data));
    } catch (const std::exception& e) {
        return Result<ChunkAck>::fail(e.what());
    }
}

Result<FetchedResource> TcpRelayChannel::fetch_url(const std::string& url) {
    Result<std::vector<u8>> r = call(MsgType::MT_FETCH_URL, codec::encode_string(url));
    if (!r) return forward_failure<FetchedResource>(r);
    try {
        return Result<FetchedResource>::ok(codec::decode_fetched(r.data));
    } catch (const std::exception& e) {
        return Result<FetchedResource>::fail(e.what());
    }
}

Result<Settings> TcpRelayChannel::get_settings() {
    Result<std::vector<u8>> r = call(MsgType::MT_GET_SETTINGS, {});
    if (!r) return forward_failure<Settings>(r);
    try {
        return Result<Settings>::ok(settings_from_json(codec::decode_string(r.data)));
    } catch (const std::exception& e) {
        return Result<Settings>::fail(e.what());
    }
}

Result<Settings> TcpRelayChannel::save_settings(const Settings& settings) {
    Result<std::vector<u8>> r = call(MsgType::MT_SAVE_SETTINGS,
                                     codec::encode_string(settings_to_json(settings)));
    if (!r) return forward_failure<Settings>(r);
    try {
        return Result<Settings>::ok(settings_from_json(codec::decode_string(r.data)));
    } catch (const std::exception& e) {
        return Result<Settings>::fail(e.what());
    }
}

Result<void> TcpRelayChannel::ping() {
    Result<std::vector<u8>> r = call(MsgType::MT_PING, {}, MsgType::MT_PONG);
    if (!r) return forward_failure<void>(r);
    return Result<void>::ok();
}
