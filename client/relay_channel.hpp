#pragma once

// ============================================================
// relay_channel.hpp -- Sender-side view of the relay RPC
//
// ChunkSender only needs the two submit calls, so they form the
// abstract RelayChannel. TcpRelayChannel is the socket implementation
// and adds the remaining RPCs used by the CLI.
// ============================================================

#include "../common/platform.hpp"
#include "../common/artifact.hpp"
#include "../common/result.hpp"
#include "../common/settings.hpp"
#include "../common/socket.hpp"
#include <string>
#include <vector>
#include <mutex>

class RelayChannel {
public:
    virtual ~RelayChannel() = default;

    // Whole artifact in one call
    virtual Result<void> submit_direct(const Artifact& artifact) = 0;

    // One chunk; data.complete is true on the call that finished the session
    virtual Result<ChunkAck> submit_chunk(const Chunk& chunk) = 0;
};

class TcpRelayChannel : public RelayChannel {
public:
    // want_compress: offer CAP_COMPRESS in HELLO
    TcpRelayChannel(std::string host, u16 port, bool want_compress = true);

    TcpRelayChannel(const TcpRelayChannel&) = delete;
    TcpRelayChannel& operator=(const TcpRelayChannel&) = delete;

    Result<void>            submit_direct(const Artifact& artifact) override;
    Result<ChunkAck>        submit_chunk(const Chunk& chunk) override;
    Result<FetchedResource> fetch_url(const std::string& url);
    Result<Settings>        get_settings();
    Result<Settings>        save_settings(const Settings& settings);
    Result<void>            ping();

    // Capabilities agreed in HELLO_ACK (0 before the first call)
    u16 agreed_caps() const { return agreed_caps_; }

private:
    std::string host_;
    u16         port_;
    bool        want_compress_;

    std::mutex  mutex_;        // one request in flight per connection
    TcpSocket   sock_;
    u16         agreed_caps_{0};

    void connect_locked();

    // One request/reply exchange. Transport errors close the socket so the
    // next call reconnects; an RESULT_ERR reply becomes Result::fail.
    Result<std::vector<u8>> call(MsgType type, const std::vector<u8>& payload,
                                 MsgType expected_reply = MsgType::MT_RESULT_OK);
};
