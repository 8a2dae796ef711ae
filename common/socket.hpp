#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or IPv4 literal) and connect
    void connect(const std::string& host, u16 port);

    // Server: bind + listen. Port 0 picks an ephemeral port (see local_port()).
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 64);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Receive whatever is available (at most 'len'); 0 on clean close
    size_t recv_some(void* buf, size_t len);

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);
    void write_frame(MsgType type, const std::vector<u8>& payload) {
        write_frame(type, 0, payload.data(), (u32)payload.size());
    }

    // Read next frame: fills header, resizes payload_buf and reads payload.
    // Returns false on clean close (peer disconnected)
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    // Stop both directions; unblocks a thread sitting in accept()/recv()
    void shutdown();
    void close();

    std::string peer_addr() const;
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
