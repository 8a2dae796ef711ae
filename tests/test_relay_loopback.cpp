#include <gtest/gtest.h>

#include <csignal>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include "../client/chunk_sender.hpp"
#include "../client/client_app.hpp"
#include "../client/relay_channel.hpp"
#include "../server/relay_server.hpp"
#include "test_support.hpp"

using namespace ::testing;
using testsupport::FakeHttpSink;
using testsupport::TempDir;
using testsupport::pattern_bytes;

namespace {

RelayServer* g_signalled_server = nullptr;

void stop_on_signal(int) {
    if (g_signalled_server) g_signalled_server->stop();
}

// Daemon on an ephemeral localhost port whose ingestion sink is a FakeHttpSink
class RelayLoopbackTest : public ::testing::Test {
protected:
    TempDir                      dir_;
    FakeHttpSink                 sink_;
    std::unique_ptr<RelayServer> server_;
    std::thread                  server_thread_;

    void SetUp() override { testsupport::quiet_logger(); }

    void TearDown() override {
        if (server_) server_->stop();
        if (server_thread_.joinable()) server_thread_.join();
    }

    void start_server(bool use_compress = true) {
        ServerConfig cfg;
        cfg.config_dir   = dir_.str();
        cfg.listen_ip    = "127.0.0.1";
        cfg.listen_port  = 0;
        cfg.use_compress = use_compress;
        server_ = std::make_unique<RelayServer>(cfg);

        Settings s;
        s.host = "127.0.0.1";
        s.port = sink_.port();
        ASSERT_TRUE(server_->settings().save(s).success);

        server_->start();
        server_thread_ = std::thread([this] { server_->run(); });
    }

    std::unique_ptr<TcpRelayChannel> channel(bool want_compress = true) {
        return std::make_unique<TcpRelayChannel>("127.0.0.1", server_->port(), want_compress);
    }

    std::string write_file(const std::string& name, const std::string& data) {
        std::string path = (dir_.path() / name).string();
        std::ofstream f(path, std::ios::binary);
        f << data;
        return path;
    }

    static Artifact make_artifact(size_t req_len, size_t resp_len) {
        Artifact a;
        a.url      = "https://target.example/assets/vendor.js";
        a.request  = "GET /assets/vendor.js HTTP/1.1\r\n\r\n" + pattern_bytes(req_len, 11);
        a.response = "HTTP/1.1 200 OK\r\n\r\n" + pattern_bytes(resp_len, 12);
        return a;
    }
};

TEST_F(RelayLoopbackTest, HandshakeAndPing) {
    start_server();
    auto ch = channel();
    ASSERT_TRUE(ch->ping().success);
    EXPECT_EQ(ch->agreed_caps(), (u16)CAP_COMPRESS);
}

TEST_F(RelayLoopbackTest, SmallArtifactGoesDirectToSink) {
    start_server();
    auto ch = channel();
    ChunkSender sender(*ch);

    Artifact a = make_artifact(100, 2000);
    auto r = sender.send(a);
    ASSERT_TRUE(r.success) << r.error;

    auto reqs = sink_.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].rfind("POST /caido-ingest HTTP/1.1\r\n", 0), 0u);
    auto body = testsupport::ingest_json(reqs[0]);
    EXPECT_EQ(body["requestUrl"], a.url);
    EXPECT_EQ(body["request"].get<std::string>(), a.request);
    EXPECT_EQ(body["response"].get<std::string>(), a.response);
}

TEST_F(RelayLoopbackTest, LargeArtifactChunkedAndReassembled) {
    start_server();
    auto ch = channel();
    ChunkSender sender(*ch, 256 * 1024);

    Artifact a = make_artifact(300 * 1024, 1200 * 1024);
    auto r = sender.send(a);
    ASSERT_TRUE(r.success) << r.error;

    auto reqs = sink_.requests();
    ASSERT_EQ(reqs.size(), 1u);
    auto body = testsupport::ingest_json(reqs[0]);
    EXPECT_EQ(body["requestUrl"], a.url);
    EXPECT_EQ(body["request"].get<std::string>(), a.request);
    EXPECT_EQ(body["response"].get<std::string>(), a.response);
    EXPECT_EQ(server_->reassembler().session_count(), 0u);
}

TEST_F(RelayLoopbackTest, WorksWithoutCompression) {
    start_server(false);
    auto ch = channel();
    ASSERT_TRUE(ch->ping().success);
    EXPECT_EQ(ch->agreed_caps(), 0);

    ChunkSender sender(*ch, 64 * 1024);
    Artifact a = make_artifact(10, 200 * 1024);
    ASSERT_TRUE(sender.send(a).success);
    ASSERT_EQ(sink_.requests().size(), 1u);
}

TEST_F(RelayLoopbackTest, OutOfOrderChunkIsRejectedAndConnectionSurvives) {
    start_server();
    auto ch = channel();

    Chunk c0;
    c0.session_id   = "manual-session";
    c0.index        = 0;
    c0.total_chunks = 3;
    c0.has_url      = true;
    c0.url          = "u";
    c0.has_request  = true;
    c0.request_piece = "part0";
    auto r0 = ch->submit_chunk(c0);
    ASSERT_TRUE(r0.success) << r0.error;
    EXPECT_FALSE(r0.data.complete);

    Chunk c2 = c0;
    c2.index   = 2;
    c2.has_url = false;
    c2.url.clear();
    auto r2 = ch->submit_chunk(c2);
    EXPECT_FALSE(r2.success);
    EXPECT_EQ(r2.error, "Expected chunk 1, got 2");

    auto received = server_->reassembler().received_chunks("manual-session");
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(*received, 1u);
    EXPECT_TRUE(ch->ping().success);
    EXPECT_TRUE(sink_.requests().empty());
}

TEST_F(RelayLoopbackTest, SilentSinkFailsTheSend) {
    start_server();
    sink_.set_silent(true);
    auto ch = channel();
    ChunkSender sender(*ch);

    auto r = sender.send(make_artifact(10, 10));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Failed to send request to ingestion sink: No response received");
}

TEST_F(RelayLoopbackTest, SettingsRoundTripOverRpc) {
    start_server();
    auto ch = channel();

    auto got = ch->get_settings();
    ASSERT_TRUE(got.success) << got.error;
    EXPECT_EQ(got.data.host, "127.0.0.1");
    EXPECT_EQ(got.data.port, sink_.port());

    Settings changed = got.data;
    changed.enabled = false;
    auto saved = ch->save_settings(changed);
    ASSERT_TRUE(saved.success) << saved.error;
    EXPECT_EQ(saved.data, changed);

    SettingsStore on_disk(dir_.str());
    EXPECT_EQ(on_disk.load(), changed);
    EXPECT_FALSE(ch->get_settings().data.enabled);
}

TEST_F(RelayLoopbackTest, FetchReturnsRawRequestAndResponse) {
    start_server();
    auto ch = channel();
    std::string url = "http://127.0.0.1:" + std::to_string(sink_.port()) + "/static/app.js?v=3";

    auto f = ch->fetch_url(url);
    ASSERT_TRUE(f.success) << f.error;
    EXPECT_EQ(f.data.request_raw.rfind("GET /static/app.js?v=3 HTTP/1.1\r\nHost: 127.0.0.1:" +
                                       std::to_string(sink_.port()) + "\r\n", 0), 0u);
    EXPECT_EQ(f.data.response_raw, sink_.reply());

    auto reqs = sink_.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0], f.data.request_raw);
}

TEST_F(RelayLoopbackTest, FetchFailureComesBackAsError) {
    start_server();
    auto ch = channel();
    auto f = ch->fetch_url("ftp://example.com/a.js");
    EXPECT_FALSE(f.success);
    EXPECT_EQ(f.error, "Failed to fetch URL: Unsupported URL scheme: ftp");
    EXPECT_TRUE(sink_.requests().empty());
    EXPECT_TRUE(ch->ping().success);
}

TEST_F(RelayLoopbackTest, CaptureHonoursGateButSendDoesNot) {
    start_server();
    std::string req  = write_file("req.txt", "GET /x.js HTTP/1.1\r\n\r\n");
    std::string resp = write_file("resp.txt", "HTTP/1.1 200 OK\r\n\r\nx()");

    ClientConfig cfg;
    cfg.relay_host = "127.0.0.1";
    cfg.relay_port = server_->port();
    ClientApp app(cfg);

    // filterInScope defaults to true: out-of-scope captures are dropped
    EXPECT_EQ(app.cmd_capture("https://t/x.js", req, resp, false), RC_OK);
    EXPECT_TRUE(sink_.requests().empty());

    EXPECT_EQ(app.cmd_capture("https://t/x.js", req, resp, true), RC_OK);
    EXPECT_EQ(sink_.requests().size(), 1u);

    EXPECT_EQ(app.cmd_set_settings({"enabled=false"}), RC_OK);
    EXPECT_EQ(app.cmd_capture("https://t/x.js", req, resp, true), RC_OK);
    EXPECT_EQ(sink_.requests().size(), 1u);

    EXPECT_EQ(app.cmd_send("https://t/x.js", req, resp), RC_OK);
    EXPECT_EQ(sink_.requests().size(), 2u);

    EXPECT_EQ(app.cmd_send("https://t/x.js", req, (dir_.path() / "missing").string()), RC_FAILED);
}

TEST_F(RelayLoopbackTest, StopWithConnectedClientReturns) {
    start_server();
    auto ch = channel();
    ASSERT_TRUE(ch->ping().success);
    server_->stop();
    server_thread_.join();
    EXPECT_FALSE(ch->ping().success);
}

TEST_F(RelayLoopbackTest, StopFromSignalHandlerClosesConnections) {
    start_server();
    auto ch = channel();
    ASSERT_TRUE(ch->ping().success);

    g_signalled_server = server_.get();
    auto previous = std::signal(SIGUSR1, stop_on_signal);
    std::raise(SIGUSR1);
    std::signal(SIGUSR1, previous);
    g_signalled_server = nullptr;

    server_thread_.join();
    EXPECT_FALSE(ch->ping().success);
    server_->stop();  // second call is a no-op
}

} // namespace
