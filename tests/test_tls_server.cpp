#include "hxfer/server.hpp"
#include "hxfer/session.hpp"
#include "hxfer/tls.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>

using namespace hxfer;
using namespace hxfer::test;

namespace {

class TlsServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_self_signed(receiver_private(), certs_.file("server.crt"), certs_.file("server.key"));
        tls_ = std::make_unique<TlsContext>(TlsContext::server(certs_.file("server.crt"), certs_.file("server.key")));

        ServerConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.port = 0;
        cfg.out_dir = out_.path();
        cfg.io_timeout_ms = 10000;
        server_ = std::make_unique<Server>(*tls_, receiver_private(), &sender_public(), cfg);
        server_->listen();
        thread_ = std::thread([this] { server_->serve(); });
    }

    void TearDown() override {
        server_->stop();
        thread_.join();
    }

    // Sends one file and reports whether the sender side completed.
    bool send(const TlsContext& client, const PrivateKey& signer, const std::string& name,
              const std::vector<uint8_t>& content, const std::string& host = "127.0.0.1") {
        write_file(source_.file(name), content);
        auto ch = tls_connect(host, server_->port(), client, 10000);
        SessionOptions opts;
        opts.chunk_size = 8192;
        SenderSession sender(*ch, receiver_public(), &signer, opts);
        try {
            sender.send_file(source_.file(name));
        } catch (const ChannelClosedError&) {
            return false;
        }
        return sender.state() == SessionState::Completed;
    }

    void wait_for(size_t total) {
        for (int i = 0; i < 1000 && server_->completed() + server_->aborted() < total; ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    TempDir certs_;
    TempDir source_;
    TempDir out_;
    std::unique_ptr<TlsContext> tls_;
    std::unique_ptr<Server> server_;
    std::thread thread_;
};

} // namespace

TEST_F(TlsServerTest, ListensOnEphemeralPort) {
    EXPECT_NE(server_->port(), 0);
}

TEST_F(TlsServerTest, ListeningIgnoresSigpipe) {
    struct sigaction sa{};
    ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &sa), 0);
    EXPECT_EQ(sa.sa_handler, SIG_IGN);
}

TEST_F(TlsServerTest, StoppedServerStartsNoSessions) {
    ServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.out_dir = out_.file("stopped");
    Server server(*tls_, receiver_private(), &sender_public(), cfg);
    server.listen();

    // Queued in the backlog before the server is stopped.
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.port());
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

    server.stop();
    server.serve();
    ::close(fd);

    EXPECT_EQ(server.completed(), 0u);
    EXPECT_EQ(server.aborted(), 0u);
    EXPECT_TRUE(std::filesystem::is_empty(out_.file("stopped")));
}

TEST_F(TlsServerTest, CreatesMissingOutputDirectory) {
    const std::string nested = out_.file("not/yet/created");
    ServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.out_dir = nested;
    Server server(*tls_, receiver_private(), &sender_public(), cfg);
    server.listen();
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    std::thread loop([&server] { server.serve(); });

    auto content = random_payload(20000);
    write_file(source_.file("late.bin"), content);
    {
        TlsContext client = TlsContext::client("", true);
        auto ch = tls_connect("127.0.0.1", server.port(), client, 10000);
        SenderSession sender(*ch, receiver_public(), &sender_private());
        sender.send_file(source_.file("late.bin"));
    }
    for (int i = 0; i < 1000 && server.completed() + server.aborted() < 1; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    server.stop();
    loop.join();

    EXPECT_EQ(server.completed(), 1u);
    EXPECT_EQ(read_file(nested + "/late.bin"), content);
}

TEST_F(TlsServerTest, SignedTransferOverVerifiedTls) {
    TlsContext client = TlsContext::client(certs_.file("server.crt"), false);
    auto content = random_payload(200000);
    EXPECT_TRUE(send(client, sender_private(), "payload.bin", content, "localhost"));
    wait_for(1);

    EXPECT_EQ(server_->completed(), 1u);
    EXPECT_EQ(server_->aborted(), 0u);
    EXPECT_EQ(read_file(out_.file("payload.bin")), content);
}

TEST_F(TlsServerTest, SeveralClientsAtOnce) {
    TlsContext client = TlsContext::client("", true);
    std::vector<std::vector<uint8_t>> contents;
    for (int i = 0; i < 4; ++i) contents.push_back(random_payload(50000 + (size_t)i));

    std::vector<std::thread> clients;
    std::vector<int> ok(contents.size(), 0);
    for (size_t i = 0; i < contents.size(); ++i) {
        clients.emplace_back([&, i] {
            try {
                ok[i] = send(client, sender_private(), "c" + std::to_string(i), contents[i]) ? 1 : -1;
            } catch (const std::exception&) {
                ok[i] = -1;
            }
        });
    }
    for (auto& t : clients) t.join();
    wait_for(contents.size());

    EXPECT_EQ(server_->completed(), contents.size());
    for (size_t i = 0; i < contents.size(); ++i) {
        EXPECT_EQ(ok[i], 1);
        EXPECT_EQ(read_file(out_.file("c" + std::to_string(i))), contents[i]);
    }
}

TEST_F(TlsServerTest, ForeignSignatureLeavesNoOutput) {
    TlsContext client = TlsContext::client("", true);
    // The sender has no acknowledgement to wait for, so it may finish either way.
    send(client, stranger_private(), "forged.bin", random_payload(30000));
    wait_for(1);

    EXPECT_EQ(server_->completed(), 0u);
    EXPECT_EQ(server_->aborted(), 1u);
    EXPECT_EQ(out_.entries(), 0u);
}

TEST_F(TlsServerTest, UntrustedServerCertificateRefused) {
    TempDir other;
    write_self_signed(stranger_private(), other.file("other.crt"), other.file("other.key"));
    TlsContext client = TlsContext::client(other.file("other.crt"), false);
    EXPECT_THROW(tls_connect("127.0.0.1", server_->port(), client, 10000), ChannelClosedError);
    wait_for(1);
    EXPECT_EQ(server_->aborted(), 1u);
    EXPECT_EQ(out_.entries(), 0u);
}
