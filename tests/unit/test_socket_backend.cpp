#include <gtest/gtest.h>
#include "mcpbridge/transport/socket_backend.hpp"
#include "mcpbridge/error.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

using namespace mcpbridge;

namespace {

PluginResponse echo_handler(const PluginRequest& req) {
    PluginResponse resp;
    if (req.request_case() == PluginRequest::kToolCall) {
        auto* call = resp.mutable_tool_call();
        call->set_success(true);
        (*call->mutable_result()->mutable_fields())["text"].set_string_value(
            "called " + req.tool_call().tool_name());
    } else {
        resp.mutable_list_tools()->add_tools()->set_name("echo");
    }
    return resp;
}

// Listening socket served on a background thread. Each accepted connection
// is handed to `serve` and closed afterwards; at most `max_connections`.
class TestServer {
public:
    using ConnectionFn = std::function<void(int fd)>;

    static TestServer unix_socket(ConnectionFn serve, int max_connections = 1) {
        char tmpl[] = "/tmp/mcpbridge-test-XXXXXX";
        std::string dir = mkdtemp(tmpl);
        std::string path = dir + "/backend.sock";

        int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        EXPECT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        EXPECT_EQ(::listen(fd, 4), 0);
        return TestServer(fd, "unix:" + path, dir, std::move(serve), max_connections);
    }

    static TestServer tcp_loopback(ConnectionFn serve) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        EXPECT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        EXPECT_EQ(::listen(fd, 4), 0);
        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        std::string address = "127.0.0.1:" + std::to_string(ntohs(addr.sin_port));
        return TestServer(fd, address, "", std::move(serve), 1);
    }

    TestServer(TestServer&& o) noexcept
        : listen_fd_(o.listen_fd_), address_(std::move(o.address_)), dir_(std::move(o.dir_)),
          thread_(std::move(o.thread_)) {
        o.listen_fd_ = -1;
    }

    ~TestServer() {
        if (thread_.joinable()) thread_.join();
        if (listen_fd_ >= 0) ::close(listen_fd_);
        if (!dir_.empty()) {
            ::unlink((dir_ + "/backend.sock").c_str());
            ::rmdir(dir_.c_str());
        }
    }

    const std::string& address() const { return address_; }

private:
    TestServer(int fd, std::string address, std::string dir, ConnectionFn serve,
               int max_connections)
        : listen_fd_(fd), address_(std::move(address)), dir_(std::move(dir)) {
        thread_ = std::thread([fd, serve = std::move(serve), max_connections]() {
            for (int i = 0; i < max_connections; ++i) {
                int conn = ::accept(fd, nullptr, nullptr);
                if (conn < 0) return;
                serve(conn);
                ::close(conn);
            }
        });
    }

    int listen_fd_;
    std::string address_;
    std::string dir_;
    std::thread thread_;
};

void serve_echo(int fd) {
    try {
        serve_backend_connection(fd, echo_handler);
    } catch (const McpBackendError&) {
        // peer went away mid-frame
    }
}

PluginRequest tool_call(const std::string& id, const std::string& name) {
    PluginRequest req;
    req.set_request_id(id);
    req.mutable_tool_call()->set_tool_name(name);
    return req;
}

} // namespace

// ---- Framing ----

TEST(Framing, RoundTripOverSocketpair) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);

    write_frame(sv[0], "hello");
    write_frame(sv[0], "");
    ::close(sv[0]);

    EXPECT_EQ(read_frame(sv[1], 1024), "hello");
    EXPECT_EQ(read_frame(sv[1], 1024), "");
    EXPECT_FALSE(read_frame(sv[1], 1024).has_value());
    ::close(sv[1]);
}

TEST(Framing, LengthPrefixIsBigEndian) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);

    write_frame(sv[0], std::string(258, 'x'));
    unsigned char header[4];
    ASSERT_EQ(::read(sv[1], header, 4), 4);
    EXPECT_EQ(header[0], 0);
    EXPECT_EQ(header[1], 0);
    EXPECT_EQ(header[2], 1);
    EXPECT_EQ(header[3], 2);
    ::close(sv[0]);
    ::close(sv[1]);
}

TEST(Framing, OversizeFrameRejected) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);

    write_frame(sv[0], std::string(100, 'x'));
    EXPECT_THROW((void)read_frame(sv[1], 10), McpBackendError);
    ::close(sv[0]);
    ::close(sv[1]);
}

TEST(Framing, TruncatedFrameRejected) {
    int sv[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);

    const unsigned char header[4] = {0, 0, 0, 10};
    ASSERT_EQ(::write(sv[0], header, 4), 4);
    ASSERT_EQ(::write(sv[0], "abc", 3), 3);
    ::close(sv[0]);

    EXPECT_THROW((void)read_frame(sv[1], 1024), McpBackendError);
    ::close(sv[1]);
}

// ---- SocketBackend ----

TEST(SocketBackend, ToolCallOverUnixSocket) {
    auto server = TestServer::unix_socket(serve_echo);

    SocketBackend backend({server.address(), std::chrono::milliseconds(5000), 1024 * 1024});
    EXPECT_FALSE(backend.is_connected());

    auto resp = backend.send(tool_call("stdio-tc-1", "echo"));
    EXPECT_TRUE(backend.is_connected());
    EXPECT_EQ(resp.request_id(), "stdio-tc-1");
    ASSERT_EQ(resp.response_case(), PluginResponse::kToolCall);
    EXPECT_EQ(resp.tool_call().result().fields().at("text").string_value(), "called echo");

    // Same connection is reused.
    PluginRequest list;
    list.set_request_id("stdio-lt-2");
    list.mutable_list_tools();
    auto resp2 = backend.send(list);
    ASSERT_EQ(resp2.response_case(), PluginResponse::kListTools);
    EXPECT_EQ(resp2.list_tools().tools(0).name(), "echo");

    backend.close();
    EXPECT_FALSE(backend.is_connected());
}

TEST(SocketBackend, ToolCallOverTcp) {
    auto server = TestServer::tcp_loopback(serve_echo);

    SocketBackend::Options opts;
    opts.address = server.address();
    SocketBackend backend(opts);

    auto resp = backend.send(tool_call("stdio-tc-7", "add"));
    EXPECT_EQ(resp.tool_call().result().fields().at("text").string_value(), "called add");
    backend.close();
}

TEST(SocketBackend, ConnectionRefused) {
    char tmpl[] = "/tmp/mcpbridge-test-XXXXXX";
    std::string dir = mkdtemp(tmpl);

    SocketBackend::Options opts;
    opts.address = "unix:" + dir + "/missing.sock";
    SocketBackend backend(opts);

    try {
        (void)backend.send(tool_call("stdio-tc-1", "echo"));
        FAIL() << "expected McpBackendError";
    } catch (const McpBackendError& e) {
        EXPECT_NE(std::string(e.what()).find("connect"), std::string::npos);
    }
    EXPECT_FALSE(backend.is_connected());
    ::rmdir(dir.c_str());
}

TEST(SocketBackend, InvalidAddress) {
    SocketBackend::Options opts;
    opts.address = "no-port-here";
    SocketBackend backend(opts);
    EXPECT_THROW((void)backend.send(tool_call("x", "y")), McpBackendError);
}

TEST(SocketBackend, MismatchedRequestIdRejected) {
    auto server = TestServer::unix_socket([](int fd) {
        auto frame = read_frame(fd, 1024 * 1024);
        if (!frame) return;
        PluginResponse resp;
        resp.set_request_id("someone-else");
        resp.mutable_tool_call()->set_success(true);
        write_frame(fd, resp.SerializeAsString());
    });

    SocketBackend::Options opts;
    opts.address = server.address();
    SocketBackend backend(opts);

    try {
        (void)backend.send(tool_call("stdio-tc-1", "echo"));
        FAIL() << "expected McpBackendError";
    } catch (const McpBackendError& e) {
        EXPECT_NE(std::string(e.what()).find("does not match"), std::string::npos);
    }
    EXPECT_FALSE(backend.is_connected());
}

TEST(SocketBackend, ReconnectsAfterPeerClose) {
    std::atomic<int> served{0};
    auto server = TestServer::unix_socket(
        [&served](int fd) {
            // First connection: hang up without answering.
            if (served++ == 0) {
                (void)read_frame(fd, 1024 * 1024);
                return;
            }
            serve_echo(fd);
        },
        2);

    SocketBackend::Options opts;
    opts.address = server.address();
    SocketBackend backend(opts);

    EXPECT_THROW((void)backend.send(tool_call("stdio-tc-1", "echo")), McpBackendError);
    EXPECT_FALSE(backend.is_connected());

    auto resp = backend.send(tool_call("stdio-tc-2", "echo"));
    EXPECT_EQ(resp.request_id(), "stdio-tc-2");
    backend.close();
}

TEST(SocketBackend, ReadTimeout) {
    int release[2];
    ASSERT_EQ(::pipe(release), 0);
    struct PipeCloser {
        int* fds;
        ~PipeCloser() { ::close(fds[0]); ::close(fds[1]); }
    } closer{release};
    auto server = TestServer::unix_socket([&release](int fd) {
        (void)read_frame(fd, 1024 * 1024);
        // Hold the connection open without replying until the test is done.
        char b;
        (void)::read(release[0], &b, 1);
    });

    SocketBackend::Options opts;
    opts.address = server.address();
    opts.io_timeout = std::chrono::milliseconds(100);
    SocketBackend backend(opts);

    try {
        (void)backend.send(tool_call("stdio-tc-1", "slow"));
        ADD_FAILURE() << "expected McpBackendError";
    } catch (const McpBackendError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
    ASSERT_EQ(::write(release[1], "x", 1), 1);
}
