#include <catch2/catch_test_macros.hpp>
#include "transport/daemon_client.hpp"
#include "transport/infallible_client.hpp"
#include "tracing/session.hpp"
#include "config/lambda_env.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <optional>
#include <string>
#include <thread>

using namespace xraylite;

namespace {

/// Loopback UDP socket standing in for the daemon
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = socket(AF_INET, SOCK_DGRAM, 0);
        REQUIRE(fd_ >= 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(bind(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0);

        socklen_t len = sizeof(addr);
        REQUIRE(getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);
        REQUIRE(port_ != 0);

        timeval tv{};
        tv.tv_sec = 2;
        REQUIRE(setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0);
    }

    ~LoopbackListener() { stop(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    /// Close the socket; the port then refuses datagrams
    void stop() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

    [[nodiscard]] std::string address() const { return std::format("127.0.0.1:{}", port_); }

    [[nodiscard]] std::string receive() const {
        char buf[65536];
        const ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) return {};
        return std::string(buf, static_cast<size_t>(n));
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

} // anonymous namespace

// ============================================================================
// Socket addresses
// ============================================================================

TEST_CASE("SocketAddress: parses IPv4 and IPv6", "[transport][address]") {
    auto v4 = SocketAddress::parse("127.0.0.1:2000");
    REQUIRE(v4.is_ok());
    REQUIRE(v4.value().family() == AF_INET);
    REQUIRE(v4.value().port() == 2000);
    REQUIRE(v4.value().to_string() == "127.0.0.1:2000");

    auto v6 = SocketAddress::parse("[::1]:2000");
    REQUIRE(v6.is_ok());
    REQUIRE(v6.value().family() == AF_INET6);
    REQUIRE(v6.value().to_string() == "[::1]:2000");
}

TEST_CASE("SocketAddress: rejects malformed input", "[transport][address]") {
    const char* bad[] = {
        "",
        "127.0.0.1",
        "127.0.0.1:",
        "127.0.0.1:99999",
        "127.0.0.1:20x0",
        "localhost:2000",
        "::1:2000",
        "[::1]2000",
    };
    for (const char* text : bad) {
        auto result = SocketAddress::parse(text);
        REQUIRE(result.is_error());
        REQUIRE(result.error_category() == ErrorCategory::BAD_CONFIG);
    }
}

// ============================================================================
// Packet framing
// ============================================================================

TEST_CASE("DaemonClient: packet framing is exact", "[transport][daemon]") {
    const auto bytes = DaemonClient::packet(nlohmann::json{{"foo", "bar"}});
    REQUIRE(bytes == "{\"format\": \"json\", \"version\": 1}\n{\"foo\":\"bar\"}");
}

TEST_CASE("DaemonClient: datagram reaches a local listener", "[transport][daemon]") {
    LoopbackListener listener;
    auto client = DaemonClient::connect(listener.address());
    REQUIRE(client.is_ok());
    REQUIRE(client.value()->name() == "daemon:" + listener.address());

    auto s = Subsegment::begin(TraceId::rendered("1-5759e988-bd862e3fe1be46a994272793"),
                               std::nullopt, "udp-test");
    auto sent = client.value()->send(s);
    REQUIRE(sent.is_ok());

    const auto datagram = listener.receive();
    REQUIRE(datagram.size() == sent.value());

    const auto newline = datagram.find('\n');
    REQUIRE(newline != std::string::npos);
    REQUIRE(datagram.substr(0, newline) == DaemonClient::HEADER);

    const auto body = nlohmann::json::parse(datagram.substr(newline + 1));
    REQUIRE(body["name"] == "udp-test");
    REQUIRE(body["id"] == s.id.str());
    REQUIRE(body["type"] == "subsegment");
    REQUIRE(body["in_progress"] == true);
}

TEST_CASE("DaemonClient: socket is non-blocking and close-on-exec", "[transport][daemon]") {
    LoopbackListener listener;
    auto client = DaemonClient::connect(listener.address());
    REQUIRE(client.is_ok());

    const int fd = client.value()->native_handle();
    REQUIRE(fd >= 0);

    const int flags = fcntl(fd, F_GETFL, 0);
    REQUIRE(flags >= 0);
    REQUIRE((flags & O_NONBLOCK) != 0);

    const int fd_flags = fcntl(fd, F_GETFD, 0);
    REQUIRE(fd_flags >= 0);
    REQUIRE((fd_flags & FD_CLOEXEC) != 0);
}

TEST_CASE("DaemonClient: unencodable subsegment is a JSON error", "[transport][daemon]") {
    LoopbackListener listener;
    auto client = DaemonClient::connect(listener.address());
    REQUIRE(client.is_ok());

    // 0xff is never valid UTF-8
    auto s = Subsegment::begin(TraceId::rendered("T"), std::nullopt, "bad\xff");
    auto sent = client.value()->send(s);
    REQUIRE(sent.is_error());
    REQUIRE(sent.error_category() == ErrorCategory::JSON_ERROR);
}

TEST_CASE("DaemonClient: session on an unencodable name stays failed", "[transport][daemon][session]") {
    LoopbackListener listener;
    auto client = DaemonClient::connect(listener.address());
    REQUIRE(client.is_ok());

    const auto header = Header::parse("Root=1-5759e988-bd862e3fe1be46a994272793;Sampled=1").value();
    SubsegmentSession<CustomNamespace> session(client.value(), header, CustomNamespace("bad\xff"), "");
    REQUIRE_FALSE(session.is_entered());
    REQUIRE_FALSE(session.x_amzn_trace_id().has_value());
}

TEST_CASE("DaemonClient: refused datagrams surface as IO errors", "[transport][daemon]") {
    LoopbackListener listener;
    auto client = DaemonClient::connect(listener.address());
    REQUIRE(client.is_ok());
    listener.stop();

    auto s = Subsegment::begin(TraceId::rendered("T"), std::nullopt, "refused");

    // The ICMP port-unreachable for an earlier datagram is reported on a later send
    std::optional<Result<size_t>> failure;
    for (int i = 0; i < 50 && !failure; ++i) {
        auto sent = client.value()->send(s);
        if (sent.is_error()) {
            failure = std::move(sent);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    REQUIRE(failure.has_value());
    REQUIRE(failure->error_category() == ErrorCategory::IO_ERROR);
    REQUIRE(failure->error_message().find(listener.address()) != std::string::npos);
}

TEST_CASE("DaemonClient: invalid address is a config error", "[transport][daemon]") {
    auto client = DaemonClient::connect(std::string_view("not-an-address"));
    REQUIRE(client.is_error());
    REQUIRE(client.error_category() == ErrorCategory::BAD_CONFIG);
    REQUIRE(client.error_message().starts_with("invalid X-Ray daemon address"));
}

TEST_CASE("DaemonClient: from_lambda_env", "[transport][daemon][env]") {
    SECTION("missing variable") {
        unsetenv(lambda_env::DAEMON_ADDRESS_VAR);
        auto client = DaemonClient::from_lambda_env();
        REQUIRE(client.is_error());
        REQUIRE(client.error_category() == ErrorCategory::MISSING_ENV_VAR);
        REQUIRE(client.error_message() == "missing environment variable: AWS_XRAY_DAEMON_ADDRESS");
    }

    SECTION("unparseable variable") {
        setenv(lambda_env::DAEMON_ADDRESS_VAR, "daemon.local:2000", 1);
        auto client = DaemonClient::from_lambda_env();
        unsetenv(lambda_env::DAEMON_ADDRESS_VAR);
        REQUIRE(client.is_error());
        REQUIRE(client.error_category() == ErrorCategory::BAD_CONFIG);
    }

    SECTION("valid variable") {
        LoopbackListener listener;
        setenv(lambda_env::DAEMON_ADDRESS_VAR, listener.address().c_str(), 1);
        auto client = DaemonClient::from_lambda_env();
        unsetenv(lambda_env::DAEMON_ADDRESS_VAR);
        REQUIRE(client.is_ok());
        REQUIRE(client.value()->address().port() == SocketAddress::parse(listener.address()).value().port());
    }
}

// ============================================================================
// InfallibleClient
// ============================================================================

TEST_CASE("InfallibleClient: inert after failed construction", "[transport][infallible]") {
    InfallibleClient client(DaemonClient::connect(std::string_view("bogus")));
    REQUIRE_FALSE(client.is_operational());
    REQUIRE(client.name() == "infallible:noop");

    auto s = Subsegment::begin(TraceId::rendered("T"), std::nullopt, "x");
    auto sent = client.send(s);
    REQUIRE(sent.is_error());
    REQUIRE(sent.error_category() == ErrorCategory::IO_ERROR);
}

TEST_CASE("InfallibleClient: forwards to a working client", "[transport][infallible]") {
    LoopbackListener listener;
    InfallibleClient client(DaemonClient::connect(listener.address()));
    REQUIRE(client.is_operational());

    auto s = Subsegment::begin(TraceId::rendered("T"), std::nullopt, "forwarded");
    REQUIRE(client.send(s).is_ok());
    REQUIRE(listener.receive().find("\"forwarded\"") != std::string::npos);
}
