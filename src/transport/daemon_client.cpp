#include "transport/daemon_client.hpp"
#include "config/lambda_env.hpp"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>

namespace xraylite {

DaemonClient::DaemonClient(PrivateTag, int fd, SocketAddress address)
    : fd_(fd), address_(address) {}

DaemonClient::~DaemonClient() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

Result<std::shared_ptr<DaemonClient>> DaemonClient::connect(const SocketAddress& address) {
    using R = Result<std::shared_ptr<DaemonClient>>;

    const int fd = socket(address.family(), SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return R::error(ErrorCategory::IO_ERROR,
            std::format("socket() failed: {}", strerror(errno)));
    }

    // Ephemeral local port on the wildcard address of the same family
    sockaddr_storage local{};
    socklen_t local_len = 0;
    if (address.family() == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&local);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_addr = in6addr_any;
        sin6->sin6_port = 0;
        local_len = sizeof(sockaddr_in6);
    } else {
        auto* sin = reinterpret_cast<sockaddr_in*>(&local);
        sin->sin_family = AF_INET;
        sin->sin_addr.s_addr = htonl(INADDR_ANY);
        sin->sin_port = 0;
        local_len = sizeof(sockaddr_in);
    }
    if (bind(fd, reinterpret_cast<const sockaddr*>(&local), local_len) < 0) {
        const int err = errno;
        close(fd);
        return R::error(ErrorCategory::IO_ERROR,
            std::format("bind() failed: {}", strerror(err)));
    }

    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        const int err = errno;
        close(fd);
        return R::error(ErrorCategory::IO_ERROR,
            std::format("fcntl(O_NONBLOCK) failed: {}", strerror(err)));
    }

    if (::connect(fd, address.raw(), address.length) < 0) {
        const int err = errno;
        close(fd);
        return R::error(ErrorCategory::IO_ERROR,
            std::format("connect({}) failed: {}", address.to_string(), strerror(err)));
    }

    return R::ok(std::make_shared<DaemonClient>(PrivateTag{}, fd, address));
}

Result<std::shared_ptr<DaemonClient>> DaemonClient::connect(std::string_view address) {
    auto parsed = SocketAddress::parse(address);
    if (parsed.is_error()) {
        return Result<std::shared_ptr<DaemonClient>>::error(ErrorCategory::BAD_CONFIG,
            std::format("invalid X-Ray daemon address: {}", parsed.error_message()));
    }
    return connect(parsed.value());
}

Result<std::shared_ptr<DaemonClient>> DaemonClient::from_lambda_env() {
    auto address = lambda_env::daemon_address();
    if (address.is_error()) {
        return Result<std::shared_ptr<DaemonClient>>::error_from(address);
    }
    return connect(address.value());
}

std::string DaemonClient::packet(const nlohmann::json& document) {
    const std::string body = document.dump();

    std::string out;
    out.reserve(HEADER.size() + 1 + body.size());
    out.append(HEADER);
    out.push_back(DELIMITER);
    out.append(body);
    return out;
}

Result<size_t> DaemonClient::send_document(const nlohmann::json& document) {
    std::string datagram;
    try {
        datagram = packet(document);
    } catch (const nlohmann::json::exception& e) {
        return Result<size_t>::error(ErrorCategory::JSON_ERROR,
            std::format("JSON encoding failed: {}", e.what()));
    }

    const ssize_t n = ::send(fd_, datagram.data(), datagram.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n < 0) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("send to {} failed: {}", address_.to_string(), strerror(errno)));
    }
    if (static_cast<size_t>(n) != datagram.size()) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("short datagram write to {}: {} of {} bytes",
                address_.to_string(), n, datagram.size()));
    }
    return Result<size_t>::ok(static_cast<size_t>(n));
}

Result<size_t> DaemonClient::send(const Subsegment& subsegment) {
    return send_document(nlohmann::json(subsegment));
}

std::string DaemonClient::name() const {
    return "daemon:" + address_.to_string();
}

} // namespace xraylite
