#include "transport/socket_address.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <format>

namespace xraylite {

Result<SocketAddress> SocketAddress::parse(std::string_view text) {
    std::string host;
    std::string_view port_str;

    if (text.starts_with('[')) {
        // [v6]:port
        const auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return Result<SocketAddress>::error(ErrorCategory::BAD_CONFIG,
                std::format("malformed IPv6 socket address '{}'", text));
        }
        host = std::string(text.substr(1, close - 1));
        port_str = text.substr(close + 2);
    } else {
        const auto colon = text.rfind(':');
        if (colon == std::string_view::npos) {
            return Result<SocketAddress>::error(ErrorCategory::BAD_CONFIG,
                std::format("missing port in socket address '{}'", text));
        }
        host = std::string(text.substr(0, colon));
        port_str = text.substr(colon + 1);
        if (host.find(':') != std::string::npos) {
            return Result<SocketAddress>::error(ErrorCategory::BAD_CONFIG,
                std::format("IPv6 address must be bracketed in '{}'", text));
        }
    }

    const auto port = utils::try_parse_int<uint16_t>(port_str);
    if (!port) {
        return Result<SocketAddress>::error(ErrorCategory::BAD_CONFIG,
            std::format("invalid port '{}'", port_str));
    }

    SocketAddress addr;
    if (text.starts_with('[')) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&addr.storage);
        if (inet_pton(AF_INET6, host.c_str(), &sin6->sin6_addr) != 1) {
            return Result<SocketAddress>::error(ErrorCategory::BAD_CONFIG,
                std::format("invalid IPv6 address '{}'", host));
        }
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(*port);
        addr.length = sizeof(sockaddr_in6);
    } else {
        auto* sin = reinterpret_cast<sockaddr_in*>(&addr.storage);
        if (inet_pton(AF_INET, host.c_str(), &sin->sin_addr) != 1) {
            return Result<SocketAddress>::error(ErrorCategory::BAD_CONFIG,
                std::format("invalid IPv4 address '{}'", host));
        }
        sin->sin_family = AF_INET;
        sin->sin_port = htons(*port);
        addr.length = sizeof(sockaddr_in);
    }
    return Result<SocketAddress>::ok(addr);
}

uint16_t SocketAddress::port() const {
    if (family() == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&storage)->sin_port);
}

std::string SocketAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    if (family() == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&storage);
        inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        return std::format("[{}]:{}", buf, port());
    }
    const auto* sin = reinterpret_cast<const sockaddr_in*>(&storage);
    inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    return std::format("{}:{}", buf, port());
}

} // namespace xraylite
