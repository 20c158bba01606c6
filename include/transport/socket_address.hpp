#pragma once

#include "core/error.hpp"

#include <sys/socket.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace xraylite {

/**
 * @brief Numeric UDP endpoint ("127.0.0.1:2000" or "[::1]:2000")
 *
 * Host names are not resolved; only literal IPv4/IPv6 addresses parse.
 */
struct SocketAddress {
    sockaddr_storage storage{};
    socklen_t length = 0;

    [[nodiscard]] static Result<SocketAddress> parse(std::string_view text);

    [[nodiscard]] int family() const { return storage.ss_family; }
    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const sockaddr* raw() const {
        return reinterpret_cast<const sockaddr*>(&storage);
    }
};

} // namespace xraylite
