#include "config/lambda_env.hpp"

#include <cstdlib>
#include <format>

namespace xraylite::lambda_env {

Result<std::string> read(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return Result<std::string>::error(ErrorCategory::MISSING_ENV_VAR,
            std::format("missing environment variable: {}", name));
    }
    return Result<std::string>::ok(value);
}

Result<Header> trace_header() {
    auto text = read(TRACE_HEADER_VAR);
    if (text.is_error()) return Result<Header>::error_from(text);

    auto header = Header::parse(text.value());
    if (header.is_error()) {
        return Result<Header>::error(ErrorCategory::BAD_CONFIG,
            std::format("invalid X-Ray trace ID header value: {}", header.error_message()));
    }
    return header;
}

Result<SocketAddress> daemon_address() {
    auto text = read(DAEMON_ADDRESS_VAR);
    if (text.is_error()) return Result<SocketAddress>::error_from(text);

    auto address = SocketAddress::parse(text.value());
    if (address.is_error()) {
        return Result<SocketAddress>::error(ErrorCategory::BAD_CONFIG,
            std::format("invalid X-Ray daemon address: {}", address.error_message()));
    }
    return address;
}

} // namespace xraylite::lambda_env
