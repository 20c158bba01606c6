#pragma once

#include "core/error.hpp"
#include "tracing/header.hpp"
#include "transport/socket_address.hpp"

#include <string>

namespace xraylite::lambda_env {

/// Collector address ("host:port") provided by the Lambda runtime
inline constexpr const char* DAEMON_ADDRESS_VAR = "AWS_XRAY_DAEMON_ADDRESS";

/// Trace header of the current invocation
inline constexpr const char* TRACE_HEADER_VAR = "_X_AMZN_TRACE_ID";

/// Value of `name`; MISSING_ENV_VAR when unset or empty
[[nodiscard]] Result<std::string> read(const char* name);

/// Parsed _X_AMZN_TRACE_ID (MISSING_ENV_VAR / BAD_CONFIG)
[[nodiscard]] Result<Header> trace_header();

/// Parsed AWS_XRAY_DAEMON_ADDRESS (MISSING_ENV_VAR / BAD_CONFIG)
[[nodiscard]] Result<SocketAddress> daemon_address();

} // namespace xraylite::lambda_env
