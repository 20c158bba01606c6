#include "tracing/context.hpp"
#include "config/lambda_env.hpp"
#include "core/utils.hpp"
#include "transport/daemon_client.hpp"

#include <format>

namespace xraylite {

// ============================================================================
// SubsegmentContext
// ============================================================================

Result<SubsegmentContext> SubsegmentContext::from_lambda_env(std::shared_ptr<IClient> client) {
    auto header = lambda_env::trace_header();
    if (header.is_error()) return Result<SubsegmentContext>::error_from(header);
    return Result<SubsegmentContext>::ok(SubsegmentContext(std::move(client), std::move(header.value())));
}

Result<SubsegmentContext> SubsegmentContext::from_config(const TracingConfig& config,
                                                         std::shared_ptr<IClient> client) {
    if (config.trace_header.empty()) {
        auto ctx = from_lambda_env(std::move(client));
        if (ctx.is_error()) return ctx;
        return Result<SubsegmentContext>::ok(ctx.value().with_name_prefix(config.name_prefix));
    }

    auto header = Header::parse(config.trace_header);
    if (header.is_error()) {
        return Result<SubsegmentContext>::error(ErrorCategory::BAD_CONFIG,
            std::format("invalid X-Ray trace ID header value: {}", header.error_message()));
    }
    return Result<SubsegmentContext>::ok(
        SubsegmentContext(std::move(client), std::move(header.value()))
            .with_name_prefix(config.name_prefix));
}

// ============================================================================
// InfallibleContext
// ============================================================================

InfallibleContext::InfallibleContext(Result<SubsegmentContext> result) {
    if (result.is_ok()) {
        inner_ = std::move(result.value());
    } else {
        utils::log::warn(std::format("InfallibleContext: tracing disabled ({}: {})",
            error_category_name(result.error_category()), result.error_message()));
    }
}

InfallibleContext InfallibleContext::from_config(const TracingConfig& config) {
    if (!config.enabled) return InfallibleContext();

    auto client = DaemonClient::connect(config.daemon_address);
    if (client.is_error()) {
        return InfallibleContext(Result<SubsegmentContext>::error_from(client));
    }
    return InfallibleContext(SubsegmentContext::from_config(config, client.value()));
}

} // namespace xraylite
