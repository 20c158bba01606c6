#pragma once

#include "core/error.hpp"
#include "integration/request_classifier.hpp"
#include "tracing/header.hpp"
#include "tracing/namespace.hpp"
#include "tracing/session.hpp"
#include "transport/iclient.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace xraylite {

/**
 * @brief Request-hook glue that traces outbound AWS calls
 *
 * Hook points of an HTTP/RPC client pipeline map onto two calls:
 *   pre-send:      auto call = interceptor.before_transmit(request);
 *   post-response: TracingInterceptor::after_attempt(std::move(call), response);
 *
 * The interceptor itself holds no per-request state; the returned
 * session is the per-request state and is owned by the caller between
 * the two hooks. Nothing here reports an error to the caller.
 */
class TracingInterceptor {
public:
    using HeaderSource = std::function<Result<Header>()>;
    using Session = SubsegmentSession<AwsNamespace>;

    /// Header source defaults to the current _X_AMZN_TRACE_ID
    TracingInterceptor(std::shared_ptr<IClient> client,
                       std::shared_ptr<const IRequestClassifier> classifier,
                       HeaderSource header_source = {});

    /**
     * @brief Classify, open a subsegment and inject X-Amzn-Trace-Id
     *
     * nullopt when the request is not recognized or no trace header is
     * available. The header is only injected when the session entered.
     */
    [[nodiscard]] std::optional<Session> before_transmit(OutboundRequest& request) const;

    /// Attach response status / request id, then finalize the subsegment
    static void after_attempt(std::optional<Session> session,
                              const std::optional<InboundResponse>& response);

private:
    std::shared_ptr<IClient> client_;
    std::shared_ptr<const IRequestClassifier> classifier_;
    HeaderSource header_source_;
};

} // namespace xraylite
