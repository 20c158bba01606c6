#include "integration/tracing_interceptor.hpp"
#include "config/lambda_env.hpp"

#include <string>

namespace xraylite {

TracingInterceptor::TracingInterceptor(std::shared_ptr<IClient> client,
                                       std::shared_ptr<const IRequestClassifier> classifier,
                                       HeaderSource header_source)
    : client_(std::move(client)),
      classifier_(std::move(classifier)),
      header_source_(header_source ? std::move(header_source) : HeaderSource(&lambda_env::trace_header)) {}

std::optional<TracingInterceptor::Session> TracingInterceptor::before_transmit(OutboundRequest& request) const {
    if (!classifier_ || !client_) return std::nullopt;

    auto ns = classifier_->classify(request);
    if (!ns) return std::nullopt;

    const auto header = header_source_();
    if (header.is_error()) return std::nullopt;

    Session session(client_, header.value(), std::move(*ns), "");
    if (auto trace_id = session.x_amzn_trace_id()) {
        request.set_header(Header::NAME, std::move(*trace_id));
    }
    return session;
}

void TracingInterceptor::after_attempt(std::optional<Session> session,
                                       const std::optional<InboundResponse>& response) {
    if (!session) return;

    if (auto* ns = session->namespace_mut(); ns && response) {
        ns->response_status(response->status);
        if (response->request_id) {
            ns->request_id(*response->request_id);
        }
    }
    // session goes out of scope here: subsegment ends and is reported
}

} // namespace xraylite
