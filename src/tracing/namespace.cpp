#include "tracing/namespace.hpp"

#include <format>

namespace xraylite {

namespace {

constexpr const char* AWS_NAMESPACE = "aws";
constexpr const char* REMOTE_NAMESPACE = "remote";

} // anonymous namespace

// ============================================================================
// AwsNamespace
// ============================================================================

std::string AwsNamespace::name(std::string_view /*prefix*/) const {
    return service_;
}

void AwsNamespace::update_subsegment(Subsegment& subsegment) const {
    set_if_absent(subsegment.namespace_name, AWS_NAMESPACE);

    auto& aws = subsegment.aws_block();
    set_if_absent(aws.operation, operation_);
    if (request_id_) {
        set_if_absent(aws.request_id, *request_id_);
    }

    if (response_status_) {
        set_if_absent(subsegment.http_response_block().status, *response_status_);
    }
}

// ============================================================================
// RemoteNamespace
// ============================================================================

std::string RemoteNamespace::name(std::string_view /*prefix*/) const {
    return name_;
}

void RemoteNamespace::update_subsegment(Subsegment& subsegment) const {
    set_if_absent(subsegment.namespace_name, REMOTE_NAMESPACE);

    // Request block first: a response never lands in an http block
    // that lacks the request it answers.
    auto& request = subsegment.http_request_block();
    set_if_absent(request.method, method_);
    set_if_absent(request.url, url_);

    if (response_status_) {
        set_if_absent(subsegment.http_response_block().status, *response_status_);
    }
}

// ============================================================================
// CustomNamespace
// ============================================================================

std::string CustomNamespace::name(std::string_view prefix) const {
    return std::format("{}{}", prefix, name_);
}

} // namespace xraylite
