#include "tracing/segment.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

namespace xraylite {

Subsegment Subsegment::begin(TraceId trace_id,
                             std::optional<SegmentId> parent_id,
                             std::string name) {
    Subsegment s;
    s.id = SegmentId::generate();
    s.name = std::move(name);
    s.start_time = utils::epoch_seconds_now();
    s.in_progress = true;
    s.trace_id = std::move(trace_id);
    s.parent_id = std::move(parent_id);
    return s;
}

void Subsegment::end() {
    end_time = utils::epoch_seconds_now();
    in_progress = false;
}

AwsOperation& Subsegment::aws_block() {
    if (!aws) aws.emplace();
    return *aws;
}

Http& Subsegment::http_block() {
    if (!http) http.emplace();
    return *http;
}

HttpRequest& Subsegment::http_request_block() {
    auto& h = http_block();
    if (!h.request) h.request.emplace();
    return *h.request;
}

HttpResponse& Subsegment::http_response_block() {
    auto& h = http_block();
    if (!h.response) h.response.emplace();
    return *h.response;
}

// ============================================================================
// JSON serialization (absent optionals are omitted, not written as null)
// ============================================================================

void to_json(nlohmann::json& j, const AwsOperation& aws) {
    j = nlohmann::json::object();
    if (aws.operation) j["operation"] = *aws.operation;
    if (aws.request_id) j["request_id"] = *aws.request_id;
}

void to_json(nlohmann::json& j, const HttpRequest& request) {
    j = nlohmann::json::object();
    if (request.method) j["method"] = *request.method;
    if (request.url) j["url"] = *request.url;
}

void to_json(nlohmann::json& j, const HttpResponse& response) {
    j = nlohmann::json::object();
    if (response.status) j["status"] = *response.status;
}

void to_json(nlohmann::json& j, const Http& http) {
    j = nlohmann::json::object();
    if (http.request) j["request"] = *http.request;
    if (http.response) j["response"] = *http.response;
}

void to_json(nlohmann::json& j, const Subsegment& s) {
    j = nlohmann::json::object();
    j["id"] = s.id.str();
    j["name"] = s.name;
    j["start_time"] = s.start_time;
    if (s.end_time) j["end_time"] = *s.end_time;
    if (s.in_progress) j["in_progress"] = true;
    j["trace_id"] = s.trace_id.str();
    if (s.parent_id) j["parent_id"] = s.parent_id->str();
    j["type"] = Subsegment::TYPE;
    if (s.namespace_name) j["namespace"] = *s.namespace_name;
    if (s.aws) j["aws"] = *s.aws;
    if (s.http) j["http"] = *s.http;
}

} // namespace xraylite
