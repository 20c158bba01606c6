#pragma once

#include "tracing/ids.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace xraylite {

/// Assign only when the slot is still empty; returns true if it wrote
template<typename T, typename V>
bool set_if_absent(std::optional<T>& slot, V&& value) {
    if (slot.has_value()) return false;
    slot = std::forward<V>(value);
    return true;
}

/**
 * @brief "aws" block of a subsegment (AWS service operation)
 */
struct AwsOperation {
    std::optional<std::string> operation;
    std::optional<std::string> request_id;

    bool operator==(const AwsOperation&) const = default;
};

struct HttpRequest {
    std::optional<std::string> method;
    std::optional<std::string> url;

    bool operator==(const HttpRequest&) const = default;
};

struct HttpResponse {
    std::optional<uint16_t> status;

    bool operator==(const HttpResponse&) const = default;
};

/**
 * @brief "http" block of a subsegment (remote call)
 */
struct Http {
    std::optional<HttpRequest> request;
    std::optional<HttpResponse> response;

    bool operator==(const Http&) const = default;
};

/**
 * @brief Subsegment record sent to the X-Ray daemon
 *
 * A record is either in progress (in_progress == true, no end_time) or
 * complete (end_time set, in_progress == false). begin() produces the
 * former, end() the latter. end() is called once per record; the session
 * enforces that, not the record.
 *
 * Nested blocks are filled with set-if-absent semantics so decorators
 * running at entry and at finalize never clobber each other.
 */
struct Subsegment {
    static constexpr const char* TYPE = "subsegment";

    SegmentId id;
    std::string name;
    double start_time = 0.0;              // seconds since epoch
    std::optional<double> end_time;
    bool in_progress = true;              // cleared by end() together with setting end_time
    TraceId trace_id;
    std::optional<SegmentId> parent_id;
    std::optional<std::string> namespace_name;  // "aws" | "remote"
    std::optional<AwsOperation> aws;
    std::optional<Http> http;

    /// New in-progress record with a fresh id, stamped now
    [[nodiscard]] static Subsegment begin(TraceId trace_id,
                                          std::optional<SegmentId> parent_id,
                                          std::string name);

    /// Stamp end_time and clear in_progress
    void end();

    [[nodiscard]] bool is_complete() const { return end_time.has_value() && !in_progress; }

    // Block accessors: create the block when missing, never reset it
    AwsOperation& aws_block();
    Http& http_block();
    HttpRequest& http_request_block();
    HttpResponse& http_response_block();
};

void to_json(nlohmann::json& j, const AwsOperation& aws);
void to_json(nlohmann::json& j, const HttpRequest& request);
void to_json(nlohmann::json& j, const HttpResponse& response);
void to_json(nlohmann::json& j, const Http& http);
void to_json(nlohmann::json& j, const Subsegment& subsegment);

} // namespace xraylite
