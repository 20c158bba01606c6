#pragma once

#include "core/error.hpp"
#include "tracing/ids.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace xraylite {

/**
 * @brief Sampling decision carried by the trace header
 *
 * Only ever parsed and forwarded, never computed here.
 */
enum class SamplingDecision {
    SAMPLED,        // "Sampled=1"
    NOT_SAMPLED,    // "Sampled=0"
    REQUESTED,      // "Sampled=?" (decision deferred to downstream)
    UNKNOWN         // absent or unrecognized
};

/// Parse a whole "Sampled=..." fragment; anything unrecognized is UNKNOWN
[[nodiscard]] SamplingDecision parse_sampling_decision(std::string_view fragment);

/// "Sampled=1" / "Sampled=0" / "Sampled=?" / "" for UNKNOWN
[[nodiscard]] std::string_view to_string(SamplingDecision decision);

/**
 * @brief Parsed X-Amzn-Trace-Id header
 *
 * Format: "Root=<trace-id>[;Parent=<segment-id>][;Sampled=<0|1|?>][;<key>=<value>]*"
 *
 * Unrecognized key=value pairs are kept in additional_data and written
 * back on format(). The "Self=" fragment is dropped on parse.
 */
struct Header {
    /// HTTP header name the formatted value travels under
    static constexpr std::string_view NAME = "X-Amzn-Trace-Id";

    TraceId trace_id;
    std::optional<SegmentId> parent_id;
    SamplingDecision sampling_decision = SamplingDecision::UNKNOWN;
    std::map<std::string, std::string> additional_data;

    Header() = default;
    explicit Header(TraceId id) : trace_id(std::move(id)) {}

    /**
     * @brief Parse header text
     *
     * Fails with PARSE_ERROR naming the fragment when a fragment other than
     * Root/Parent/Sampled/Self carries no '='. A header without Root gets a
     * freshly generated trace id.
     */
    [[nodiscard]] static Result<Header> parse(std::string_view text);

    /// Serialize: Root first, then Parent, Sampled, then additional pairs
    [[nodiscard]] std::string format() const;

    /// Copy with the parent id replaced
    [[nodiscard]] Header with_parent_id(SegmentId id) const;

    /// Copy with the sampling decision replaced
    [[nodiscard]] Header with_sampling_decision(SamplingDecision decision) const;

    Header& insert_data(std::string key, std::string value);

    bool operator==(const Header&) const = default;
};

} // namespace xraylite
