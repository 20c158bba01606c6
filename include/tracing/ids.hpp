#pragma once

#include <string>
#include <string_view>

namespace xraylite {

/**
 * @brief End-to-end trace identifier
 *
 * Holds the rendered token verbatim ("1-5759e988-bd862e3fe1be46a994272793").
 * A default-constructed TraceId is the unset marker.
 *
 * Generated format: "1-{8 hex epoch seconds}-{24 hex random}"
 */
class TraceId {
public:
    TraceId() = default;

    [[nodiscard]] static TraceId rendered(std::string_view token) {
        TraceId id;
        id.value_ = std::string(token);
        return id;
    }

    /// Fresh trace id stamped with the current time
    [[nodiscard]] static TraceId generate();

    [[nodiscard]] bool is_set() const { return !value_.empty(); }
    [[nodiscard]] const std::string& str() const { return value_; }

    bool operator==(const TraceId&) const = default;

private:
    std::string value_;
};

/**
 * @brief Segment/subsegment identifier (16 hex chars when generated)
 */
class SegmentId {
public:
    SegmentId() = default;

    [[nodiscard]] static SegmentId rendered(std::string_view token) {
        SegmentId id;
        id.value_ = std::string(token);
        return id;
    }

    /// Random 64-bit id
    [[nodiscard]] static SegmentId generate();

    [[nodiscard]] bool is_set() const { return !value_.empty(); }
    [[nodiscard]] const std::string& str() const { return value_; }

    bool operator==(const SegmentId&) const = default;

private:
    std::string value_;
};

} // namespace xraylite
