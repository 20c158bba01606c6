#include "tracing/header.hpp"
#include "core/utils.hpp"

#include <format>

namespace xraylite {

namespace {

constexpr std::string_view ROOT_PREFIX = "Root=";
constexpr std::string_view PARENT_PREFIX = "Parent=";
constexpr std::string_view SAMPLED_PREFIX = "Sampled=";
constexpr std::string_view SELF_PREFIX = "Self=";

} // anonymous namespace

SamplingDecision parse_sampling_decision(std::string_view fragment) {
    if (fragment == "Sampled=1") return SamplingDecision::SAMPLED;
    if (fragment == "Sampled=0") return SamplingDecision::NOT_SAMPLED;
    if (fragment == "Sampled=?") return SamplingDecision::REQUESTED;
    return SamplingDecision::UNKNOWN;
}

std::string_view to_string(SamplingDecision decision) {
    switch (decision) {
        case SamplingDecision::SAMPLED:     return "Sampled=1";
        case SamplingDecision::NOT_SAMPLED: return "Sampled=0";
        case SamplingDecision::REQUESTED:   return "Sampled=?";
        case SamplingDecision::UNKNOWN:     return "";
    }
    return "";
}

Result<Header> Header::parse(std::string_view text) {
    Header header;
    bool has_root = false;

    for (const auto fragment : utils::split_view(text, ';')) {
        if (fragment.starts_with(ROOT_PREFIX)) {
            header.trace_id = TraceId::rendered(fragment.substr(ROOT_PREFIX.size()));
            has_root = true;
        } else if (fragment.starts_with(PARENT_PREFIX)) {
            header.parent_id = SegmentId::rendered(fragment.substr(PARENT_PREFIX.size()));
        } else if (fragment.starts_with(SAMPLED_PREFIX)) {
            header.sampling_decision = parse_sampling_decision(fragment);
        } else if (!fragment.starts_with(SELF_PREFIX)) {
            const auto eq = fragment.find('=');
            if (eq == std::string_view::npos) {
                return Result<Header>::error(ErrorCategory::PARSE_ERROR,
                    std::format("invalid key=value: no '=' found in '{}'", fragment));
            }
            header.additional_data.insert_or_assign(
                std::string(fragment.substr(0, eq)),
                std::string(fragment.substr(eq + 1)));
        }
    }

    if (!has_root) {
        header.trace_id = TraceId::generate();
    }
    return Result<Header>::ok(std::move(header));
}

std::string Header::format() const {
    std::string out = std::format("Root={}", trace_id.str());
    if (parent_id) {
        out += std::format(";Parent={}", parent_id->str());
    }
    if (sampling_decision != SamplingDecision::UNKNOWN) {
        out += ';';
        out += to_string(sampling_decision);
    }
    for (const auto& [key, value] : additional_data) {
        out += std::format(";{}={}", key, value);
    }
    return out;
}

Header Header::with_parent_id(SegmentId id) const {
    Header copy = *this;
    copy.parent_id = std::move(id);
    return copy;
}

Header Header::with_sampling_decision(SamplingDecision decision) const {
    Header copy = *this;
    copy.sampling_decision = decision;
    return copy;
}

Header& Header::insert_data(std::string key, std::string value) {
    additional_data.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

} // namespace xraylite
