#include "integration/request_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace xraylite {

namespace {

constexpr std::string_view AWS_DOMAIN_SUFFIX = ".amazonaws.com";
constexpr std::string_view TARGET_HEADER = "x-amz-target";
constexpr std::string_view S3_OPERATION_PARAM = "x-id";

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// application/x-www-form-urlencoded decoding ('+' is a space)
std::string form_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_digit(s[i + 1]);
            const int lo = hex_digit(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += s[i];
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// OutboundRequest
// ============================================================================

std::optional<std::string> OutboundRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (utils::iequals(key, name)) return value;
    }
    return std::nullopt;
}

void OutboundRequest::set_header(std::string_view name, std::string value) {
    std::erase_if(headers, [name](const auto& kv) { return utils::iequals(kv.first, name); });
    headers.emplace_back(std::string(name), std::move(value));
}

// ============================================================================
// AwsEndpoint
// ============================================================================

std::optional<AwsEndpoint> AwsEndpoint::parse(std::string_view uri) {
    const auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) return std::nullopt;

    const auto rest = uri.substr(scheme_end + 3);
    const auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);

    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    // IP literals are not domains
    if (authority.starts_with('[')) return std::nullopt;
    if (const auto colon = authority.find(':'); colon != std::string_view::npos) {
        authority = authority.substr(0, colon);
    }

    AwsEndpoint endpoint;
    endpoint.host = utils::to_lower(authority);
    if (!endpoint.host.ends_with(AWS_DOMAIN_SUFFIX) ||
        endpoint.host.size() == AWS_DOMAIN_SUFFIX.size()) {
        return std::nullopt;
    }

    if (authority_end != std::string_view::npos) {
        const auto tail = rest.substr(authority_end);
        const auto q = tail.find('?');
        if (q != std::string_view::npos) {
            auto query = tail.substr(q + 1);
            query = query.substr(0, query.find('#'));
            for (const auto pair : utils::split_view(query, '&')) {
                if (pair.empty()) continue;
                const auto eq = pair.find('=');
                if (eq == std::string_view::npos) {
                    endpoint.query.emplace_back(form_decode(pair), "");
                } else {
                    endpoint.query.emplace_back(form_decode(pair.substr(0, eq)),
                                                form_decode(pair.substr(eq + 1)));
                }
            }
        }
    }
    return endpoint;
}

std::optional<std::string> AwsEndpoint::service_code() const {
    const auto labels = utils::split_view(host, '.');
    switch (labels.size()) {
        case 5:
            return std::string(labels[1]);
        case 3:
        case 4:
            return std::string(labels[0]);
        default:
            return std::nullopt;
    }
}

std::optional<std::string> AwsEndpoint::query_value(std::string_view name) const {
    const auto it = std::find_if(query.begin(), query.end(),
        [name](const auto& kv) { return utils::iequals(kv.first, name); });
    if (it == query.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// Classifiers
// ============================================================================

std::optional<AwsNamespace> S3RequestClassifier::classify_endpoint(const AwsEndpoint& endpoint) {
    const auto code = endpoint.service_code();
    if (!code || *code != "s3") return std::nullopt;

    auto operation = endpoint.query_value(S3_OPERATION_PARAM);
    if (!operation) return std::nullopt;
    return AwsNamespace("S3", std::move(*operation));
}

std::optional<AwsNamespace> S3RequestClassifier::classify(const OutboundRequest& request) const {
    const auto endpoint = AwsEndpoint::parse(request.uri);
    if (!endpoint) return std::nullopt;
    return classify_endpoint(*endpoint);
}

std::optional<AwsNamespace> KnownServicesClassifier::classify(const OutboundRequest& request) const {
    if (const auto target = request.header(TARGET_HEADER)) {
        const auto parts = utils::split_view(*target, '.');
        if (parts.size() != 2) return std::nullopt;
        return AwsNamespace(std::string(parts[0]), std::string(parts[1]));
    }

    const auto endpoint = AwsEndpoint::parse(request.uri);
    if (!endpoint) return std::nullopt;

    const auto code = endpoint->service_code();
    if (code && *code == "s3") {
        return S3RequestClassifier::classify_endpoint(*endpoint);
    }
    return std::nullopt;
}

} // namespace xraylite
