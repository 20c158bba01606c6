#pragma once

#include "tracing/namespace.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xraylite {

/**
 * @brief Outbound request as seen by the request hooks
 *
 * Header names compare case-insensitively.
 */
struct OutboundRequest {
    std::string method;
    std::string uri;
    std::vector<std::pair<std::string, std::string>> headers;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    /// Replace every header called `name` (any case) with a single value
    void set_header(std::string_view name, std::string value);
};

struct InboundResponse {
    uint16_t status = 0;
    std::optional<std::string> request_id;
};

/**
 * @brief Parsed *.amazonaws.com endpoint
 */
struct AwsEndpoint {
    std::string host;                                           // lowercase
    std::vector<std::pair<std::string, std::string>> query;     // decoded pairs

    /// nullopt unless `uri` is an absolute URL on an *.amazonaws.com host
    [[nodiscard]] static std::optional<AwsEndpoint> parse(std::string_view uri);

    /**
     * @brief Service code from the host
     *
     * {bucket}.s3.{region}.amazonaws.com -> "s3" (5 labels, second label);
     * s3.{region}.amazonaws.com / s3.amazonaws.com -> "s3" (first label).
     */
    [[nodiscard]] std::optional<std::string> service_code() const;

    /// First query value whose name matches case-insensitively
    [[nodiscard]] std::optional<std::string> query_value(std::string_view name) const;
};

/**
 * @brief Strategy that names the AWS operation behind an outbound request
 */
class IRequestClassifier {
public:
    virtual ~IRequestClassifier() = default;

    /// nullopt when this strategy does not recognize the request
    [[nodiscard]] virtual std::optional<AwsNamespace> classify(const OutboundRequest& request) const = 0;
};

/**
 * @brief S3 requests carrying the "x-id" query parameter (aws-sdk style)
 */
class S3RequestClassifier : public IRequestClassifier {
public:
    [[nodiscard]] static std::optional<AwsNamespace> classify_endpoint(const AwsEndpoint& endpoint);

    [[nodiscard]] std::optional<AwsNamespace> classify(const OutboundRequest& request) const override;
};

/**
 * @brief Classifier covering a number of known services
 *
 * An "x-amz-target: Service.Operation" header decides first (DynamoDB,
 * SQS, Cognito, ...). A target that is not exactly two dot-separated parts
 * classifies as nothing. Without the header, S3 endpoints are handed to
 * S3RequestClassifier.
 */
class KnownServicesClassifier : public IRequestClassifier {
public:
    [[nodiscard]] std::optional<AwsNamespace> classify(const OutboundRequest& request) const override;
};

/**
 * @brief Every request is the same, caller-named operation
 */
class FixedOperationClassifier : public IRequestClassifier {
public:
    FixedOperationClassifier(std::string service, std::string operation)
        : service_(std::move(service)), operation_(std::move(operation)) {}

    [[nodiscard]] std::optional<AwsNamespace> classify(const OutboundRequest& /*request*/) const override {
        return AwsNamespace(service_, operation_);
    }

private:
    std::string service_;
    std::string operation_;
};

} // namespace xraylite
