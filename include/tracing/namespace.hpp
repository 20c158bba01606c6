#pragma once

#include "tracing/segment.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace xraylite {

/**
 * @brief Decoration strategy for a subsegment
 *
 * Supplies the subsegment name and merges domain fields into the record.
 * update_subsegment() runs once at entry and again at finalize, so
 * implementations must only fill fields that are still absent.
 */
class INamespace {
public:
    virtual ~INamespace() = default;

    /// Subsegment name; `prefix` may be ignored
    [[nodiscard]] virtual std::string name(std::string_view prefix) const = 0;

    virtual void update_subsegment(Subsegment& subsegment) const = 0;
};

/**
 * @brief AWS service operation ("S3" / "GetObject")
 *
 * namespace = "aws", name = service. Request id and response status are
 * usually only known after the call and are attached through the session.
 */
class AwsNamespace : public INamespace {
public:
    AwsNamespace(std::string service, std::string operation)
        : service_(std::move(service)), operation_(std::move(operation)) {}

    AwsNamespace& request_id(std::string id) {
        request_id_ = std::move(id);
        return *this;
    }

    AwsNamespace& response_status(uint16_t status) {
        response_status_ = status;
        return *this;
    }

    [[nodiscard]] std::string name(std::string_view prefix) const override;
    void update_subsegment(Subsegment& subsegment) const override;

    [[nodiscard]] const std::string& service() const { return service_; }
    [[nodiscard]] const std::string& operation() const { return operation_; }

private:
    std::string service_;
    std::string operation_;
    std::optional<std::string> request_id_;
    std::optional<uint16_t> response_status_;
};

/**
 * @brief Arbitrary remote HTTP service
 *
 * namespace = "remote", name = name, http.request = {method, url}.
 */
class RemoteNamespace : public INamespace {
public:
    RemoteNamespace(std::string name, std::string method, std::string url)
        : name_(std::move(name)), method_(std::move(method)), url_(std::move(url)) {}

    RemoteNamespace& response_status(uint16_t status) {
        response_status_ = status;
        return *this;
    }

    [[nodiscard]] std::string name(std::string_view prefix) const override;
    void update_subsegment(Subsegment& subsegment) const override;

private:
    std::string name_;
    std::string method_;
    std::string url_;
    std::optional<uint16_t> response_status_;
};

/**
 * @brief Custom subsegment: prefixed name, no decoration
 */
class CustomNamespace : public INamespace {
public:
    explicit CustomNamespace(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] std::string name(std::string_view prefix) const override;
    void update_subsegment(Subsegment& /*subsegment*/) const override {}

private:
    std::string name_;
};

} // namespace xraylite
