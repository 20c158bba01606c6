#pragma once

#include "core/utils.hpp"
#include "tracing/header.hpp"
#include "tracing/namespace.hpp"
#include "tracing/segment.hpp"
#include "transport/iclient.hpp"

#include <concepts>
#include <exception>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace xraylite {

/**
 * @brief RAII session for one subsegment
 *
 * Construction begins the subsegment, decorates it through the namespace
 * and sends it as in-progress. If that send fails the session is Failed
 * for its whole lifetime: no header, no namespace, nothing sent on
 * destruction. An Entered session ends the subsegment, decorates it again
 * and sends it once more when destroyed; that send's failure is only logged.
 *
 * Usage:
 *   {
 *       auto session = context.enter_subsegment(AwsNamespace("S3", "GetObject"));
 *       if (auto header = session.x_amzn_trace_id()) request.set_header(Header::NAME, *header);
 *       // ... call S3 ...
 *       if (auto* ns = session.namespace_mut()) ns->request_id(id).response_status(200);
 *   } // subsegment completed and reported here
 *
 * Move-only; a moved-from session is Failed.
 */
template<typename N>
    requires std::derived_from<N, INamespace>
class SubsegmentSession {
public:
    struct Entered {
        std::shared_ptr<IClient> client;
        Header header;              // parent replaced by this subsegment's id
        Subsegment subsegment;
        N ns;
    };

    struct Failed {};

    SubsegmentSession(std::shared_ptr<IClient> client, const Header& header,
                      N ns, std::string_view name_prefix)
        : state_(Failed{}) {
        if (!client) return;

        try {
            auto subsegment = Subsegment::begin(header.trace_id, header.parent_id, ns.name(name_prefix));
            ns.update_subsegment(subsegment);

            const auto sent = client->send(subsegment);
            if (sent.is_error()) return;

            auto derived = header.with_parent_id(subsegment.id);
            state_ = Entered{std::move(client), std::move(derived), std::move(subsegment), std::move(ns)};
        } catch (const std::exception& e) {
            utils::log::warn(std::format("failed to begin subsegment: {}", e.what()));
        } catch (...) {
            utils::log::warn("failed to begin subsegment: unknown error");
        }
    }

    /// Session that never traces
    [[nodiscard]] static SubsegmentSession failed() { return SubsegmentSession(); }

    ~SubsegmentSession() { finish(); }

    SubsegmentSession(const SubsegmentSession&) = delete;
    SubsegmentSession& operator=(const SubsegmentSession&) = delete;

    SubsegmentSession(SubsegmentSession&& other) noexcept
        : state_(std::exchange(other.state_, Failed{})) {}

    SubsegmentSession& operator=(SubsegmentSession&& other) noexcept {
        if (this != &other) {
            finish();
            state_ = std::exchange(other.state_, Failed{});
        }
        return *this;
    }

    /// X-Amzn-Trace-Id value for downstream calls; nullopt when Failed
    [[nodiscard]] std::optional<std::string> x_amzn_trace_id() const {
        if (const auto* entered = std::get_if<Entered>(&state_)) {
            return entered->header.format();
        }
        return std::nullopt;
    }

    /// Live namespace for post-hoc fields; nullptr when Failed
    [[nodiscard]] N* namespace_mut() {
        if (auto* entered = std::get_if<Entered>(&state_)) {
            return &entered->ns;
        }
        return nullptr;
    }

    [[nodiscard]] bool is_entered() const { return std::holds_alternative<Entered>(state_); }

    /// Subsegment as last sent; nullptr when Failed
    [[nodiscard]] const Subsegment* subsegment() const {
        if (const auto* entered = std::get_if<Entered>(&state_)) {
            return &entered->subsegment;
        }
        return nullptr;
    }

private:
    SubsegmentSession() : state_(Failed{}) {}

    void finish() noexcept {
        auto* entered = std::get_if<Entered>(&state_);
        if (!entered) return;

        try {
            entered->subsegment.end();
            entered->ns.update_subsegment(entered->subsegment);
            const auto sent = entered->client->send(entered->subsegment);
            if (sent.is_error()) {
                utils::log::warn(std::format("failed to end subsegment '{}': {}",
                    entered->subsegment.name, sent.error_message()));
            }
        } catch (const std::exception& e) {
            utils::log::warn(std::format("failed to end subsegment: {}", e.what()));
        } catch (...) {
            utils::log::warn("failed to end subsegment: unknown error");
        }
        state_ = Failed{};
    }

    std::variant<Failed, Entered> state_;
};

} // namespace xraylite
