#pragma once

#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "tracing/header.hpp"
#include "tracing/session.hpp"
#include "transport/iclient.hpp"

#include <memory>
#include <optional>
#include <string>

namespace xraylite {

/**
 * @brief Tracing context: a client plus the trace header to nest under
 *
 * Cheap to copy; copies share the client.
 */
class SubsegmentContext {
public:
    SubsegmentContext(std::shared_ptr<IClient> client, Header header)
        : client_(std::move(client)), header_(std::move(header)) {}

    /// Header from _X_AMZN_TRACE_ID (MISSING_ENV_VAR / BAD_CONFIG)
    [[nodiscard]] static Result<SubsegmentContext> from_lambda_env(std::shared_ptr<IClient> client);

    /// Header from config.trace_header, or the environment when that is empty
    [[nodiscard]] static Result<SubsegmentContext> from_config(const TracingConfig& config,
                                                               std::shared_ptr<IClient> client);

    /// Copy whose custom subsegment names are prefixed with `prefix`
    [[nodiscard]] SubsegmentContext with_name_prefix(std::string prefix) const {
        SubsegmentContext copy = *this;
        copy.name_prefix_ = std::move(prefix);
        return copy;
    }

    /// Begin a subsegment; it is reported when the returned session is destroyed
    template<typename N>
    [[nodiscard]] SubsegmentSession<N> enter_subsegment(N ns) const {
        return SubsegmentSession<N>(client_, header_, std::move(ns), name_prefix_);
    }

    [[nodiscard]] const Header& header() const { return header_; }
    [[nodiscard]] const std::string& name_prefix() const { return name_prefix_; }
    [[nodiscard]] const std::shared_ptr<IClient>& client() const { return client_; }

private:
    std::shared_ptr<IClient> client_;
    Header header_;
    std::string name_prefix_;
};

/**
 * @brief Context that falls back to no-op when setup failed
 *
 * An inert context hands out Failed sessions without touching the network.
 */
class InfallibleContext {
public:
    explicit InfallibleContext(Result<SubsegmentContext> result);

    /// Inert context
    InfallibleContext() = default;

    /// Daemon client + context from config; inert when disabled or on any error
    [[nodiscard]] static InfallibleContext from_config(const TracingConfig& config);

    template<typename N>
    [[nodiscard]] SubsegmentSession<N> enter_subsegment(N ns) const {
        if (!inner_) return SubsegmentSession<N>::failed();
        return inner_->enter_subsegment(std::move(ns));
    }

    [[nodiscard]] bool is_operational() const { return inner_.has_value(); }
    [[nodiscard]] const SubsegmentContext* get() const { return inner_ ? &*inner_ : nullptr; }

private:
    std::optional<SubsegmentContext> inner_;
};

} // namespace xraylite
