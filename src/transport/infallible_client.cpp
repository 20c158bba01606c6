#include "transport/infallible_client.hpp"
#include "core/utils.hpp"

#include <format>

namespace xraylite {

void InfallibleClient::log_fallback(const std::string& reason) {
    utils::log::warn(std::format("InfallibleClient: tracing disabled ({})", reason));
}

Result<size_t> InfallibleClient::send(const Subsegment& subsegment) {
    if (!inner_) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR, "tracing client is not operational");
    }
    return inner_->send(subsegment);
}

std::string InfallibleClient::name() const {
    return inner_ ? "infallible:" + inner_->name() : "infallible:noop";
}

} // namespace xraylite
