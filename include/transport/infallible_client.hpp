#pragma once

#include "transport/iclient.hpp"

#include <memory>
#include <string>

namespace xraylite {

/**
 * @brief Client that never fails to construct
 *
 * Wraps the result of building a real client. When that failed, the
 * wrapper is inert: every send() fails with IO_ERROR, so sessions built
 * on top of it settle in the Failed state and never touch the network.
 */
class InfallibleClient : public IClient {
public:
    template<typename C>
    explicit InfallibleClient(const Result<std::shared_ptr<C>>& result) {
        if (result.is_ok()) {
            inner_ = result.value();
        } else {
            log_fallback(result.error_message());
        }
    }

    /// Inert client
    InfallibleClient() = default;

    [[nodiscard]] Result<size_t> send(const Subsegment& subsegment) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] bool is_operational() const { return inner_ != nullptr; }

private:
    static void log_fallback(const std::string& reason);

    std::shared_ptr<IClient> inner_;
};

} // namespace xraylite
