#pragma once

#include "core/error.hpp"
#include "tracing/segment.hpp"

#include <cstddef>
#include <string>

namespace xraylite {

/**
 * @brief Abstract interface for the trace collector connection
 *
 * Shared between sessions through std::shared_ptr; send() may be called
 * concurrently and must not block. Failures are reported, never retried.
 */
class IClient {
public:
    virtual ~IClient() = default;

    /// Send one subsegment as a single datagram. Returns bytes written.
    [[nodiscard]] virtual Result<size_t> send(const Subsegment& subsegment) = 0;

    /// Human-readable client name for logging (e.g. "daemon:127.0.0.1:2000")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace xraylite
