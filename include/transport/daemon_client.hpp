#pragma once

#include "transport/iclient.hpp"
#include "transport/socket_address.hpp"

#include <nlohmann/json_fwd.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace xraylite {

/**
 * @brief X-Ray daemon client over UDP
 *
 * Owns one non-blocking datagram socket connected to the daemon. Every
 * send() is a single self-contained ::send() call, so one instance can be
 * shared across threads without locking.
 *
 * Datagram layout:
 *   {"format": "json", "version": 1}\n<segment JSON>
 */
class DaemonClient : public IClient {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static constexpr std::string_view HEADER = R"({"format": "json", "version": 1})";
    static constexpr char DELIMITER = '\n';

    /// Bind an ephemeral local port and connect to `address`
    [[nodiscard]] static Result<std::shared_ptr<DaemonClient>> connect(const SocketAddress& address);

    /// Parse "host:port" and connect
    [[nodiscard]] static Result<std::shared_ptr<DaemonClient>> connect(std::string_view address);

    /// Connect to AWS_XRAY_DAEMON_ADDRESS
    [[nodiscard]] static Result<std::shared_ptr<DaemonClient>> from_lambda_env();

    /// Built by connect(); PrivateTag keeps other callers out
    DaemonClient(PrivateTag, int fd, SocketAddress address);
    ~DaemonClient() override;

    DaemonClient(const DaemonClient&) = delete;
    DaemonClient& operator=(const DaemonClient&) = delete;

    [[nodiscard]] Result<size_t> send(const Subsegment& subsegment) override;
    [[nodiscard]] std::string name() const override;

    /// Send an arbitrary JSON document with the daemon framing
    [[nodiscard]] Result<size_t> send_document(const nlohmann::json& document);

    /// Framed datagram bytes; throws nlohmann::json::exception on encoding failure
    [[nodiscard]] static std::string packet(const nlohmann::json& document);

    [[nodiscard]] const SocketAddress& address() const { return address_; }

    /// Underlying socket descriptor (owned by this client)
    [[nodiscard]] int native_handle() const { return fd_; }

private:
    int fd_ = -1;
    SocketAddress address_;
};

} // namespace xraylite
