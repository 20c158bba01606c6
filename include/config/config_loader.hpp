#pragma once

#include <string>
#include <vector>

namespace xraylite {

// ============================================================================
// Tracing Config (mirrors the [xray] TOML table)
// ============================================================================

struct TracingConfig {
    bool enabled = true;
    std::string daemon_address;     // "host:port"; AWS_XRAY_DAEMON_ADDRESS when unset
    std::string trace_header;       // fixed header text; _X_AMZN_TRACE_ID is read per context when empty
    std::string name_prefix;        // prepended to custom subsegment names
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML or the process environment
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        TracingConfig config;

        static LoadResult ok(TracingConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from the Lambda runtime environment
     *
     * Reads AWS_XRAY_DAEMON_ADDRESS. The trace header is left empty so each
     * context picks up the current _X_AMZN_TRACE_ID.
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to the .toml file
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     *
     * String values support ${VAR} environment expansion. Keys missing from
     * the [xray] table fall back to the environment.
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Human-readable problems; empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const TracingConfig& config);

private:
    static LoadResult validate_and_return(TracingConfig config);
    static void apply_env_defaults(TracingConfig& config);
};

} // namespace xraylite
