#include "config/config_loader.hpp"
#include "config/lambda_env.hpp"
#include "core/utils.hpp"
#include "tracing/header.hpp"
#include "transport/socket_address.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace xraylite {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

TracingConfig extract_xray(const toml::table& root) {
    TracingConfig cfg;
    const auto* xray = root["xray"].as_table();
    if (!xray) return cfg;
    const auto& x = *xray;

    cfg.enabled = x["enabled"].value_or(true);
    cfg.daemon_address = utils::trim(x["daemon_address"].value_or(""s));
    cfg.trace_header = utils::trim(x["trace_header"].value_or(""s));
    cfg.name_prefix = x["name_prefix"].value_or(""s);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

void ConfigLoader::apply_env_defaults(TracingConfig& config) {
    if (config.daemon_address.empty()) {
        auto env = lambda_env::read(lambda_env::DAEMON_ADDRESS_VAR);
        if (env.is_ok()) config.daemon_address = utils::trim(env.value());
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    TracingConfig cfg;
    apply_env_defaults(cfg);
    return validate_and_return(std::move(cfg));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        auto cfg = extract_xray(tbl);
        apply_env_defaults(cfg);
        return validate_and_return(std::move(cfg));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        auto cfg = extract_xray(tbl);
        apply_env_defaults(cfg);
        return validate_and_return(std::move(cfg));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TracingConfig& config) {
    std::vector<std::string> errors;
    if (!config.enabled) return errors;

    if (config.daemon_address.empty()) {
        errors.push_back(std::format("xray.daemon_address is required (or set {})",
            lambda_env::DAEMON_ADDRESS_VAR));
    } else {
        const auto addr = SocketAddress::parse(config.daemon_address);
        if (addr.is_error()) {
            errors.push_back(std::format("xray.daemon_address: {}", addr.error_message()));
        }
    }

    if (!config.trace_header.empty()) {
        const auto header = Header::parse(config.trace_header);
        if (header.is_error()) {
            errors.push_back(std::format("xray.trace_header: {}", header.error_message()));
        }
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(TracingConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string msg = "Config validation failed:";
        for (const auto& e : errors) {
            msg += "\n  - " + e;
        }
        return LoadResult::error(std::move(msg));
    }
    return LoadResult::ok(std::move(config));
}

} // namespace xraylite
