#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "config/lambda_env.hpp"

#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <string>

using namespace xraylite;

TEST_CASE("ConfigLoader: full [xray] table", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[xray]
enabled = true
daemon_address = "127.0.0.1:2000"
trace_header = "Root=1-5759e988-bd862e3fe1be46a994272793;Sampled=1"
name_prefix = "svc."
)");

    REQUIRE(result.success);
    REQUIRE(result.config.enabled);
    REQUIRE(result.config.daemon_address == "127.0.0.1:2000");
    REQUIRE(result.config.trace_header == "Root=1-5759e988-bd862e3fe1be46a994272793;Sampled=1");
    REQUIRE(result.config.name_prefix == "svc.");
}

TEST_CASE("ConfigLoader: ${VAR} expansion", "[config]") {
    setenv("XRAYLITE_TEST_DAEMON", "127.0.0.1:3000", 1);
    auto result = ConfigLoader::load_from_string(R"(
[xray]
daemon_address = "${XRAYLITE_TEST_DAEMON}"
)");
    unsetenv("XRAYLITE_TEST_DAEMON");

    REQUIRE(result.success);
    REQUIRE(result.config.daemon_address == "127.0.0.1:3000");
}

TEST_CASE("ConfigLoader: unclosed ${ is an error", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[xray]
daemon_address = "${OOPS"
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: daemon address falls back to the environment", "[config]") {
    setenv(lambda_env::DAEMON_ADDRESS_VAR, "127.0.0.1:2000", 1);
    auto result = ConfigLoader::load_from_string("[xray]\nname_prefix = \"p.\"\n");
    auto from_env = ConfigLoader::load_from_env();
    unsetenv(lambda_env::DAEMON_ADDRESS_VAR);

    REQUIRE(result.success);
    REQUIRE(result.config.daemon_address == "127.0.0.1:2000");
    REQUIRE(from_env.success);
    REQUIRE(from_env.config.daemon_address == "127.0.0.1:2000");
    REQUIRE(from_env.config.trace_header.empty());
}

TEST_CASE("ConfigLoader: missing daemon address fails validation", "[config]") {
    unsetenv(lambda_env::DAEMON_ADDRESS_VAR);
    auto result = ConfigLoader::load_from_env();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.starts_with("Config validation failed:"));
    REQUIRE(result.error_message.find("xray.daemon_address is required") != std::string::npos);
}

TEST_CASE("ConfigLoader: validation reports every problem", "[config]") {
    TracingConfig config;
    config.daemon_address = "daemon:2000";
    config.trace_header = "Root=R;broken";

    const auto errors = ConfigLoader::validate_config(config);
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].starts_with("xray.daemon_address:"));
    REQUIRE(errors[1].starts_with("xray.trace_header:"));
}

TEST_CASE("ConfigLoader: disabled config skips validation", "[config]") {
    unsetenv(lambda_env::DAEMON_ADDRESS_VAR);
    auto result = ConfigLoader::load_from_string("[xray]\nenabled = false\n");

    REQUIRE(result.success);
    REQUIRE_FALSE(result.config.enabled);
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[xray\nenabled = ");
    REQUIRE_FALSE(result.success);
}

TEST_CASE("ConfigLoader: load_from_file", "[config]") {
    const std::string path = "xraylite_test_config.toml";
    {
        std::ofstream out(path);
        out << "[xray]\ndaemon_address = \"[::1]:2000\"\n";
    }
    auto result = ConfigLoader::load_from_file(path);
    std::remove(path.c_str());

    REQUIRE(result.success);
    REQUIRE(result.config.daemon_address == "[::1]:2000");

    auto missing = ConfigLoader::load_from_file("does_not_exist.toml");
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.error_message.starts_with("Failed to load config"));
}
