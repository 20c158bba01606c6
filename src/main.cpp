#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "tracing/context.hpp"
#include "tracing/namespace.hpp"

#include <cstdlib>
#include <cstring>
#include <format>
#include <iostream>
#include <string>

using namespace xraylite;

namespace {

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} <subsegment-name> [--prefix PREFIX] [--config FILE]\n"
        "\n"
        "Records one custom subsegment under the current trace and prints the\n"
        "X-Amzn-Trace-Id value to propagate (nothing when tracing is unavailable).\n"
        "\n"
        "Environment:\n"
        "  AWS_XRAY_DAEMON_ADDRESS  collector address (host:port)\n"
        "  _X_AMZN_TRACE_ID         trace header of the current invocation\n",
        argv0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string name;
    std::string prefix;
    std::string config_file;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--prefix") == 0 && i + 1 < argc) {
            prefix = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (name.empty()) {
            name = argv[i];
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (name.empty()) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    // Tracing problems never change the exit code
    auto loaded = config_file.empty()
        ? ConfigLoader::load_from_env()
        : ConfigLoader::load_from_file(config_file);

    InfallibleContext context;
    if (loaded.success) {
        if (!prefix.empty()) loaded.config.name_prefix = prefix;
        context = InfallibleContext::from_config(loaded.config);
    } else {
        utils::log::warn(std::format("xray-lite-emit: tracing disabled: {}", loaded.error_message));
    }

    auto session = context.enter_subsegment(CustomNamespace(name));
    if (auto header = session.x_amzn_trace_id()) {
        std::cout << *header << '\n';
    }
    return EXIT_SUCCESS;
}
