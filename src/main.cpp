#include <spdlog/spdlog.h>
#include <cstring>
#include "kernel/config.hpp"
#include "kernel/kernel.hpp"
#include "util/logger.hpp"

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} [config.json]", program);
    spdlog::info("Without a config file one 'echo' domain is started.");
}

} // anonymous namespace

int main(int argc, char** argv) {
    mycelium::util::init_logger();

    if (argc > 1 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)) {
        print_usage(argv[0]);
        return 0;
    }

    spdlog::info("=================================");
    spdlog::info("  Mycelium Kernel v0.1.0");
    spdlog::info("=================================");

    mycelium::kernel::Kernel::Config config = mycelium::kernel::default_config();
    if (argc > 1) {
        auto loaded = mycelium::kernel::load_config(argv[1]);
        if (!loaded.success) {
            spdlog::error("Invalid configuration {}: {}", argv[1], loaded.error);
            return 1;
        }
        config = loaded.config;
        spdlog::info("Loaded configuration from {}", argv[1]);
    }
    mycelium::util::set_log_level(mycelium::util::log_level_from_string(config.log_level));

    mycelium::kernel::Kernel kernel(config);
    if (!kernel.init()) {
        spdlog::error("Failed to initialize kernel");
        return 1;
    }

    // Blocks until SIGINT/SIGTERM
    kernel.run();
    return 0;
}
