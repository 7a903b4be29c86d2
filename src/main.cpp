#include "app/MainLoop.hpp"
#include "backend/Config.hpp"
#include "backend/MpdClient.hpp"
#include "util/Logger.hpp"
#ifdef CODA_HAVE_PIPEWIRE
#include "audio/PipeWireContext.hpp"
#include "audio/PipeWireRateController.hpp"
#endif
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

// nullptr when switching is off or the server does not support it
static std::shared_ptr<coda::audio::RateController> create_rate_controller(const coda::backend::Config& config) {
    if (!config.bit_perfect) {
        return nullptr;
    }
#ifdef CODA_HAVE_PIPEWIRE
    auto context = std::make_shared<coda::audio::PipeWireContext>();
    if (!context->init()) {
        coda::util::Logger::warn("PipeWire unavailable, bit-perfect switching disabled");
        return nullptr;
    }
    auto controller = std::make_shared<coda::audio::PipeWireRateController>(context);
    if (!controller->init()) {
        return nullptr;
    }
    return controller;
#else
    coda::util::Logger::warn("Built without PipeWire, ignoring pipewire.bit_perfect");
    return nullptr;
#endif
}

int main() {
    try {
        auto config = coda::backend::ConfigLoader::load_config();

        coda::util::Logger::init(config.log_file, coda::util::Logger::parse_level(config.log_level));
        coda::util::Logger::info("coda starting, daemon " + config.host + ":" + std::to_string(config.port));

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        coda::backend::MpdClient::Settings settings;
        settings.host = config.host;
        settings.port = config.port;
        settings.timeout_ms = config.timeout_ms;
        settings.pool_size = config.pool_size;
        settings.art_pool_size = config.art_connections;

        auto client = std::make_shared<coda::backend::MpdClient>(settings);
        client->connect();
        client->set_binary_limit(config.binary_limit);

        auto rates = create_rate_controller(config);

        {
            // Scoped so pending rate switches finish before the reset below
            coda::app::MainLoop loop(config, client, rates, std::cout);
            loop.load_library();
            coda::util::Logger::info("Library loaded, entering main loop");

            std::cout << "coda ready, type 'help' for commands" << std::endl;
            loop.run(g_shutdown);
        }

        if (rates && !rates->reset_rate()) {
            coda::util::Logger::warn("Failed to reset graph rate on exit");
        }

        coda::util::Logger::info("coda shutdown");
        return 0;
    } catch (const std::exception& e) {
        coda::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
