#include "api.h"
#include "background_tasks.h"
#include "cache.h"
#include "cache_error.h"
#include "cache_settings.h"
#include "logger.h"
#include "origin_client.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
// Only set from the signal handler; the watcher thread does the actual stop
volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

void print_usage(const char* prog) {
    std::cerr << "usage: " << prog
              << " [--config FILE] [--host HOST] [--port PORT] [--origin URL]"
                 " [--ttl-ms MS] [--max-size N] [--log-level LEVEL]\n";
}
}

int main(int argc, char* argv[]) {
    std::string host = "0.0.0.0";
    int port = 5000;
    CacheSettings settings;

    try {
        // --config first so command-line flags override the file
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) settings = load_settings(argv[++i]);
        }
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) ++i;
            else if (arg == "--host" && i + 1 < argc) host = argv[++i];
            else if (arg == "--port" && i + 1 < argc) port = std::stoi(argv[++i]);
            else if (arg == "--origin" && i + 1 < argc) settings.origin = argv[++i];
            else if (arg == "--ttl-ms" && i + 1 < argc) settings.ttl_ms = std::stoull(argv[++i]);
            else if (arg == "--max-size" && i + 1 < argc) settings.max_size = std::stoul(argv[++i]);
            else if (arg == "--log-level" && i + 1 < argc) settings.log_level = parse_log_level(argv[++i]);
            else if (arg == "--help" || arg == "-h") { print_usage(argv[0]); return 0; }
            else { print_usage(argv[0]); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 2;
    }
    set_log_level(settings.log_level);

    // Declared before the cache so it outlives every task the cache hands it
    BackgroundTasks tasks;

    std::shared_ptr<StringCache> cache;
    try {
        auto options = make_cache_options<std::string, std::string>(settings);
        options.keep_alive = tasks.hook();
        if (!settings.origin.empty()) {
            OriginClient origin(settings.origin);
            options.resolvers.push_back(origin.as_filler());
            options.revalidators.push_back(origin.as_filler());
            log_info("node", "using origin " + settings.origin);
        }
        cache = std::make_shared<StringCache>(std::move(options));
    } catch (const CacheConfigError& e) {
        log_error("node", std::string("configuration error: ") + e.what());
        return 2;
    }

    CacheAPI api(cache);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::atomic<bool> serving{true};
    std::thread watcher([&api, &serving]() {
        while (serving.load()) {
            if (g_stop_requested) {
                log_info("node", "stop requested, shutting down REST API");
                api.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int rc = 0;
    try {
        api.start(host, port);
    } catch (const std::exception& e) {
        log_error("node", e.what());
        rc = 1;
    }
    serving.store(false);
    if (watcher.joinable()) watcher.join();

    size_t drained = tasks.wait_all();
    log_info("node", "shut down after draining " + std::to_string(drained) + " background task(s)");
    return rc;
}
