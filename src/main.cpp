#include "config.hpp"
#include "foretime.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <pthread.h>

// ─────────────────────────────────────
int main(int argc, char **argv) {
    Config config;
    std::string error;

    switch (LoadConfig(argc, argv, config, error)) {
    case ARGS_HELP:
        std::cout << Usage(argv[0]);
        return 0;
    case ARGS_ERROR:
        std::cerr << "Error: " << error << "\n" << Usage(argv[0]);
        return 2;
    case ARGS_OK:
        break;
    }

    // Block the termination signals in every thread; a dedicated thread picks them up.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        spdlog::error("Unable to block termination signals");
        return 1;
    }

    std::unique_ptr<Foretime> app;
    try {
        app = std::make_unique<Foretime>(config);
    } catch (const std::exception &e) {
        spdlog::error("Startup failed: {}", e.what());
        return 1;
    }

    std::thread signalThread([&app, signals] {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            spdlog::info("Received signal {}", sig);
        }
        app->RequestShutdown();
    });

    app->Run();
    app->Shutdown();

    // Run() only returns after a signal, so the waiter has already finished.
    signalThread.join();
    return 0;
}
