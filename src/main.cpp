#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/daemon.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <ctime>
#include <thread>
#include <pthread.h>

static int run_daemon(int argc, char* argv[]) {
    Config config;
    CLI::load_config(config, argc, argv);
    init_logging(config.data().log_level);

    // SIGTERM/SIGINT are consumed by one waiter thread, once
    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGTERM);
    sigaddset(&shutdown_signals, SIGINT);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr);

    Daemon daemon(config);
    std::atomic<bool> done{false};

    std::thread signal_thread([&] {
        while (!done.load()) {
            struct timespec timeout = {0, 200 * 1000 * 1000};
            int sig = sigtimedwait(&shutdown_signals, nullptr, &timeout);
            if (sig > 0) {
                spdlog::info("Received {}, shutting down", strsignal(sig));
                daemon.request_stop();
                return;
            }
        }
    });

    int ret = daemon.run();
    done.store(true);
    signal_thread.join();
    return ret;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        return run_daemon(argc, argv);
    }
    return cli_result;
}
