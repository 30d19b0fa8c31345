#include "../include/io/loader.hpp"
#include "../include/core/engine.hpp"
#include "../include/utils/cli.hpp"
#include "../include/utils/logger.hpp"
#include "../include/config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <functional>
#include <getopt.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

    void usage(const char* prog) {
        std::printf("Usage: %s [-C] [-t threads] [config_file]\n", prog);
        std::printf("  -C  check config and exit\n");
        std::printf("  -t  worker threads (default: hardware concurrency)\n");
        std::printf("  config_file  .yaml, .yml, .json or .msgpack (default: %s)\n",
                    std::string(ctp::config::PATH_RULES_CONFIG).c_str());
    }

    void log_proxy_settings(const ctp::io::ProxySettings& proxy) {
        std::string ports;
        for (auto port : proxy.proxy_ports) {
            if (!ports.empty()) ports += ",";
            ports += std::to_string(port);
        }
        ctp::log::info("Transport settings: listen=" + std::to_string(proxy.listen_port)
                       + " proxy_ports=[" + ports + "]"
                       + " proxy_mark=" + std::to_string(proxy.proxy_mark)
                       + " ignore_mark=" + std::to_string(proxy.ignore_mark)
                       + " route_table=" + std::to_string(proxy.route_table));
    }
}

int main(int argc, char* argv[]) {
    bool check_only = false;
    unsigned threads = ctp::config::WORKER_THREADS;

    int ch;
    while ((ch = getopt(argc, argv, "Ct:h")) != -1) {
        switch (ch) {
            case 'C':
                check_only = true;
                break;
            case 't':
            {
                auto parsed = ctp::utils::parse_thread_count(optarg);
                if (!parsed) {
                    std::fprintf(stderr, "Invalid thread count \"%s\" (expected 0..%u)\n",
                                 optarg, ctp::config::MAX_WORKER_THREADS);
                    usage(argv[0]);
                    return 2;
                }
                threads = *parsed;
                break;
            }
            case 'h':
                usage(argv[0]);
                return 0;
            default:
                usage(argv[0]);
                return 2;
        }
    }

    std::string config_path = (optind < argc) ? argv[optind] : std::string(ctp::config::PATH_RULES_CONFIG);

    ctp::log::info("=== CTPROXY ENGINE (chaos rules) ===");

    // 1. Chargement + validation (Loader)
    ctp::io::Config config;
    if (!ctp::io::Loader::load(config_path, config)) {
        ctp::log::error("Critical: Failed to load configuration.");
        return 1;
    }

    if (check_only) {
        std::printf("OK\n");
        return 0;
    }

    log_proxy_settings(config.proxy);

    // 2. Runtime : un io_context partagé par un pool de threads
    if (threads == 0) {
        threads = std::clamp(std::thread::hardware_concurrency(), 1u, ctp::config::MAX_WORKER_THREADS);
    }
    boost::asio::io_context io(static_cast<int>(threads));

    // 3. Init Engine (snapshot immuable des règles)
    auto rules = std::make_shared<const ctp::core::RuleSet>(std::move(config.rules));
    ctp::core::Engine engine(io.get_executor(), rules);

    // 4. Signaux : SIGINT/SIGTERM arrêt propre, SIGHUP rechargement des règles
    boost::asio::signal_set signals(io, SIGINT, SIGTERM, SIGHUP);
    std::function<void(const boost::system::error_code&, int)> on_signal;
    on_signal = [&](const boost::system::error_code& ec, int sig) {
        if (ec) return;

        if (sig == SIGHUP) {
            ctp::io::Config reloaded;
            if (ctp::io::Loader::load(config_path, reloaded)) {
                engine.reload(std::make_shared<const ctp::core::RuleSet>(std::move(reloaded.rules)));
            } else {
                ctp::log::error("Reload failed, keeping current rule snapshot.");
            }
            signals.async_wait(on_signal);
            return;
        }

        ctp::log::info("[SHUTDOWN] Signal " + std::to_string(sig) + " received. Stopping engine...");
        io.stop();
    };
    signals.async_wait(on_signal);

    // 5. Run (Bloquant). La couche transport poste ses échanges sur io.
    ctp::log::info(">>> Engine Running with " + std::to_string(threads) + " worker threads.");
    ctp::log::info(">>> Press CTRL+C to stop gracefully, SIGHUP to reload rules.");

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (unsigned i = 1; i < threads; ++i) {
        workers.emplace_back([&io] { io.run(); });
    }
    io.run();

    for (auto& worker : workers) {
        worker.join();
    }

    ctp::log::info("Handled " + std::to_string(engine.exchange_count()) + " exchanges. Bye.");
    return 0;
}
