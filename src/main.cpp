#include "atomman_agent.h"
#include "config.h"

#include <atomic>
#include <signal.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_stop{false};

static void on_signal(int)
{
    g_stop.store(true);
}

// No SA_RESTART: a blocked epoll_wait returns EINTR and the loops see the flag.
static void install_signal_handlers()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int main(int argc, char **argv) {
    AgentConfig cfg;

    try {
        auto env = [](const char *name) -> const char * { return std::getenv(name); };
        if (load_agent_config(argc, argv, env, cfg) == ArgsResult::Help) {
            print_usage(argv[0]);
            return 0;
        }
    } catch (const std::exception &ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    std::cout << "[AtomMan-Agent] port=" << cfg.port
              << " baud=" << cfg.baud
              << " attempts=" << cfg.attempts
              << " window=" << cfg.window_s << "s"
              << " fan_prefer=" << cfg.fan_prefer
              << " cache=" << (cfg.cache_path.empty() ? "off" : cfg.cache_path)
              << " redis=" << (cfg.redis_uri.empty() ? "off" : cfg.redis_uri)
              << "\n";

    install_signal_handlers();

    try {
        AtommanAgent agent(cfg, g_stop);
        agent.run();
    } catch (const std::exception &ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
