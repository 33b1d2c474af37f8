#include "signals.hpp"
#include <signal.h>

namespace platform {

static std::atomic<bool> g_shutdown{false};
static_assert(std::atomic<bool>::is_always_lock_free,
              "signal handler needs a lock-free flag");

static struct sigaction g_old_int;
static struct sigaction g_old_term;
static bool g_installed = false;

static void shutdown_handler(int) {
    g_shutdown.store(true);
}

std::atomic<bool>& shutdown_flag() {
    return g_shutdown;
}

void install_shutdown_handlers() {
    struct sigaction sa;
    sa.sa_handler = shutdown_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;   // no SA_RESTART: let sleeps and polls return early
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGTERM, &sa, &g_old_term);
    g_installed = true;
}

void remove_shutdown_handlers() {
    if (!g_installed) return;
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGTERM, &g_old_term, nullptr);
    g_installed = false;
}

} // namespace platform
