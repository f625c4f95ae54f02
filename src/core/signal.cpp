#include "core/signal.h"
#include "core/logging.h"

#include <algorithm>
#include <cerrno>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <mutex>
#include <unistd.h>

namespace core {

namespace {

// The handler only touches this flag; it never takes the mutex below.
std::atomic<bool> g_shutdown{false};
static_assert(std::atomic<bool>::is_always_lock_free);

std::mutex g_wait_mutex;
std::condition_variable g_wait_cv;

void on_signal(int /*signum*/) {
    if (g_shutdown.exchange(true)) {
        constexpr char msg[] = "\nsecond signal, exiting now\n";
        (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        ::_exit(1);
    }
}

bool install(int signum, void (*handler)(int)) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    return ::sigaction(signum, &sa, nullptr) == 0;
}

} // anonymous namespace

void init_signal_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
            if (!install(sig, on_signal)) {
                LOG_ERROR(LogCategory::NONE,
                          std::string("cannot install handler for ") +
                          strsignal(sig) + ": " + std::strerror(errno));
            }
        }
        if (!install(SIGPIPE, SIG_IGN)) {
            LOG_ERROR(LogCategory::NONE, "cannot ignore SIGPIPE");
        }
    });
}

bool shutdown_requested() noexcept {
    return g_shutdown.load(std::memory_order_acquire);
}

void request_shutdown() {
    if (!g_shutdown.exchange(true)) {
        LOG_INFO(LogCategory::NONE, "shutdown requested");
    }
    std::lock_guard<std::mutex> lock(g_wait_mutex);
    g_wait_cv.notify_all();
}

void wait_for_shutdown() {
    std::unique_lock<std::mutex> lock(g_wait_mutex);
    while (!shutdown_requested()) {
        g_wait_cv.wait_for(lock, SIGNAL_POLL_INTERVAL);
    }
}

bool sleep_unless_shutdown(std::chrono::milliseconds duration) {
    const auto until = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(g_wait_mutex);
    while (!shutdown_requested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) return true;
        const auto slice = std::min<std::chrono::steady_clock::duration>(
            until - now, SIGNAL_POLL_INTERVAL);
        g_wait_cv.wait_for(lock, slice);
    }
    return false;
}

void reset_shutdown() {
    g_shutdown.store(false, std::memory_order_release);
}

} // namespace core
