#include "termination.h"
#include <csignal>
#include <signal.h>

static std::atomic<stop_source *> g_interrupt_target(nullptr);

static void interrupt_handler(int signo) {
    (void)signo;
    stop_source *stop = g_interrupt_target.load();
    if (stop) stop->request_stop();
}

bool install_interrupt_handler(stop_source &stop) {
    g_interrupt_target.store(&stop);

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    return sigaction(SIGINT, &sa, nullptr) == 0;
}

void remove_interrupt_handler() {
    std::signal(SIGINT, SIG_DFL);
    g_interrupt_target.store(nullptr);
}

timeout_timer::timeout_timer(stop_source &stop, std::chrono::milliseconds after)
    : stop_(stop), cancelled_(false), fired_(false) {
    thread_ = std::thread(&timeout_timer::run, this, after);
}

timeout_timer::~timeout_timer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void timeout_timer::run(std::chrono::milliseconds after) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, after, [this] { return cancelled_; })) return;

    fired_.store(true);
    stop_.request_stop();
}
