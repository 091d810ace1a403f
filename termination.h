#ifndef TERMINATION_H
#define TERMINATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

// Stop flag shared by the hop loop, the SIGINT handler and the timeout timer.
// Once set it stays set.
class stop_source {
public:
    stop_source() : stopped_(false) {}

    // Safe to call from a signal handler.
    void request_stop() { stopped_.store(true); }
    bool stop_requested() const { return stopped_.load(); }

private:
    stop_source(const stop_source &);
    stop_source &operator=(const stop_source &);

    std::atomic<bool> stopped_;
};

// Routes SIGINT to stop.request_stop(). stop must outlive the handler;
// remove_interrupt_handler() restores the default disposition.
bool install_interrupt_handler(stop_source &stop);
void remove_interrupt_handler();

// One-shot timer that calls request_stop() after the given duration.
// Destroying it before it fires cancels it.
class timeout_timer {
public:
    timeout_timer(stop_source &stop, std::chrono::milliseconds after);
    ~timeout_timer();

    bool fired() const { return fired_.load(); }

private:
    timeout_timer(const timeout_timer &);
    timeout_timer &operator=(const timeout_timer &);

    void run(std::chrono::milliseconds after);

    stop_source &stop_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_;
    std::atomic<bool> fired_;
    std::thread thread_;
};

#endif // TERMINATION_H
