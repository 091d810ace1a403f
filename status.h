#ifndef STATUS_H
#define STATUS_H

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// What the status screen shows after a hop
struct hop_status {
    std::string interface_name;
    const std::vector<int> *channels;
    size_t index;                  // entry hopped to last
    int channel;
    int freq_mhz;
    uint64_t hop_count;
    int delay_ms;
    int timeout_s;                 // 0 when none
    std::chrono::steady_clock::time_point started;
};

// "1 8 [2] 9 ...": the sequence with the given entry bracketed.
std::string format_sequence(const std::vector<int> &channels, size_t index);

// "12s left", or "until SIGINT" when there is no timeout.
std::string format_remaining(int timeout_s, std::chrono::steady_clock::duration elapsed);

void init_status_screen();
void end_status_screen();
void draw_status(const hop_status &st);

#endif // STATUS_H
