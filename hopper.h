#ifndef HOPPER_H
#define HOPPER_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <linux/nl80211.h>
#include "termination.h"

// One NL80211_CMD_SET_CHANNEL request.
struct radio_command {
    uint32_t ifindex;
    uint32_t freq_mhz;
    uint32_t chan_width;   // enum nl80211_chan_width
    uint32_t chan_type;    // enum nl80211_channel_type
};

// Request/acknowledge channel switching. Implementations return 0 on
// acknowledge and a negative error code otherwise.
class radio_transport {
public:
    virtual ~radio_transport() {}

    virtual int set_channel(const radio_command &cmd) = 0;
    virtual std::string error_string(int err) const = 0;
};

radio_command make_channel_command(uint32_t ifindex, uint32_t freq_mhz);

enum hop_result {
    HOP_STOPPED,           // stop flag observed at a tick boundary
    HOP_TRANSPORT_FAILED   // a channel could not be set
};

// Reported after every tick
struct hop_event {
    size_t index;          // cursor position of the tick
    int channel;
    int freq_mhz;          // 0 when the hop was skipped
    uint64_t hop_count;    // successful hops so far
};

class hop_driver {
public:
    typedef std::function<void(const hop_event &)> observer;

    // channels must be non-empty.
    hop_driver(radio_transport &transport, uint32_t ifindex,
               const std::vector<int> &channels, int delay_ms, const stop_source &stop);

    void set_observer(const observer &obs) { observer_ = obs; }

    // Runs ticks until the stop flag is seen or the transport fails.
    hop_result run();

    // One hop without the delay. Returns false on transport failure.
    bool tick();

    size_t cursor() const { return cursor_; }
    int current_channel() const { return channels_[cursor_]; }
    uint64_t hop_count() const { return hop_count_; }
    const std::vector<int> &channels() const { return channels_; }

    int failed_channel() const { return failed_channel_; }
    const std::string &last_error() const { return last_error_; }

private:
    radio_transport &transport_;
    uint32_t ifindex_;
    const std::vector<int> channels_;
    int delay_ms_;
    const stop_source &stop_;
    observer observer_;

    size_t cursor_;
    uint64_t hop_count_;
    int failed_channel_;
    std::string last_error_;
};

#endif // HOPPER_H
