#include "hopper.h"
#include "channels.h"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

radio_command make_channel_command(uint32_t ifindex, uint32_t freq_mhz) {
    radio_command cmd;
    cmd.ifindex = ifindex;
    cmd.freq_mhz = freq_mhz;
    cmd.chan_width = NL80211_CHAN_WIDTH_20_NOHT;
    cmd.chan_type = NL80211_CHAN_HT20;
    return cmd;
}

hop_driver::hop_driver(radio_transport &transport, uint32_t ifindex,
                       const std::vector<int> &channels, int delay_ms, const stop_source &stop)
    : transport_(transport), ifindex_(ifindex), channels_(channels), delay_ms_(delay_ms),
      stop_(stop), cursor_(0), hop_count_(0), failed_channel_(0) {
    if (channels_.empty()) throw std::invalid_argument("hop_driver: empty channel list");
}

bool hop_driver::tick() {
    hop_event ev;
    ev.index = cursor_;
    ev.channel = channels_[cursor_];
    ev.freq_mhz = channel_to_frequency(ev.channel);

    if (ev.freq_mhz == 0) {
        std::cerr << "WARNING: channel " << ev.channel << " has no frequency, skipping hop\n";
    } else {
        int err = transport_.set_channel(make_channel_command(ifindex_, ev.freq_mhz));
        if (err < 0) {
            failed_channel_ = ev.channel;
            last_error_ = transport_.error_string(err);
            return false;
        }
        hop_count_++;
    }
    ev.hop_count = hop_count_;

    cursor_ = (cursor_ + 1) % channels_.size();

    if (observer_) observer_(ev);
    return true;
}

hop_result hop_driver::run() {
    while (!stop_.stop_requested()) {
        if (!tick()) return HOP_TRANSPORT_FAILED;

        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    }
    return HOP_STOPPED;
}
