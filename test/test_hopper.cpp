#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include "channels.h"
#include "hopper.h"
#include "mocks/mock_radio_transport.h"

/**
 * @file test_hopper.cpp
 * @brief Unit tests for hop_driver.
 *
 * The driver walks the channel list in a cycle, sending one SET_CHANNEL
 * command per tick and checking the stop flag between ticks.
 */

namespace {

const uint32_t IFINDEX = 7;

TEST(MakeChannelCommand, FixedTwentyMegahertzProfile) {
    radio_command cmd = make_channel_command(3, 2437);

    EXPECT_EQ(3u, cmd.ifindex);
    EXPECT_EQ(2437u, cmd.freq_mhz);
    EXPECT_EQ(static_cast<uint32_t>(NL80211_CHAN_WIDTH_20_NOHT), cmd.chan_width);
    EXPECT_EQ(static_cast<uint32_t>(NL80211_CHAN_HT20), cmd.chan_type);
}

TEST(HopDriver, TickSendsCommandAndAdvances) {
    MockRadioTransport radio;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1, 6, 11}, 0, stop);

    EXPECT_EQ(0u, driver.cursor());
    EXPECT_EQ(1, driver.current_channel());

    ASSERT_TRUE(driver.tick());

    // One command for channel 1 on the configured interface.
    ASSERT_EQ(1, radio.set_channel_calls);
    EXPECT_EQ(IFINDEX, radio.commands[0].ifindex);
    EXPECT_EQ(2412u, radio.commands[0].freq_mhz);
    EXPECT_EQ(1u, driver.cursor());
    EXPECT_EQ(6, driver.current_channel());
    EXPECT_EQ(1u, driver.hop_count());
}

TEST(HopDriver, CursorWrapsAroundWithPeriodOfListLength) {
    MockRadioTransport radio;
    stop_source stop;
    std::vector<int> channels = {1, 6, 11};
    hop_driver driver(radio, IFINDEX, channels, 0, stop);

    for (int i = 0; i < 7; i++) ASSERT_TRUE(driver.tick());

    std::vector<uint32_t> expected = {2412, 2437, 2462, 2412, 2437, 2462, 2412};
    EXPECT_EQ(expected, radio.frequencies());
    EXPECT_EQ(1u, driver.cursor());
}

TEST(HopDriver, DefaultListIsWalkedInOrder) {
    MockRadioTransport radio;
    stop_source stop;
    std::vector<int> channels = default_channel_list();
    hop_driver driver(radio, IFINDEX, channels, 0, stop);

    for (size_t i = 0; i < 2 * channels.size(); i++) ASSERT_TRUE(driver.tick());

    // Every frequency is the mapping of the channel at that cursor position.
    ASSERT_EQ(2 * channels.size(), radio.commands.size());
    for (size_t i = 0; i < radio.commands.size(); i++) {
        int ch = channels[i % channels.size()];
        EXPECT_EQ(static_cast<uint32_t>(channel_to_frequency(ch)), radio.commands[i].freq_mhz)
            << "tick " << i;
    }
    EXPECT_EQ(0u, driver.cursor());
}

TEST(HopDriver, DuplicatesAreHoppedRepeatedly) {
    MockRadioTransport radio;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {6, 6, 1}, 0, stop);

    for (int i = 0; i < 3; i++) ASSERT_TRUE(driver.tick());

    EXPECT_EQ((std::vector<uint32_t>{2437, 2437, 2412}), radio.frequencies());
}

TEST(HopDriver, SingleChannelStaysPut) {
    MockRadioTransport radio;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {14}, 0, stop);

    for (int i = 0; i < 3; i++) ASSERT_TRUE(driver.tick());

    EXPECT_EQ((std::vector<uint32_t>{2484, 2484, 2484}), radio.frequencies());
    EXPECT_EQ(0u, driver.cursor());
}

TEST(HopDriver, UnsupportedChannelIsSkippedWithoutCommand) {
    MockRadioTransport radio;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1, 36, 6}, 0, stop);

    for (int i = 0; i < 3; i++) ASSERT_TRUE(driver.tick());

    // No zero-frequency command ever reaches the transport.
    EXPECT_EQ((std::vector<uint32_t>{2412, 2437}), radio.frequencies());
    EXPECT_EQ(2u, driver.hop_count());
    EXPECT_EQ(0u, driver.cursor());
}

TEST(HopDriver, EmptyListIsRejected) {
    MockRadioTransport radio;
    stop_source stop;
    EXPECT_THROW({
        hop_driver driver(radio, IFINDEX, std::vector<int>(), 0, stop);
        (void)driver;
    }, std::invalid_argument);
}

TEST(HopDriver, RunReturnsImmediatelyWhenAlreadyStopped) {
    MockRadioTransport radio;
    stop_source stop;
    stop.request_stop();
    hop_driver driver(radio, IFINDEX, {1, 6, 11}, 0, stop);

    EXPECT_EQ(HOP_STOPPED, driver.run());
    EXPECT_EQ(0, radio.set_channel_calls);
}

TEST(HopDriver, StopDuringTickFinishesThatTickOnly) {
    MockRadioTransport radio;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1, 6, 11}, 1, stop);

    // Stop arrives while the fourth command is in flight.
    radio.on_set_channel = [&stop](int call) {
        if (call == 4) stop.request_stop();
    };

    EXPECT_EQ(HOP_STOPPED, driver.run());
    EXPECT_EQ(4, radio.set_channel_calls);
    EXPECT_EQ(4u, driver.hop_count());
    EXPECT_EQ(1u, driver.cursor());
}

TEST(HopDriver, RepeatedStopBehavesLikeSingleStop) {
    MockRadioTransport radio;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1, 6, 11}, 1, stop);

    radio.on_set_channel = [&stop](int call) {
        if (call == 2) {
            stop.request_stop();
            stop.request_stop();
        }
    };

    EXPECT_EQ(HOP_STOPPED, driver.run());
    EXPECT_EQ(2, radio.set_channel_calls);
    EXPECT_TRUE(stop.stop_requested());
}

TEST(HopDriver, TransportFailureEndsRun) {
    MockRadioTransport radio;
    radio.fail_on_call = 3;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1, 6, 11, 2}, 0, stop);

    EXPECT_EQ(HOP_TRANSPORT_FAILED, driver.run());

    // No tick after the failing one, the cursor stays on the failed entry.
    EXPECT_EQ(3, radio.set_channel_calls);
    EXPECT_EQ(11, driver.failed_channel());
    EXPECT_EQ("mock error -19", driver.last_error());
    EXPECT_EQ(2u, driver.hop_count());
    EXPECT_EQ(2u, driver.cursor());
    EXPECT_FALSE(stop.stop_requested());
}

TEST(HopDriver, FirstTickFailureSendsNothingElse) {
    MockRadioTransport radio;
    radio.set_channel_ret = -1;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1, 6, 11}, 0, stop);

    EXPECT_EQ(HOP_TRANSPORT_FAILED, driver.run());
    EXPECT_EQ(1, radio.set_channel_calls);
    EXPECT_EQ(1, driver.failed_channel());
    EXPECT_EQ(0u, driver.hop_count());
}

TEST(HopDriver, ObserverSeesEveryHop) {
    MockRadioTransport radio;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1, 6}, 0, stop);

    std::vector<hop_event> events;
    driver.set_observer([&events](const hop_event &ev) { events.push_back(ev); });

    for (int i = 0; i < 3; i++) ASSERT_TRUE(driver.tick());

    ASSERT_EQ(3u, events.size());
    EXPECT_EQ(0u, events[0].index);
    EXPECT_EQ(1, events[0].channel);
    EXPECT_EQ(2412, events[0].freq_mhz);
    EXPECT_EQ(1u, events[0].hop_count);
    EXPECT_EQ(1u, events[1].index);
    EXPECT_EQ(6, events[1].channel);
    EXPECT_EQ(0u, events[2].index);
    EXPECT_EQ(3u, events[2].hop_count);
}

TEST(HopDriver, ObserverNotCalledOnFailure) {
    MockRadioTransport radio;
    radio.set_channel_ret = -1;
    stop_source stop;
    hop_driver driver(radio, IFINDEX, {1}, 0, stop);

    int calls = 0;
    driver.set_observer([&calls](const hop_event &) { calls++; });

    EXPECT_FALSE(driver.tick());
    EXPECT_EQ(0, calls);
}

TEST(HopDriver, DelaySeparatesHops) {
    MockRadioTransport radio;
    stop_source stop;
    const int delay_ms = 20;
    hop_driver driver(radio, IFINDEX, {1, 6, 11}, delay_ms, stop);

    std::vector<std::chrono::steady_clock::time_point> sent;
    radio.on_set_channel = [&](int call) {
        sent.push_back(std::chrono::steady_clock::now());
        if (call == 4) stop.request_stop();
    };

    EXPECT_EQ(HOP_STOPPED, driver.run());
    ASSERT_EQ(4u, sent.size());
    for (size_t i = 1; i < sent.size(); i++) {
        EXPECT_GE(sent[i] - sent[i - 1], std::chrono::milliseconds(delay_ms)) << "gap " << i;
    }
}

}  // namespace
