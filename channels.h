#ifndef CHANNELS_H
#define CHANNELS_H

#include <cstddef>
#include <string>
#include <vector>
#include <ostream>

// Default hop order: non-overlapping channels are reached early in the cycle.
extern const int DEFAULT_CHANNELS[];
extern const size_t DEFAULT_CHANNEL_COUNT;

std::vector<int> default_channel_list();

// Parses a comma-separated channel list. Anything that is not a digit or a
// comma is dropped before splitting, so "1 2 3" becomes the single channel 123.
// Tokens that fail to parse are reported on warn and skipped, zero is skipped.
std::vector<int> parse_channel_list(const std::string &input, std::ostream &warn);

// 2.4 GHz channel -> center frequency in MHz, 0 when unsupported.
int channel_to_frequency(int channel);

// Drops channels that have no frequency (warning on warn) and substitutes
// the default list when nothing is left.
std::vector<int> finalize_channel_list(const std::vector<int> &channels, std::ostream &warn);

std::string channel_list_to_string(const std::vector<int> &channels);

#endif // CHANNELS_H
