#include "channels.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

const int DEFAULT_CHANNELS[] = {1, 8, 2, 9, 3, 10, 4, 11, 5, 12, 6, 13, 7};
const size_t DEFAULT_CHANNEL_COUNT = sizeof(DEFAULT_CHANNELS) / sizeof(DEFAULT_CHANNELS[0]);

std::vector<int> default_channel_list() {
    return std::vector<int>(DEFAULT_CHANNELS, DEFAULT_CHANNELS + DEFAULT_CHANNEL_COUNT);
}

// Parses a 32-bit signed value, false on garbage or overflow.
static bool parse_int32(const std::string &token, int &out) {
    errno = 0;
    char *end = nullptr;
    long long value = std::strtoll(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0') return false;
    if (errno == ERANGE || value > INT_MAX || value < INT_MIN) return false;
    out = static_cast<int>(value);
    return true;
}

std::vector<int> parse_channel_list(const std::string &input, std::ostream &warn) {
    std::vector<int> ret;

    // Keep digits and commas only
    std::string cleaned;
    cleaned.reserve(input.size());
    for (char c : input) {
        if ((c >= '0' && c <= '9') || c == ',') cleaned += c;
    }

    std::istringstream iss(cleaned);
    std::string part;
    while (std::getline(iss, part, ',')) {
        if (part.empty()) continue;

        int value = 0;
        if (!parse_int32(part, value)) {
            warn << "WARNING: there was an error parsing: \"" << part << "\" is out of range\n";
            continue;
        }
        if (value == 0) continue;

        ret.push_back(value);
    }
    return ret;
}

int channel_to_frequency(int channel) {
    // TODO: 5 GHz channels (36-177) once width selection supports more than HT20
    if (channel <= 0) return 0;

    if (channel == 14) return 2484;
    if (channel < 14) return 2407 + channel * 5;

    return 0;
}

std::vector<int> finalize_channel_list(const std::vector<int> &channels, std::ostream &warn) {
    std::vector<int> ret;
    for (int ch : channels) {
        if (channel_to_frequency(ch) == 0) {
            warn << "WARNING: channel " << ch << " is not supported, skipping it.\n";
            continue;
        }
        ret.push_back(ch);
    }

    if (ret.empty()) ret = default_channel_list();
    return ret;
}

std::string channel_list_to_string(const std::vector<int> &channels) {
    std::ostringstream oss;
    for (size_t i = 0; i < channels.size(); i++) {
        if (i) oss << ",";
        oss << channels[i];
    }
    return oss.str();
}
