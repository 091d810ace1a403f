#ifndef OPTIONS_H
#define OPTIONS_H

#include <ostream>
#include <string>

#define PROGRAM_NAME "chopper"
#define PROGRAM_VERSION "1.0.0"

#define DEFAULT_DELAY_MS 200
#define MIN_SANE_DELAY_MS 10

struct hop_options {
    bool show_help;
    bool show_version;
    bool verbose;
    bool status_screen;
    std::string interface_name;
    std::string channels;
    int delay_ms;
    bool delay_set;
    int timeout_s;
    bool timeout_set;

    hop_options();
};

// Fills opts from argv. Returns false and sets err on an unknown option or a
// malformed number.
bool parse_options(int argc, char *argv[], hop_options &opts, std::string &err);

// Warnings for values that are accepted but probably not intended.
void check_options(const hop_options &opts, std::ostream &warn);

// Timeout that should actually be armed, 0 when none.
int effective_timeout(const hop_options &opts);

void print_usage(std::ostream &out, const char *prog);
void print_version(std::ostream &out);

#endif // OPTIONS_H
