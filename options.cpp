#include "options.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <getopt.h>

hop_options::hop_options()
    : show_help(false), show_version(false), verbose(false), status_screen(false),
      delay_ms(DEFAULT_DELAY_MS), delay_set(false), timeout_s(0), timeout_set(false) {}

static bool parse_int_arg(const char *arg, int &out) {
    errno = 0;
    char *end = nullptr;
    long value = std::strtol(arg, &end, 10);
    if (end == arg || *end != '\0') return false;
    if (errno == ERANGE || value > INT_MAX || value < INT_MIN) return false;
    out = static_cast<int>(value);
    return true;
}

bool parse_options(int argc, char *argv[], hop_options &opts, std::string &err) {
    static const struct option long_options[] = {
        {"help",      no_argument,       nullptr, 'h'},
        {"version",   no_argument,       nullptr, 'V'},
        {"interface", required_argument, nullptr, 'i'},
        {"channels",  required_argument, nullptr, 'c'},
        {"delay",     required_argument, nullptr, 'd'},
        {"timeout",   required_argument, nullptr, 't'},
        {"verbose",   no_argument,       nullptr, 'v'},
        {"status",    no_argument,       nullptr, 's'},
        {nullptr, 0, nullptr, 0}
    };

    // Full rescan, argv may be parsed more than once.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":hVi:c:d:t:vs", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h': opts.show_help = true; break;
            case 'V': opts.show_version = true; break;
            case 'i': opts.interface_name = optarg; break;
            case 'c': opts.channels = optarg; break;
            case 'v': opts.verbose = true; break;
            case 's': opts.status_screen = true; break;
            case 'd':
                if (!parse_int_arg(optarg, opts.delay_ms)) {
                    err = std::string("invalid argument \"") + optarg + "\" for --delay";
                    return false;
                }
                opts.delay_set = true;
                break;
            case 't':
                if (!parse_int_arg(optarg, opts.timeout_s)) {
                    err = std::string("invalid argument \"") + optarg + "\" for --timeout";
                    return false;
                }
                opts.timeout_set = true;
                break;
            case ':':
                err = std::string("flag needs an argument: -") + static_cast<char>(optopt);
                return false;
            default:
                if (optopt)
                    err = std::string("unknown shorthand flag: -") + static_cast<char>(optopt);
                else
                    err = std::string("unknown flag: ") + argv[optind - 1];
                return false;
        }
    }

    if (optind < argc) {
        err = std::string("unexpected argument: ") + argv[optind];
        return false;
    }
    return true;
}

void check_options(const hop_options &opts, std::ostream &warn) {
    if (opts.delay_set && opts.delay_ms < MIN_SANE_DELAY_MS) {
        warn << "WARNING: the delay is very small, why are you doing this?\n";
    }
    if (opts.timeout_set && opts.timeout_s <= 0) {
        warn << "WARNING: timeout cannot be 0, running until SIGINT.\n";
    }
}

int effective_timeout(const hop_options &opts) {
    return opts.timeout_s > 0 ? opts.timeout_s : 0;
}

void print_usage(std::ostream &out, const char *prog) {
    out << "Usage of " << prog << ":\n"
        << "  -c, --channels string    comma-separated list of channels (default: 1,8,2,9,3,10,4,11,5,12,6,13,7)\n"
        << "  -d, --delay int          delay between each hop in milliseconds (default " << DEFAULT_DELAY_MS << ")\n"
        << "  -h, --help               show this help message\n"
        << "  -i, --interface string   interface name (must be in monitor mode)\n"
        << "  -s, --status             show a live status screen\n"
        << "  -t, --timeout int        exit the program after X seconds\n"
        << "  -v, --verbose            print every hop\n"
        << "  -V, --version            show version\n";
}

void print_version(std::ostream &out) {
    out << PROGRAM_NAME << " v" << PROGRAM_VERSION << "\n";
}
