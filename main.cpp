#include <chrono>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <memory>
#include <vector>

#include "channels.h"
#include "hopper.h"
#include "interfaces.h"
#include "nl80211_socket.h"
#include "options.h"
#include "status.h"
#include "termination.h"

int main(int argc, char *argv[]) {
    hop_options opts;
    std::string err;
    if (!parse_options(argc, argv, opts, err)) {
        std::cerr << "ERROR: " << err << "\n";
        print_usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }

    if (opts.show_help) {
        print_usage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    } else if (opts.show_version) {
        print_version(std::cout);
        return EXIT_SUCCESS;
    }

    // SIGINT and the timeout both end up in stop.request_stop()
    stop_source stop;
    if (!install_interrupt_handler(stop)) {
        perror("sigaction(SIGINT)");
        return EXIT_FAILURE;
    }

    if (opts.interface_name.empty()) {
        print_usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }
    check_options(opts, std::cerr);

    std::unique_ptr<timeout_timer> timer;
    if (effective_timeout(opts) > 0) {
        timer.reset(new timeout_timer(stop, std::chrono::seconds(opts.timeout_s)));
    }

    std::vector<int> channels =
        finalize_channel_list(parse_channel_list(opts.channels, std::cerr), std::cerr);

    nl80211_socket nl;
    int nlerr = nl.connect();
    if (nlerr < 0) {
        std::cerr << "ERROR: cannot connect to Netlink socket: " << nl.error_string(nlerr) << "\n";
        return EXIT_FAILURE;
    }
    if (nl.resolve_family() < 0) {
        std::cerr << "ERROR: nl80211 not available\n";
        return EXIT_FAILURE;
    }

    std::vector<wifi_interface> interfaces;
    nlerr = nl.get_interfaces(interfaces);
    if (nlerr < 0) {
        std::cerr << "ERROR: cannot list interfaces: " << nl.error_string(nlerr) << "\n";
        return EXIT_FAILURE;
    }

    wifi_interface iface;
    iface_status ist = check_monitor_interface(interfaces, opts.interface_name, iface);
    if (ist != IFACE_OK) {
        std::cerr << "ERROR: " << iface_status_message(ist, opts.interface_name, iface) << "\n";
        return EXIT_FAILURE;
    }

    hop_driver driver(nl, iface.ifindex, channels, opts.delay_ms, stop);

    hop_status status;
    status.interface_name = iface.name;
    status.channels = &driver.channels();
    status.index = 0;
    status.channel = 0;
    status.freq_mhz = 0;
    status.hop_count = 0;
    status.delay_ms = opts.delay_ms;
    status.timeout_s = effective_timeout(opts);
    status.started = std::chrono::steady_clock::now();

    if (opts.status_screen) {
        init_status_screen();
        driver.set_observer([&status](const hop_event &ev) {
            status.index = ev.index;
            status.channel = ev.channel;
            status.freq_mhz = ev.freq_mhz;
            status.hop_count = ev.hop_count;
            draw_status(status);
        });
    } else {
        std::cout << "[*] Hopping on " << iface.name << " (ifindex " << iface.ifindex
                  << ") channels " << channel_list_to_string(channels)
                  << " every " << opts.delay_ms << " ms\n";
        if (opts.verbose) {
            driver.set_observer([](const hop_event &ev) {
                std::cout << "[*] CH " << ev.channel << " (" << ev.freq_mhz << " MHz)\n";
            });
        }
    }

    hop_result res = driver.run();
    end_status_screen();

    if (res == HOP_TRANSPORT_FAILED) {
        std::cerr << "Cannot set channel " << driver.failed_channel() << "\n";
        std::cerr << "ERROR: " << driver.last_error() << "\n";
        return EXIT_FAILURE;
    }

    remove_interrupt_handler();
    if (!opts.status_screen) {
        std::cout << "[*] Stopped after " << driver.hop_count() << " hops\n";
    }
    return EXIT_SUCCESS;
}
