#ifndef INTERFACES_H
#define INTERFACES_H

#include <cstdint>
#include <string>
#include <vector>
#include <linux/nl80211.h>

// nl80211 view of a wireless interface
struct wifi_interface {
    std::string name;
    uint32_t ifindex;
    uint32_t wiphy;
    uint32_t iftype;   // enum nl80211_iftype
};

enum iface_status {
    IFACE_OK,
    IFACE_NOT_FOUND,
    IFACE_NOT_MONITOR
};

// Picks the first interface called name and checks that it is in monitor mode.
iface_status check_monitor_interface(const std::vector<wifi_interface> &interfaces,
                                     const std::string &name, wifi_interface &found);

// found is only read for IFACE_NOT_MONITOR.
std::string iface_status_message(iface_status status, const std::string &name,
                                 const wifi_interface &found);

const char *iftype_to_string(uint32_t iftype);

#endif // INTERFACES_H
