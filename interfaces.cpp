#include "interfaces.h"

iface_status check_monitor_interface(const std::vector<wifi_interface> &interfaces,
                                     const std::string &name, wifi_interface &found) {
    for (const auto &iface : interfaces) {
        if (iface.name != name) continue;

        found = iface;
        return iface.iftype == NL80211_IFTYPE_MONITOR ? IFACE_OK : IFACE_NOT_MONITOR;
    }
    return IFACE_NOT_FOUND;
}

std::string iface_status_message(iface_status status, const std::string &name,
                                 const wifi_interface &found) {
    switch (status) {
        case IFACE_NOT_FOUND:
            return "cannot find " + name;
        case IFACE_NOT_MONITOR:
            return name + " is not in monitor mode (" + iftype_to_string(found.iftype) + ")";
        default:
            return "";
    }
}

const char *iftype_to_string(uint32_t iftype) {
    switch (iftype) {
        case NL80211_IFTYPE_ADHOC:     return "IBSS";
        case NL80211_IFTYPE_STATION:   return "managed";
        case NL80211_IFTYPE_AP:        return "AP";
        case NL80211_IFTYPE_AP_VLAN:   return "AP/VLAN";
        case NL80211_IFTYPE_WDS:       return "WDS";
        case NL80211_IFTYPE_MONITOR:   return "monitor";
        case NL80211_IFTYPE_MESH_POINT: return "mesh point";
        case NL80211_IFTYPE_P2P_CLIENT: return "P2P-client";
        case NL80211_IFTYPE_P2P_GO:    return "P2P-GO";
        case NL80211_IFTYPE_P2P_DEVICE: return "P2P-device";
        default:                       return "unknown";
    }
}
