#ifndef NL80211_SOCKET_H
#define NL80211_SOCKET_H

#include <string>
#include <vector>
#include "hopper.h"
#include "interfaces.h"

struct nl_sock;

// Generic netlink session bound to the nl80211 family. The socket is held
// for the lifetime of the object. All calls return 0 or a negative libnl
// error code (see error_string()).
class nl80211_socket : public radio_transport {
public:
    nl80211_socket();
    ~nl80211_socket();

    // Allocates the socket and connects it to NETLINK_GENERIC.
    int connect();
    // Looks up the "nl80211" family id. connect() must have succeeded.
    int resolve_family();

    int set_channel(const radio_command &cmd) override;
    int get_interfaces(std::vector<wifi_interface> &out);

    std::string error_string(int err) const override;
    int family_id() const { return family_id_; }

private:
    nl80211_socket(const nl80211_socket &);
    nl80211_socket &operator=(const nl80211_socket &);

    struct nl_sock *sock_;
    int family_id_;
};

#endif // NL80211_SOCKET_H
