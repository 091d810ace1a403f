#include "nl80211_socket.h"
#include <linux/genetlink.h>
#include <linux/nl80211.h>
#include <netlink/attr.h>
#include <netlink/errno.h>
#include <netlink/genl/ctrl.h>
#include <netlink/genl/genl.h>
#include <netlink/msg.h>
#include <netlink/netlink.h>

nl80211_socket::nl80211_socket() : sock_(nullptr), family_id_(-1) {}

nl80211_socket::~nl80211_socket() {
    if (sock_) nl_socket_free(sock_);
}

int nl80211_socket::connect() {
    sock_ = nl_socket_alloc();
    if (!sock_) return -NLE_NOMEM;

    int err = genl_connect(sock_);
    if (err < 0) {
        nl_socket_free(sock_);
        sock_ = nullptr;
        return err;
    }
    return 0;
}

int nl80211_socket::resolve_family() {
    if (!sock_) return -NLE_BAD_SOCK;

    int id = genl_ctrl_resolve(sock_, NL80211_GENL_NAME);
    if (id < 0) return id;

    family_id_ = id;
    return 0;
}

int nl80211_socket::set_channel(const radio_command &cmd) {
    if (!sock_ || family_id_ < 0) return -NLE_BAD_SOCK;

    struct nl_msg *msg = nlmsg_alloc();
    if (!msg) return -NLE_NOMEM;

    if (!genlmsg_put(msg, NL_AUTO_PORT, NL_AUTO_SEQ, family_id_, 0, 0,
                     NL80211_CMD_SET_CHANNEL, 0))
        goto nla_put_failure;

    NLA_PUT_U32(msg, NL80211_ATTR_IFINDEX, cmd.ifindex);
    NLA_PUT_U32(msg, NL80211_ATTR_WIPHY_FREQ, cmd.freq_mhz);
    NLA_PUT_U32(msg, NL80211_ATTR_CHANNEL_WIDTH, cmd.chan_width);
    NLA_PUT_U32(msg, NL80211_ATTR_WIPHY_CHANNEL_TYPE, cmd.chan_type);

    // Sends with NLM_F_REQUEST | NLM_F_ACK, waits for the ack and frees msg.
    return nl_send_sync(sock_, msg);

nla_put_failure:
    nlmsg_free(msg);
    return -NLE_NOMEM;
}

// NL80211_CMD_NEW_INTERFACE replies of a GET_INTERFACE dump
static int interface_handler(struct nl_msg *msg, void *arg) {
    std::vector<wifi_interface> *out = static_cast<std::vector<wifi_interface> *>(arg);

    struct genlmsghdr *gnlh = static_cast<struct genlmsghdr *>(nlmsg_data(nlmsg_hdr(msg)));
    struct nlattr *tb[NL80211_ATTR_MAX + 1];

    if (nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0),
                  genlmsg_attrlen(gnlh, 0), nullptr) < 0)
        return NL_SKIP;

    if (!tb[NL80211_ATTR_IFNAME] || !tb[NL80211_ATTR_IFINDEX]) return NL_SKIP;

    wifi_interface iface;
    iface.name = nla_get_string(tb[NL80211_ATTR_IFNAME]);
    iface.ifindex = nla_get_u32(tb[NL80211_ATTR_IFINDEX]);
    iface.wiphy = tb[NL80211_ATTR_WIPHY] ? nla_get_u32(tb[NL80211_ATTR_WIPHY]) : 0;
    iface.iftype = tb[NL80211_ATTR_IFTYPE] ? nla_get_u32(tb[NL80211_ATTR_IFTYPE])
                                           : NL80211_IFTYPE_UNSPECIFIED;
    out->push_back(iface);

    return NL_OK;
}

int nl80211_socket::get_interfaces(std::vector<wifi_interface> &out) {
    if (!sock_ || family_id_ < 0) return -NLE_BAD_SOCK;

    struct nl_msg *msg = nlmsg_alloc();
    if (!msg) return -NLE_NOMEM;

    if (!genlmsg_put(msg, NL_AUTO_PORT, NL_AUTO_SEQ, family_id_, 0, NLM_F_DUMP,
                     NL80211_CMD_GET_INTERFACE, 0)) {
        nlmsg_free(msg);
        return -NLE_NOMEM;
    }

    int err = nl_send_auto(sock_, msg);
    nlmsg_free(msg);
    if (err < 0) return err;

    struct nl_cb *cb = nl_cb_alloc(NL_CB_DEFAULT);
    if (!cb) return -NLE_NOMEM;
    nl_cb_set(cb, NL_CB_VALID, NL_CB_CUSTOM, interface_handler, &out);

    err = nl_recvmsgs(sock_, cb);
    nl_cb_put(cb);

    return err < 0 ? err : 0;
}

std::string nl80211_socket::error_string(int err) const {
    return nl_geterror(err);
}
