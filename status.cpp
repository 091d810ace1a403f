#include "status.h"
#include <ctime>
#include <ncurses.h>
#include <sstream>

static bool g_screen_active = false;

std::string format_sequence(const std::vector<int> &channels, size_t index) {
    std::ostringstream oss;
    for (size_t i = 0; i < channels.size(); i++) {
        if (i) oss << " ";
        if (i == index)
            oss << "[" << channels[i] << "]";
        else
            oss << channels[i];
    }
    return oss.str();
}

std::string format_remaining(int timeout_s, std::chrono::steady_clock::duration elapsed) {
    if (timeout_s <= 0) return "until SIGINT";

    long long left = timeout_s - std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    if (left < 0) left = 0;

    std::ostringstream oss;
    oss << left << "s left";
    return oss.str();
}

// ncurses setup, SIGINT keeps working in cbreak mode
void init_status_screen() {
    initscr();
    cbreak();
    noecho();
    curs_set(0);
    nodelay(stdscr, TRUE);
    keypad(stdscr, TRUE);
    g_screen_active = true;
}

void end_status_screen() {
    if (!g_screen_active) return;
    endwin();
    g_screen_active = false;
}

void draw_status(const hop_status &st) {
    if (!g_screen_active) return;

    time_t now = time(nullptr);
    tm *tm_struct = localtime(&now);
    char time_str[64];
    strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", tm_struct);

    std::chrono::steady_clock::duration elapsed = std::chrono::steady_clock::now() - st.started;

    clear();

    mvprintw(0, 0, "[ CH %d | %d MHz ] [ %s ]", st.channel, st.freq_mhz, time_str);
    mvprintw(2, 0, " Interface : %s", st.interface_name.c_str());
    mvprintw(3, 0, " Delay     : %d ms", st.delay_ms);
    mvprintw(4, 0, " Hops      : %lu", (unsigned long)st.hop_count);
    mvprintw(5, 0, " Running   : %s", format_remaining(st.timeout_s, elapsed).c_str());
    if (st.channels) {
        mvprintw(7, 0, " Sequence  : %s", format_sequence(*st.channels, st.index).c_str());
    }
    mvprintw(9, 0, " Ctrl-C to stop");

    wnoutrefresh(stdscr);
    doupdate();
}
