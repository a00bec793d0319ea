#include "../include/Status.hpp"
#include <ostream>
#include <string>
#include <unistd.h>
#include <sys/ioctl.h>

using namespace std;

namespace {
    bool verbose_enabled = false;

    int terminal_width() {
        winsize w{};
        int term_width = 80;
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
            term_width = w.ws_col;
        }
        return term_width;
    }
} // namespace

namespace assay {
    void print_status(ostream &log, const string &msg, const string &status, const bool error) {
        // Colors: Stars (Green), Brackets (White), Status (Green/Red)
        const string star = error ? "\033[31m*\033[0m" : "\033[32m*\033[0m";
        const string white_bracket_open = "\033[37m[\033[0m";
        const string white_bracket_close = "\033[37m]\033[0m";
        const string status_text = error ? "\033[31;1m" + status + "\033[0m" : "\033[32;1m" + status + "\033[0m";
        const string status_block = " " + white_bracket_open + " " + status_text + " " + white_bracket_close;
        const int msg_display_len = 3 + static_cast<int>(msg.length());
        int padding = terminal_width() - msg_display_len - 7;
        if (padding < 1) padding = 1;

        log << " " << star << " " << msg;
        for (int i = 0; i < padding; ++i) log << " ";
        log << status_block << endl;
    }

    void print_subhead(ostream &log, const string &msg) {
        log << "\n\033[1m" << msg << "\033[0m" << endl;
    }

    void print_ok_line(ostream &log, const string &msg) {
        log << "\033[32m" << msg << "\033[0m" << endl;
    }

    void print_error_line(ostream &log, const string &msg) {
        log << "\033[31m" << msg << "\033[0m" << endl;
    }

    void set_verbose(const bool on) {
        verbose_enabled = on;
    }

    bool verbose() {
        return verbose_enabled;
    }

    void print_verbose(ostream &log, const string &msg) {
        if (!verbose_enabled) return;
        log << " \033[36m>\033[0m " << msg << endl;
    }
} // namespace assay
