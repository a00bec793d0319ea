#pragma once
#include <libintl.h>
#include <iosfwd>
#include <string>

#ifndef ASSAY_GETTEXT_DEFINED
#define _(String) gettext(String)
#define ASSAY_GETTEXT_DEFINED
#endif

namespace assay {
    // OpenRC style status line: " * message ....... [ ok ]".
    // The width follows the terminal when stdout is a tty, 80 columns otherwise.
    void print_status(std::ostream &log, const std::string &msg, const std::string &status, bool error = false);

    // Section header printed before a group of status lines.
    void print_subhead(std::ostream &log, const std::string &msg);

    // Plain green/red lines used by the verification listing.
    void print_ok_line(std::ostream &log, const std::string &msg);

    void print_error_line(std::ostream &log, const std::string &msg);

    // Diagnostics that only appear with --verbose.
    void set_verbose(bool on);

    [[nodiscard]] bool verbose();

    void print_verbose(std::ostream &log, const std::string &msg);
} // namespace assay
