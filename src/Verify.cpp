#include "../include/Verify.hpp"
#include "../include/Status.hpp"
#include <filesystem>
#include <ostream>

using namespace assay;
using namespace std;

VerificationReport::VerificationReport(vector<pair<string, bool> > entries) : entries_(std::move(entries)) {
    for (const auto &[path, ok]: entries_) {
        if (!ok) ++missing_;
    }
}

bool VerificationReport::present(const string &path) const {
    for (const auto &[p, ok]: entries_) {
        if (p == path) return ok;
    }
    return false;
}

vector<string> VerificationReport::missing_files() const {
    vector<string> out;
    for (const auto &[p, ok]: entries_) {
        if (!ok) out.push_back(p);
    }
    return out;
}

MissingFileError::MissingFileError(const size_t missing, const size_t expected, vector<string> files)
    : runtime_error(to_string(missing) + " out of " + to_string(expected) + " " + _("expected files not found")),
      missing_(missing), expected_(expected), files_(std::move(files)) {
}

namespace assay {
    vector<string> materialize(const ExpectedFiles &expected) {
        if (const auto *list = get_if<vector<string> >(&expected)) return *list;
        const auto &gen = get<FileListGenerator>(expected);
        if (!gen) return {};
        return gen();
    }

    VerificationReport verify(const vector<string> &expected_files) {
        vector<pair<string, bool> > entries;
        entries.reserve(expected_files.size());
        for (const auto &name: expected_files) {
            std::error_code ec;
            entries.emplace_back(name, filesystem::exists(name, ec));
        }
        return VerificationReport(std::move(entries));
    }

    void display_report(const VerificationReport &report, ostream &log) {
        for (const auto &[path, ok]: report.entries()) {
            if (ok) print_ok_line(log, path + " - ✓ " + _("Present"));
            else print_error_line(log, path + " - ✗ " + _("Missing"));
        }
    }

    void process_report(const VerificationReport &report, ostream &log) {
        if (!report.passed()) {
            print_status(log, _("Verification failed"), "!!", true);
            throw MissingFileError(report.missing_count(), report.expected_count(), report.missing_files());
        }
        print_status(log, _("Verification passed"), "ok");
        print_ok_line(log, to_string(report.expected_count()) + " out of " + to_string(report.expected_count()) +
                           " " + _("expected files were present"));
    }

    VerificationReport verify_target(const string &message, const ExpectedFiles &expected, ostream &log) {
        print_subhead(log, message);
        auto report = verify(materialize(expected));
        display_report(report, log);
        process_report(report, log);
        return report;
    }
} // namespace assay
