#pragma once
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace assay {
    /**
     * @brief Presence record for a list of expected output files.
     *
     * Entries keep the order of the input list. The report is built once by
     * verify() and is read-only afterwards.
     */
    class VerificationReport {
    public:
        explicit VerificationReport(std::vector<std::pair<std::string, bool> > entries);

        [[nodiscard]] const std::vector<std::pair<std::string, bool> > &entries() const { return entries_; }
        [[nodiscard]] std::size_t missing_count() const { return missing_; }
        [[nodiscard]] std::size_t expected_count() const { return entries_.size(); }
        [[nodiscard]] bool passed() const { return missing_ == 0; }

        // Presence of `path`; false for a path that was not checked.
        [[nodiscard]] bool present(const std::string &path) const;

        [[nodiscard]] std::vector<std::string> missing_files() const;

    private:
        std::vector<std::pair<std::string, bool> > entries_;
        std::size_t missing_ = 0;
    };

    // Verification found absent artifacts. Fatal: publishing must not go on.
    class MissingFileError : public std::runtime_error {
    public:
        MissingFileError(std::size_t missing, std::size_t expected, std::vector<std::string> files);

        [[nodiscard]] std::size_t missing_count() const { return missing_; }
        [[nodiscard]] std::size_t expected_count() const { return expected_; }
        [[nodiscard]] const std::vector<std::string> &files() const { return files_; }

    private:
        std::size_t missing_;
        std::size_t expected_;
        std::vector<std::string> files_;
    };

    using FileListGenerator = std::function<std::vector<std::string>()>;

    // Either a fixed list, or a generator evaluated when verification runs.
    using ExpectedFiles = std::variant<std::vector<std::string>, FileListGenerator>;

    [[nodiscard]] std::vector<std::string> materialize(const ExpectedFiles &expected);

    // Check each path on disk at call time.
    [[nodiscard]] VerificationReport verify(const std::vector<std::string> &expected_files);

    // "<path> - ✓ Present" / "<path> - ✗ Missing", input order.
    void display_report(const VerificationReport &report, std::ostream &log);

    // Passes silently with a summary line, or throws MissingFileError.
    void process_report(const VerificationReport &report, std::ostream &log);

    // subhead + verify + display + process, as one verification target.
    VerificationReport verify_target(const std::string &message, const ExpectedFiles &expected, std::ostream &log);
} // namespace assay
