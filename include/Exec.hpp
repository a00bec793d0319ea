#pragma once
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace assay {
    // Raised when an external command cannot produce a value: it could not be
    // started, exited non-zero, or printed nothing.
    class CommandUnavailableError : public std::runtime_error {
    public:
        CommandUnavailableError(const std::string &command, int exit_code);

        [[nodiscard]] const std::string &command() const { return command_; }
        [[nodiscard]] int exit_code() const { return exit_code_; }

    private:
        std::string command_;
        int exit_code_;
    };

    struct CommandResult {
        enum class Kind {
            Succeeded, // value holds the trimmed stdout
            Unavailable, // the command answered "no value"; default substituted
            Failed // the launch itself broke (fork, pipe, signal); default substituted
        };

        Kind kind = Kind::Failed;
        std::string value;
        int exit_code = -1;
        std::string detail;

        [[nodiscard]] bool substituted() const { return kind != Kind::Succeeded; }
    };

    // Run `cmd` through /bin/sh and wait for it; standard output and error are inherited.
    // Returns the exit code, 128 + signal when killed, -1 when fork/wait failed.
    int run_shell(const std::string &cmd, std::ostream &log);

    // Run `cmd` and return its standard output with trailing whitespace removed.
    // Throws CommandUnavailableError on a non-zero exit or an empty answer and
    // std::system_error when the process could not be set up.
    std::string capture_shell(const std::string &cmd);

    // Blocking lookup with no timeout. Never throws: every failure degrades to
    // `default_value`, Unavailable quietly (verbose only), Failed with a warning.
    CommandResult capture_or_default(const std::string &cmd, const std::string &default_value, std::ostream &log);
} // namespace assay
