#include "../include/Exec.hpp"
#include "../include/Status.hpp"
#include <cerrno>
#include <ostream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>

using namespace assay;
using namespace std;

namespace {
    int decode_status(const int status) {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    string rtrim(string s) {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
            s.pop_back();
        }
        return s;
    }

    int wait_child(const pid_t pid) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        return decode_status(status);
    }
} // namespace

CommandUnavailableError::CommandUnavailableError(const string &command, const int exit_code)
    : std::runtime_error(string(_("command unavailable: ")) + command + " (exit " + to_string(exit_code) + ")"),
      command_(command), exit_code_(exit_code) {
}

namespace assay {
    int run_shell(const string &cmd, ostream &log) {
        const pid_t pid = fork();
        if (pid < 0) {
            print_status(log, _("failed to fork cmd"), "!!", true);
            return -1;
        }
        if (pid == 0) {
            execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr));
            _exit(127);
        }
        const int rc = wait_child(pid);
        if (rc < 0) print_status(log, _("failed to wait pid"), "!!", true);
        return rc;
    }

    string capture_shell(const string &cmd) {
        int fds[2];
        if (pipe(fds) != 0) {
            throw system_error(errno, generic_category(), "pipe");
        }
        const pid_t pid = fork();
        if (pid < 0) {
            const int err = errno;
            close(fds[0]);
            close(fds[1]);
            throw system_error(err, generic_category(), "fork");
        }
        if (pid == 0) {
            close(fds[0]);
            dup2(fds[1], STDOUT_FILENO);
            close(fds[1]);
            // stderr is dropped unless diagnostics were asked for
            if (!verbose()) {
                if (const int devnull = open("/dev/null", O_WRONLY); devnull >= 0) {
                    dup2(devnull, STDERR_FILENO);
                    close(devnull);
                }
            }
            execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr));
            _exit(127);
        }
        close(fds[1]);
        string output;
        char buffer[4096];
        for (;;) {
            const ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                output.append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
        close(fds[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) throw system_error(errno, generic_category(), "waitpid");
        }
        if (WIFSIGNALED(status)) {
            throw system_error(EINTR, generic_category(), "killed by signal " + to_string(WTERMSIG(status)));
        }
        const int rc = decode_status(status);
        output = rtrim(output);
        if (rc != 0 || output.empty()) {
            throw CommandUnavailableError(cmd, rc);
        }
        return output;
    }

    CommandResult capture_or_default(const string &cmd, const string &default_value, ostream &log) {
        CommandResult result;
        try {
            result.value = capture_shell(cmd);
            result.kind = CommandResult::Kind::Succeeded;
            result.exit_code = 0;
            print_verbose(log, cmd + " -> " + result.value);
        } catch (const CommandUnavailableError &e) {
            result.kind = CommandResult::Kind::Unavailable;
            result.value = default_value;
            result.exit_code = e.exit_code();
            result.detail = e.what();
            print_verbose(log, string(e.what()) + "; " + _("using default") + " \"" + default_value + "\"");
        } catch (const system_error &e) {
            result.kind = CommandResult::Kind::Failed;
            result.value = default_value;
            result.detail = e.what();
            print_status(log, string(_("Error executing command: ")) + cmd + " (" + e.what() + ")", "!!", true);
        }
        return result;
    }
} // namespace assay
