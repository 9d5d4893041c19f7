#include "launcher.hpp"
#include "diag.hpp"
#include "sys.hpp"

#include <cerrno>
#include <csignal>
#include <filesystem>
#include <sstream>
#include <unistd.h>
#include <sys/wait.h>

namespace {

constexpr const char* TAG = "launcher";

// Records sent back from the intermediate and final child over the
// close-on-exec status pipe. EOF without a failure record means exec worked.
enum Stage : int { ForkedPid = 0, SessionFailed, ForkFailed, RedirectFailed, ExecFailed };

struct StatusMsg {
    int stage;
    int value;
};

const char* stage_text(int stage) {
    switch (stage) {
    case SessionFailed:  return "setsid";
    case ForkFailed:     return "fork";
    case RedirectFailed: return "dup2";
    case ExecFailed:     return "execv";
    default:             return "launch";
    }
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

void child_reset_signals() {
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGQUIT, SIG_DFL);
    ::signal(SIGTSTP, SIG_DFL);
    ::signal(SIGTTIN, SIG_DFL);
    ::signal(SIGTTOU, SIG_DFL);
    ::signal(SIGCHLD, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);

    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
}

// Only async-signal-safe calls from here on: the parent may have threads.
[[noreturn]] void report_and_exit(int status_fd, int stage, int value) {
    StatusMsg m{stage, value};
    if (!sys::write_all(status_fd, &m, sizeof m)) _exit(126);
    _exit(127);
}

void redirect(int status_fd, int from, int to) {
    if (::dup2(from, to) < 0) report_and_exit(status_fd, RedirectFailed, errno);
}

} // namespace

Result make_plan(const Command& cmd, LaunchPlan& plan) {
    plan = LaunchPlan{};

    auto kind = cmd.kind();
    if (!kind) {
        return Result::failure(Error::UnknownCommandKind,
                               "Unknown command type '" + cmd.type_tag() + "' in '" + cmd.name() + "'");
    }

    switch (*kind) {
    case CommandKind::Single:
        plan.echo_lines.push_back(cmd.content());
        plan.shell_body = cmd.content();
        break;

    case CommandKind::Multi: {
        std::istringstream iss(cmd.content());
        for (std::string line; std::getline(iss, line); ) {
            std::string t = trim(line);
            if (!t.empty()) plan.echo_lines.push_back(std::move(t));
        }
        if (plan.echo_lines.empty()) {
            diag::warn(TAG, "No commands to execute in '" + cmd.name() + "'");
            return Result::failure(Error::EmptyCommand, "'" + cmd.name() + "' has no non-blank lines");
        }
        for (size_t i = 0; i < plan.echo_lines.size(); ++i) {
            if (i) plan.shell_body.push_back('\n');
            plan.shell_body += plan.echo_lines[i];
        }
        break;
    }

    case CommandKind::Script: {
        std::error_code ec;
        if (!std::filesystem::exists(cmd.content(), ec)) {
            diag::error(TAG, "Script file does not exist: " + cmd.content());
            return Result::failure(Error::ScriptNotFound, "Script file does not exist: " + cmd.content());
        }
        plan.echo_lines.push_back(cmd.content());
        plan.shell_body = shell_quote(cmd.content());
        break;
    }
    }

    return Result::success();
}

Result launch_detached(const LaunchRequest& req) {
    sys::Fd devnull;
    sys::Pipe status;
    try {
        devnull = sys::Fd{sys::open_dev_null()};
        status = sys::make_pipe();
    } catch (const std::system_error& e) {
        diag::error(TAG, std::string("cannot prepare launch of '") + req.label + "': " + e.what());
        return Result::failure(Error::LaunchFailure, e.what());
    }

    // Built before fork; the children must not allocate.
    std::string sh = "/bin/sh";
    std::string dash_c = "-c";
    std::string body = req.shell_body;
    char* argv[] = {sh.data(), dash_c.data(), body.data(), nullptr};

    pid_t mid = ::fork();
    if (mid < 0) {
        int err = errno;
        diag::error(TAG, "fork failed for '" + req.label + "': " + sys::errno_text(err));
        return Result::failure(Error::LaunchFailure, "fork: " + sys::errno_text(err));
    }

    if (mid == 0) {
        const int sfd = status.w.get();
        ::close(status.r.get());

        if (::setsid() < 0) report_and_exit(sfd, SessionFailed, errno);

        pid_t pid = ::fork();
        if (pid < 0) report_and_exit(sfd, ForkFailed, errno);

        if (pid == 0) {
            child_reset_signals();
            redirect(sfd, devnull.get(), STDIN_FILENO);
            if (req.stdout_fd >= 0) redirect(sfd, req.stdout_fd, STDOUT_FILENO);
            if (req.stderr_fd >= 0) redirect(sfd, req.stderr_fd, STDERR_FILENO);
            ::execv(argv[0], argv);
            report_and_exit(sfd, ExecFailed, errno);
        }

        StatusMsg m{ForkedPid, static_cast<int>(pid)};
        _exit(sys::write_all(sfd, &m, sizeof m) ? 0 : 1);
    }

    status.w.reset();

    // The intermediate exits right after its fork, so this does not block on the command.
    int wst = 0;
    while (::waitpid(mid, &wst, 0) < 0) {
        if (errno == EINTR) continue;
        if (errno == ECHILD) break;   // reaped by someone else's SIGCHLD handler
        diag::warn(TAG, "waitpid(intermediate): " + sys::errno_text(errno));
        break;
    }

    pid_t child = -1;
    int fail_stage = -1;
    int fail_errno = 0;
    for (;;) {
        StatusMsg m{};
        ssize_t n = ::read(status.r.get(), &m, sizeof m);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        if (n != static_cast<ssize_t>(sizeof m)) break;
        if (m.stage == ForkedPid) child = static_cast<pid_t>(m.value);
        else if (fail_stage < 0) { fail_stage = m.stage; fail_errno = m.value; }
    }

    if (fail_stage >= 0 || child < 0) {
        std::string why = fail_stage >= 0
            ? std::string(stage_text(fail_stage)) + ": " + sys::errno_text(fail_errno)
            : std::string("launch: no child reported");
        diag::error(TAG, "Failed to start '" + req.label + "': " + why);
        return Result::failure(Error::LaunchFailure, why);
    }

    diag::info(TAG, "'" + req.label + "' started with PID " + std::to_string(child));
    return Result::success(child);
}
