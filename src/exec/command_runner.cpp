#include "exec/command_runner.hpp"

#include "io/fd.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace uploader {

namespace {

constexpr size_t kMaxDetailBytes = 1024;

Result MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int err = errno;
        return Result::Fail(err, std::string("pipe2 failed: ") + std::strerror(err));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

// Logs complete lines of child output as they arrive.
void EchoLines(const char* program, std::string& pending, const char* data, size_t n) {
    pending.append(data, n);
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
        const std::string_view line = Trim(std::string_view(pending).substr(0, pos));
        if (!line.empty()) {
            LogDebug("[%s] %.*s", program, static_cast<int>(line.size()), line.data());
        }
        pending.erase(0, pos + 1);
    }
}

[[noreturn]] void ExecChild(const Command& cmd, int out_fd, int err_fd) {
    // Own process group: a terminal Ctrl-C reaches the uploader only. A second
    // signal is forwarded to this group by the uploader's handler.
    (void)::setpgid(0, 0);

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        if (null_fd != STDIN_FILENO) ::close(null_fd);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(cmd.args.size() + 2);
    argv.push_back(const_cast<char*>(cmd.program.c_str()));
    for (const auto& a : cmd.args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(cmd.program.c_str(), argv.data());

    const int err = errno;
    std::fprintf(stderr, "cannot execute %s: %s\n", cmd.program.c_str(), std::strerror(err));
    ::_exit(127);
}

int WaitForExit(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::string Command::ToString() const {
    std::string out = ShellQuote(program);
    for (const auto& a : args) {
        out.push_back(' ');
        out += ShellQuote(a);
    }
    return out;
}

std::string CommandResult::Describe() const {
    std::string_view text = Trim(stderr_text);
    if (text.empty()) text = Trim(stdout_text);
    if (text.size() > kMaxDetailBytes) {
        text = text.substr(text.size() - kMaxDetailBytes);
    }

    std::string out = "exit " + std::to_string(exit_code);
    if (!text.empty()) {
        out += ": ";
        out += text;
    }
    return out;
}

CommandResult PosixCommandRunner::Run(const Command& cmd) {
    CommandResult result;
    LogInfo("$ %s", cmd.ToString().c_str());

    Fd out_read, out_write, err_read, err_write;
    if (auto r = MakePipe(out_read, out_write); !r.is_ok()) {
        result.stderr_text = r.message();
        return result;
    }
    if (auto r = MakePipe(err_read, err_write); !r.is_ok()) {
        result.stderr_text = r.message();
        return result;
    }

    // Buffered log output must not be duplicated into the child.
    std::fflush(stdout);
    std::fflush(stderr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        result.stderr_text = std::string("fork failed: ") + std::strerror(err);
        return result;
    }
    if (pid == 0) {
        ExecChild(cmd, out_write.Get(), err_write.Get());
    }
    // Set here as well so the group exists before it is registered; EACCES
    // once the child has exec'd is harmless.
    (void)::setpgid(pid, pid);
    SetForegroundChild(pid);

    out_write.Close();
    err_write.Close();

    std::string out_pending, err_pending;
    std::array<char, 64 * 1024> buf{};
    std::array<pollfd, 2> fds{{
        {out_read.Get(), POLLIN, 0},
        {err_read.Get(), POLLIN, 0},
    }};

    int open_streams = 2;
    while (open_streams > 0) {
        const int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LogError("poll failed while running %s: %s", cmd.program.c_str(), std::strerror(errno));
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            const ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                fds[i].fd = -1;
                --open_streams;
                continue;
            }

            std::string& sink = (i == 0) ? result.stdout_text : result.stderr_text;
            sink.append(buf.data(), static_cast<size_t>(n));
            EchoLines(cmd.program.c_str(), i == 0 ? out_pending : err_pending, buf.data(), static_cast<size_t>(n));
        }
    }

    out_read.Close();
    err_read.Close();
    result.exit_code = WaitForExit(pid);
    SetForegroundChild(0);
    if (!result.Succeeded()) {
        LogDebug("%s exited with %d", cmd.program.c_str(), result.exit_code);
    }
    return result;
}

CommandResult DryRunCommandRunner::Run(const Command& cmd) {
    LogInfo("[dry-run] $ %s", cmd.ToString().c_str());
    printed_.push_back(cmd);

    CommandResult result;
    result.exit_code = 0;
    return result;
}

} // namespace uploader
