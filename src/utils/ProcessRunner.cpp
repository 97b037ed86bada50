#include "utils/ProcessRunner.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace MediaBot {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kPollInterval = std::chrono::milliseconds(100);

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void killGroup(pid_t pid) {
    // Negative pid targets the process group created for the child
    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
}

// Only write(2); safe to call in the forked child
void writeAll(int fd, const char* text) {
    size_t left = std::strlen(text);
    while (left > 0) {
        const ssize_t written = write(fd, text, left);
        if (written < 0 && errno == EINTR) continue;
        if (written <= 0) return;
        text += written;
        left -= static_cast<size_t>(written);
    }
}

std::string trimmed(const std::string& text) {
    const size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

PosixCommandRunner::PosixCommandRunner(std::shared_ptr<std::atomic<bool>> cancelFlag,
                                       size_t maxOutputBytes)
    : cancelFlag(std::move(cancelFlag))
    , maxOutputBytes(maxOutputBytes) {
}

bool PosixCommandRunner::isCancelled() const {
    return cancelFlag && cancelFlag->load();
}

CommandResult PosixCommandRunner::run(const CommandSpec& spec) {
    CommandResult result;
    LOG_DL_DEBUG("exec: {}", describeCommand(spec));

    if (isCancelled()) {
        result.cancelled = true;
        result.error = spec.program + " cancelled";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(outPipe) != 0 || pipe(errPipe) != 0) {
        result.error = spec.program + " failed: could not create pipe: " + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = spec.program + " failed: fork: " + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);

        execvp(argv[0], argv.data());

        // No allocation between fork and _exit
        const char* reason = std::strerror(errno);
        writeAll(STDERR_FILENO, "exec ");
        writeAll(STDERR_FILENO, argv[0]);
        writeAll(STDERR_FILENO, ": ");
        writeAll(STDERR_FILENO, reason);
        writeAll(STDERR_FILENO, "\n");
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    const auto deadline = Clock::now() + spec.timeout;
    struct pollfd fds[2];
    fds[0] = {outPipe[0], POLLIN, 0};
    fds[1] = {errPipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.output, &result.errorOutput};
    int openCount = 2;
    char buffer[64 * 1024];

    while (openCount > 0) {
        if (isCancelled()) {
            result.cancelled = true;
            killGroup(pid);
            break;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            killGroup(pid);
            break;
        }

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (wait > kPollInterval) wait = kPollInterval;

        int ready = poll(fds, 2, static_cast<int>(wait.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = spec.program + " failed: poll: " + std::strerror(errno);
            killGroup(pid);
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                std::string& sink = *sinks[i];
                if (sink.size() < maxOutputBytes) {
                    size_t room = maxOutputBytes - sink.size();
                    sink.append(buffer, std::min(static_cast<size_t>(n), room));
                }
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openCount;
            }
        }
    }

    closeFd(fds[0].fd);
    closeFd(fds[1].fd);

    // Reap the child, still honouring the deadline
    int status = 0;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            status = -1;
            break;
        }
        if (!result.timedOut && !result.cancelled) {
            if (isCancelled()) {
                result.cancelled = true;
                killGroup(pid);
            } else if (Clock::now() >= deadline) {
                result.timedOut = true;
                killGroup(pid);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (status != -1 && WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    result.success = result.exitCode == 0 && !result.timedOut && !result.cancelled && result.error.empty();

    if (!result.success && result.error.empty()) {
        if (result.cancelled) {
            result.error = spec.program + " cancelled";
        } else if (result.timedOut) {
            result.error = spec.program + " failed: timed out after " +
                           std::to_string(spec.timeout.count()) + " ms";
        } else {
            std::string reason = trimmed(result.errorOutput);
            if (reason.empty()) {
                reason = "exited with code " + std::to_string(result.exitCode);
            }
            result.error = spec.program + " failed: " + reason;
        }
    }

    return result;
}

std::string describeCommand(const CommandSpec& spec) {
    std::string line = spec.program;
    for (const auto& arg : spec.args) {
        line += ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            line += '"' + arg + '"';
        } else {
            line += arg;
        }
    }
    return line;
}

} // namespace MediaBot
