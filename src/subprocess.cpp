#include "subprocess.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <limits>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& extraEnv) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq != std::string::npos && extraEnv.contains(item.substr(0, eq))) {
            continue;
        }
        env.push_back(std::move(item));
    }
    for (const auto& [name, value] : extraEnv) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> toCArray(std::vector<std::string>& items) {
    std::vector<char*> pointers;
    pointers.reserve(items.size() + 1);
    for (auto& item : items) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void killGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

} // namespace

std::expected<ProcessResult, std::string> runProcess(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        return std::unexpected("Empty command line");
    }

    std::vector<std::string> args = spec.argv;
    std::vector<std::string> env = buildEnvironment(spec.extraEnv);
    std::vector<char*> argvPtr = toCArray(args);
    std::vector<char*> envPtr = toCArray(env);

    int outPipe[2];
    int errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        return std::unexpected(std::format("pipe failed: {}", std::strerror(errno)));
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        int savedErrno = errno;
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return std::unexpected(std::format("pipe failed: {}", std::strerror(savedErrno)));
    }

    // Closed by a successful exec; carries errno back when exec fails.
    int execPipe[2];
    if (::pipe2(execPipe, O_CLOEXEC) != 0) {
        int savedErrno = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
            ::close(fd);
        }
        return std::unexpected(std::format("pipe failed: {}", std::strerror(savedErrno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int savedErrno = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1], execPipe[0], execPipe[1]}) {
            ::close(fd);
        }
        return std::unexpected(std::format("fork failed: {}", std::strerror(savedErrno)));
    }

    if (pid == 0) {
        // Own process group so a timeout can take down everything the tool spawned.
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvpe(argvPtr[0], argvPtr.data(), envPtr.data());
        int execErrno = errno;
        [[maybe_unused]] ssize_t written = ::write(execPipe[1], &execErrno, sizeof(execErrno));
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(execPipe[1]);

    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    ::close(execPipe[0]);
    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
        return std::unexpected(std::format("cannot execute {}: {}", spec.argv.front(), std::strerror(execErrno)));
    }

    ProcessResult result;
    result.pid = pid;

    std::optional<Clock::time_point> deadline;
    if (spec.timeout) {
        deadline = Clock::now() + *spec.timeout;
    }

    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.stdoutText, &result.stderrText};
    int openStreams = 2;
    char buf[8192];

    while (openStreams > 0) {
        int waitMs = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            if (remaining.count() <= 0) {
                result.timedOut = true;
                break;
            }
            waitMs = pollTimeoutMs(remaining);
        }

        int ready = ::poll(fds, 2, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int savedErrno = errno;
            killGroup(pid);
            ::close(outPipe[0]);
            ::close(errPipe[0]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(std::format("poll failed: {}", std::strerror(savedErrno)));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            ::close(fd.fd);
            fd.fd = -1;
        }
    }

    int status = 0;
    if (!result.timedOut) {
        // Output is closed; the child may still be finishing.
        while (true) {
            pid_t done = ::waitpid(pid, &status, WNOHANG);
            if (done == pid) {
                result.exitCode = decodeStatus(status);
                return result;
            }
            if (done < 0 && errno != EINTR) {
                return std::unexpected(std::format("waitpid failed: {}", std::strerror(errno)));
            }
            if (deadline && Clock::now() >= *deadline) {
                result.timedOut = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    killGroup(pid);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exitCode = decodeStatus(status);
    return result;
}

int pollTimeoutMs(std::chrono::milliseconds remaining) {
    if (remaining.count() <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<long long>(remaining.count(), std::numeric_limits<int>::max()));
}
