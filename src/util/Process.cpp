#include "util/Process.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace lnk::util {

namespace {

using Clock = std::chrono::steady_clock;

int decodeStatus(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] void execChild(const ProcessOptions& opts, const int outFd) {
    if (outFd >= 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(outFd, STDOUT_FILENO);
        dup2(outFd, STDERR_FILENO);
        close(outFd);
    }

    if (!opts.cwd.empty() && chdir(opts.cwd.c_str()) != 0) {
        const auto msg = fmt::format("cannot change directory to '{}': {}\n", opts.cwd.string(), std::strerror(errno));
        [[maybe_unused]] const ssize_t n = write(STDERR_FILENO, msg.data(), msg.size());
        _exit(126);
    }

    for (const auto& [key, value] : opts.env) setenv(key.c_str(), value.c_str(), 1);

    std::vector<char*> args;
    args.reserve(opts.argv.size() + 1);
    for (const auto& a : opts.argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    execvp(args[0], args.data());
    _exit(127); // exec failed
}

bool waitWithDeadline(const pid_t pid, int& status, const std::chrono::seconds timeout, const Clock::time_point start) {
    if (timeout.count() == 0) {
        while (waitpid(pid, &status, 0) < 0)
            if (errno != EINTR) return true;
        return true;
    }

    while (true) {
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) return true;
        if (Clock::now() - start >= timeout) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

}

ProcessResult runProcess(const ProcessOptions& opts) {
    if (opts.argv.empty()) throw std::invalid_argument("runProcess: empty argv");

    log::Registry::vcs()->debug("[runProcess] {} (cwd: {})", fmt::join(opts.argv, " "), opts.cwd.string());

    int pipefd[2] = {-1, -1};
    if (opts.captureOutput && pipe(pipefd) == -1)
        throw error::io("create pipe", opts.argv.front(), std::strerror(errno));

    const auto start = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        if (opts.captureOutput) {
            close(pipefd[0]);
            close(pipefd[1]);
        }
        throw error::io("fork", opts.argv.front(), std::strerror(errno));
    }

    if (pid == 0) {
        if (opts.captureOutput) close(pipefd[0]);
        execChild(opts, opts.captureOutput ? pipefd[1] : -1);
    }

    ProcessResult result;

    if (opts.captureOutput) {
        close(pipefd[1]);

        char buf[4096];
        pollfd pfd{ .fd = pipefd[0], .events = POLLIN, .revents = 0 };

        while (true) {
            int waitMs = -1;
            if (opts.timeout.count() > 0) {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    opts.timeout - (Clock::now() - start));
                if (left.count() <= 0) {
                    result.timedOut = true;
                    break;
                }
                waitMs = static_cast<int>(left.count());
            }

            const int pr = poll(&pfd, 1, waitMs);
            if (pr < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (pr == 0) continue; // deadline re-checked above

            const ssize_t n = read(pipefd[0], buf, sizeof(buf));
            if (n > 0) result.output.append(buf, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) break;
        }

        close(pipefd[0]);
    }

    int status = 0;
    if (result.timedOut || !waitWithDeadline(pid, status, opts.timeout, start)) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.timedOut = true;
        log::Registry::vcs()->warn("[runProcess] {} timed out after {}s, killed",
                                   opts.argv.front(), opts.timeout.count());
        return result;
    }

    result.exitCode = decodeStatus(status);
    log::Registry::vcs()->trace("[runProcess] {} exited with {}", opts.argv.front(), result.exitCode);
    return result;
}

}
