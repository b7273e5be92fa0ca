/**
 * @file process_runner.cpp
 * @brief fork/exec with a poll() deadline
 */

#include "fdr/status/process_runner.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace fdr::status {

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        throw common::CommandException("empty command line");
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw common::CommandException(std::string("pipe failed: ") + std::strerror(errno));
    }
    FdGuard readEnd(fds[0]);
    FdGuard writeEnd(fds[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw common::CommandException(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devNull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDERR_FILENO);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::execvp(cargv[0], cargv.data());
        _exit(127);
    }

    writeEnd.reset();

    CommandResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd pfd{readEnd.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("[ProcessRunner] poll failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(readEnd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            spdlog::warn("[ProcessRunner] read failed: {}", std::strerror(errno));
            break;
        }
    }

    if (result.timedOut) {
        killAndReap(pid);
        spdlog::warn("[ProcessRunner] {} timed out after {} ms, killed", argv[0], timeout.count());
        return result;
    }

    // stdout is closed; give the child the rest of the deadline to exit
    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            result.exitCode = decodeStatus(status);
            return result;
        }
        if (done < 0 && errno != EINTR) {
            spdlog::warn("[ProcessRunner] waitpid failed: {}", std::strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            killAndReap(pid);
            spdlog::warn("[ProcessRunner] {} did not exit within {} ms, killed", argv[0], timeout.count());
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace fdr::status
