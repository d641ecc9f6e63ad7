#include "process.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace {

// Owns a file descriptor and closes it on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ != -1) close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

// Splits a byte stream into lines for the sink, keeping the unterminated tail.
struct LineBuffer {
    std::string pending;

    void feed(const char* data, size_t size, const LineSink& sink) {
        if (!sink) return;
        pending.append(data, size);
        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            std::string_view line(pending.data() + start, newline - start);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            sink(line);
            start = newline + 1;
        }
        pending.erase(0, start);
    }

    void flush(const LineSink& sink) {
        if (sink && !pending.empty()) sink(pending);
        pending.clear();
    }
};

// Held from pipe creation until fork returns, so a concurrent spawn never inherits
// a descriptor before its close-on-exec flag is set.
std::mutex spawn_mutex;

void make_pipe(int fds[2]) {
    if (pipe(fds) != 0) {
        throw CommandError(CommandFailure::SPAWN_FAILURE,
                           string_format("error.spawn_failed", std::string(strerror(errno))));
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

ProcessResult run_shell_command(const std::string& command, std::chrono::milliseconds timeout, const LineSink& on_line) {
    int out_pipe[2];
    int err_pipe[2];
    int exec_pipe[2]; // reports exec failure from the child
    std::unique_lock<std::mutex> spawn_lock(spawn_mutex);
    make_pipe(out_pipe);
    FdGuard out_read(out_pipe[0]), out_write(out_pipe[1]);
    make_pipe(err_pipe);
    FdGuard err_read(err_pipe[0]), err_write(err_pipe[1]);
    make_pipe(exec_pipe);
    FdGuard exec_read(exec_pipe[0]), exec_write(exec_pipe[1]);

    pid_t pid = fork();
    if (pid == -1) {
        throw CommandError(CommandFailure::SPAWN_FAILURE,
                           string_format("error.spawn_failed", std::string(strerror(errno))));
    }
    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull != -1) dup2(devnull, STDIN_FILENO);
        dup2(out_write.get(), STDOUT_FILENO);
        dup2(err_write.get(), STDERR_FILENO);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        int err = errno;
        ssize_t ignored = write(exec_write.get(), &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }
    setpgid(pid, pid);
    spawn_lock.unlock();

    out_write.reset();
    err_write.reset();
    exec_write.reset();

    int exec_errno = 0;
    ssize_t n = read(exec_read.get(), &exec_errno, sizeof(exec_errno));
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        waitpid(pid, nullptr, 0);
        throw CommandError(CommandFailure::SPAWN_FAILURE,
                           string_format("error.spawn_failed", std::string(strerror(exec_errno))));
    }

    ProcessResult result;
    LineBuffer out_lines;
    LineBuffer err_lines;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    int status = 0;
    std::array<char, 4096> buffer;

    // Returns false once the descriptor has nothing more to give right now.
    auto drain = [&](FdGuard& fd, bool& open_flag, std::string& text, LineBuffer& lines) {
        ssize_t count = read(fd.get(), buffer.data(), buffer.size());
        if (count > 0) {
            text.append(buffer.data(), count);
            lines.feed(buffer.data(), count, on_line);
            return true;
        }
        if (count == 0 || (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK)) {
            open_flag = false;
        }
        return count < 0 && errno == EINTR;
    };

    while (!exited) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(remaining, 100));

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_read.get(), POLLIN, 0};
        if (err_open) fds[count++] = {err_read.get(), POLLIN, 0};

        if (count == 0) {
            usleep(static_cast<useconds_t>(wait_ms) * 1000);
        } else if (int ready = poll(fds.data(), count, wait_ms); ready > 0) {
            for (nfds_t i = 0; i < count; ++i) {
                if (fds[i].revents == 0) continue;
                if (fds[i].fd == out_read.get()) {
                    drain(out_read, out_open, result.output, out_lines);
                } else {
                    drain(err_read, err_open, result.errors, err_lines);
                }
            }
        } else if (ready < 0 && errno != EINTR) {
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
            throw CommandError(CommandFailure::SPAWN_FAILURE,
                               string_format("error.spawn_failed", std::string(strerror(errno))));
        }

        if (waitpid(pid, &status, WNOHANG) == pid) {
            exited = true;
        }
    }

    if (!result.timed_out) {
        // Collect what is still buffered; a grandchild may hold the pipe open, so never block.
        fcntl(out_read.get(), F_SETFL, O_NONBLOCK);
        fcntl(err_read.get(), F_SETFL, O_NONBLOCK);
        while (out_open && drain(out_read, out_open, result.output, out_lines)) {}
        while (err_open && drain(err_read, err_open, result.errors, err_lines)) {}
    }

    out_lines.flush(on_line);
    err_lines.flush(on_line);
    result.exit_code = result.timed_out ? -1 : decode_status(status);
    return result;
}
