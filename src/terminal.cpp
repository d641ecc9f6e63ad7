#include "terminal.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <poll.h>
#ifdef __APPLE__
#include <util.h>
#else
#include <pty.h>
#endif
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace {

bool write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t written = write(fd, data.data(), data.size());
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(written));
    }
    return true;
}

bool open_cloexec_pipe(int fds[2]) {
    if (pipe(fds) != 0) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

} // anonymous namespace

Subscription::Subscription(Subscription&& other) noexcept
    : terminal_(other.terminal_), id_(other.id_) {
    other.terminal_ = nullptr;
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        terminal_ = other.terminal_;
        id_ = other.id_;
        other.terminal_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::reset() {
    if (terminal_ != nullptr) {
        terminal_->unsubscribe(id_);
        terminal_ = nullptr;
        id_ = 0;
    }
}

Subscription Terminal::subscribe(OutputListener on_output, ClosedListener on_closed) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (closed_) {
        if (on_closed) on_closed();
        return Subscription();
    }
    const unsigned long id = next_id_++;
    listeners_.emplace(id, Listener{std::move(on_output), std::move(on_closed)});
    return Subscription(this, id);
}

void Terminal::unsubscribe(unsigned long id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

bool Terminal::is_closed() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return closed_;
}

void Terminal::publish(std::string_view chunk) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (auto& [id, listener] : listeners_) {
        if (listener.on_output) listener.on_output(chunk);
    }
}

void Terminal::publish_closed() {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (closed_) return;
    closed_ = true;
    for (auto& [id, listener] : listeners_) {
        if (listener.on_closed) listener.on_closed();
    }
}

PtyTerminal::PtyTerminal(std::string title, std::string shell, bool relay_input)
    : title_(std::move(title)) {
    if (shell.empty()) {
        shell = std::filesystem::exists("/bin/bash") ? "/bin/bash" : "/bin/sh";
    }

    if (!open_cloexec_pipe(wake_pipe_)) {
        throw CommandError(CommandFailure::SPAWN_FAILURE,
                           string_format("error.terminal_open_failed", title_, std::string(strerror(errno))));
    }

    struct winsize ws{};
    const bool has_size = isatty(STDIN_FILENO) && ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) == 0;

    child_ = forkpty(&master_fd_, nullptr, nullptr, has_size ? &ws : nullptr);
    if (child_ == -1) {
        int err = errno;
        ::close(wake_pipe_[0]);
        ::close(wake_pipe_[1]);
        throw CommandError(CommandFailure::SPAWN_FAILURE,
                           string_format("error.terminal_open_failed", title_, std::string(strerror(err))));
    }
    if (child_ == 0) {
        setenv("DEVSETUP_SESSION", title_.c_str(), 1);
        execl(shell.c_str(), shell.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    fcntl(master_fd_, F_SETFD, FD_CLOEXEC);

    log_info(string_format("info.terminal_opened", title_));

    if (relay_input && isatty(STDIN_FILENO)) {
        enter_raw_mode();
        input_ = std::thread(&PtyTerminal::input_loop, this);
    }
    reader_ = std::thread(&PtyTerminal::read_loop, this);
}

PtyTerminal::~PtyTerminal() {
    close(std::chrono::seconds(1));
}

void PtyTerminal::send_text(const std::string& text) {
    if (eof_.load() || !write_all(master_fd_, text + "\n")) {
        throw CommandError(CommandFailure::TERMINAL_CLOSED, string_format("error.terminal_closed", title_));
    }
}

void PtyTerminal::close(std::chrono::milliseconds grace) {
    if (master_fd_ == -1) return;

    if (!eof_.load() && write_all(master_fd_, "exit\n")) {
        std::unique_lock<std::mutex> lock(state_mutex_);
        eof_cv_.wait_for(lock, grace, [this] { return eof_.load(); });
    }

    stopping_ = true;
    ssize_t ignored = write(wake_pipe_[1], "x", 1);
    (void)ignored;
    if (reader_.joinable()) reader_.join();
    if (input_.joinable()) input_.join();

    if (child_ > 0) {
        int status = 0;
        if (waitpid(child_, &status, WNOHANG) == 0) {
            kill(child_, SIGHUP);
            waitpid(child_, &status, 0);
        }
        child_ = -1;
    }

    restore_mode();
    ::close(master_fd_);
    ::close(wake_pipe_[0]);
    ::close(wake_pipe_[1]);
    master_fd_ = -1;
}

void PtyTerminal::read_loop() {
    std::array<char, 4096> buffer;
    while (!stopping_.load()) {
        std::array<pollfd, 2> fds{{{master_fd_, POLLIN, 0}, {wake_pipe_[0], POLLIN, 0}}};
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[1].revents != 0) break;
        if (fds[0].revents == 0) continue;

        ssize_t count = read(master_fd_, buffer.data(), buffer.size());
        if (count > 0) {
            std::string_view chunk(buffer.data(), static_cast<size_t>(count));
            write_all(STDOUT_FILENO, chunk);
            publish(chunk);
        } else if (count < 0 && errno == EINTR) {
            continue;
        } else {
            break; // EIO once the shell has exited
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        eof_ = true;
    }
    eof_cv_.notify_all();
    publish_closed();
}

void PtyTerminal::input_loop() {
    std::array<char, 1024> buffer;
    while (!stopping_.load()) {
        std::array<pollfd, 2> fds{{{STDIN_FILENO, POLLIN, 0}, {wake_pipe_[0], POLLIN, 0}}};
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[1].revents != 0) break;
        if (fds[0].revents == 0) continue;

        ssize_t count = read(STDIN_FILENO, buffer.data(), buffer.size());
        if (count <= 0) break;
        if (!write_all(master_fd_, std::string_view(buffer.data(), static_cast<size_t>(count)))) break;
    }
}

void PtyTerminal::enter_raw_mode() {
    if (raw_mode_enabled_) return;
    if (tcgetattr(STDIN_FILENO, &saved_termios_) != 0) return;

    struct termios raw = saved_termios_;
    // Keystrokes go to the session untouched; its own line discipline echoes and handles ^C.
    // Output post-processing stays on so our log lines keep their carriage returns.
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0) {
        raw_mode_enabled_ = true;
    }
}

void PtyTerminal::restore_mode() {
    if (!raw_mode_enabled_) return;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_termios_);
    raw_mode_enabled_ = false;
}

std::unique_ptr<Terminal> make_pty_terminal(const std::string& title) {
    return std::make_unique<PtyTerminal>(title);
}
