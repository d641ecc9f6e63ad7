#include "command_channel.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <openssl/rand.h>

#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <condition_variable>
#include <iomanip>
#include <mutex>
#include <sstream>

MarkerScanner::MarkerScanner(std::string token) : token_(std::move(token)) {}

MarkerScanner::State MarkerScanner::feed(std::string_view chunk) {
    if (state_ != State::WAITING) {
        return state_;
    }
    buffer_.append(chunk);

    size_t search_from = 0;
    while (true) {
        const size_t pos = buffer_.find(token_, search_from);
        if (pos == std::string::npos) {
            // Keep just enough to complete a token split across chunks.
            const size_t keep = token_.size() - 1;
            if (buffer_.size() > keep) {
                buffer_.erase(0, buffer_.size() - keep);
            }
            return state_;
        }

        const size_t colon = pos + token_.size();
        if (colon >= buffer_.size()) {
            buffer_.erase(0, pos);
            return state_;
        }
        if (buffer_[colon] != ':') {
            search_from = pos + 1;
            continue;
        }

        size_t end = colon + 1;
        while (end < buffer_.size() && std::isdigit(static_cast<unsigned char>(buffer_[end]))) {
            ++end;
        }
        if (end >= buffer_.size()) {
            // The code (or its terminator) has not arrived yet.
            buffer_.erase(0, pos);
            return state_;
        }
        if (end == colon + 1) {
            search_from = pos + 1;
            continue;
        }

        int code = -1;
        const char* first = buffer_.data() + colon + 1;
        const char* last = buffer_.data() + end;
        if (std::from_chars(first, last, code).ec != std::errc()) {
            code = -1;
        }
        exit_code_ = code;
        state_ = State::MATCHED;
        buffer_.clear();
        return state_;
    }
}

void MarkerScanner::close() {
    if (state_ == State::WAITING) {
        state_ = State::CLOSED;
    }
    buffer_.clear();
}

std::string make_exit_token() {
    static std::atomic<unsigned long> counter{0};

    std::array<unsigned char, 8> random_bytes{};
    if (RAND_bytes(random_bytes.data(), static_cast<int>(random_bytes.size())) != 1) {
        throw DevsetupException(get_string("error.openssl_rand_failed"));
    }

    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream ss;
    ss << "DEVSETUP_EXIT_" << now << "_" << counter.fetch_add(1) << "_";
    for (unsigned char byte : random_bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

ShellCommandChannel::ShellCommandChannel(std::string session_title, TerminalFactory terminal_factory,
                                         std::chrono::milliseconds silent_timeout)
    : session_title_(std::move(session_title)),
      terminal_factory_(std::move(terminal_factory)),
      silent_timeout_(silent_timeout) {}

ShellCommandChannel::~ShellCommandChannel() = default;

void ShellCommandChannel::run(const std::string& command, ExecutionMode mode) {
    if (mode == ExecutionMode::INTERACTIVE) {
        run_interactive(command);
    } else {
        run_silent(command);
    }
}

void ShellCommandChannel::open_session() {
    session();
}

void ShellCommandChannel::notify(const std::string& message) {
    if (terminal_ && !terminal_->is_closed()) {
        terminal_->send_text("echo " + shell_quote(message));
    }
}

Terminal& ShellCommandChannel::session() {
    if (terminal_ && terminal_->is_closed()) {
        log_info(string_format("info.terminal_reopened", session_title_));
        terminal_.reset();
    }
    if (!terminal_) {
        terminal_ = terminal_factory_(session_title_);
    }
    return *terminal_;
}

void ShellCommandChannel::run_silent(const std::string& command) {
    log_info(string_format("info.running_silently", command));

    ProcessResult result = run_shell_command(command, silent_timeout_, log_output);
    if (result.timed_out) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(silent_timeout_).count();
        throw CommandError(CommandFailure::TIMEOUT, string_format("error.command_timeout", command, seconds));
    }
    if (result.exit_code != 0) {
        throw CommandError(CommandFailure::EXIT_CODE,
                           string_format("error.command_failed", command, result.exit_code),
                           result.exit_code);
    }
}

void ShellCommandChannel::run_interactive(const std::string& command) {
    Terminal& terminal = session();
    MarkerScanner scanner(make_exit_token());
    std::mutex scan_mutex;
    std::condition_variable scan_cv;

    {
        Subscription subscription = terminal.subscribe(
            [&](std::string_view chunk) {
                std::lock_guard<std::mutex> lock(scan_mutex);
                if (scanner.feed(chunk) != MarkerScanner::State::WAITING) {
                    scan_cv.notify_all();
                }
            },
            [&] {
                std::lock_guard<std::mutex> lock(scan_mutex);
                scanner.close();
                scan_cv.notify_all();
            });

        log_info(string_format("info.sending_to_terminal", command));
        // The quoted colon keeps the echoed command line from looking like a marker.
        terminal.send_text(command + "; echo " + scanner.token() + "':'$?");

        std::unique_lock<std::mutex> lock(scan_mutex);
        scan_cv.wait(lock, [&] { return scanner.state() != MarkerScanner::State::WAITING; });
    }

    if (scanner.state() == MarkerScanner::State::CLOSED) {
        throw CommandError(CommandFailure::TERMINAL_CLOSED, string_format("error.terminal_closed", session_title_));
    }
    if (scanner.exit_code() != 0) {
        throw CommandError(CommandFailure::EXIT_CODE,
                           string_format("error.command_failed", command, scanner.exit_code()),
                           scanner.exit_code());
    }
}
