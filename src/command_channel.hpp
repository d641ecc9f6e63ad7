#pragma once

#include "config.hpp"
#include "terminal.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

enum class ExecutionMode {
    SILENT,      // captured output, no elevation or input, bounded by a timeout
    INTERACTIVE  // typed into a visible terminal session, waits for the real exit code
};

// Runs a command to completion. Throws CommandError (or another DevsetupException) on failure.
class CommandChannel {
public:
    virtual ~CommandChannel() = default;

    virtual void run(const std::string& command, ExecutionMode mode) = 0;

    // Makes the interactive session visible before the first command is sent.
    virtual void open_session() {}

    // Echoes a notice into the interactive session, if one is open.
    virtual void notify(const std::string& message) { (void)message; }
};

// Finds "<token>:<exit code>" in a terminal byte stream, however the stream is chunked.
// The token must be immediately followed by ':' and at least one digit, and the
// digits must be terminated by a non-digit, so the echoed command text
// ("<token>':'$?") and a half-delivered code never match.
class MarkerScanner {
public:
    enum class State {
        WAITING,
        MATCHED,
        CLOSED  // the session ended before the marker appeared
    };

    explicit MarkerScanner(std::string token);

    State feed(std::string_view chunk);
    void close();

    State state() const { return state_; }
    int exit_code() const { return exit_code_; }
    const std::string& token() const { return token_; }

private:
    std::string token_;
    std::string buffer_;
    State state_ = State::WAITING;
    int exit_code_ = -1;
};

// Fresh per call: time, a process-wide counter and random bytes.
std::string make_exit_token();

using TerminalFactory = std::function<std::unique_ptr<Terminal>(const std::string& title)>;

class ShellCommandChannel : public CommandChannel {
public:
    explicit ShellCommandChannel(std::string session_title,
                                 TerminalFactory terminal_factory = make_pty_terminal,
                                 std::chrono::milliseconds silent_timeout = get_silent_timeout());
    ~ShellCommandChannel() override;

    void run(const std::string& command, ExecutionMode mode) override;
    void open_session() override;
    void notify(const std::string& message) override;

    void run_silent(const std::string& command);
    void run_interactive(const std::string& command);

private:
    Terminal& session();

    std::string session_title_;
    TerminalFactory terminal_factory_;
    std::chrono::milliseconds silent_timeout_;
    std::unique_ptr<Terminal> terminal_;
};
