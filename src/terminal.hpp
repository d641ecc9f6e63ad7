#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <sys/types.h>
#include <termios.h>

using OutputListener = std::function<void(std::string_view chunk)>;
using ClosedListener = std::function<void()>;

class Terminal;

// Scoped registration of a terminal output listener; unsubscribes on destruction.
class Subscription {
public:
    Subscription() = default;
    Subscription(Terminal* terminal, unsigned long id) : terminal_(terminal), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();

private:
    Terminal* terminal_ = nullptr;
    unsigned long id_ = 0;
};

// A user-visible shell session whose raw output can be observed.
// Listeners are invoked on the terminal's reader thread and must not subscribe or unsubscribe.
class Terminal {
public:
    virtual ~Terminal() = default;

    // Types `text` followed by a newline into the session.
    virtual void send_text(const std::string& text) = 0;

    // on_closed is invoked once when the session ends (immediately if it already has).
    Subscription subscribe(OutputListener on_output, ClosedListener on_closed = {});

    // True once the session has ended; a closed terminal never reopens.
    bool is_closed() const;

protected:
    void publish(std::string_view chunk);
    void publish_closed();

private:
    friend class Subscription;
    void unsubscribe(unsigned long id);

    struct Listener {
        OutputListener on_output;
        ClosedListener on_closed;
    };

    mutable std::mutex listeners_mutex_;
    std::map<unsigned long, Listener> listeners_;
    unsigned long next_id_ = 1;
    bool closed_ = false;
};

// Interactive shell on a pseudo-terminal, relayed to this process's stdout and fed from its stdin.
class PtyTerminal : public Terminal {
public:
    explicit PtyTerminal(std::string title, std::string shell = "", bool relay_input = true);
    ~PtyTerminal() override;

    PtyTerminal(const PtyTerminal&) = delete;
    PtyTerminal& operator=(const PtyTerminal&) = delete;

    void send_text(const std::string& text) override;

    // Asks the shell to exit and waits up to `grace` before killing it.
    void close(std::chrono::milliseconds grace = std::chrono::seconds(5));

private:
    void read_loop();
    void input_loop();
    void enter_raw_mode();
    void restore_mode();

    std::string title_;
    int master_fd_ = -1;
    pid_t child_ = -1;
    int wake_pipe_[2] = {-1, -1};
    std::thread reader_;
    std::thread input_;
    std::atomic<bool> eof_{false};
    std::atomic<bool> stopping_{false};
    std::mutex state_mutex_;
    std::condition_variable eof_cv_;
    struct termios saved_termios_{};
    bool raw_mode_enabled_ = false;
};

std::unique_ptr<Terminal> make_pty_terminal(const std::string& title);
