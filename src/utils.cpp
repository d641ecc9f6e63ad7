#include "utils.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {
    NonInteractiveMode non_interactive_mode = NonInteractiveMode::INTERACTIVE;
    std::mutex log_mutex;

    enum class Stream { OUT, ERR };

    // Colour only on a terminal, and never when NO_COLOR is set.
    bool use_color(Stream stream) {
        static const bool no_color = std::getenv("NO_COLOR") != nullptr;
        static const bool out_tty = isatty(STDOUT_FILENO);
        static const bool err_tty = isatty(STDERR_FILENO);
        if (no_color) return false;
        return stream == Stream::OUT ? out_tty : err_tty;
    }

    void write_line(Stream stream, std::string_view color, std::string_view prefix, std::string_view msg) {
        std::ostream& out = stream == Stream::OUT ? std::cout : std::cerr;
        std::lock_guard<std::mutex> lock(log_mutex);
        if (use_color(stream)) {
            out << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            out << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    write_line(Stream::OUT, COLOR_GREEN, get_string("info.log_prefix"), msg);
}

void log_warning(std::string_view msg) {
    write_line(Stream::ERR, COLOR_YELLOW, get_string("warning.prefix") + " ", msg);
}

void log_error(std::string_view msg) {
    write_line(Stream::ERR, COLOR_RED, get_string("error.prefix") + " ", msg);
}

void log_output(std::string_view line) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (use_color(Stream::OUT)) {
        std::cout << COLOR_DIM << "    " << line << COLOR_RESET << std::endl;
    } else {
        std::cout << "    " << line << std::endl;
    }
}

void set_non_interactive_mode(NonInteractiveMode mode) {
    non_interactive_mode = mode;
}

NonInteractiveMode get_non_interactive_mode() {
    return non_interactive_mode;
}

bool user_confirms(const std::string& prompt) {
    switch (get_non_interactive_mode()) {
        case NonInteractiveMode::YES:
            return true;
        case NonInteractiveMode::NO:
            return false;
        case NonInteractiveMode::INTERACTIVE:
            break;
    }

    {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cout << prompt << " " << get_string("prompt.yes_no") << " " << std::flush;
    }
    std::string response;
    if (!std::getline(std::cin, response)) {
        return false; // stdin closed counts as "no"
    }
    response = trim(response);
    return response == "y" || response == "Y" || response == "yes";
}

RunLock::RunLock() {
    ensure_dir_exists(LOCK_DIR);
    lock_fd = open(LOCK_FILE.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw DevsetupException(string_format("error.create_file_failed", LOCK_FILE.string()));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw DevsetupException(get_string("error.run_locked"));
        }
        throw DevsetupException(string_format("error.run_lock_failed", std::string(strerror(err))));
    }

    // Record the owner so a stuck run can be identified.
    const std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(lock_fd, 0) == 0) {
        ssize_t ignored = write(lock_fd, pid.data(), pid.size());
        (void)ignored;
    }
}

RunLock::~RunLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

TmpDirManager::TmpDirManager() : tmp_dir_path_(get_tmp_dir()) {
    ensure_dir_exists(tmp_dir_path_);
}

TmpDirManager::~TmpDirManager() {
    std::error_code ec;
    fs::remove_all(tmp_dir_path_, ec);
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw DevsetupException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw DevsetupException(string_format("error.path_not_dir", path.string()));
    }
}

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::string shell_quote(std::string_view word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
