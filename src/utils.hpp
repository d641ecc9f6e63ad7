#pragma once

#include "exception.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_DIM = "\033[2m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
// One line of captured child-process output
void log_output(std::string_view line);

// Interactive mode control
enum class NonInteractiveMode {
    INTERACTIVE,
    YES,
    NO
};

void set_non_interactive_mode(NonInteractiveMode mode);
NonInteractiveMode get_non_interactive_mode();

bool user_confirms(const std::string& prompt);

// Prevents two setup runs from driving package managers at the same time (RAII lock)
class RunLock {
public:
    RunLock();
    ~RunLock();
    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;
private:
    int lock_fd = -1;
};

// Owns the per-process temporary directory for its lifetime
class TmpDirManager {
public:
    TmpDirManager();
    ~TmpDirManager();
    TmpDirManager(const TmpDirManager&) = delete;
    TmpDirManager& operator=(const TmpDirManager&) = delete;
private:
    fs::path tmp_dir_path_;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);

// String utilities
std::string trim(std::string_view text);
// Wraps a word in single quotes for /bin/sh, escaping embedded quotes.
std::string shell_quote(std::string_view word);
