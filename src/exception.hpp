#pragma once

#include <stdexcept>
#include <string>

class DevsetupException : public std::runtime_error {
public:
    explicit DevsetupException(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised by read-only system checks that cannot produce an answer.
class ProbeError : public DevsetupException {
public:
    using DevsetupException::DevsetupException;
};

// No install/uninstall command can be built for a dependency on this host.
class NoCommandAvailable : public DevsetupException {
public:
    using DevsetupException::DevsetupException;
};

enum class CommandFailure {
    EXIT_CODE,
    TIMEOUT,
    SPAWN_FAILURE,
    TERMINAL_CLOSED
};

class CommandError : public DevsetupException {
public:
    CommandError(CommandFailure kind, const std::string& message, int exit_code = -1)
        : DevsetupException(message), kind_(kind), exit_code_(exit_code) {}

    CommandFailure kind() const { return kind_; }
    int exit_code() const { return exit_code_; }

private:
    CommandFailure kind_;
    int exit_code_;
};
