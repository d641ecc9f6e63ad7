#include "executor.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace {
constexpr std::array<std::pair<const char*, LinuxPackageManager>, 3> LINUX_MANAGER_PRIORITY = {{
    {"apt", LinuxPackageManager::APT},
    {"dnf", LinuxPackageManager::DNF},
    {"pacman", LinuxPackageManager::PACMAN},
}};
}

std::string linux_package_manager_name(LinuxPackageManager manager) {
    switch (manager) {
        case LinuxPackageManager::APT: return "apt";
        case LinuxPackageManager::DNF: return "dnf";
        case LinuxPackageManager::PACMAN: return "pacman";
        case LinuxPackageManager::UNKNOWN: break;
    }
    return "unknown";
}

LinuxPackageManager detect_linux_package_manager(const SystemProbe& probe) {
    log_info(get_string("info.detecting_package_manager"));
    for (const auto& [name, manager] : LINUX_MANAGER_PRIORITY) {
        if (probe.check_package_manager_presence(name)) {
            log_info(string_format("info.package_manager_detected", std::string(name)));
            return manager;
        }
    }
    log_warning(get_string("warning.no_package_manager"));
    return LinuxPackageManager::UNKNOWN;
}

std::optional<PlatformKey> resolve_platform_key(Platform platform, LinuxPackageManager manager) {
    switch (platform) {
        case Platform::WINDOWS: return PlatformKey::WIN32_WINGET;
        case Platform::MACOS: return PlatformKey::DARWIN_BREW;
        case Platform::LINUX:
            switch (manager) {
                case LinuxPackageManager::APT: return PlatformKey::APT;
                case LinuxPackageManager::DNF: return PlatformKey::DNF;
                case LinuxPackageManager::PACMAN: return PlatformKey::PACMAN;
                case LinuxPackageManager::UNKNOWN: return std::nullopt;
            }
            return std::nullopt;
        case Platform::UNSUPPORTED: break;
    }
    return std::nullopt;
}

std::optional<std::string> build_install_command(PlatformKey key, const std::string& package_name) {
    switch (key) {
        case PlatformKey::WIN32_WINGET: return "winget install -e --id " + package_name;
        case PlatformKey::DARWIN_BREW: return "brew install " + package_name;
        case PlatformKey::APT: return "sudo apt-get install -y " + package_name;
        case PlatformKey::DNF: return "sudo dnf install -y " + package_name;
        case PlatformKey::PACMAN: return "sudo pacman -S --noconfirm " + package_name;
        case PlatformKey::ZYPPER: break;
    }
    return std::nullopt;
}

std::optional<std::string> build_uninstall_command(PlatformKey key, const std::string& package_name) {
    switch (key) {
        case PlatformKey::WIN32_WINGET: return "winget uninstall -e --id " + package_name;
        case PlatformKey::DARWIN_BREW: return "brew uninstall " + package_name;
        case PlatformKey::APT: return "sudo apt-get remove -y " + package_name;
        case PlatformKey::DNF: return "sudo dnf remove -y " + package_name;
        case PlatformKey::PACMAN: return "sudo pacman -Rns --noconfirm " + package_name;
        case PlatformKey::ZYPPER: break;
    }
    return std::nullopt;
}

size_t ExecutionReport::count(StepStatus status) const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [status](const StepOutcome& outcome) { return outcome.status == status; }));
}

Executor::Executor(CommandChannel& channel, const SystemProbe& probe, const PackageCatalog& catalog, Platform platform)
    : channel_(channel), probe_(probe), catalog_(catalog), platform_(platform) {}

ExecutionReport Executor::run(const ActionPlan& plan) {
    log_info(string_format("info.execute_start", plan.size()));

    RunContext context;
    LinuxPackageManager manager = LinuxPackageManager::UNKNOWN;
    if (platform_ == Platform::LINUX) {
        // sudo needs a visible terminal for its password prompt
        try {
            channel_.open_session();
            context.mode = ExecutionMode::INTERACTIVE;
        } catch (const DevsetupException& e) {
            log_warning(string_format("warning.session_unavailable", std::string(e.what())));
        }
        manager = detect_linux_package_manager(probe_);
    }
    context.platform_key = resolve_platform_key(platform_, manager);

    ExecutionReport report;
    report.outcomes.reserve(plan.size());
    for (const auto& step : plan) {
        report.outcomes.push_back(execute_step(step, context));
    }

    log_info(string_format("info.execute_finished",
                           report.count(StepStatus::SUCCEEDED),
                           report.count(StepStatus::SKIPPED),
                           report.count(StepStatus::FAILED)));
    notify_quietly(get_string("info.terminal_all_done"));
    return report;
}

StepOutcome Executor::execute_step(const ActionStep& step, const RunContext& context) {
    const DependencyRequirement& dependency = *step.dependency;
    StepOutcome outcome;
    outcome.dependency = step.dependency;
    outcome.action = step.action;

    try {
        switch (step.action) {
            case ActionKind::ALREADY_MET: {
                const std::string message = string_format("info.step_skipped", dependency.name);
                log_info(message);
                outcome.status = StepStatus::SKIPPED;
                notify_quietly(get_string("info.terminal_info_prefix") + " " + message);
                return outcome;
            }
            case ActionKind::INSTALL:
                install(dependency, context);
                break;
            case ActionKind::REINSTALL:
                try {
                    uninstall(dependency, context);
                } catch (const DevsetupException& e) {
                    // Removal is best effort; the install below decides the step.
                    log_warning(string_format("warning.uninstall_failed", dependency.name, std::string(e.what())));
                    outcome.detail = e.what();
                }
                install(dependency, context);
                break;
        }
        outcome.status = StepStatus::SUCCEEDED;
        log_info(string_format("info.step_succeeded", dependency.name));
    } catch (const std::exception& e) {
        outcome.status = StepStatus::FAILED;
        outcome.detail = e.what();
        const std::string message = string_format("error.step_failed", dependency.name, std::string(e.what()));
        log_error(message);
        notify_quietly(get_string("error.terminal_error_prefix") + " " + message);
    }
    return outcome;
}

// A notice that cannot be shown never changes a step's outcome.
void Executor::notify_quietly(const std::string& message) {
    try {
        channel_.notify(message);
    } catch (const DevsetupException& e) {
        log_warning(string_format("warning.notify_failed", std::string(e.what())));
    }
}

std::string Executor::resolve_command(const DependencyRequirement& dependency, const RunContext& context, bool for_install) const {
    std::optional<std::string> command;
    if (context.platform_key) {
        if (auto package_name = catalog_.lookup(dependency.id, *context.platform_key)) {
            command = for_install ? build_install_command(*context.platform_key, *package_name)
                                  : build_uninstall_command(*context.platform_key, *package_name);
        }
    }
    if (!command) {
        const std::string key = for_install ? "error.no_install_command" : "error.no_uninstall_command";
        throw NoCommandAvailable(string_format(key, dependency.name));
    }
    return *command;
}

void Executor::install(const DependencyRequirement& dependency, const RunContext& context) {
    log_info(string_format("info.install_start", dependency.name));
    channel_.run(resolve_command(dependency, context, true), context.mode);
}

void Executor::uninstall(const DependencyRequirement& dependency, const RunContext& context) {
    log_info(string_format("info.uninstall_start", dependency.name));
    channel_.run(resolve_command(dependency, context, false), context.mode);
}
