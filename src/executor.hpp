#pragma once

#include "catalog.hpp"
#include "command_channel.hpp"
#include "config.hpp"
#include "probe.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

enum class LinuxPackageManager {
    APT,
    DNF,
    PACMAN,
    UNKNOWN
};

std::string linux_package_manager_name(LinuxPackageManager manager);

// First manager found on PATH, in priority order apt, dnf, pacman.
LinuxPackageManager detect_linux_package_manager(const SystemProbe& probe);

// Catalog column for this host; std::nullopt on an unknown Linux manager or unsupported platform.
std::optional<PlatformKey> resolve_platform_key(Platform platform, LinuxPackageManager manager);

// std::nullopt for a catalog column that has no command family (zypper).
std::optional<std::string> build_install_command(PlatformKey key, const std::string& package_name);
std::optional<std::string> build_uninstall_command(PlatformKey key, const std::string& package_name);

enum class StepStatus {
    SUCCEEDED,
    SKIPPED,
    FAILED
};

struct StepOutcome {
    const DependencyRequirement* dependency = nullptr;
    ActionKind action = ActionKind::INSTALL;
    StepStatus status = StepStatus::SUCCEEDED;
    std::string detail;  // failure reason, or a note such as a failed uninstall
};

struct ExecutionReport {
    std::vector<StepOutcome> outcomes;

    size_t count(StepStatus status) const;
    bool all_succeeded() const { return count(StepStatus::FAILED) == 0; }
};

class Executor {
public:
    Executor(CommandChannel& channel, const SystemProbe& probe,
             const PackageCatalog& catalog = PackageCatalog::builtin(),
             Platform platform = get_platform());

    // Runs every step in order. A failing step is recorded and the next one still runs.
    ExecutionReport run(const ActionPlan& plan);

private:
    // Resolved once at the start of a run and passed to every step.
    struct RunContext {
        std::optional<PlatformKey> platform_key;
        ExecutionMode mode = ExecutionMode::SILENT;
    };

    StepOutcome execute_step(const ActionStep& step, const RunContext& context);
    void notify_quietly(const std::string& message);
    void install(const DependencyRequirement& dependency, const RunContext& context);
    void uninstall(const DependencyRequirement& dependency, const RunContext& context);
    std::string resolve_command(const DependencyRequirement& dependency, const RunContext& context, bool for_install) const;

    CommandChannel& channel_;
    const SystemProbe& probe_;
    const PackageCatalog& catalog_;
    Platform platform_;
};
