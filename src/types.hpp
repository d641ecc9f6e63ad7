#pragma once

#include <optional>
#include <string>
#include <vector>

// One entry of the "dependencies" list in .devsetup.json
struct DependencyRequirement {
    std::string id;                // catalog key, e.g. "node"
    std::string name;              // display name, e.g. "Node.js"
    std::string required_version;  // semver range, e.g. "^18.17.0"
    std::string cli_name;          // executable to probe, e.g. "node"
    std::string version_flag;      // e.g. "-v" or "--version"
};

using RequirementList = std::vector<DependencyRequirement>;

// Points at the requirement it was produced from; the requirement list must outlive it.
struct AuditResult {
    const DependencyRequirement* dependency = nullptr;
    bool is_installed = false;
    std::optional<std::string> installed_version;
};

enum class ActionKind {
    INSTALL,
    REINSTALL,
    ALREADY_MET
};

struct ActionStep {
    const DependencyRequirement* dependency = nullptr;
    ActionKind action = ActionKind::INSTALL;
    std::string reason;
};

using ActionPlan = std::vector<ActionStep>;

std::string action_name(ActionKind action);
