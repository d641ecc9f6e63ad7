#include "planner.hpp"

#include "localization.hpp"
#include "version.hpp"

std::string action_name(ActionKind action) {
    switch (action) {
        case ActionKind::INSTALL: return "INSTALL";
        case ActionKind::REINSTALL: return "REINSTALL";
        case ActionKind::ALREADY_MET: return "ALREADY_MET";
    }
    return "UNKNOWN";
}

ActionPlan create_action_plan(const std::vector<AuditResult>& audit_results) {
    ActionPlan plan;
    plan.reserve(audit_results.size());
    for (const auto& result : audit_results) {
        plan.push_back(determine_action(result));
    }
    return plan;
}

ActionStep determine_action(const AuditResult& result) {
    const DependencyRequirement& dependency = *result.dependency;
    ActionStep step;
    step.dependency = result.dependency;

    if (!result.is_installed) {
        step.action = ActionKind::INSTALL;
        step.reason = string_format("plan.reason_not_installed", dependency.name);
        return step;
    }

    if (result.installed_version && version_satisfies(*result.installed_version, dependency.required_version)) {
        step.action = ActionKind::ALREADY_MET;
        step.reason = string_format("plan.reason_compatible", dependency.name, *result.installed_version);
        return step;
    }

    step.action = ActionKind::REINSTALL;
    step.reason = string_format("plan.reason_incompatible", dependency.name,
                                result.installed_version.value_or(get_string("plan.unknown_version")),
                                dependency.required_version);
    return step;
}
