#pragma once

#include "types.hpp"

#include <vector>

// One step per result, same order. Never fails.
ActionPlan create_action_plan(const std::vector<AuditResult>& audit_results);

ActionStep determine_action(const AuditResult& result);
