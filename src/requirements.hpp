#pragma once

#include "types.hpp"

#include <filesystem>
#include <optional>
#include <vector>

// First <workspace>/.devsetup.json that exists, searched in order.
// Throws DevsetupException if a workspace directory does not exist.
std::optional<std::filesystem::path> find_config_file(const std::vector<std::filesystem::path>& workspaces);

// Parses a .devsetup.json file. Throws DevsetupException on I/O or schema errors.
RequirementList load_requirements(const std::filesystem::path& config_path);

// Searches the workspaces and loads the first config that parses.
// Missing or unparseable files yield an empty list ("nothing to audit").
RequirementList read_workspace_requirements(const std::vector<std::filesystem::path>& workspaces);
