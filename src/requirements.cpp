#include "requirements.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string required_field(const json& entry, const char* field, size_t index) {
    auto it = entry.find(field);
    if (it == entry.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw DevsetupException(string_format("error.config_missing_field", std::string(field), index));
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::optional<fs::path> find_config_file(const std::vector<fs::path>& workspaces) {
    for (const auto& workspace : workspaces) {
        if (!fs::is_directory(workspace)) {
            throw DevsetupException(string_format("error.workspace_missing", workspace.string()));
        }
        fs::path candidate = workspace / CONFIG_FILE_NAME;
        if (fs::is_regular_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

RequirementList load_requirements(const fs::path& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw DevsetupException(string_format("error.open_file_failed", config_path.string()));
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw DevsetupException(string_format("error.config_parse_failed", config_path.string(), std::string(e.what())));
    }

    RequirementList requirements;
    if (!document.is_object()) {
        throw DevsetupException(string_format("error.config_parse_failed", config_path.string(), get_string("error.config_not_object")));
    }
    auto deps = document.find("dependencies");
    if (deps == document.end() || deps->is_null()) {
        return requirements;
    }
    if (!deps->is_array()) {
        throw DevsetupException(string_format("error.config_parse_failed", config_path.string(), get_string("error.config_deps_not_array")));
    }

    try {
        for (size_t i = 0; i < deps->size(); ++i) {
            const json& entry = (*deps)[i];
            if (!entry.is_object()) {
                throw DevsetupException(string_format("error.config_missing_field", std::string("id"), i));
            }
            DependencyRequirement req;
            req.id = required_field(entry, "id", i);
            req.name = entry.value("name", req.id);
            req.required_version = entry.value("requiredVersion", std::string("*"));
            req.cli_name = required_field(entry, "cliName", i);
            req.version_flag = entry.value("versionFlag", std::string("--version"));
            requirements.push_back(std::move(req));
        }
    } catch (const json::exception& e) {
        throw DevsetupException(string_format("error.config_parse_failed", config_path.string(), std::string(e.what())));
    }
    return requirements;
}

RequirementList read_workspace_requirements(const std::vector<fs::path>& workspaces) {
    for (const auto& workspace : workspaces) {
        if (!fs::is_directory(workspace)) {
            throw DevsetupException(string_format("error.workspace_missing", workspace.string()));
        }
        const fs::path candidate = workspace / CONFIG_FILE_NAME;
        if (!fs::exists(candidate)) {
            continue;
        }
        try {
            RequirementList requirements = load_requirements(candidate);
            log_info(string_format("info.config_found", candidate.string()));
            return requirements;
        } catch (const DevsetupException& e) {
            log_error(e.what());
        }
    }
    log_warning(get_string("warning.no_config_found"));
    return {};
}
