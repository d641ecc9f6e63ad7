#include "probe.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <fstream>
#include <sstream>

std::string parse_os_release_id(std::istream& os_release) {
    std::string line;
    while (std::getline(os_release, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.starts_with("ID=")) continue;

        std::string value = line.substr(3);
        std::erase(value, '"');
        std::erase(value, '\'');
        return trim(value);
    }
    return "";
}

bool SystemProbe::check_package_manager_presence(const std::string& name) const {
    try {
        ProcessResult result = run_shell_command("command -v " + shell_quote(name) + " >/dev/null 2>&1", PROBE_TIMEOUT);
        return !result.timed_out && result.exit_code == 0;
    } catch (const CommandError& e) {
        log_warning(string_format("warning.probe_failed", name, std::string(e.what())));
        return false;
    }
}

std::string SystemProbe::identify_linux_distribution() const {
    std::ifstream file(OS_RELEASE_FILE);
    if (!file.is_open()) {
        throw ProbeError(string_format("error.open_file_failed", OS_RELEASE_FILE.string()));
    }
    std::string id = parse_os_release_id(file);
    if (id.empty()) {
        throw ProbeError(string_format("error.os_release_no_id", OS_RELEASE_FILE.string()));
    }
    return id;
}

AuditResult SystemProbe::check_dependency(const DependencyRequirement& requirement) const {
    AuditResult result;
    result.dependency = &requirement;

    std::string command = shell_quote(requirement.cli_name);
    std::istringstream flags(requirement.version_flag);
    std::string flag;
    while (flags >> flag) {
        command += " " + shell_quote(flag);
    }

    ProcessResult probe;
    try {
        probe = run_shell_command(command, PROBE_TIMEOUT);
    } catch (const CommandError&) {
        return result;
    }
    if (probe.timed_out || probe.exit_code != 0) {
        return result;
    }

    result.is_installed = true;
    result.installed_version = coerce_version(probe.output);
    if (!result.installed_version) {
        // Some tools (java -version) report on stderr.
        result.installed_version = coerce_version(probe.errors);
    }
    return result;
}
