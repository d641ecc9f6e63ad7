#pragma once

#include "types.hpp"

#include <istream>
#include <string>

// Read-only system checks. Nothing here writes files or installs software.
class SystemProbe {
public:
    virtual ~SystemProbe() = default;

    // "command -v <name>" with all output discarded.
    virtual bool check_package_manager_presence(const std::string& name) const;

    // ID= from the OS identification file. Throws ProbeError if it cannot be read or has no ID.
    virtual std::string identify_linux_distribution() const;

    // Runs "<cliName> <versionFlag>". Any failure means "not installed"; never throws.
    virtual AuditResult check_dependency(const DependencyRequirement& requirement) const;
};

// Extracts the unquoted ID= value from os-release content, or "" if there is none.
std::string parse_os_release_id(std::istream& os_release);
