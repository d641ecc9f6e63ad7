#pragma once

#include "command_channel.hpp"
#include "config.hpp"
#include "probe.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

class Auditor {
public:
    Auditor(const SystemProbe& probe, CommandChannel& installer_channel, Platform platform = get_platform());

    // Preflight, then every requirement probed concurrently.
    // std::nullopt when preflight failed fatally; an empty list when nothing is declared.
    std::optional<std::vector<AuditResult>> run(const RequirementList& requirements);

    // Throws DevsetupException when no package manager can be relied on.
    void ensure_package_manager();

    // Results in input order; one probe's failure never affects the others.
    std::vector<AuditResult> probe_all(const RequirementList& requirements) const;

private:
    void check_and_install_homebrew();
    void check_winget();
    void detect_linux_distribution();

    const SystemProbe& probe_;
    CommandChannel& installer_channel_;
    Platform platform_;
};

// Distribution ids devsetup knows how to map to a package manager family.
bool is_supported_distribution(const std::string& distro_id);
