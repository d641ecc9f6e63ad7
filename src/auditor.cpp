#include "auditor.hpp"

#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <future>
#include <string_view>

namespace {
constexpr std::array<std::string_view, 8> SUPPORTED_DISTROS = {
    "ubuntu", "debian", "fedora", "centos", "rhel", "arch", "suse", "opensuse"};
}

bool is_supported_distribution(const std::string& distro_id) {
    return std::find(SUPPORTED_DISTROS.begin(), SUPPORTED_DISTROS.end(), distro_id) != SUPPORTED_DISTROS.end();
}

Auditor::Auditor(const SystemProbe& probe, CommandChannel& installer_channel, Platform platform)
    : probe_(probe), installer_channel_(installer_channel), platform_(platform) {}

std::optional<std::vector<AuditResult>> Auditor::run(const RequirementList& requirements) {
    log_info(get_string("info.audit_start"));

    try {
        ensure_package_manager();
    } catch (const DevsetupException& e) {
        log_error(string_format("error.audit_fatal", std::string(e.what())));
        return std::nullopt;
    }

    if (requirements.empty()) {
        log_info(get_string("info.audit_no_dependencies"));
        return std::vector<AuditResult>{};
    }

    log_info(string_format("info.audit_dependency_count", requirements.size()));
    std::vector<AuditResult> results = probe_all(requirements);
    log_info(get_string("info.audit_complete"));
    return results;
}

void Auditor::ensure_package_manager() {
    log_info(string_format("info.preflight_platform", platform_name(platform_)));
    switch (platform_) {
        case Platform::MACOS:
            check_and_install_homebrew();
            break;
        case Platform::WINDOWS:
            check_winget();
            break;
        case Platform::LINUX:
            detect_linux_distribution();
            break;
        case Platform::UNSUPPORTED:
            throw DevsetupException(string_format("error.unsupported_platform", platform_name(platform_)));
    }
}

std::vector<AuditResult> Auditor::probe_all(const RequirementList& requirements) const {
    std::vector<std::future<AuditResult>> futures;
    futures.reserve(requirements.size());
    for (const auto& requirement : requirements) {
        futures.push_back(std::async(std::launch::async, [this, &requirement] {
            return probe_.check_dependency(requirement);
        }));
    }

    std::vector<AuditResult> results;
    results.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            log_warning(string_format("warning.probe_failed", requirements[i].name, std::string(e.what())));
            AuditResult missing;
            missing.dependency = &requirements[i];
            results.push_back(missing);
        }
    }
    return results;
}

void Auditor::check_and_install_homebrew() {
    if (probe_.check_package_manager_presence("brew")) {
        log_info(get_string("info.homebrew_present"));
        return;
    }

    log_info(get_string("info.homebrew_installing"));
    const fs::path script = get_tmp_dir() / "homebrew-install.sh";
    try {
        ensure_dir_exists(script.parent_path());
        download_with_retries(get_homebrew_installer_url(), script);
        installer_channel_.run("/bin/bash " + shell_quote(script.string()), ExecutionMode::INTERACTIVE);
    } catch (const DevsetupException& e) {
        throw DevsetupException(string_format("error.homebrew_install_failed", std::string(e.what())));
    }
    log_info(get_string("info.homebrew_install_finished"));

    if (!probe_.check_package_manager_presence("brew")) {
        throw DevsetupException(get_string("error.homebrew_verify_failed"));
    }
    log_info(get_string("info.homebrew_verified"));
}

void Auditor::check_winget() {
    if (probe_.check_package_manager_presence("winget")) {
        log_info(get_string("info.winget_present"));
        return;
    }

    log_info(get_string("info.winget_missing"));
    log_error(get_string("error.winget_required"));
    if (!user_confirms(get_string("prompt.open_store"))) {
        throw DevsetupException(get_string("error.winget_cancelled"));
    }

    try {
        installer_channel_.run(std::string("cmd /c start \"\" \"") + std::string(STORE_APP_INSTALLER_URI) + "\"",
                               ExecutionMode::SILENT);
    } catch (const CommandError& e) {
        log_warning(string_format("warning.store_open_failed", std::string(e.what())));
    }
    // The App Installer has to be installed by hand before anything else can run.
    throw DevsetupException(get_string("error.winget_store_opened"));
}

void Auditor::detect_linux_distribution() {
    std::string distro;
    try {
        distro = probe_.identify_linux_distribution();
    } catch (const ProbeError& e) {
        throw DevsetupException(string_format("error.linux_distro_detect_failed", std::string(e.what())));
    }

    if (is_supported_distribution(distro)) {
        log_info(string_format("info.linux_distro_supported", distro));
    } else {
        log_warning(string_format("warning.linux_distro_unsupported", distro));
    }
}
