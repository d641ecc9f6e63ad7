#include "auditor.hpp"
#include "catalog.hpp"
#include "command_channel.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "executor.hpp"
#include "localization.hpp"
#include "planner.hpp"
#include "probe.hpp"
#include "requirements.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.audit_desc") << std::endl;
    std::cerr << get_string("info.plan_desc") << std::endl;
    std::cerr << get_string("info.run_desc") << std::endl;
    std::cerr << get_string("info.catalog_desc") << std::endl;
}

void print_audit(const std::vector<AuditResult>& results) {
    for (const auto& result : results) {
        const DependencyRequirement& dep = *result.dependency;
        std::string status;
        if (!result.is_installed) {
            status = get_string("audit.status_missing");
        } else {
            status = result.installed_version.value_or(get_string("plan.unknown_version"));
        }
        std::cout << string_format("audit.row", dep.name, dep.required_version, status) << std::endl;
    }
}

void print_plan(const ActionPlan& plan) {
    for (const auto& step : plan) {
        std::cout << string_format("plan.row", action_name(step.action), step.dependency->name, step.reason) << std::endl;
    }
}

void print_catalog(const SystemProbe& probe) {
    Platform platform = get_platform();
    LinuxPackageManager manager = LinuxPackageManager::UNKNOWN;
    if (platform == Platform::LINUX) {
        manager = detect_linux_package_manager(probe);
    }
    auto key = resolve_platform_key(platform, manager);
    if (!key) {
        log_warning(string_format("warning.catalog_no_platform_key", platform_name(platform)));
        return;
    }
    const auto& catalog = PackageCatalog::builtin();
    std::cout << string_format("catalog.header", platform_key_name(*key)) << std::endl;
    for (const auto& id : catalog.known_ids()) {
        auto package_name = catalog.lookup(id, *key);
        std::cout << string_format("catalog.row", id, package_name.value_or("-")) << std::endl;
    }
}

RequirementList read_requirements(const cxxopts::ParseResult& result) {
    if (result.count("config")) {
        fs::path config_path = result["config"].as<std::string>();
        log_info(string_format("info.config_found", config_path.string()));
        return load_requirements(config_path);
    }
    std::vector<fs::path> workspaces;
    if (result.count("workspace")) {
        for (const auto& dir : result["workspace"].as<std::vector<std::string>>()) {
            workspaces.emplace_back(dir);
        }
    } else {
        workspaces.push_back(fs::current_path());
    }
    return read_workspace_requirements(workspaces);
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0], string_format("info.usage", argv[0]));

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("w,workspace", get_string("info.workspace_option_desc"), cxxopts::value<std::vector<std::string>>())
            ("c,config", get_string("info.config_option_desc"), cxxopts::value<std::string>())
            ("non-interactive", get_string("info.non_interactive_option_desc"), cxxopts::value<std::string>()->implicit_value("n"))
            ("timeout", get_string("info.timeout_option_desc"), cxxopts::value<long>())
            ("os-release", get_string("info.os_release_option_desc"), cxxopts::value<std::string>())
            ("homebrew-installer", get_string("info.homebrew_installer_option_desc"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("non-interactive")) {
            std::string value = result["non-interactive"].as<std::string>();
            if (value == "y" || value == "Y") {
                set_non_interactive_mode(NonInteractiveMode::YES);
            } else if (value == "n" || value == "N") {
                set_non_interactive_mode(NonInteractiveMode::NO);
            } else {
                log_error(get_string("error.invalid_non_interactive_value"));
                return 1;
            }
        }

        if (result.count("timeout")) {
            long seconds = result["timeout"].as<long>();
            if (seconds <= 0) {
                log_error(get_string("error.invalid_timeout_value"));
                return 1;
            }
            set_silent_timeout(std::chrono::seconds(seconds));
        }
        if (result.count("os-release")) {
            set_os_release_path(result["os-release"].as<std::string>());
        }
        if (result.count("homebrew-installer")) {
            set_homebrew_installer_url(result["homebrew-installer"].as<std::string>());
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        if (command != "audit" && command != "plan" && command != "run" && command != "catalog") {
            print_usage(options);
            return 1;
        }

        SystemProbe probe;
        if (command == "catalog") {
            print_catalog(probe);
            return 0;
        }

        std::unique_ptr<RunLock> run_lock;
        if (command == "run") {
            run_lock = std::make_unique<RunLock>();
        }
        TmpDirManager tmp_dir;

        RequirementList requirements = read_requirements(result);
        ShellCommandChannel channel(get_string("info.terminal_title"));

        Auditor auditor(probe, channel);
        auto audit_results = auditor.run(requirements);
        if (!audit_results) {
            return 1;
        }
        if (audit_results->empty()) {
            log_info(get_string("info.nothing_to_do"));
            return 0;
        }

        if (command == "audit") {
            print_audit(*audit_results);
            return 0;
        }

        ActionPlan plan = create_action_plan(*audit_results);
        if (command == "plan") {
            print_plan(plan);
            return 0;
        }

        Executor executor(channel, probe);
        ExecutionReport report = executor.run(plan);
        if (!report.all_succeeded()) {
            log_error(string_format("error.run_had_failures", report.count(StepStatus::FAILED)));
            return 1;
        }
        log_info(get_string("info.run_complete"));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const DevsetupException& e) {
        log_error(string_format("error.devsetup_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
