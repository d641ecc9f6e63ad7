#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path LOCK_DIR;
extern std::filesystem::path LOCK_FILE;
extern std::filesystem::path OS_RELEASE_FILE;

inline constexpr std::string_view CONFIG_FILE_NAME = ".devsetup.json";
inline constexpr std::string_view DEFAULT_HOMEBREW_INSTALLER_URL =
    "https://raw.githubusercontent.com/Homebrew/install/HEAD/install.sh";
inline constexpr std::string_view STORE_APP_INSTALLER_URI =
    "ms-windows-store://pdp/?productid=9NBLGGH4NNS1";

inline constexpr std::chrono::milliseconds DEFAULT_SILENT_TIMEOUT = std::chrono::minutes(10);
inline constexpr std::chrono::milliseconds PROBE_TIMEOUT = std::chrono::seconds(60);

enum class Platform {
    WINDOWS,
    MACOS,
    LINUX,
    UNSUPPORTED
};

std::filesystem::path get_tmp_dir();

// Host platform, detected at compile time unless overridden
Platform get_platform();
void set_platform_override(Platform platform);
void clear_platform_override();
std::string platform_name(Platform platform);

void set_os_release_path(const std::string& path);

std::chrono::milliseconds get_silent_timeout();
void set_silent_timeout(std::chrono::milliseconds timeout);

std::string get_homebrew_installer_url();
void set_homebrew_installer_url(const std::string& url);
