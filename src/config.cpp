#include "config.hpp"

#include <unistd.h>

#include <optional>

namespace fs = std::filesystem;

fs::path LOCK_DIR = DEVSETUP_LOCK_DIR;
fs::path LOCK_FILE = fs::path(DEVSETUP_LOCK_DIR) / ("run-" + std::to_string(getuid()) + ".lck");
fs::path OS_RELEASE_FILE = "/etc/os-release";

namespace {
    std::optional<Platform> g_platform_override;
    std::chrono::milliseconds g_silent_timeout = DEFAULT_SILENT_TIMEOUT;
    std::string g_homebrew_installer_url(DEFAULT_HOMEBREW_INSTALLER_URL);
}

fs::path get_tmp_dir() {
    static const fs::path tmp_dir = fs::temp_directory_path() / ("devsetup_" + std::to_string(getpid()));
    return tmp_dir;
}

Platform get_platform() {
    if (g_platform_override) {
        return *g_platform_override;
    }
    // Only POSIX hosts build; Platform::WINDOWS is set through set_platform_override.
#if defined(__APPLE__)
    return Platform::MACOS;
#elif defined(__linux__)
    return Platform::LINUX;
#else
    return Platform::UNSUPPORTED;
#endif
}

void set_platform_override(Platform platform) {
    g_platform_override = platform;
}

void clear_platform_override() {
    g_platform_override.reset();
}

std::string platform_name(Platform platform) {
    switch (platform) {
        case Platform::WINDOWS: return "win32";
        case Platform::MACOS: return "darwin";
        case Platform::LINUX: return "linux";
        case Platform::UNSUPPORTED: break;
    }
    return "unsupported";
}

void set_os_release_path(const std::string& path) {
    OS_RELEASE_FILE = path;
}

std::chrono::milliseconds get_silent_timeout() {
    return g_silent_timeout;
}

void set_silent_timeout(std::chrono::milliseconds timeout) {
    g_silent_timeout = timeout;
}

std::string get_homebrew_installer_url() {
    return g_homebrew_installer_url;
}

void set_homebrew_installer_url(const std::string& url) {
    g_homebrew_installer_url = url;
}
