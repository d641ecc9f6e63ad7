#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;

    // Audit probes log from worker threads, so placeholders are created under a lock.
    // Node-based storage keeps returned references valid across inserts.
    std::mutex missing_mutex;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count != -1) {
            return fs::path(std::string(result, count)).parent_path();
        }
        return fs::current_path();
    }

    // LC_ALL overrides LC_MESSAGES, which overrides LANG.
    std::string detect_language() {
        for (const char* var : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
            const char* value = std::getenv(var);
            if (value == nullptr || *value == '\0') continue;
            return std::string_view(value).starts_with("zh") ? "zh" : "en";
        }
        return "en";
    }

    fs::path find_l10n_dir() {
        // A build tree keeps l10n/ next to the build directory.
        fs::path build_relative = get_executable_dir() / ".." / "l10n";
        if (fs::is_directory(build_relative)) {
            return build_relative;
        }
        return DEVSETUP_L10N_DIR;
    }
}

void load_strings(const std::string& lang, const fs::path& base_dir) {
    std::ifstream file(base_dir / (lang + ".txt"));
    if (!file.is_open()) {
        if (lang != "en") {
            log_warning("Could not open localization file for " + lang + ", falling back to English.");
            load_strings("en", base_dir);
        }
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        size_t pos = line.find('=');
        if (pos == std::string::npos || pos == 0) continue;
        translations[line.substr(0, pos)] = line.substr(pos + 1);
    }
}

void init_localization() {
    const fs::path dir = find_l10n_dir();
    const std::string lang = detect_language();
    if (lang != "en") {
        // Keys a partial translation lacks still read as English.
        load_strings("en", dir);
    }
    load_strings(lang, dir);
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
