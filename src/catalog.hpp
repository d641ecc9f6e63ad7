#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class PlatformKey {
    WIN32_WINGET,
    DARWIN_BREW,
    APT,
    DNF,
    PACMAN,
    ZYPPER
};

inline constexpr size_t PLATFORM_KEY_COUNT = 6;

std::string platform_key_name(PlatformKey key);
std::optional<PlatformKey> parse_platform_key(std::string_view name);

// Package name per platform key; std::nullopt means no standard package exists.
using PackageNames = std::array<std::optional<std::string>, PLATFORM_KEY_COUNT>;

class PackageCatalog {
public:
    explicit PackageCatalog(std::map<std::string, PackageNames, std::less<>> entries);

    // The table shipped with devsetup.
    static const PackageCatalog& builtin();

    // Unknown ids and unsupported platforms both yield std::nullopt.
    std::optional<std::string> lookup(std::string_view dependency_id, PlatformKey key) const;
    std::vector<std::string> known_ids() const;

private:
    std::map<std::string, PackageNames, std::less<>> entries_;
};
