#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct SemVer {
    long long major = 0;
    long long minor = 0;
    long long patch = 0;
    std::vector<std::string> pre_release;

    std::string to_string() const;
};

// Parses "1.2.3", "v1.2.3-beta.1+build". Throws DevsetupException on malformed input.
SemVer parse_version(const std::string& version_str);

// <0, 0, >0 by SemVer 2.0 precedence; build metadata is ignored.
int compare_versions(const SemVer& a, const SemVer& b);

// True if v1 < v2.
bool version_compare(const std::string& v1_str, const std::string& v2_str);

// node-semver range semantics: ||, comparator sets, hyphen ranges,
// x-ranges, ~ and ^. Malformed versions or ranges never satisfy.
bool version_satisfies(const std::string& version, const std::string& range);
bool valid_range(const std::string& range);

// First "X[.Y[.Z]]" run in arbitrary tool output, normalised to "X.Y.Z".
std::optional<std::string> coerce_version(std::string_view raw_output);
