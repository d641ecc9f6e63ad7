#include "version.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace {
static const std::regex version_regex(
    R"(^[v=]*\s*(\d+)\.(\d+)\.(\d+)(?:-([0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*))?(?:\+[0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*)?$)");
static const std::regex partial_regex(
    R"(^[v=]*\s*(\d+|[xX*])(?:\.(\d+|[xX*])(?:\.(\d+|[xX*])(?:-([0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*))?(?:\+[0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*)?)?)?$)");
static const std::regex hyphen_regex(R"(^\s*(\S+)\s+-\s+(\S+)\s*$)");
static const std::regex operator_space_regex(R"((<=|>=|<|>|=|~>|~|\^)\s+)");
static const std::regex coerce_regex(R"((?:^|[^\d])(\d{1,16})(?:\.(\d{1,16}))?(?:\.(\d{1,16}))?(?:$|[^\d]))");
static const std::regex re_dot("[.]");

std::vector<std::string> split_identifiers(const std::string& text) {
    std::vector<std::string> parts;
    std::sregex_token_iterator it(text.begin(), text.end(), re_dot, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        parts.push_back(it->str());
    }
    return parts;
}

long long parse_number(const std::string& digits, const std::string& version_str) {
    try {
        return std::stoll(digits);
    } catch (const std::exception& e) {
        throw DevsetupException(string_format("error.invalid_version_format", version_str) + ": " + e.what());
    }
}

bool is_numeric(const std::string& identifier) {
    return !identifier.empty() && std::all_of(identifier.begin(), identifier.end(), ::isdigit);
}

int compare_numeric_identifier(const std::string& a, const std::string& b) {
    auto strip = [](const std::string& s) {
        size_t first = s.find_first_not_of('0');
        return first == std::string::npos ? std::string("0") : s.substr(first);
    };
    const std::string sa = strip(a);
    const std::string sb = strip(b);
    if (sa.size() != sb.size()) return sa.size() < sb.size() ? -1 : 1;
    int res = sa.compare(sb);
    return res == 0 ? 0 : (res < 0 ? -1 : 1);
}

int compare_pre_release_part(const std::vector<std::string>& p1, const std::vector<std::string>& p2) {
    size_t min_len = std::min(p1.size(), p2.size());
    for (size_t i = 0; i < min_len; ++i) {
        bool is_num1 = is_numeric(p1[i]);
        bool is_num2 = is_numeric(p2[i]);

        if (is_num1 && is_num2) {
            int res = compare_numeric_identifier(p1[i], p2[i]);
            if (res != 0) return res;
        } else if (is_num1) {
            return -1; // Numeric identifiers have lower precedence than non-numeric identifiers.
        } else if (is_num2) {
            return 1;
        } else {
            int res = p1[i].compare(p2[i]);
            if (res != 0) return res < 0 ? -1 : 1;
        }
    }

    if (p1.size() < p2.size()) return -1;
    if (p1.size() > p2.size()) return 1;
    return 0;
}

// A version where any trailing component may be a wildcard ("1", "1.x", "1.2.*").
struct Partial {
    std::optional<long long> major;
    std::optional<long long> minor;
    std::optional<long long> patch;
    std::vector<std::string> pre_release;
};

Partial parse_partial(const std::string& text) {
    std::smatch match;
    if (!std::regex_match(text, match, partial_regex)) {
        throw DevsetupException(string_format("error.invalid_range_format", text));
    }
    Partial p;
    auto component = [&](size_t group) -> std::optional<long long> {
        if (!match[group].matched) return std::nullopt;
        const std::string part = match[group].str();
        if (part == "x" || part == "X" || part == "*") return std::nullopt;
        return parse_number(part, text);
    };
    p.major = component(1);
    if (p.major) p.minor = component(2);
    if (p.minor) p.patch = component(3);
    if (p.patch && match[4].matched) {
        p.pre_release = split_identifiers(match[4].str());
    }
    return p;
}

enum class Op { ANY, LT, LE, GT, GE, EQ };

struct Comparator {
    Op op = Op::ANY;
    SemVer version;

    bool test(const SemVer& v) const {
        if (op == Op::ANY) return true;
        int c = compare_versions(v, version);
        switch (op) {
            case Op::LT: return c < 0;
            case Op::LE: return c <= 0;
            case Op::GT: return c > 0;
            case Op::GE: return c >= 0;
            case Op::EQ: return c == 0;
            case Op::ANY: break;
        }
        return true;
    }
};

using ComparatorSet = std::vector<Comparator>;

SemVer make_version(long long major, long long minor, long long patch, std::vector<std::string> pre = {}) {
    SemVer v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    v.pre_release = std::move(pre);
    return v;
}

// "<X.Y.Z-0" excludes every pre-release of X.Y.Z as well as X.Y.Z itself.
Comparator below(long long major, long long minor, long long patch) {
    return {Op::LT, make_version(major, minor, patch, {"0"})};
}

Comparator at_least(long long major, long long minor, long long patch, std::vector<std::string> pre = {}) {
    return {Op::GE, make_version(major, minor, patch, std::move(pre))};
}

Comparator nothing() {
    return below(0, 0, 0);
}

void desugar_tilde(const Partial& p, ComparatorSet& out) {
    if (!p.major) {
        out.push_back({});
    } else if (!p.minor) {
        out.push_back(at_least(*p.major, 0, 0));
        out.push_back(below(*p.major + 1, 0, 0));
    } else {
        out.push_back(at_least(*p.major, *p.minor, p.patch.value_or(0), p.pre_release));
        out.push_back(below(*p.major, *p.minor + 1, 0));
    }
}

void desugar_caret(const Partial& p, ComparatorSet& out) {
    if (!p.major) {
        out.push_back({});
        return;
    }
    const long long major = *p.major;
    if (!p.minor) {
        out.push_back(at_least(major, 0, 0));
        out.push_back(below(major + 1, 0, 0));
        return;
    }
    const long long minor = *p.minor;
    if (!p.patch) {
        out.push_back(at_least(major, minor, 0));
        out.push_back(major > 0 ? below(major + 1, 0, 0) : below(0, minor + 1, 0));
        return;
    }
    const long long patch = *p.patch;
    out.push_back(at_least(major, minor, patch, p.pre_release));
    if (major > 0) {
        out.push_back(below(major + 1, 0, 0));
    } else if (minor > 0) {
        out.push_back(below(0, minor + 1, 0));
    } else {
        out.push_back(below(0, 0, patch + 1));
    }
}

void desugar_primitive(Op op, const Partial& p, ComparatorSet& out) {
    const bool full = p.patch.has_value();
    if (full) {
        out.push_back({op == Op::ANY ? Op::EQ : op, make_version(*p.major, *p.minor, *p.patch, p.pre_release)});
        return;
    }

    switch (op) {
        case Op::ANY:
        case Op::EQ:
            if (!p.major) {
                out.push_back({});
            } else if (!p.minor) {
                out.push_back(at_least(*p.major, 0, 0));
                out.push_back(below(*p.major + 1, 0, 0));
            } else {
                out.push_back(at_least(*p.major, *p.minor, 0));
                out.push_back(below(*p.major, *p.minor + 1, 0));
            }
            break;
        case Op::GT:
            if (!p.major) {
                out.push_back(nothing());
            } else if (!p.minor) {
                out.push_back(at_least(*p.major + 1, 0, 0));
            } else {
                out.push_back(at_least(*p.major, *p.minor + 1, 0));
            }
            break;
        case Op::GE:
            if (!p.major) {
                out.push_back({});
            } else {
                out.push_back(at_least(*p.major, p.minor.value_or(0), 0));
            }
            break;
        case Op::LT:
            if (!p.major) {
                out.push_back(nothing());
            } else {
                out.push_back(below(*p.major, p.minor.value_or(0), 0));
            }
            break;
        case Op::LE:
            if (!p.major) {
                out.push_back({});
            } else if (!p.minor) {
                out.push_back(below(*p.major + 1, 0, 0));
            } else {
                out.push_back(below(*p.major, *p.minor + 1, 0));
            }
            break;
    }
}

void desugar_hyphen(const Partial& from, const Partial& to, ComparatorSet& out) {
    if (from.major) {
        out.push_back(at_least(*from.major, from.minor.value_or(0), from.patch.value_or(0), from.pre_release));
    } else {
        out.push_back({});
    }

    if (!to.major) {
        out.push_back({});
    } else if (!to.minor) {
        out.push_back(below(*to.major + 1, 0, 0));
    } else if (!to.patch) {
        out.push_back(below(*to.major, *to.minor + 1, 0));
    } else {
        out.push_back({Op::LE, make_version(*to.major, *to.minor, *to.patch, to.pre_release)});
    }
}

void desugar_token(const std::string& token, ComparatorSet& out) {
    if (token.starts_with("~>")) {
        desugar_tilde(parse_partial(token.substr(2)), out);
    } else if (token.starts_with("~")) {
        desugar_tilde(parse_partial(token.substr(1)), out);
    } else if (token.starts_with("^")) {
        desugar_caret(parse_partial(token.substr(1)), out);
    } else if (token.starts_with(">=")) {
        desugar_primitive(Op::GE, parse_partial(token.substr(2)), out);
    } else if (token.starts_with("<=")) {
        desugar_primitive(Op::LE, parse_partial(token.substr(2)), out);
    } else if (token.starts_with(">")) {
        desugar_primitive(Op::GT, parse_partial(token.substr(1)), out);
    } else if (token.starts_with("<")) {
        desugar_primitive(Op::LT, parse_partial(token.substr(1)), out);
    } else if (token.starts_with("=")) {
        desugar_primitive(Op::EQ, parse_partial(token.substr(1)), out);
    } else {
        desugar_primitive(Op::ANY, parse_partial(token), out);
    }
}

ComparatorSet parse_comparator_set(const std::string& raw_set) {
    ComparatorSet set;
    const std::string text = trim(raw_set);
    if (text.empty()) {
        set.push_back({});
        return set;
    }

    std::smatch match;
    if (std::regex_match(text, match, hyphen_regex)) {
        desugar_hyphen(parse_partial(match[1].str()), parse_partial(match[2].str()), set);
        return set;
    }

    const std::string normalized = std::regex_replace(text, operator_space_regex, "$1");
    std::istringstream tokens(normalized);
    std::string token;
    while (tokens >> token) {
        desugar_token(token, set);
    }
    return set;
}

std::vector<ComparatorSet> parse_range(const std::string& range) {
    std::vector<ComparatorSet> sets;
    size_t start = 0;
    while (true) {
        size_t pos = range.find("||", start);
        sets.push_back(parse_comparator_set(range.substr(start, pos == std::string::npos ? std::string::npos : pos - start)));
        if (pos == std::string::npos) break;
        start = pos + 2;
    }
    return sets;
}

bool set_satisfied(const ComparatorSet& set, const SemVer& version) {
    for (const auto& comparator : set) {
        if (!comparator.test(version)) return false;
    }

    if (version.pre_release.empty()) return true;

    // A pre-release only matches a set that names the same [major, minor, patch] tuple with a pre-release.
    for (const auto& comparator : set) {
        if (comparator.op == Op::ANY || comparator.version.pre_release.empty()) continue;
        const SemVer& allowed = comparator.version;
        if (allowed.major == version.major && allowed.minor == version.minor && allowed.patch == version.patch) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

std::string SemVer::to_string() const {
    std::string text = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (size_t i = 0; i < pre_release.size(); ++i) {
        text += (i == 0 ? "-" : ".") + pre_release[i];
    }
    return text;
}

SemVer parse_version(const std::string& version_str) {
    const std::string text = trim(version_str);
    std::smatch match;
    if (!std::regex_match(text, match, version_regex)) {
        throw DevsetupException(string_format("error.invalid_version_format", version_str));
    }
    SemVer v;
    v.major = parse_number(match[1].str(), version_str);
    v.minor = parse_number(match[2].str(), version_str);
    v.patch = parse_number(match[3].str(), version_str);
    if (match[4].matched) {
        v.pre_release = split_identifiers(match[4].str());
    }
    return v;
}

int compare_versions(const SemVer& a, const SemVer& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;

    if (!a.pre_release.empty() && b.pre_release.empty()) {
        return -1; // A pre-release version has lower precedence than a normal version.
    }
    if (a.pre_release.empty() && !b.pre_release.empty()) {
        return 1;
    }
    return compare_pre_release_part(a.pre_release, b.pre_release);
}

bool version_compare(const std::string& v1_str, const std::string& v2_str) {
    return compare_versions(parse_version(v1_str), parse_version(v2_str)) < 0;
}

bool version_satisfies(const std::string& version, const std::string& range) {
    try {
        const SemVer parsed = parse_version(version);
        for (const auto& set : parse_range(range)) {
            if (set_satisfied(set, parsed)) return true;
        }
    } catch (const DevsetupException&) {
        return false;
    }
    return false;
}

bool valid_range(const std::string& range) {
    try {
        parse_range(range);
        return true;
    } catch (const DevsetupException&) {
        return false;
    }
}

std::optional<std::string> coerce_version(std::string_view raw_output) {
    const std::string text(raw_output);
    std::smatch match;
    if (!std::regex_search(text, match, coerce_regex)) {
        return std::nullopt;
    }
    SemVer v;
    v.major = std::stoll(match[1].str());
    v.minor = match[2].matched ? std::stoll(match[2].str()) : 0;
    v.patch = match[3].matched ? std::stoll(match[3].str()) : 0;
    return v.to_string();
}
