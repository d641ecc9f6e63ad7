#include "catalog.hpp"

#include <utility>

namespace {

PackageNames names(const char* win32, const char* darwin, const char* apt, const char* dnf,
                   const char* pacman, const char* zypper) {
    auto opt = [](const char* name) -> std::optional<std::string> {
        if (name == nullptr) return std::nullopt;
        return std::string(name);
    };
    return {opt(win32), opt(darwin), opt(apt), opt(dnf), opt(pacman), opt(zypper)};
}

std::map<std::string, PackageNames, std::less<>> builtin_entries() {
    return {
        // Languages and runtimes
        {"python",         names("Python.Python.3", "python@3.12", "python3", "python3", "python", "python3")},
        {"node",           names("OpenJS.NodeJS.LTS", "node", "nodejs", "nodejs", "nodejs", "nodejs")},
        {"java_lts",       names("Microsoft.OpenJDK.21", "openjdk@21", "openjdk-21-jdk", "java-21-openjdk-devel", "jdk-openjdk", "java-21-openjdk-devel")},
        {"go",             names("Go.Go", "go", "golang-go", "golang", "go", "go")},
        {"rust",           names("Rustlang.Rustup", "rustup-init", "rustc", "rust", "rust", "rust")},
        {"dotnet_sdk",     names("Microsoft.DotNet.SDK.8", "dotnet-sdk", "dotnet-sdk-8.0", "dotnet-sdk-8.0", "dotnet-sdk", "dotnet-sdk-8_0")},
        // Version control
        {"git",            names("Git.Git", "git", "git", "git", "git", "git")},
        // Databases
        {"postgres",       names("PostgreSQL.PostgreSQL", "postgresql@16", "postgresql", "postgresql-server", "postgresql", "postgresql-server")},
        {"mysql",          names("Oracle.MySQL", "mysql", "mysql-server", "mysql-server", "mariadb", "mysql-community-server")},
        // mongodb-org needs the vendor repository on apt/dnf
        {"mongodb",        names("MongoDB.Server", "mongodb-community", "mongodb-org", "mongodb-org", "mongodb", "mongodb")},
        {"redis",          names("Redis.Redis", "redis", "redis-server", "redis", "redis", "redis")},
        {"sqlite",         names("SQLite.SQLite", "sqlite", "sqlite3", "sqlite", "sqlite", "sqlite3")},
        // Containers and DevOps
        {"docker",         names("Docker.DockerDesktop", "docker", "docker.io", "moby-engine", "docker", "docker")},
        {"kubernetes_cli", names("Kubernetes.kubectl", "kubernetes-cli", "kubectl", "kubectl", "kubectl", "kubectl")},
        {"terraform",      names("HashiCorp.Terraform", "terraform", "terraform", "terraform", "terraform", "terraform")},
        // Cloud CLIs
        {"aws_cli",        names("Amazon.AWSCLI", "awscli", "awscli", "awscli", "aws-cli", "aws-cli")},
        {"azure_cli",      names("Microsoft.AzureCLI", "azure-cli", "azure-cli", "azure-cli", "azure-cli", "azure-cli")},
        {"gcloud_cli",     names("Google.CloudSDK", "google-cloud-sdk", "google-cloud-cli", "google-cloud-cli", "google-cloud-sdk", nullptr)},
        // Utilities
        {"jq",             names("stedolan.jq", "jq", "jq", "jq", "jq", "jq")},
        {"neovim",         names("Neovim.Neovim", "neovim", "neovim", "neovim", "neovim", "neovim")},
    };
}

} // anonymous namespace

std::string platform_key_name(PlatformKey key) {
    switch (key) {
        case PlatformKey::WIN32_WINGET: return "win32";
        case PlatformKey::DARWIN_BREW: return "darwin";
        case PlatformKey::APT: return "apt";
        case PlatformKey::DNF: return "dnf";
        case PlatformKey::PACMAN: return "pacman";
        case PlatformKey::ZYPPER: return "zypper";
    }
    return "unknown";
}

std::optional<PlatformKey> parse_platform_key(std::string_view name) {
    if (name == "win32") return PlatformKey::WIN32_WINGET;
    if (name == "darwin") return PlatformKey::DARWIN_BREW;
    if (name == "apt") return PlatformKey::APT;
    if (name == "dnf") return PlatformKey::DNF;
    if (name == "pacman") return PlatformKey::PACMAN;
    if (name == "zypper") return PlatformKey::ZYPPER;
    return std::nullopt;
}

PackageCatalog::PackageCatalog(std::map<std::string, PackageNames, std::less<>> entries)
    : entries_(std::move(entries)) {}

const PackageCatalog& PackageCatalog::builtin() {
    static const PackageCatalog catalog(builtin_entries());
    return catalog;
}

std::optional<std::string> PackageCatalog::lookup(std::string_view dependency_id, PlatformKey key) const {
    auto it = entries_.find(dependency_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const auto& name = it->second[static_cast<size_t>(key)];
    if (!name || name->empty()) {
        return std::nullopt;
    }
    return name;
}

std::vector<std::string> PackageCatalog::known_ids() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, _] : entries_) {
        ids.push_back(id);
    }
    return ids;
}
