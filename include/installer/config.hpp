#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace installer {

class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    [[nodiscard]] virtual std::string mirrorUrl() const = 0;
    [[nodiscard]] virtual std::string arch() const = 0;
    [[nodiscard]] virtual std::filesystem::path installRoot() const = 0;
    [[nodiscard]] virtual std::string npmCommand() const = 0;
    [[nodiscard]] virtual std::optional<std::string> npmRegistry() const = 0;
    [[nodiscard]] virtual bool extractArchives() const = 0;
};

// Plain settings filled by the command line front end.
struct Settings final : ConfigProvider {
    std::string mirror_url{"https://nodejs.org/dist/"};
    std::string arch_name{"64"};
    std::filesystem::path install_root{std::filesystem::current_path()};
    std::string npm_command{"npm"};
    std::optional<std::string> npm_registry;
    bool extract_archives{true};

    [[nodiscard]] std::string mirrorUrl() const override { return mirror_url; }
    [[nodiscard]] std::string arch() const override { return arch_name; }
    [[nodiscard]] std::filesystem::path installRoot() const override { return install_root; }
    [[nodiscard]] std::string npmCommand() const override { return npm_command; }
    [[nodiscard]] std::optional<std::string> npmRegistry() const override { return npm_registry; }
    [[nodiscard]] bool extractArchives() const override { return extract_archives; }
};

// Where a Node.js release archive comes from and where it lands on disk.
struct NodeArtifact {
    std::string url;
    std::filesystem::path install_dir;
    std::filesystem::path staging_path;
    std::filesystem::path archive_path;
};

// "64" -> "x64", "32" -> "x86"; other tokens pass through unchanged.
[[nodiscard]] std::string archToken(const std::string& arch);

// version must already carry its 'v' prefix, e.g. "v20.0.0".
[[nodiscard]] NodeArtifact resolveNodeArtifact(const ConfigProvider& config, const std::string& version);

} // namespace installer
