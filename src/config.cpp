#include "installer/config.hpp"

#include <fmt/format.h>

namespace installer {

std::string archToken(const std::string& arch) {
    if (arch == "64") {
        return "x64";
    }
    if (arch == "32") {
        return "x86";
    }
    return arch;
}

NodeArtifact resolveNodeArtifact(const ConfigProvider& config, const std::string& version) {
    std::string mirror = config.mirrorUrl();
    while (!mirror.empty() && mirror.back() == '/') {
        mirror.pop_back();
    }

    const std::string archive_name =
        fmt::format("node-{}-linux-{}.tar.xz", version, archToken(config.arch()));

    NodeArtifact artifact;
    artifact.url = fmt::format("{}/{}/{}", mirror, version, archive_name);
    artifact.install_dir = config.installRoot() / version;
    artifact.archive_path = artifact.install_dir / "node.tar.xz";
    artifact.staging_path = artifact.install_dir / "node.tar.xz.part";
    return artifact;
}

} // namespace installer
