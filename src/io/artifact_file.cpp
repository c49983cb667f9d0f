#include "io/artifact_file.h"

#include "logging/logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace podium {
namespace io {

namespace {

bool writeAtomically(const std::string& path, const std::string& content) {
    if (path.empty()) {
        return false;
    }

    std::string tmpPath = path + ".tmp";
    std::ofstream ofs(tmpPath, std::ios::binary);
    if (!ofs) {
        LOG_ERROR("Artifact: cannot open {} for writing", tmpPath);
        return false;
    }
    ofs << content;
    ofs.close();
    if (!ofs) {
        LOG_ERROR("Artifact: write to {} failed", tmpPath);
        std::error_code ec;
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        LOG_ERROR("Artifact: rename {} -> {} failed", tmpPath, path);
        std::error_code ec;
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
    LOG_INFO("Wrote {}", path);
    return true;
}

}  // namespace

ArtifactFile::ArtifactFile(std::string path) : path_(std::move(path)) {}

ArtifactFile::ArtifactFile(ArtifactFile&& other) noexcept : path_(std::move(other.path_)) {}

ArtifactFile& ArtifactFile::operator=(ArtifactFile&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    path_ = std::move(other.path_);
    return *this;
}

const std::string& ArtifactFile::path() const {
    return path_;
}

void ArtifactFile::removeIfExists() const {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::remove(path_, ec)) {
        LOG_DEBUG("Removed stale {}", path_);
    }
}

bool ArtifactFile::writeJsonAtomically(const nlohmann::json& payload) const {
    return writeAtomically(path_, payload.dump(2) + '\n');
}

bool ArtifactFile::writeTextAtomically(const std::string& text) const {
    return writeAtomically(path_, text);
}

}  // namespace io
}  // namespace podium
