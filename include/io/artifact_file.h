#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace podium {
namespace io {

// One output file in the work directory. Writes go to "<path>.tmp" and are renamed into place.
class ArtifactFile {
   public:
    explicit ArtifactFile(std::string path);

    ArtifactFile(const ArtifactFile&) = delete;
    ArtifactFile& operator=(const ArtifactFile&) = delete;

    ArtifactFile(ArtifactFile&& other) noexcept;
    ArtifactFile& operator=(ArtifactFile&& other) noexcept;

    const std::string& path() const;

    void removeIfExists() const;
    bool writeJsonAtomically(const nlohmann::json& payload) const;
    bool writeTextAtomically(const std::string& text) const;

   private:
    std::string path_;
};

}  // namespace io
}  // namespace podium
