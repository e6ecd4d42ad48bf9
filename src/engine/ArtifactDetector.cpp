#include "engine/ArtifactDetector.hpp"
#include <algorithm>
#include <set>

namespace coderun {
namespace engine {

namespace fs = std::filesystem;

std::string artifactPolicyToString(ArtifactPolicy policy) {
    switch (policy) {
        case ArtifactPolicy::CreatedOrModified: return "created-or-modified";
        case ArtifactPolicy::CreatedOnly: return "created-only";
    }
    return "created-or-modified";
}

ArtifactPolicy parseArtifactPolicy(const std::string& name) {
    if (name == "created-or-modified") return ArtifactPolicy::CreatedOrModified;
    if (name == "created-only") return ArtifactPolicy::CreatedOnly;
    throw std::invalid_argument("Unknown artifact policy: " + name);
}

ArtifactDetector::ArtifactDetector(ArtifactPolicy policy)
    : m_policy(policy)
{}

DirectorySnapshot ArtifactDetector::snapshot(const fs::path& dir) const {
    DirectorySnapshot result;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return result;
    }

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw ArtifactIOError("Cannot list " + dir.string() + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw ArtifactIOError("Cannot list " + dir.string() + ": " + ec.message());
        }
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) continue;
        auto mtime = it->last_write_time(entryEc);
        if (entryEc) {
            // Deleted between listing and stat
            continue;
        }
        result[it->path().string()] = mtime;
    }
    if (ec) {
        throw ArtifactIOError("Cannot list " + dir.string() + ": " + ec.message());
    }
    return result;
}

std::vector<std::string> ArtifactDetector::detect(const fs::path& workdir,
                                                  const DirectorySnapshot& before,
                                                  const std::vector<std::string>& explicitFiles) const {
    std::vector<std::string> artifacts;
    std::set<std::string> seen;

    auto addUnique = [&](const fs::path& path) {
        std::error_code ec;
        fs::path canonical = fs::weakly_canonical(path, ec);
        std::string key = ec ? path.lexically_normal().string() : canonical.string();
        if (seen.insert(key).second) {
            artifacts.push_back(path.string());
        }
    };

    for (const auto& declared : explicitFiles) {
        if (declared.empty()) continue;
        fs::path path(declared);
        if (path.is_relative()) {
            path = workdir / path;
        }
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            addUnique(path);
        }
    }

    DirectorySnapshot after = snapshot(workdir);
    // std::map iterates in path order
    for (const auto& [path, mtime] : after) {
        auto previous = before.find(path);
        bool created = previous == before.end();
        bool modified = !created && previous->second != mtime;
        if (created || (modified && m_policy == ArtifactPolicy::CreatedOrModified)) {
            addUnique(path);
        }
    }
    return artifacts;
}

} // namespace engine
} // namespace coderun
