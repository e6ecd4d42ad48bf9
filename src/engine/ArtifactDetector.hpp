#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace coderun {
namespace engine {

class ArtifactIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ArtifactPolicy {
    CreatedOrModified,
    CreatedOnly
};

std::string artifactPolicyToString(ArtifactPolicy policy);

/// Throws std::invalid_argument for unknown names
ArtifactPolicy parseArtifactPolicy(const std::string& name);

/// path -> last write time of every regular file below a directory
using DirectorySnapshot = std::map<std::string, std::filesystem::file_time_type>;

/**
 * Works out which files a run produced by diffing the save directory
 * before and after, plus the paths the snippet declared explicitly.
 */
class ArtifactDetector {
public:
    explicit ArtifactDetector(ArtifactPolicy policy = ArtifactPolicy::CreatedOrModified);

    /**
     * Recursive listing of dir. A missing dir yields an empty snapshot.
     * Throws ArtifactIOError when the directory cannot be walked.
     */
    DirectorySnapshot snapshot(const std::filesystem::path& dir) const;

    /**
     * Explicit files (existing regular files only, declaration order) followed
     * by new or changed files under workdir sorted by path. Relative explicit
     * paths resolve against workdir. Deduplicated by canonical path.
     */
    std::vector<std::string> detect(const std::filesystem::path& workdir,
                                    const DirectorySnapshot& before,
                                    const std::vector<std::string>& explicitFiles) const;

    ArtifactPolicy policy() const { return m_policy; }

private:
    ArtifactPolicy m_policy;
};

} // namespace engine
} // namespace coderun
