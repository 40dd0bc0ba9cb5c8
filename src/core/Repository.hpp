#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gitcl {

/// Where HEAD points
struct HeadState {
    std::string commit;   // Empty on an unborn branch
    std::string ref;      // "refs/heads/<b>" when attached, empty when detached
    bool detached() const { return ref.empty(); }
};

/**
 * @brief Reference and HEAD handling for a git directory
 *
 * Repository layout (only the parts used here):
 *   .git/
 *     HEAD              - "ref: refs/heads/main" or a detached commit id
 *     config            - [user] identity
 *     index             - staging area (DIRC)
 *     objects/          - loose objects
 *     refs/heads/...    - branch tips
 *     refs/remotes/...  - remote-tracking branches
 *     packed-refs       - refs packed by git gc
 *
 * All helpers are static and take the git directory explicitly.
 */
class Repository {
public:
    /**
     * @brief Find the working tree root by searching upwards for .git
     * @return Absolute path of the directory containing .git
     */
    static Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start);

    /**
     * @brief Git directory of a working tree
     *
     * Follows a ".git" file ("gitdir: <path>") as written for linked worktrees
     * and submodules.
     */
    static Expected<std::filesystem::path> gitDirOf(const std::filesystem::path& root);

    static Expected<HeadState> readHEAD(const std::filesystem::path& gitDir);

    /**
     * @brief Read a full ref name ("refs/heads/main") to a commit id
     *
     * Loose refs win over packed-refs; symbolic refs are followed.
     * A missing ref is RefNotFound.
     */
    static Expected<std::string> readRef(const std::filesystem::path& gitDir, const std::string& refName);

    static Expected<void> writeRef(const std::filesystem::path& gitDir, const std::string& refName,
                                   const std::string& commitHash);

    static Expected<void> attachHEAD(const std::filesystem::path& gitDir, const std::string& refName);
    static Expected<void> detachHEAD(const std::filesystem::path& gitDir, const std::string& commitHash);

    /// Short branch name of an attached HEAD, empty when detached
    static Expected<std::string> getCurrentBranch(const std::filesystem::path& gitDir);

    /**
     * @brief Resolve a user-supplied revision to an object id
     *
     * Accepts a full or abbreviated (4+ hex) object id, HEAD, a full ref name
     * and the short forms git accepts: <name> is tried as refs/<name>,
     * refs/tags/<name>, refs/heads/<name>, refs/remotes/<name> and
     * refs/remotes/<name>/HEAD, in that order.
     */
    static Expected<std::string> resolve(const std::filesystem::path& gitDir, const std::string& rev);

    /// True for a 40-character lowercase hex string
    static bool isObjectId(const std::string& text);
};

}
