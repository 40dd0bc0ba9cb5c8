#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitcl {

/**
 * @brief Parsed git commit object
 *
 * Git commit format:
 *   commit <size>\0tree <hash>
 *   parent <hash>
 *   author Name <email> <timestamp> <timezone>
 *   committer Name <email> <timestamp> <timezone>
 *
 *   <commit message>
 *
 * Headers other than these (gpgsig, encoding, mergetag) are kept verbatim in
 * `extraHeaders` so a rewritten commit can drop or keep them deliberately.
 */
struct CommitObject {
    std::string hash;
    std::string treeHash;
    std::vector<std::string> parentHashes;  // 0 for root, 2+ for merges
    std::string authorName;
    std::string authorEmail;
    int64_t authorTimestamp{0};
    std::string authorTimezone{"+0000"};
    std::string committerName;
    std::string committerEmail;
    int64_t committerTimestamp{0};
    std::string committerTimezone{"+0000"};
    std::vector<std::string> extraHeaders;
    std::string message;                    // Full message, trailing newline kept

    /// First line of the message
    std::string shortMessage() const {
        size_t newlinePos = message.find('\n');
        if (newlinePos != std::string::npos) {
            return message.substr(0, newlinePos);
        }
        return message;
    }

    std::string shortHash() const {
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }

    /// First parent, or empty for a root commit
    std::string firstParent() const {
        return parentHashes.empty() ? std::string() : parentHashes.front();
    }

    /// Commit payload (without the "commit <size>\0" header)
    std::string serialize() const;

    /// "Name <email>"
    std::string authorIdent() const { return authorName + " <" + authorEmail + ">"; }
};

}
