#include "core/CommitObject.hpp"

namespace gitcl {

std::string CommitObject::serialize() const {
    std::string out;
    out += "tree " + treeHash + "\n";
    for (const auto& parent : parentHashes) {
        out += "parent " + parent + "\n";
    }
    out += "author " + authorName + " <" + authorEmail + "> " +
           std::to_string(authorTimestamp) + " " + authorTimezone + "\n";
    out += "committer " + committerName + " <" + committerEmail + "> " +
           std::to_string(committerTimestamp) + " " + committerTimezone + "\n";
    for (const auto& header : extraHeaders) {
        out += header + "\n";
    }
    out += "\n";
    out += message;
    return out;
}

}
