#include "core/Repository.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace gitcl {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

Expected<std::string> readFirstLine(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string()};
    }
    std::string line;
    std::getline(in, line);
    return trimRight(line);
}

Expected<void> writeFileAtomically(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create directory: " + ec.message()};
    }
    fs::path tmp = path;
    tmp += ".lock";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to open " + tmp.string()};
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return Error{ErrorCode::IoError, "Failed to write " + path.string()};
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::IoError, "Failed to update " + path.string() + ": " + ec.message()};
    }
    return {};
}

/// Look a ref up in packed-refs; empty when absent
std::string lookupPackedRef(const fs::path& gitDir, const std::string& refName) {
    std::ifstream in(gitDir / "packed-refs", std::ios::binary);
    if (!in) return std::string();
    std::string line;
    while (std::getline(in, line)) {
        line = trimRight(line);
        // Comments ("# pack-refs with: ...") and peeled lines ("^<id>")
        if (line.empty() || line[0] == '#' || line[0] == '^') continue;
        size_t space = line.find(' ');
        if (space == std::string::npos) continue;
        if (line.compare(space + 1, std::string::npos, refName) == 0) {
            return line.substr(0, space);
        }
    }
    return std::string();
}

bool isHex(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

Expected<std::string> resolveAbbreviated(const fs::path& gitDir, const std::string& prefix) {
    fs::path dir = gitDir / "objects" / prefix.substr(0, Constants::OBJECT_DIR_LENGTH);
    std::string rest = prefix.substr(Constants::OBJECT_DIR_LENGTH);
    std::error_code ec;
    std::vector<std::string> matches;
    if (fs::is_directory(dir, ec)) {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string name = entry.path().filename().string();
            if (name.compare(0, rest.size(), rest) == 0) {
                matches.push_back(prefix.substr(0, Constants::OBJECT_DIR_LENGTH) + name);
            }
        }
    }
    if (matches.size() == 1) return matches.front();
    if (matches.empty()) {
        return Error{ErrorCode::RefNotFound, "unknown revision: " + prefix};
    }
    return Error{ErrorCode::InvalidArgs, "ambiguous abbreviated object id: " + prefix};
}

}

bool Repository::isObjectId(const std::string& text) {
    return text.size() == Constants::SHA1_HEX_LENGTH && isHex(text);
}

Expected<fs::path> Repository::discoverRoot(const fs::path& start) {
    std::error_code ec;
    fs::path cur = fs::absolute(start, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot resolve " + start.string()};
    }
    while (true) {
        if (fs::exists(cur / ".git", ec)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "not a git repository (or any of the parent directories)"};
        }
        cur = cur.parent_path();
    }
}

Expected<fs::path> Repository::gitDirOf(const fs::path& root) {
    fs::path dotGit = root / ".git";
    std::error_code ec;
    if (fs::is_directory(dotGit, ec)) {
        return dotGit;
    }
    if (!fs::is_regular_file(dotGit, ec)) {
        return Error{ErrorCode::NotARepository, "no .git in " + root.string()};
    }
    auto line = readFirstLine(dotGit);
    if (!line) return line.error();
    const std::string& content = line.value();
    if (content.rfind("gitdir: ", 0) != 0) {
        return Error{ErrorCode::NotARepository, "invalid gitfile: " + dotGit.string()};
    }
    fs::path target(content.substr(8));
    if (target.is_relative()) {
        target = root / target;
    }
    return target.lexically_normal();
}

Expected<HeadState> Repository::readHEAD(const fs::path& gitDir) {
    auto line = readFirstLine(gitDir / "HEAD");
    if (!line) return line.error();
    const std::string& content = line.value();

    HeadState head;
    if (content.rfind("ref: ", 0) == 0) {
        head.ref = content.substr(5);
        auto commit = readRef(gitDir, head.ref);
        if (commit) {
            head.commit = commit.value();
        } else if (commit.error().code != ErrorCode::RefNotFound) {
            return commit.error();
        }
        // Unborn branch: attached with no commit yet
        return head;
    }
    if (!isObjectId(content)) {
        return Error{ErrorCode::CorruptObject, "invalid HEAD: " + content};
    }
    head.commit = content;
    return head;
}

Expected<std::string> Repository::readRef(const fs::path& gitDir, const std::string& refName) {
    std::string name = refName;
    // Bounded so a symref loop cannot spin forever
    for (int depth = 0; depth < 5; ++depth) {
        fs::path loose = gitDir / name;
        std::error_code ec;
        std::string value;
        if (fs::is_regular_file(loose, ec)) {
            auto line = readFirstLine(loose);
            if (!line) return line.error();
            value = line.value();
        } else {
            value = lookupPackedRef(gitDir, name);
        }
        if (value.empty()) {
            return Error{ErrorCode::RefNotFound, "unknown ref: " + refName};
        }
        if (value.rfind("ref: ", 0) == 0) {
            name = value.substr(5);
            continue;
        }
        if (!isObjectId(value)) {
            return Error{ErrorCode::CorruptObject, "invalid ref " + name + ": " + value};
        }
        return value;
    }
    return Error{ErrorCode::RefNotFound, "symbolic ref loop at " + refName};
}

Expected<void> Repository::writeRef(const fs::path& gitDir, const std::string& refName,
                                    const std::string& commitHash) {
    if (!isObjectId(commitHash)) {
        return Error{ErrorCode::InvalidArgs, "not an object id: " + commitHash};
    }
    return writeFileAtomically(gitDir / refName, commitHash + "\n");
}

Expected<void> Repository::attachHEAD(const fs::path& gitDir, const std::string& refName) {
    return writeFileAtomically(gitDir / "HEAD", "ref: " + refName + "\n");
}

Expected<void> Repository::detachHEAD(const fs::path& gitDir, const std::string& commitHash) {
    if (!isObjectId(commitHash)) {
        return Error{ErrorCode::InvalidArgs, "not an object id: " + commitHash};
    }
    return writeFileAtomically(gitDir / "HEAD", commitHash + "\n");
}

Expected<std::string> Repository::getCurrentBranch(const fs::path& gitDir) {
    auto head = readHEAD(gitDir);
    if (!head) return head.error();
    const std::string& ref = head.value().ref;
    const std::string prefix = "refs/heads/";
    if (ref.rfind(prefix, 0) == 0) {
        return ref.substr(prefix.size());
    }
    return std::string();
}

Expected<std::string> Repository::resolve(const fs::path& gitDir, const std::string& rev) {
    if (rev.empty()) {
        return Error{ErrorCode::InvalidArgs, "empty revision"};
    }
    if (isObjectId(rev)) {
        return rev;
    }
    if (rev == "HEAD") {
        auto head = readHEAD(gitDir);
        if (!head) return head.error();
        if (head.value().commit.empty()) {
            return Error{ErrorCode::RefNotFound, "HEAD does not point to a commit yet"};
        }
        return head.value().commit;
    }

    const std::vector<std::string> candidates = {
        rev,
        "refs/" + rev,
        "refs/tags/" + rev,
        "refs/heads/" + rev,
        "refs/remotes/" + rev,
        "refs/remotes/" + rev + "/HEAD",
    };
    for (const auto& candidate : candidates) {
        if (candidate.rfind("refs/", 0) != 0) continue;
        auto hash = readRef(gitDir, candidate);
        if (hash) return hash;
        if (hash.error().code != ErrorCode::RefNotFound) return hash.error();
    }

    if (rev.size() >= 4 && rev.size() < Constants::SHA1_HEX_LENGTH && isHex(rev)) {
        return resolveAbbreviated(gitDir, rev);
    }
    return Error{ErrorCode::RefNotFound, "unknown revision: " + rev};
}

}
