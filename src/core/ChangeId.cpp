#include "core/ChangeId.hpp"

#include <regex>
#include <set>
#include <sstream>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace gitcl {

namespace ChangeId {

namespace {

const std::regex& changeIdPattern() {
    static const std::regex re("^I[0-9a-f]{8,40}$");
    return re;
}

const std::regex& legacyPattern() {
    static const std::regex re("^[0-9]+$");
    return re;
}

const std::regex& rangePattern() {
    static const std::regex re("^([0-9]+)\\.\\.([0-9]+)$");
    return re;
}

// Guards against "1..99999999" creating an enormous request list
constexpr long MAX_RANGE = 1000;

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

}

bool isChangeId(const std::string& text) {
    return std::regex_match(text, changeIdPattern());
}

bool isLegacyId(const std::string& text) {
    return std::regex_match(text, legacyPattern()) &&
           text.find_first_not_of('0') != std::string::npos;
}

std::optional<std::string> fromCommitMessage(const std::string& message) {
    std::vector<std::string> lines;
    std::istringstream iss(message);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    while (!lines.empty() && trim(lines.back()).empty()) {
        lines.pop_back();
    }

    // Last paragraph only; a single-paragraph message (subject only) has no trailers
    size_t start = lines.size();
    while (start > 0 && !trim(lines[start - 1]).empty()) {
        --start;
    }
    if (start == 0) {
        return std::nullopt;
    }

    const std::string key = std::string(Constants::CHANGE_ID_TRAILER) + ":";
    std::optional<std::string> found;
    for (size_t i = start; i < lines.size(); ++i) {
        if (lines[i].rfind(key, 0) != 0) continue;
        std::string value = trim(lines[i].substr(key.size()));
        if (isChangeId(value)) {
            found = value;
        } else {
            Logger::instance().warn("ignoring malformed Change-Id trailer: " + value);
        }
    }
    return found;
}

std::vector<std::string> expandArguments(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    auto add = [&](const std::string& id) {
        if (seen.insert(id).second) out.push_back(id);
    };

    for (const auto& arg : args) {
        std::smatch m;
        if (isChangeId(arg) || isLegacyId(arg)) {
            add(arg);
        } else if (std::regex_match(arg, m, rangePattern())) {
            long first = 0;
            long last = 0;
            try {
                first = std::stol(m[1].str());
                last = std::stol(m[2].str());
            } catch (const std::exception&) {
                Logger::instance().warn("invalid change range: " + arg);
                continue;
            }
            if (first < 1 || last < first || last - first >= MAX_RANGE) {
                Logger::instance().warn("invalid change range: " + arg);
                continue;
            }
            for (long n = first; n <= last; ++n) {
                add(std::to_string(n));
            }
        } else {
            Logger::instance().warn("invalid change identifier: " + arg);
        }
    }
    return out;
}

}

}
