#include "util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitcl {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool parseBool(const std::string& v) {
    std::string l = toLower(v);
    return l == "true" || l == "yes" || l == "on" || l == "1";
}

}

Expected<IniFile> IniFile::parse(const std::string& text, const std::string& origin) {
    IniFile ini;
    std::istringstream iss(text);
    std::string line;
    std::string section;
    int lineNo = 0;

    while (std::getline(iss, line)) {
        ++lineNo;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;

        if (t.front() == '[') {
            if (t.back() != ']') {
                return Error{ErrorCode::ConfigError,
                             origin + ":" + std::to_string(lineNo) + ": unterminated section header"};
            }
            section = toLower(trim(t.substr(1, t.size() - 2)));
            ini.sections[section];
            continue;
        }

        size_t sep = t.find_first_of("=:");
        if (sep == std::string::npos) {
            // git config allows bare boolean keys ("[core] bare")
            if (section.empty()) {
                return Error{ErrorCode::ConfigError,
                             origin + ":" + std::to_string(lineNo) + ": expected key = value"};
            }
            ini.sections[section][toLower(t)] = "true";
            continue;
        }
        if (section.empty()) {
            return Error{ErrorCode::ConfigError,
                         origin + ":" + std::to_string(lineNo) + ": key outside of any section"};
        }
        std::string key = toLower(trim(t.substr(0, sep)));
        std::string value = unquote(trim(t.substr(sep + 1)));
        ini.sections[section][key] = value;
    }
    return ini;
}

Expected<IniFile> IniFile::load(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot read " + path.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), path.string());
}

void IniFile::merge(const IniFile& other) {
    for (const auto& [name, keys] : other.sections) {
        auto& mine = sections[name];
        for (const auto& [k, v] : keys) {
            mine[k] = v;
        }
    }
}

bool IniFile::hasSection(const std::string& section) const {
    return sections.find(toLower(section)) != sections.end();
}

std::optional<std::string> IniFile::get(const std::string& section, const std::string& key) const {
    auto s = sections.find(toLower(section));
    if (s == sections.end()) return std::nullopt;
    auto k = s->second.find(toLower(key));
    if (k == s->second.end()) return std::nullopt;
    return k->second;
}

std::string GerritConfig::serverUrl() const {
    std::string url = host;
    while (!url.empty() && url.back() == '/') url.pop_back();

    bool hasScheme = url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
    if (!hasScheme) {
        url = std::string(insecure ? "http" : "https") + "://" + url;
    }
    if (port > 0) {
        // Insert the port after the authority unless one is already present
        size_t authorityStart = url.find("://") + 3;
        size_t pathStart = url.find('/', authorityStart);
        std::string authority = url.substr(authorityStart, pathStart == std::string::npos
                                                                ? std::string::npos
                                                                : pathStart - authorityStart);
        if (authority.find(':') == std::string::npos) {
            url.insert(authorityStart + authority.size(), ":" + std::to_string(port));
        }
    }
    return url;
}

std::string GerritConfig::baseUrl() const {
    // Gerrit authenticates requests whose path starts with /a/
    return requiresAuth() ? serverUrl() + "/a" : serverUrl();
}

namespace Config {

std::optional<fs::path> reverseFindFile(const std::string& filename, const fs::path& start) {
    std::error_code ec;
    fs::path cur = fs::absolute(start, ec);
    if (ec) return std::nullopt;
    while (true) {
        fs::path candidate = cur / filename;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return std::nullopt;
        }
        cur = cur.parent_path();
    }
}

Expected<GerritConfig> gerritConfigFrom(const IniFile& ini) {
    if (!ini.hasSection(GERRIT_SECTION)) {
        return Error{ErrorCode::ConfigError, std::string("missing section [") + GERRIT_SECTION + "]"};
    }
    GerritConfig cfg;
    if (auto v = ini.get(GERRIT_SECTION, "host")) cfg.host = *v;
    if (auto v = ini.get(GERRIT_SECTION, "project")) {
        cfg.project = *v;
        // .gitreview files conventionally carry the ".git" suffix
        if (cfg.project.size() > 4 && cfg.project.compare(cfg.project.size() - 4, 4, ".git") == 0) {
            cfg.project.erase(cfg.project.size() - 4);
        }
    }
    if (auto v = ini.get(GERRIT_SECTION, "defaultbranch")) cfg.defaultBranch = *v;
    if (auto v = ini.get(GERRIT_SECTION, "defaultremote")) cfg.defaultRemote = *v;
    if (auto v = ini.get(GERRIT_SECTION, "username")) cfg.username = *v;
    if (auto v = ini.get(GERRIT_SECTION, "password")) cfg.password = *v;
    if (auto v = ini.get(GERRIT_SECTION, "insecure")) cfg.insecure = parseBool(*v);
    if (auto v = ini.get(GERRIT_SECTION, "port")) {
        try {
            cfg.port = std::stoi(*v);
        } catch (const std::exception&) {
            return Error{ErrorCode::ConfigError, "invalid gerrit.port: " + *v};
        }
    }
    return cfg;
}

Expected<GerritConfig> loadGerritConfig(const fs::path& startDir, const fs::path& homeDir) {
    IniFile merged;
    bool found = false;
    std::error_code ec;

    fs::path global;
    if (!homeDir.empty()) {
        global = homeDir / SETTINGS_FILENAME;
        if (fs::is_regular_file(global, ec)) {
            auto g = IniFile::load(global);
            if (!g) return g.error();
            merged.merge(g.value());
            found = true;
            Logger::instance().debug("loaded settings from " + global.string());
        }
    }

    auto local = reverseFindFile(SETTINGS_FILENAME, startDir);
    if (local && (global.empty() || !fs::equivalent(*local, global, ec))) {
        auto l = IniFile::load(*local);
        if (!l) return l.error();
        merged.merge(l.value());
        found = true;
        Logger::instance().debug("loaded settings from " + local->string());
    }

    if (!found) {
        // Remote commands report the missing host themselves
        return GerritConfig{};
    }
    return gerritConfigFrom(merged);
}

Identity loadIdentity(const fs::path& gitDir, const fs::path& homeDir) {
    Identity id;
    std::error_code ec;
    std::vector<fs::path> candidates;
    if (!gitDir.empty()) candidates.push_back(gitDir / "config");
    if (!homeDir.empty()) candidates.push_back(homeDir / ".gitconfig");

    for (const auto& path : candidates) {
        if (!fs::is_regular_file(path, ec)) continue;
        auto ini = IniFile::load(path);
        if (!ini) {
            Logger::instance().warn(ini.error().message);
            continue;
        }
        if (id.name.empty()) {
            if (auto v = ini.value().get("user", "name")) id.name = *v;
        }
        if (id.email.empty()) {
            if (auto v = ini.value().get("user", "email")) id.email = *v;
        }
    }
    if (id.name.empty()) id.name = "git-cl";
    if (id.email.empty()) id.email = "git-cl@localhost";
    return id;
}

fs::path homeDirectory() {
    const char* home = std::getenv("HOME");
    return home ? fs::path(home) : fs::path();
}

}

}
