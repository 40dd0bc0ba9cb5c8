#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "util/Expected.hpp"

namespace gitcl {

/**
 * @brief Minimal INI reader for .gitreview and git config files
 *
 * Accepts "[section]" headers (including git's `[remote "origin"]` form),
 * "key = value" or "key: value" lines and '#' / ';' comments. Section and
 * key names are case-insensitive and stored lowercase.
 */
class IniFile {
public:
    static Expected<IniFile> parse(const std::string& text, const std::string& origin);
    static Expected<IniFile> load(const std::filesystem::path& path);

    /// Later values win: keys present in `other` replace ours
    void merge(const IniFile& other);

    bool hasSection(const std::string& section) const;
    std::optional<std::string> get(const std::string& section, const std::string& key) const;

private:
    std::map<std::string, std::map<std::string, std::string>> sections;
};

/**
 * @brief Connection and project settings for the review server
 *
 * Built once at startup from the [gerrit] section of the settings files and
 * handed to the remote client explicitly.
 */
struct GerritConfig {
    std::string host;                    // "review.example.org" or full "https://host/prefix"
    int port{0};                         // 0: scheme default
    std::string project;
    std::string defaultBranch{"master"};
    std::string defaultRemote{"origin"};
    std::string username;
    std::string password;                // HTTP password / access token
    bool insecure{false};                // http:// instead of https://

    bool requiresAuth() const { return !username.empty(); }

    /// Server root, e.g. "https://review.example.org:8443"
    std::string serverUrl() const;

    /// REST/git root: serverUrl() plus "/a" when authenticating
    std::string baseUrl() const;
};

struct Identity {
    std::string name;
    std::string email;
};

namespace Config {

constexpr const char* SETTINGS_FILENAME = ".gitreview";
constexpr const char* GERRIT_SECTION = "gerrit";

/// Walk up from `start` looking for `filename`; returns its path if found
std::optional<std::filesystem::path> reverseFindFile(const std::string& filename, const std::filesystem::path& start);

/**
 * @brief Load ~/.gitreview then the nearest .gitreview above `startDir`
 * @param homeDir Home directory (empty: skip the global file)
 *
 * Missing files are not an error; a file without a [gerrit] section or with
 * an unparsable port is a ConfigError.
 */
Expected<GerritConfig> loadGerritConfig(const std::filesystem::path& startDir, const std::filesystem::path& homeDir);

/// Build a GerritConfig from an already merged settings file
Expected<GerritConfig> gerritConfigFrom(const IniFile& ini);

/// Committer identity from <gitDir>/config, then ~/.gitconfig, then a fixed fallback
Identity loadIdentity(const std::filesystem::path& gitDir, const std::filesystem::path& homeDir);

/// $HOME, or empty when unset
std::filesystem::path homeDirectory();

}

}
