#pragma once

#include <filesystem>
#include <functional>
#include <memory>

#include "core/LocalRepository.hpp"
#include "remote/RemoteChangeClient.hpp"
#include "util/Config.hpp"
#include "util/Expected.hpp"

namespace gitcl {

/**
 * @brief Services handed to every command
 *
 * Settings are loaded once in main(). The repository and the remote client
 * are opened on demand so commands that need neither never touch them; the
 * factories can be replaced (tests plug in fakes).
 */
struct AppContext {
    using RepositoryFactory = std::function<Expected<std::shared_ptr<LocalRepository>>(const AppContext&)>;
    using RemoteFactory = std::function<Expected<std::shared_ptr<RemoteChangeClient>>(const AppContext&)>;

    std::filesystem::path workDir;
    GerritConfig config;
    RepositoryFactory repositoryFactory;   // Default: GitDirRepository around workDir
    RemoteFactory remoteFactory;           // Default: GerritClient over libcurl

    Expected<std::shared_ptr<LocalRepository>> openRepository() const;
    Expected<std::shared_ptr<RemoteChangeClient>> openRemote() const;

    /// "<defaultremote>/<defaultbranch>", the base a stack is reconciled against
    std::string upstreamRef() const { return config.defaultRemote + "/" + config.defaultBranch; }
};

}
