#include "cli/AppContext.hpp"

#include "core/GitDirRepository.hpp"
#include "remote/GerritClient.hpp"

namespace gitcl {

Expected<std::shared_ptr<LocalRepository>> AppContext::openRepository() const {
    if (repositoryFactory) {
        return repositoryFactory(*this);
    }
    auto repo = GitDirRepository::open(workDir.empty() ? std::filesystem::current_path() : workDir);
    if (!repo) return repo.error();
    return std::shared_ptr<LocalRepository>(std::move(repo.value()));
}

Expected<std::shared_ptr<RemoteChangeClient>> AppContext::openRemote() const {
    if (remoteFactory) {
        return remoteFactory(*this);
    }
    auto client = GerritClient::create(config);
    if (!client) return client.error();
    return std::shared_ptr<RemoteChangeClient>(std::move(client.value()));
}

}
