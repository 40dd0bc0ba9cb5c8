#pragma once

#include <memory>
#include <string>

#include "remote/HttpTransport.hpp"
#include "remote/RemoteChangeClient.hpp"
#include "util/Config.hpp"

namespace gitcl {

/**
 * @brief RemoteChangeClient for a Gerrit server
 *
 * Change queries use the REST API under <base>/changes/; patch sets are
 * uploaded to refs/for/<branch> over git smart HTTP. The configuration is
 * fixed at construction.
 */
class GerritClient : public RemoteChangeClient {
public:
    GerritClient(GerritConfig config, std::unique_ptr<IHttpTransport> transport);

    /// Client over libcurl; ConfigError when no host is configured
    static Expected<std::unique_ptr<RemoteChangeClient>> create(const GerritConfig& config);

    Expected<Change> getChange(const std::string& changeId) override;
    Expected<std::vector<PatchSet>> getPatchSets(const std::string& changeId) override;
    Expected<std::vector<Change>> listChanges(const ChangeQuery& filter) override;
    Expected<PatchSet> pushPatchSet(const PushRequest& request) override;
    Expected<Change> submit(const std::string& changeId) override;
    Expected<std::string> getPatch(const std::string& changeId, const std::string& revision) override;

    const GerritConfig& config() const { return settings; }

    /// Percent-encode everything except RFC 3986 unreserved characters
    static std::string urlEncode(const std::string& text);

private:
    GerritConfig settings;
    std::unique_ptr<IHttpTransport> transport;

    /// "project~branch~Change-Id" when both are known, else the id as given
    std::string identifier(const std::string& changeId, const std::string& branch) const;
    std::string changeUrl(const std::string& id) const;

    /// Send and map non-2xx statuses onto error kinds
    Expected<HttpResponse> call(HttpRequest request);
};

}
