#include "remote/GerritClient.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "core/Constants.hpp"
#include "remote/GerritJson.hpp"
#include "remote/GitProtocol.hpp"
#include "util/Logger.hpp"

namespace gitcl {

namespace {

constexpr const char* CHANGE_OPTIONS = "o=ALL_REVISIONS&o=ALL_COMMITS&o=DETAILED_ACCOUNTS";
constexpr const char* LIST_OPTIONS = "o=DETAILED_ACCOUNTS&o=CURRENT_REVISION";

bool mentionsConflict(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text.find("conflict") != std::string::npos;
}

}

GerritClient::GerritClient(GerritConfig config, std::unique_ptr<IHttpTransport> transport)
    : settings(std::move(config)), transport(std::move(transport)) {}

Expected<std::unique_ptr<RemoteChangeClient>> GerritClient::create(const GerritConfig& config) {
    if (config.host.empty()) {
        return Error{ErrorCode::ConfigError,
                     "no review server configured; set host in the [gerrit] section of .gitreview"};
    }
    return std::unique_ptr<RemoteChangeClient>(std::make_unique<GerritClient>(
        config, std::make_unique<CurlTransport>(config.username, config.password)));
}

std::string GerritClient::urlEncode(const std::string& text) {
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string GerritClient::identifier(const std::string& changeId, const std::string& branch) const {
    if (!settings.project.empty() && !branch.empty() && changeId.size() > 1 && changeId[0] == 'I') {
        return settings.project + "~" + branch + "~" + changeId;
    }
    return changeId;
}

std::string GerritClient::changeUrl(const std::string& id) const {
    return settings.baseUrl() + "/changes/" + urlEncode(id);
}

Expected<HttpResponse> GerritClient::call(HttpRequest request) {
    auto sent = transport->send(request);
    if (!sent) return sent.error();
    const HttpResponse& response = sent.value();
    if (response.status >= 200 && response.status < 300) {
        return response;
    }

    std::string message = GerritJson::errorMessage(response.body);
    std::string detail = "HTTP " + std::to_string(response.status) + (message.empty() ? "" : ": " + message);
    switch (response.status) {
        case 401:
        case 403:
            return Error{ErrorCode::AuthFailure, "authentication failed (" + detail + ")"};
        case 404:
            return Error{ErrorCode::NotFound, "not found (" + detail + ")"};
        case 409:
            return Error{ErrorCode::Conflict, detail};
        default:
            return Error{ErrorCode::ProtocolError, "unexpected response from " + request.url + " (" + detail + ")"};
    }
}

Expected<Change> GerritClient::getChange(const std::string& changeId) {
    HttpRequest request;
    request.url = changeUrl(changeId) + "?" + CHANGE_OPTIONS;
    request.headers.push_back("Accept: application/json");
    auto response = call(request);
    if (!response) {
        Error err = response.error();
        if (err.code == ErrorCode::NotFound) err.message = "change " + changeId + " not found";
        return err;
    }
    return GerritJson::parseChange(response.value().body);
}

Expected<std::vector<PatchSet>> GerritClient::getPatchSets(const std::string& changeId) {
    auto change = getChange(changeId);
    if (!change) return change.error();
    return change.value().patchSets;
}

Expected<std::vector<Change>> GerritClient::listChanges(const ChangeQuery& filter) {
    std::vector<std::string> terms;
    if (!filter.status.empty()) terms.push_back("status:" + filter.status);
    if (filter.watched) {
        terms.push_back("is:watched");
    } else if (!filter.owner.empty()) {
        terms.push_back("owner:" + filter.owner);
    }
    if (!filter.branch.empty()) terms.push_back("branch:" + filter.branch);
    if (!filter.project.empty()) terms.push_back("project:" + filter.project);

    std::string query;
    for (const auto& term : terms) {
        if (!query.empty()) query += '+';
        query += urlEncode(term);
    }

    HttpRequest request;
    request.url = settings.baseUrl() + "/changes/?q=" + query + "&" + LIST_OPTIONS;
    if (filter.limit > 0) request.url += "&n=" + std::to_string(filter.limit);
    request.headers.push_back("Accept: application/json");
    auto response = call(request);
    if (!response) return response.error();
    return GerritJson::parseChanges(response.value().body);
}

Expected<PatchSet> GerritClient::pushPatchSet(const PushRequest& req) {
    if (settings.project.empty()) {
        return Error{ErrorCode::ConfigError, "no project configured; set project in the [gerrit] section"};
    }
    const std::string branch = req.branch.empty() ? settings.defaultBranch : req.branch;
    const std::string ref = "refs/for/" + branch;
    const std::string repoUrl = settings.baseUrl() + "/" + settings.project;

    HttpRequest discover;
    discover.url = repoUrl + "/info/refs?service=git-receive-pack";
    auto advertised = call(discover);
    if (!advertised) return advertised.error();
    auto adv = ReceivePack::parseAdvertisement(advertised.value().body);
    if (!adv) return adv.error();
    if (!adv.value().supports("report-status")) {
        return Error{ErrorCode::ProtocolError, "server does not offer report-status"};
    }

    HttpRequest upload;
    upload.method = "POST";
    upload.url = repoUrl + "/git-receive-pack";
    upload.headers.push_back("Content-Type: application/x-git-receive-pack-request");
    upload.headers.push_back("Accept: application/x-git-receive-pack-result");
    upload.body = ReceivePack::buildRequest(Constants::NULL_OBJECT_ID, req.commit, ref, {"report-status"},
                                            PackWriter::build(req.objects));
    Logger::instance().debug("pushing " + req.commit + " (" + std::to_string(req.objects.size()) +
                             " objects) to " + ref);
    auto pushed = call(upload);
    if (!pushed) return pushed.error();
    auto status = ReceivePack::checkReportStatus(pushed.value().body, ref);
    if (!status) return status.error();

    auto change = getChange(identifier(req.changeId, branch));
    if (!change) return change.error();
    const PatchSet* ps = change.value().findByCommit(req.commit);
    if (!ps) {
        return Error{ErrorCode::ProtocolError,
                     "server accepted " + req.commit.substr(0, Constants::SHORT_HASH_LENGTH) +
                         " but does not list it as a patch set of " + req.changeId};
    }
    Logger::instance().info(req.changeId + ": uploaded patch set " + std::to_string(ps->number));
    return *ps;
}

Expected<Change> GerritClient::submit(const std::string& changeId) {
    HttpRequest request;
    request.method = "POST";
    request.url = changeUrl(changeId) + "/submit";
    request.headers.push_back("Content-Type: application/json; charset=UTF-8");
    request.headers.push_back("Accept: application/json");
    request.body = nlohmann::json{{"wait_for_merge", true}}.dump();

    auto response = call(request);
    if (!response) {
        Error err = response.error();
        if (err.code == ErrorCode::Conflict && !mentionsConflict(err.message)) {
            err.code = ErrorCode::NotReady;
        }
        return err;
    }
    auto change = GerritJson::parseChange(response.value().body);
    if (!change) return change.error();
    if (change.value().status != ChangeStatus::Merged) {
        return Error{ErrorCode::NotReady, changeId + " is " + changeStatusName(change.value().status) +
                                              " after submit"};
    }
    return change;
}

Expected<std::string> GerritClient::getPatch(const std::string& changeId, const std::string& revision) {
    HttpRequest request;
    request.url = changeUrl(changeId) + "/revisions/" + urlEncode(revision) + "/patch";
    auto response = call(request);
    if (!response) return response.error();
    return GerritJson::decodeBase64(response.value().body);
}

}
