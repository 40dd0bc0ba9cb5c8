#include "remote/GerritJson.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>

using json = nlohmann::json;

namespace gitcl {

namespace GerritJson {

namespace {

Expected<json> parseBody(const std::string& body) {
    auto stripped = stripXssi(body);
    if (!stripped) return stripped.error();
    try {
        return json::parse(stripped.value());
    } catch (const json::exception& e) {
        return Error{ErrorCode::ProtocolError, std::string("malformed JSON response: ") + e.what()};
    }
}

std::string stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

Account accountFrom(const json& obj) {
    Account account;
    if (!obj.is_object()) return account;
    account.name = stringField(obj, "name");
    account.email = stringField(obj, "email");
    account.username = stringField(obj, "username");
    return account;
}

Expected<ChangeStatus> statusFrom(const std::string& status) {
    // DRAFT changes of older servers are still open
    if (status == "NEW" || status == "DRAFT" || status.empty()) return ChangeStatus::New;
    if (status == "MERGED") return ChangeStatus::Merged;
    if (status == "ABANDONED") return ChangeStatus::Abandoned;
    return Error{ErrorCode::ProtocolError, "unknown change status: " + status};
}

Expected<Change> changeFrom(const json& obj) {
    if (!obj.is_object()) {
        return Error{ErrorCode::ProtocolError, "expected a change object"};
    }
    Change change;
    change.changeId = stringField(obj, "change_id");
    change.uuid = stringField(obj, "id");
    change.project = stringField(obj, "project");
    change.branch = stringField(obj, "branch");
    change.subject = stringField(obj, "subject");
    if (change.changeId.empty()) {
        return Error{ErrorCode::ProtocolError, "change without change_id"};
    }
    auto number = obj.find("_number");
    if (number != obj.end() && number->is_number_integer()) {
        change.number = number->get<int>();
    }
    auto status = statusFrom(stringField(obj, "status"));
    if (!status) return status.error();
    change.status = status.value();
    if (obj.contains("owner")) {
        change.owner = accountFrom(obj["owner"]);
    }

    auto revisions = obj.find("revisions");
    if (revisions != obj.end() && revisions->is_object()) {
        for (auto it = revisions->begin(); it != revisions->end(); ++it) {
            const json& rev = it.value();
            PatchSet ps;
            ps.commitHash = it.key();
            auto n = rev.find("_number");
            if (n == rev.end() || !n->is_number_integer()) {
                return Error{ErrorCode::ProtocolError, "revision " + it.key() + " has no patch-set number"};
            }
            ps.number = n->get<int>();
            ps.created = stringField(rev, "created");
            auto commit = rev.find("commit");
            if (commit != rev.end() && commit->is_object()) {
                auto parents = commit->find("parents");
                if (parents != commit->end() && parents->is_array() && !parents->empty()) {
                    ps.parentHash = stringField(parents->front(), "commit");
                }
            }
            change.patchSets.push_back(std::move(ps));
        }
    }
    std::sort(change.patchSets.begin(), change.patchSets.end(),
              [](const PatchSet& a, const PatchSet& b) { return a.number < b.number; });
    for (size_t i = 0; i < change.patchSets.size(); ++i) {
        if (change.patchSets[i].number < 1 ||
            (i > 0 && change.patchSets[i].number == change.patchSets[i - 1].number)) {
            return Error{ErrorCode::ProtocolError,
                         change.changeId + ": patch-set numbers are not strictly increasing"};
        }
    }
    return change;
}

}

Expected<std::string> stripXssi(const std::string& body) {
    if (body.compare(0, std::char_traits<char>::length(XSSI_PREFIX), XSSI_PREFIX) != 0) {
        return Error{ErrorCode::ProtocolError, "response lacks the )]}' guard"};
    }
    size_t eol = body.find('\n');
    return eol == std::string::npos ? std::string() : body.substr(eol + 1);
}

Expected<Change> parseChange(const std::string& body) {
    auto doc = parseBody(body);
    if (!doc) return doc.error();
    return changeFrom(doc.value());
}

Expected<std::vector<Change>> parseChanges(const std::string& body) {
    auto doc = parseBody(body);
    if (!doc) return doc.error();
    if (!doc.value().is_array()) {
        return Error{ErrorCode::ProtocolError, "expected a list of changes"};
    }
    std::vector<Change> changes;
    for (const auto& item : doc.value()) {
        auto change = changeFrom(item);
        if (!change) return change.error();
        changes.push_back(std::move(change.value()));
    }
    return changes;
}

std::string errorMessage(const std::string& body) {
    std::string text = body;
    auto stripped = stripXssi(body);
    if (stripped) text = stripped.value();
    try {
        json doc = json::parse(text);
        if (doc.is_string()) return doc.get<std::string>();
        if (doc.is_object() && doc.contains("message") && doc["message"].is_string()) {
            return doc["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Plain-text error body
    }
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    return text;
}

Expected<std::string> decodeBase64(const std::string& text) {
    static const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ') continue;
        size_t v = alphabet.find(c);
        if (v == std::string::npos) {
            return Error{ErrorCode::ProtocolError, "invalid base64 in response"};
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

}

}
