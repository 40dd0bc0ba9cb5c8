#include "remote/HttpTransport.hpp"

#include <curl/curl.h>

#include <memory>

#include "util/Logger.hpp"

namespace gitcl {

namespace {

size_t appendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}

CurlTransport::CurlTransport(std::string username, std::string password, long timeoutSeconds)
    : username(std::move(username)), password(std::move(password)), timeoutSeconds(timeoutSeconds) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

Expected<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error{ErrorCode::NetworkError, "curl init failed"};
    }

    curl_slist* rawHeaders = nullptr;
    for (const auto& header : request.headers) {
        rawHeaders = curl_slist_append(rawHeaders, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(rawHeaders);

    HttpResponse response;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "git-cl");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    if (!username.empty()) {
        curl_easy_setopt(h, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC | CURLAUTH_DIGEST));
        curl_easy_setopt(h, CURLOPT_USERNAME, username.c_str());
        curl_easy_setopt(h, CURLOPT_PASSWORD, password.c_str());
    }

    if (request.method == "POST" || request.method == "PUT") {
        if (request.method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
        } else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        }
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    Logger::instance().debug(request.method + " " + request.url);

    CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        return Error{ErrorCode::NetworkError, request.url + ": " + curl_easy_strerror(res)};
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    Logger::instance().debug("HTTP " + std::to_string(response.status) + " (" +
                             std::to_string(response.body.size()) + " bytes)");
    return response;
}

}
