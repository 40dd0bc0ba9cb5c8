#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gitcl {

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
};

struct HttpResponse {
    long status{0};
    std::string body;
};

/// Blocking HTTP round trip; a transport failure is a NetworkError, any
/// HTTP status (including 4xx/5xx) is a response
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual Expected<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl-backed transport with optional HTTP basic/digest credentials
 */
class CurlTransport : public IHttpTransport {
public:
    CurlTransport(std::string username, std::string password, long timeoutSeconds = 60);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Expected<HttpResponse> send(const HttpRequest& request) override;

private:
    std::string username;
    std::string password;
    long timeoutSeconds;
};

}
