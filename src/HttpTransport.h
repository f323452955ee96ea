#pragma once

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    uint32_t timeoutMs = 5000;
};

struct HttpResponse {
    // < 0: transport failure, error holds the reason
    int status = -1;
    std::string body;   // already inflated when the server sent gzip
    std::string error;
};

// The single GET the API clients need. The firmware implements it with
// HTTPClient over WiFiClientSecure; tests script it.
class HttpTransport {
public:
    virtual ~HttpTransport() {}
    virtual HttpResponse get(const HttpRequest& req) = 0;
};

// Percent-encodes a query parameter value (UTF-8 safe).
std::string url_encode(const std::string& value);
