#pragma once

#include <stdint.h>
#include <string>

#include "FetchResult.h"
#include "HttpTransport.h"
#include "PanelData.h"

struct TextClientConfig {
    std::string host = "api.shwgij.com";
    std::string apiKey;       // query-string key
    uint32_t timeoutMs = 4000;
};

// Short text content for the ticker and the clock page. No location
// dependency.
class TextClient {
public:
    TextClient(HttpTransport& http, TextClientConfig cfg);

    // Random quote of the given type: "text cn" when both parts exist.
    FetchResult<std::string> fetchShortText(int quoteType);

    FetchResult<LunarInfo> fetchLunar();

private:
    FetchResult<std::string> get_(const char* path, const std::string& query);

    HttpTransport& http_;
    const TextClientConfig cfg_;
};
