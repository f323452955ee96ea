#pragma once

#include <string>

#include "HttpTransport.h"

// HTTPS GET over WiFiClientSecure + HTTPClient. Certificates are not
// verified. Gzip bodies (QWeather always compresses) are inflated with the
// miniz inflater in the ESP32 ROM.
class EspHttpTransport : public HttpTransport {
public:
    HttpResponse get(const HttpRequest& req) override;
};

// Inflates a complete gzip member. false with err set on a malformed or
// oversized stream.
bool gzip_inflate(const std::string& in, std::string& out, std::string& err);
