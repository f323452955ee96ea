#include "EspHttpTransport.h"

#include <Arduino.h>
#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>
#include <rom/miniz.h>
#include <utility>

#include "GzipFrame.h"
#include "Log.h"

static constexpr const char* TAG = "Http";

bool gzip_inflate(const std::string& in, std::string& out, std::string& err)
{
    GzipFrame frame;
    if (!gzip_frame(in, frame, err)) return false;

    out.assign(frame.isize, '\0');
    const size_t n = tinfl_decompress_mem_to_mem(&out[0], out.size(), in.data() + frame.dataOffset,
                                                 frame.dataLen, 0);
    if (n == TINFL_DECOMPRESS_MEM_TO_MEM_FAILED || n != frame.isize) {
        out.clear();
        err = "inflate failed";
        return false;
    }
    return true;
}

HttpResponse EspHttpTransport::get(const HttpRequest& req)
{
    HttpResponse resp;

    if (WiFi.status() != WL_CONNECTED) {
        resp.error = "wifi not connected";
        return resp;
    }

    WiFiClientSecure client;
    client.setInsecure();

    HTTPClient https;
    https.setConnectTimeout(req.timeoutMs);
    https.setTimeout(req.timeoutMs);
    if (!https.begin(client, req.url.c_str())) {
        resp.error = "https.begin() failed";
        return resp;
    }

    for (const auto& h : req.headers) {
        https.addHeader(h.first.c_str(), h.second.c_str());
    }
    https.addHeader("Accept-Encoding", "gzip");

    const char* collect[] = {"Content-Encoding"};
    https.collectHeaders(collect, 1);

    const int code = https.GET();
    if (code < 0) {
        resp.error = HTTPClient::errorToString(code).c_str();
        https.end();
        return resp;
    }

    resp.status = code;
    String payload = https.getString();
    const bool gzipped = https.header("Content-Encoding") == "gzip";
    https.end();

    std::string raw(payload.c_str(), payload.length());
    if (gzipped || looks_gzip(raw)) {
        std::string err;
        if (!gzip_inflate(raw, resp.body, err)) {
            panel_log(TAG, "gzip body: %s", err.c_str());
            resp.status = -1;
            resp.error = "gzip: " + err;
            return resp;
        }
    } else {
        resp.body = std::move(raw);
    }
    return resp;
}
