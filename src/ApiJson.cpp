#include "ApiJson.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

std::string json_text(JsonVariantConst v, const char* fallback)
{
    if (v.is<const char*>()) return v.as<const char*>();
    if (v.is<long>()) return std::to_string(v.as<long>());
    if (v.is<double>()) {
        char buf[24];
        snprintf(buf, sizeof(buf), "%g", v.as<double>());
        return buf;
    }
    return fallback ? fallback : "";
}

bool json_code_is(JsonVariantConst code, int expected)
{
    if (code.is<const char*>()) {
        const char* s = code.as<const char*>();
        char* end = nullptr;
        const long n = strtol(s, &end, 10);
        return end != s && *end == '\0' && n == expected;
    }
    if (code.is<long>()) return code.as<long>() == expected;
    return false;
}

std::string json_code_desc(JsonVariantConst code)
{
    if (code.isNull()) return "code missing";
    return "code=" + json_text(code, "?");
}
