#pragma once

#include <ArduinoJson.h>
#include <string>

// Field as display text. The APIs send numbers both quoted and bare.
std::string json_text(JsonVariantConst v, const char* fallback = "-");

// API status codes come as "200" (weather) or 200 (text).
bool json_code_is(JsonVariantConst code, int expected);

// "code=401" style description for error messages.
std::string json_code_desc(JsonVariantConst code);
