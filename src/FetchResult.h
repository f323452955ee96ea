#pragma once

#include <stdint.h>
#include <string>
#include <utility>

enum class FetchError : uint8_t {
    None,
    Network,   // connect / DNS / timeout
    Http,      // non-2xx
    Protocol,  // API status code or missing field
    Parse,     // malformed body
    Config     // missing host, key or location
};

inline const char* fetch_error_name(FetchError e)
{
    switch (e) {
        case FetchError::None:     return "ok";
        case FetchError::Network:  return "network";
        case FetchError::Http:     return "http";
        case FetchError::Protocol: return "protocol";
        case FetchError::Parse:    return "parse";
        case FetchError::Config:   return "config";
    }
    return "unknown";
}

// Outcome of one remote call. Every error class takes the same retry path;
// only the message differs.
template <typename T>
struct FetchResult {
    T value{};
    FetchError error = FetchError::None;
    std::string message;

    bool ok() const { return error == FetchError::None; }

    static FetchResult success(T v)
    {
        FetchResult r;
        r.value = std::move(v);
        return r;
    }

    static FetchResult failure(FetchError e, std::string msg)
    {
        FetchResult r;
        r.error = e;
        r.message = std::move(msg);
        return r;
    }

    // Re-wrap another result's failure under this value type.
    template <typename U>
    static FetchResult failureFrom(const FetchResult<U>& other)
    {
        return failure(other.error, other.message);
    }
};
