#include "GzipFrame.h"

#include <stdint.h>

static constexpr size_t GZ_HEADER_LEN  = 10;
static constexpr size_t GZ_TRAILER_LEN = 8;

static constexpr uint8_t GZ_CM_DEFLATE = 8;
static constexpr uint8_t GZ_FHCRC      = 0x02;
static constexpr uint8_t GZ_FEXTRA     = 0x04;
static constexpr uint8_t GZ_FNAME      = 0x08;
static constexpr uint8_t GZ_FCOMMENT   = 0x10;

bool looks_gzip(const std::string& body)
{
    return body.size() >= GZ_HEADER_LEN + GZ_TRAILER_LEN &&
           (uint8_t)body[0] == 0x1f && (uint8_t)body[1] == 0x8b;
}

// Skips a zero-terminated header field. false if it has no terminator
// before `end`.
static bool skip_cstring(const std::string& in, size_t& pos, size_t end)
{
    while (pos < end && in[pos] != '\0') ++pos;
    if (pos >= end) return false;
    ++pos;
    return true;
}

bool gzip_frame(const std::string& in, GzipFrame& frame, std::string& err)
{
    if (!looks_gzip(in) || (uint8_t)in[2] != GZ_CM_DEFLATE) {
        err = "not a deflate gzip stream";
        return false;
    }

    const uint8_t flags = (uint8_t)in[3];
    const size_t end = in.size() - GZ_TRAILER_LEN;
    size_t pos = GZ_HEADER_LEN;

    if (flags & GZ_FEXTRA) {
        if (pos + 2 > end) { err = "truncated gzip header"; return false; }
        const size_t xlen = (uint8_t)in[pos] | ((size_t)(uint8_t)in[pos + 1] << 8);
        pos += 2 + xlen;
    }
    if ((flags & GZ_FNAME) && !skip_cstring(in, pos, end)) {
        err = "truncated gzip header";
        return false;
    }
    if ((flags & GZ_FCOMMENT) && !skip_cstring(in, pos, end)) {
        err = "truncated gzip header";
        return false;
    }
    if (flags & GZ_FHCRC) pos += 2;
    if (pos >= end) {
        err = "truncated gzip header";
        return false;
    }

    const uint8_t* t = (const uint8_t*)in.data() + in.size() - 4;
    const size_t isize = (size_t)t[0] | ((size_t)t[1] << 8) | ((size_t)t[2] << 16) | ((size_t)t[3] << 24);
    if (isize == 0 || isize > GZIP_MAX_INFLATED) {
        err = "inflated size " + std::to_string(isize) + " out of range";
        return false;
    }

    frame.dataOffset = pos;
    frame.dataLen = end - pos;
    frame.isize = isize;
    return true;
}
