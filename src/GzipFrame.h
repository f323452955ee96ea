#pragma once

#include <stddef.h>
#include <string>

// Largest inflated body we accept; API responses are a few KB.
static constexpr size_t GZIP_MAX_INFLATED = 32 * 1024;

// Where the raw deflate data of a single gzip member sits (RFC 1952).
struct GzipFrame {
    size_t dataOffset = 0;   // first byte after the header
    size_t dataLen = 0;      // up to the CRC32 + ISIZE trailer
    size_t isize = 0;        // inflated size from the trailer
};

// Magic bytes plus room for the fixed header and trailer.
bool looks_gzip(const std::string& body);

// Walks the gzip header (FEXTRA, FNAME, FCOMMENT, FHCRC) and reads the
// trailer. false with err set when the stream is not deflate gzip, the
// header runs into the trailer, or ISIZE is 0 or above GZIP_MAX_INFLATED.
bool gzip_frame(const std::string& in, GzipFrame& frame, std::string& err);
