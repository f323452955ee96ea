#pragma once

#include <string>

// Flat key/file storage behind the disk cache. Names are bare file names
// ("geo_cache.json"); the store decides the directory.
class StateStore {
public:
    virtual ~StateStore() {}

    // false when missing or unreadable.
    virtual bool read(const std::string& name, std::string& out) = 0;

    // Write a sibling temp file, then rename it over the target, so a reset
    // mid-write never leaves a torn file behind.
    virtual bool writeAtomic(const std::string& name, const std::string& data) = 0;

    // Human readable reason for the last failed call.
    virtual const char* lastError() const = 0;
};
