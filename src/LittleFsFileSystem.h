#pragma once

#include <string>

#include "FileStateStore.h"

// FileSystem on the mounted LittleFS partition.
class LittleFsFileSystem : public FileSystem {
public:
    bool exists(const std::string& path) override;
    bool mkdir(const std::string& path) override;
    bool readAll(const std::string& path, std::string& out) override;
    long writeAll(const std::string& path, const std::string& data) override;
    bool rename(const std::string& from, const std::string& to) override;
    bool remove(const std::string& path) override;
};
