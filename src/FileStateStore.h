#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "StateStore.h"

// Raw file operations on absolute paths. The board implements them on
// LittleFS; tests use an in-memory one that can fail on demand.
class FileSystem {
public:
    virtual ~FileSystem() {}

    virtual bool exists(const std::string& path) = 0;
    virtual bool mkdir(const std::string& path) = 0;
    virtual bool readAll(const std::string& path, std::string& out) = 0;

    // Creates or truncates `path`. Returns the bytes written, -1 if the file
    // could not be opened.
    virtual long writeAll(const std::string& path, const std::string& data) = 0;

    // Replaces an existing target.
    virtual bool rename(const std::string& from, const std::string& to) = 0;
    virtual bool remove(const std::string& path) = 0;
};

// StateStore over a FileSystem. Files live under one directory
// (paths.state_dir); writes go to "<name>.tmp" and are renamed into place,
// and a failed write never leaves the temp file or touches the old target.
class FileStateStore : public StateStore {
public:
    FileStateStore(FileSystem& fs, std::string dir);

    // Creates the state directory if needed. The filesystem must be mounted.
    bool begin();

    bool read(const std::string& name, std::string& out) override;
    bool writeAtomic(const std::string& name, const std::string& data) override;
    const char* lastError() const override { return lastError_.load(); }

    // Full path of a state file.
    std::string pathOf(const std::string& name) const;

private:
    bool fail_(const char* why);

    FileSystem& fs_;
    const std::string dir_;
    std::mutex mutex_;   // one file operation at a time across poller tasks
    std::atomic<const char*> lastError_{""};
};
