#include "LittleFsFileSystem.h"

#include <Arduino.h>
#include <LittleFS.h>

bool LittleFsFileSystem::exists(const std::string& path)
{
    return LittleFS.exists(path.c_str());
}

bool LittleFsFileSystem::mkdir(const std::string& path)
{
    return LittleFS.mkdir(path.c_str());
}

bool LittleFsFileSystem::readAll(const std::string& path, std::string& out)
{
    File file = LittleFS.open(path.c_str(), FILE_READ);
    if (!file) return false;

    out.clear();
    out.reserve(file.size());
    uint8_t buf[256];
    while (file.available()) {
        const size_t n = file.read(buf, sizeof(buf));
        if (n == 0) break;
        out.append((const char*)buf, n);
    }
    file.close();
    return true;
}

long LittleFsFileSystem::writeAll(const std::string& path, const std::string& data)
{
    File file = LittleFS.open(path.c_str(), FILE_WRITE);
    if (!file) return -1;

    const size_t written = file.write((const uint8_t*)data.data(), data.size());
    file.close();
    return (long)written;
}

// littlefs replaces an existing target atomically
bool LittleFsFileSystem::rename(const std::string& from, const std::string& to)
{
    return LittleFS.rename(from.c_str(), to.c_str());
}

bool LittleFsFileSystem::remove(const std::string& path)
{
    return LittleFS.remove(path.c_str());
}
