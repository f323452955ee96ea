#include "FileStateStore.h"

#include <utility>

#include "Log.h"

static constexpr const char* TAG = "FS";

FileStateStore::FileStateStore(FileSystem& fs, std::string dir)
: fs_(fs), dir_(std::move(dir)) {}

std::string FileStateStore::pathOf(const std::string& name) const
{
    if (dir_.empty() || dir_ == "/") return "/" + name;
    return dir_ + "/" + name;
}

bool FileStateStore::fail_(const char* why)
{
    lastError_.store(why);
    return false;
}

bool FileStateStore::begin()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (dir_.empty() || dir_ == "/" || fs_.exists(dir_)) return true;

    if (!fs_.mkdir(dir_)) {
        panel_log(TAG, "mkdir %s failed", dir_.c_str());
        return fail_("mkdir failed");
    }
    panel_log(TAG, "created %s", dir_.c_str());
    return true;
}

bool FileStateStore::read(const std::string& name, std::string& out)
{
    const std::string path = pathOf(name);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs_.exists(path)) return fail_("not found");
    if (!fs_.readAll(path, out)) return fail_("open for read failed");
    return true;
}

bool FileStateStore::writeAtomic(const std::string& name, const std::string& data)
{
    const std::string path = pathOf(name);
    const std::string tmp = path + ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);

    const long written = fs_.writeAll(tmp, data);
    if (written < 0) {
        // a failed open can still leave an empty file behind
        if (fs_.exists(tmp) && !fs_.remove(tmp)) {
            panel_log(TAG, "could not remove %s", tmp.c_str());
        }
        return fail_("open temp file failed");
    }

    if ((size_t)written != data.size()) {
        if (!fs_.remove(tmp)) panel_log(TAG, "could not remove %s", tmp.c_str());
        panel_log(TAG, "short write %s: %ld of %u bytes", tmp.c_str(), written, (unsigned)data.size());
        return fail_("short write (filesystem full?)");
    }

    if (!fs_.rename(tmp, path)) {
        if (!fs_.remove(tmp)) panel_log(TAG, "could not remove %s", tmp.c_str());
        panel_log(TAG, "rename %s failed", tmp.c_str());
        return fail_("rename failed");
    }
    return true;
}
