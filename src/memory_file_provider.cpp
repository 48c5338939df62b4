#include "fineview/memory_file_provider.hpp"
#include "fineview/path_utils.hpp"
#include <mutex>
#include <stdexcept>

namespace fineview {

std::string MemoryFileProvider::keyFor(const std::string& path) {
    try {
        return normalizePath(path);
    } catch (const std::invalid_argument&) {
        // Unreachable paths map to an empty key, which never holds a file
        return {};
    }
}

std::optional<FileInfo> MemoryFileProvider::getFileInfo(const std::string& path) const {
    auto key = keyFor(path);

    std::shared_lock lock(mutex_);
    auto it = files_.find(key);
    if (it == files_.end()) {
        return std::nullopt;
    }

    FileInfo info;
    auto slash = key.rfind('/');
    info.name = slash == std::string::npos ? key : key.substr(slash + 1);
    info.length = it->second.content.size();
    info.lastModified = it->second.lastModified;
    return info;
}

std::optional<std::string> MemoryFileProvider::readFile(const std::string& path) const {
    auto key = keyFor(path);

    std::shared_lock lock(mutex_);
    auto it = files_.find(key);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second.content;
}

ChangeTriggerPtr MemoryFileProvider::watch(const std::vector<std::string>& paths) {
    std::vector<ChangeTriggerPtr> triggers;
    triggers.reserve(paths.size());

    std::unique_lock lock(mutex_);
    for (const auto& path : paths) {
        auto key = keyFor(path);
        if (key.empty()) continue;

        auto trigger = liveTriggerLocked(key);
        if (trigger->isExpired()) {
            // Expired triggers are one-shot, hand out a fresh one
            trigger = std::make_shared<FlagChangeTrigger>();
            triggers_[key] = trigger;
        }
        triggers.push_back(std::move(trigger));
    }

    return std::make_shared<CompositeChangeTrigger>(std::move(triggers));
}

void MemoryFileProvider::addFile(const std::string& path, std::string content) {
    auto key = keyFor(path);
    if (key.empty()) {
        throw std::invalid_argument("MemoryFileProvider: invalid file path '" + path + "'");
    }

    std::unique_lock lock(mutex_);
    files_[key] = File{std::move(content), std::filesystem::file_time_type::clock::now()};
    expireLocked(key);
}

bool MemoryFileProvider::deleteFile(const std::string& path) {
    auto key = keyFor(path);

    std::unique_lock lock(mutex_);
    if (files_.erase(key) == 0) {
        return false;
    }
    expireLocked(key);
    return true;
}

std::shared_ptr<FlagChangeTrigger> MemoryFileProvider::getTrigger(const std::string& path) {
    auto key = keyFor(path);
    if (key.empty()) {
        throw std::invalid_argument("MemoryFileProvider: invalid file path '" + path + "'");
    }

    std::unique_lock lock(mutex_);
    return liveTriggerLocked(key);
}

void MemoryFileProvider::expire(const std::string& path) {
    auto key = keyFor(path);

    std::unique_lock lock(mutex_);
    expireLocked(key);
}

size_t MemoryFileProvider::fileCount() const {
    std::shared_lock lock(mutex_);
    return files_.size();
}

std::shared_ptr<FlagChangeTrigger> MemoryFileProvider::liveTriggerLocked(const std::string& key) {
    auto& slot = triggers_[key];
    if (!slot) {
        slot = std::make_shared<FlagChangeTrigger>();
    }
    return slot;
}

void MemoryFileProvider::expireLocked(const std::string& key) {
    auto it = triggers_.find(key);
    if (it != triggers_.end()) {
        it->second->expire();
    }
}

}  // namespace fineview
