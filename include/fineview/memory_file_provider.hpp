#pragma once

/**
 * @file memory_file_provider.hpp
 * @brief In-memory FileProvider with explicitly expirable triggers
 */

#include "fineview/file_provider.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace fineview {

// ============================================================================
// MemoryFileProvider - FileProvider over an in-memory file table
// ============================================================================
//
// Each path has at most one live FlagChangeTrigger. watch() hands out the
// live trigger for every path (replacing expired ones with fresh triggers)
// and combines them into a CompositeChangeTrigger.
//
// addFile() and deleteFile() expire the path's trigger, like a real file
// system would. getTrigger() exposes the live trigger so it can be expired
// by hand.
//
// Thread safety: All public methods are thread-safe.
//
class MemoryFileProvider : public FileProvider {
public:
    MemoryFileProvider() = default;

    [[nodiscard]] std::optional<FileInfo> getFileInfo(const std::string& path) const override;
    [[nodiscard]] std::optional<std::string> readFile(const std::string& path) const override;
    [[nodiscard]] ChangeTriggerPtr watch(const std::vector<std::string>& paths) override;

    // Add or replace a file
    void addFile(const std::string& path, std::string content);

    // Remove a file. Returns false if it did not exist.
    bool deleteFile(const std::string& path);

    // Live trigger for a path, created if none exists yet
    [[nodiscard]] std::shared_ptr<FlagChangeTrigger> getTrigger(const std::string& path);

    // Expire the live trigger for a path (no-op if the path was never watched)
    void expire(const std::string& path);

    [[nodiscard]] size_t fileCount() const;

private:
    struct File {
        std::string content;
        std::filesystem::file_time_type lastModified;
    };

    // Requires unique lock
    std::shared_ptr<FlagChangeTrigger> liveTriggerLocked(const std::string& key);
    void expireLocked(const std::string& key);

    // Files and triggers are keyed by normalized path
    [[nodiscard]] static std::string keyFor(const std::string& path);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, File> files_;
    std::unordered_map<std::string, std::shared_ptr<FlagChangeTrigger>> triggers_;
};

}  // namespace fineview
