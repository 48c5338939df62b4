#pragma once

/**
 * @file physical_file_provider.hpp
 * @brief FileProvider over a directory on disk, with polling triggers
 */

#include "fineview/file_provider.hpp"
#include <chrono>
#include <filesystem>

namespace fineview {

// ============================================================================
// PhysicalFileProvider - FileProvider rooted at a directory
// ============================================================================
//
// Relative paths resolve against the root. Paths that normalize to outside
// the root are never found.
//
// watch() snapshots (exists, size, mtime) of every watched path. The trigger
// re-checks the snapshot when isExpired() is called and latches expired on
// the first difference. Missing paths are snapshotted as missing, so a later
// creation is reported.
//
// Limits:
// - A poll stats every watched path, so checking a trigger costs N stat
//   calls rather than a flag read. With a non-zero pollInterval a trigger
//   polls at most once per interval and reports its last answer in between,
//   trading change latency for cheaper cache hits.
// - A rewrite that keeps the size and lands within the file system's mtime
//   granularity is not detected.
//
// Thread safety: All public methods are thread-safe.
//
class PhysicalFileProvider : public FileProvider {
public:
    explicit PhysicalFileProvider(std::filesystem::path root,
                                  std::chrono::milliseconds pollInterval = std::chrono::milliseconds(0));

    [[nodiscard]] std::optional<FileInfo> getFileInfo(const std::string& path) const override;
    [[nodiscard]] std::optional<std::string> readFile(const std::string& path) const override;
    [[nodiscard]] ChangeTriggerPtr watch(const std::vector<std::string>& paths) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::chrono::milliseconds pollInterval() const { return pollInterval_; }

    // Physical path for a relative path, empty if it escapes the root
    [[nodiscard]] std::filesystem::path resolve(const std::string& path) const;

private:
    std::filesystem::path root_;
    std::chrono::milliseconds pollInterval_;
};

}  // namespace fineview
