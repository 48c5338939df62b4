#pragma once

/**
 * @file file_provider.hpp
 * @brief File lookup and change notification used by the compiler cache
 */

#include "fineview/change_trigger.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fineview {

// Metadata for an existing file
struct FileInfo {
    std::string name;                     // File name without directory
    std::filesystem::path physicalPath;   // Empty for non-physical providers
    uint64_t length = 0;
    std::filesystem::file_time_type lastModified{};
};

// ============================================================================
// FileProvider - file-system abstraction consumed by CompilerCache
// ============================================================================
//
// Paths are application-relative and '/'-separated (see normalizePath).
//
// Thread safety: implementations must allow concurrent calls.
//
class FileProvider {
public:
    virtual ~FileProvider() = default;

    // Returns nullopt if the file does not exist
    [[nodiscard]] virtual std::optional<FileInfo> getFileInfo(const std::string& path) const = 0;

    // Returns nullopt if the file does not exist or cannot be read
    [[nodiscard]] virtual std::optional<std::string> readFile(const std::string& path) const = 0;

    // Watch all paths together. The returned trigger expires when any of them
    // is created, modified or deleted. Paths that do not exist yet are valid.
    [[nodiscard]] virtual ChangeTriggerPtr watch(const std::vector<std::string>& paths) = 0;
};

}  // namespace fineview
