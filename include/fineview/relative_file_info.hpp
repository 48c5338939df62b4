#pragma once

#include "fineview/file_provider.hpp"
#include <optional>
#include <string>

namespace fineview {

// File handed to a compile callback: provider metadata plus the normalized
// application-relative path it was looked up under.
//
// Only valid for the duration of the callback; the provider is not owned.
class RelativeFileInfo {
public:
    RelativeFileInfo(FileInfo fileInfo, std::string relativePath, const FileProvider& provider)
        : fileInfo_(std::move(fileInfo)),
          relativePath_(std::move(relativePath)),
          provider_(&provider) {}

    [[nodiscard]] const FileInfo& fileInfo() const { return fileInfo_; }
    [[nodiscard]] const std::string& relativePath() const { return relativePath_; }

    // Read the file through the provider. nullopt if it vanished meanwhile.
    [[nodiscard]] std::optional<std::string> readContent() const {
        return provider_->readFile(relativePath_);
    }

private:
    FileInfo fileInfo_;
    std::string relativePath_;
    const FileProvider* provider_;
};

}  // namespace fineview
