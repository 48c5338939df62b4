#pragma once

/**
 * @file path_utils.hpp
 * @brief Relative path normalization and ancestor import file enumeration
 */

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

namespace fineview {

// Default name of the per-directory import file
inline constexpr std::string_view DEFAULT_IMPORT_FILE_NAME = "_ViewImports.cshtml";

// Normalize an application-relative path:
//   - '\' is treated as a separator
//   - leading "~/" and "/" are stripped
//   - empty and "." segments are dropped, ".." removes the previous segment
// Throws std::invalid_argument if the result is empty or escapes the root.
//   "/Views//Home/./Index.cshtml" -> "Views/Home/Index.cshtml"
//   "~/Views/Shared/../Home/x"    -> "Views/Home/x"
[[nodiscard]] std::string normalizePath(std::string_view path);

// Key used for cache lookups. ASCII lower-cased unless caseSensitive.
[[nodiscard]] std::string makeCacheKey(std::string_view normalizedPath, bool caseSensitive);

// Case-insensitive (ASCII) string equality
[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b);

// Join a directory and a file name with '/', directory may be empty
[[nodiscard]] std::string combinePath(std::string_view directory, std::string_view fileName);

// ============================================================================
// AncestorImportPaths - import files that apply to a path, nearest first
// ============================================================================
//
// For "Views/Home/Index.cshtml" and "_ViewImports.cshtml" yields:
//   Views/Home/_ViewImports.cshtml
//   Views/_ViewImports.cshtml
//   _ViewImports.cshtml
//
// If the path names an import file itself, enumeration starts at the parent
// directory (an import file never depends on itself).
//
// The range is lazy and does no I/O. It can be iterated any number of times.
// The path should already be normalized (see normalizePath).
//
class AncestorImportPaths {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = std::string;

        Iterator() = default;

        [[nodiscard]] std::string operator*() const;

        Iterator& operator++();
        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        [[nodiscard]] bool operator==(const Iterator& other) const {
            return owner_ == other.owner_ && dirLength_ == other.dirLength_;
        }
        [[nodiscard]] bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class AncestorImportPaths;
        Iterator(const AncestorImportPaths* owner, size_t dirLength)
            : owner_(owner), dirLength_(dirLength) {}

        const AncestorImportPaths* owner_ = nullptr;
        // Length of the directory prefix of owner_->path_, npos at end
        size_t dirLength_ = std::string::npos;
    };

    AncestorImportPaths(std::string path, std::string importFileName);

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const { return Iterator(this, std::string::npos); }

    [[nodiscard]] bool empty() const { return begin() == end(); }

    [[nodiscard]] const std::string& importFileName() const { return importFileName_; }

private:
    std::string path_;
    std::string importFileName_;
};

}  // namespace fineview
