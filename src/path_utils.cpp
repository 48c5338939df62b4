#include "fineview/path_utils.hpp"
#include <cctype>
#include <stdexcept>
#include <vector>

namespace fineview {

namespace {

char toLowerAscii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Length of the directory part of path[0, length), npos if it has none
size_t parentLength(std::string_view path, size_t length) {
    auto slash = path.substr(0, length).rfind('/');
    return slash == std::string_view::npos ? std::string_view::npos : slash;
}

}  // namespace

std::string normalizePath(std::string_view path) {
    std::string work(path);
    for (auto& c : work) {
        if (c == '\\') c = '/';
    }

    std::string_view view(work);
    if (view.starts_with("~/")) {
        view.remove_prefix(2);
    }

    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= view.size()) {
        size_t next = view.find('/', pos);
        if (next == std::string_view::npos) next = view.size();

        auto segment = view.substr(pos, next - pos);
        if (segment.empty() || segment == ".") {
            // Skip
        } else if (segment == "..") {
            if (segments.empty()) {
                throw std::invalid_argument("Path escapes the application root: " + std::string(path));
            }
            segments.pop_back();
        } else {
            segments.push_back(segment);
        }
        pos = next + 1;
    }

    if (segments.empty()) {
        throw std::invalid_argument("Path is empty: '" + std::string(path) + "'");
    }

    std::string result;
    for (const auto& segment : segments) {
        if (!result.empty()) result += '/';
        result += segment;
    }
    return result;
}

std::string makeCacheKey(std::string_view normalizedPath, bool caseSensitive) {
    std::string key(normalizedPath);
    if (!caseSensitive) {
        for (auto& c : key) {
            c = toLowerAscii(c);
        }
    }
    return key;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLowerAscii(a[i]) != toLowerAscii(b[i])) return false;
    }
    return true;
}

std::string combinePath(std::string_view directory, std::string_view fileName) {
    if (directory.empty()) {
        return std::string(fileName);
    }
    std::string result(directory);
    result += '/';
    result += fileName;
    return result;
}

// ============================================================================
// AncestorImportPaths
// ============================================================================

AncestorImportPaths::AncestorImportPaths(std::string path, std::string importFileName)
    : path_(std::move(path)), importFileName_(std::move(importFileName)) {}

AncestorImportPaths::Iterator AncestorImportPaths::begin() const {
    if (path_.empty() || importFileName_.empty()) {
        return end();
    }

    size_t dir = parentLength(path_, path_.size());
    std::string_view fileName = dir == std::string::npos
        ? std::string_view(path_)
        : std::string_view(path_).substr(dir + 1);

    if (equalsIgnoreCase(fileName, importFileName_)) {
        // Root import file has no ancestors
        if (dir == std::string::npos) {
            return end();
        }
        dir = parentLength(path_, dir);
    }

    // A file at the root still sees the root import file
    return Iterator(this, dir == std::string::npos ? 0 : dir);
}

std::string AncestorImportPaths::Iterator::operator*() const {
    return combinePath(std::string_view(owner_->path_).substr(0, dirLength_),
                       owner_->importFileName_);
}

AncestorImportPaths::Iterator& AncestorImportPaths::Iterator::operator++() {
    if (dirLength_ == 0) {
        // Root visited
        dirLength_ = std::string::npos;
    } else if (dirLength_ != std::string::npos) {
        size_t parent = parentLength(owner_->path_, dirLength_);
        dirLength_ = parent == std::string::npos ? 0 : parent;
    }
    return *this;
}

}  // namespace fineview
