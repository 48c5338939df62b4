#pragma once

#include "fineview/compilation_result.hpp"
#include <memory>

namespace fineview {

// ============================================================================
// CompilerCacheResult - outcome of CompilerCache::getOrAdd()
// ============================================================================
//
// Either "file not found" (no payload) or "found" with the compilation
// result and whether it was already available without compiling.
//
// fileNotFound() returns a shared constant, and equality compares the tag and
// the identity of the compilation result, so
//   cache.getOrAdd(path, compile) == CompilerCacheResult::fileNotFound()
// is the way to branch on a missing file.
//
class CompilerCacheResult {
public:
    using ResultPtr = std::shared_ptr<const CompilationResult>;

    [[nodiscard]] static const CompilerCacheResult& fileNotFound();

    [[nodiscard]] static CompilerCacheResult found(ResultPtr result, bool fromCache) {
        return CompilerCacheResult(std::move(result), fromCache);
    }

    [[nodiscard]] bool isFound() const { return result_ != nullptr; }

    // Null when the file was not found
    [[nodiscard]] const ResultPtr& compilationResult() const { return result_; }

    // True when no compilation was performed to produce this result
    [[nodiscard]] bool isFromCache() const { return fromCache_; }

    [[nodiscard]] bool operator==(const CompilerCacheResult& other) const {
        return result_ == other.result_;
    }
    [[nodiscard]] bool operator!=(const CompilerCacheResult& other) const { return !(*this == other); }

private:
    CompilerCacheResult() = default;
    CompilerCacheResult(ResultPtr result, bool fromCache)
        : result_(std::move(result)), fromCache_(fromCache) {}

    ResultPtr result_;
    bool fromCache_ = false;
};

inline const CompilerCacheResult& CompilerCacheResult::fileNotFound() {
    static const CompilerCacheResult instance;
    return instance;
}

}  // namespace fineview
