#pragma once

#include "fineview/change_trigger.hpp"
#include "fineview/compilation_result.hpp"
#include <memory>
#include <string>

namespace fineview {

// ============================================================================
// CompilerCacheEntry - immutable record published in the cache
// ============================================================================
//
// Three shapes:
//   runtime compiled - result + trigger over the file and its import files
//   precompiled      - result, no trigger, never invalidated
//   not found        - null result + trigger on the missing path
//
// A "not found" entry remembers the exact spelling that was checked. Under a
// case-insensitive cache key it only answers for that spelling, since the
// provider may be case-sensitive.
//
// Entries are replaced, never mutated.
//
class CompilerCacheEntry {
    struct PrivateTag {};

public:
    using ResultPtr = std::shared_ptr<const CompilationResult>;

    [[nodiscard]] static std::shared_ptr<const CompilerCacheEntry>
    runtimeCompiled(ResultPtr result, ChangeTriggerPtr trigger) {
        return std::make_shared<const CompilerCacheEntry>(
            PrivateTag{}, std::move(result), std::move(trigger), false, std::string());
    }

    [[nodiscard]] static std::shared_ptr<const CompilerCacheEntry>
    precompiled(ResultPtr result) {
        return std::make_shared<const CompilerCacheEntry>(
            PrivateTag{}, std::move(result), nullptr, true, std::string());
    }

    [[nodiscard]] static std::shared_ptr<const CompilerCacheEntry>
    notFound(std::string checkedPath, ChangeTriggerPtr trigger) {
        return std::make_shared<const CompilerCacheEntry>(
            PrivateTag{}, nullptr, std::move(trigger), false, std::move(checkedPath));
    }

    // Only constructible through the factories above
    CompilerCacheEntry(PrivateTag, ResultPtr result, ChangeTriggerPtr trigger,
                       bool isPrecompiled, std::string checkedPath)
        : result_(std::move(result)),
          trigger_(std::move(trigger)),
          checkedPath_(std::move(checkedPath)),
          isPrecompiled_(isPrecompiled) {}

    [[nodiscard]] const ResultPtr& result() const { return result_; }
    [[nodiscard]] const ChangeTriggerPtr& trigger() const { return trigger_; }
    [[nodiscard]] bool isPrecompiled() const { return isPrecompiled_; }
    [[nodiscard]] bool isNotFound() const { return result_ == nullptr; }

    // Normalized path the provider was asked for. Empty unless not found.
    [[nodiscard]] const std::string& checkedPath() const { return checkedPath_; }

    // Precompiled entries never go stale. Others are stale once their
    // trigger has expired.
    [[nodiscard]] bool isStale() const {
        if (isPrecompiled_) return false;
        return !trigger_ || trigger_->isExpired();
    }

    // Whether this entry may answer a lookup for the given normalized path
    [[nodiscard]] bool answers(const std::string& normalizedPath) const {
        return !isNotFound() || checkedPath_ == normalizedPath;
    }

private:
    ResultPtr result_;
    ChangeTriggerPtr trigger_;
    std::string checkedPath_;
    bool isPrecompiled_;
};

}  // namespace fineview
