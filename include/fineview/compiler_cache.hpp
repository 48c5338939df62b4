#pragma once

/**
 * @file compiler_cache.hpp
 * @brief Path-keyed cache of compiled views with change-based invalidation
 */

#include "fineview/compilation_result.hpp"
#include "fineview/compiler_cache_entry.hpp"
#include "fineview/compiler_cache_options.hpp"
#include "fineview/compiler_cache_result.hpp"
#include "fineview/file_provider.hpp"
#include "fineview/relative_file_info.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fineview {

// Views compiled ahead of time: relative path -> compiled type
using PrecompiledViews = std::vector<std::pair<std::string, std::type_index>>;

// ============================================================================
// CompilerCache - memoizes view compilation per file
// ============================================================================
//
// getOrAdd() returns the cached result for a path while it is fresh, and
// compiles it otherwise. A runtime-compiled entry goes stale when the file or
// any ancestor import file (see AncestorImportPaths) is created, modified or
// deleted. Precompiled views are served from the table given at construction
// and are never recompiled, whatever their files do.
//
// Missing files are cached as "not found" until the path changes.
//
// Thread safety: All public methods are thread-safe. Compilation runs
// outside the lock, so two threads missing on the same path at once may both
// compile; the last one to finish wins. Readers only ever see fully built
// entries.
//
class CompilerCache {
public:
    using ResultPtr = std::shared_ptr<const CompilationResult>;

    // Compile callback. Must return a non-null result. Failed results (see
    // CompilationResult::failed) and exceptions propagate out of getOrAdd().
    using CompileCallback = std::function<ResultPtr(const RelativeFileInfo&)>;

    // Throws std::invalid_argument if a precompiled path is invalid or two
    // precompiled paths map to the same cache key, or if options are invalid.
    explicit CompilerCache(FileProvider& fileProvider,
                           const PrecompiledViews& precompiledViews = {},
                           CompilerCacheOptions options = {});

    CompilerCache(const CompilerCache&) = delete;
    CompilerCache& operator=(const CompilerCache&) = delete;

    // Get the compiled view for a path, compiling it if needed.
    // compile is not called on a fresh hit, for precompiled views, or when
    // the file doesn't exist.
    // Throws std::invalid_argument for empty paths or paths escaping the root.
    [[nodiscard]] CompilerCacheResult getOrAdd(const std::string& path, const CompileCallback& compile);

    // Number of published entries (including "not found" entries)
    [[nodiscard]] size_t size() const;

    [[nodiscard]] const CompilerCacheOptions& options() const { return options_; }

    struct Stats {
        size_t entries = 0;
        size_t hits = 0;          // Fresh entries served
        size_t misses = 0;        // Lookups that found nothing or a stale entry
        size_t compilations = 0;  // Successful compile callbacks
        size_t notFound = 0;      // Misses for files that don't exist
    };
    [[nodiscard]] Stats stats() const;

private:
    using EntryPtr = std::shared_ptr<const CompilerCacheEntry>;

    [[nodiscard]] EntryPtr findEntry(const std::string& key) const;
    void publish(const std::string& key, EntryPtr entry);

    CompilerCacheResult onCacheMiss(const std::string& path, const std::string& key,
                                    const CompileCallback& compile);

    // Paths whose changes invalidate a view: itself, then its import files
    [[nodiscard]] std::vector<std::string> watchedPaths(const std::string& path) const;

    FileProvider& fileProvider_;
    CompilerCacheOptions options_;

    // Immutable after construction, read without locking
    std::unordered_map<std::string, ResultPtr> precompiled_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, EntryPtr> entries_;

    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> compilations_{0};
    std::atomic<size_t> notFound_{0};
};

}  // namespace fineview
