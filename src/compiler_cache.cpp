#include "fineview/compiler_cache.hpp"
#include "fineview/path_utils.hpp"
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace fineview {

CompilerCache::CompilerCache(FileProvider& fileProvider,
                             const PrecompiledViews& precompiledViews,
                             CompilerCacheOptions options)
    : fileProvider_(fileProvider), options_(std::move(options)) {
    options_.validate();

    for (const auto& [path, type] : precompiledViews) {
        std::string key;
        try {
            key = makeCacheKey(normalizePath(path), options_.caseSensitive);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(std::string("CompilerCache: invalid precompiled view path: ") + e.what());
        }

        auto result = std::make_shared<const CompilationResult>(CompilationResult::successful(type));
        if (!precompiled_.emplace(std::move(key), std::move(result)).second) {
            throw std::invalid_argument("CompilerCache: duplicate precompiled view '" + path + "'");
        }
    }
}

CompilerCacheResult CompilerCache::getOrAdd(const std::string& path, const CompileCallback& compile) {
    auto normalized = normalizePath(path);
    auto key = makeCacheKey(normalized, options_.caseSensitive);

    if (auto entry = findEntry(key)) {
        if (!entry->answers(normalized)) {
            // "Not found" under another spelling says nothing about this one
            if (options_.debugLogging) {
                std::cerr << "[CompilerCache] '" << normalized << "' shares a key with missing '"
                          << entry->checkedPath() << "', checking the file\n";
            }
        } else if (!entry->isStale()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            if (entry->isNotFound()) {
                return CompilerCacheResult::fileNotFound();
            }
            return CompilerCacheResult::found(entry->result(), true);
        } else if (options_.debugLogging) {
            std::cerr << "[CompilerCache] '" << normalized << "' changed, recompiling\n";
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    return onCacheMiss(normalized, key, compile);
}

CompilerCacheResult CompilerCache::onCacheMiss(const std::string& path, const std::string& key,
                                               const CompileCallback& compile) {
    // Precompiled views need neither a file nor a trigger
    auto precompiled = precompiled_.find(key);
    if (precompiled != precompiled_.end()) {
        publish(key, CompilerCacheEntry::precompiled(precompiled->second));
        return CompilerCacheResult::found(precompiled->second, true);
    }

    // Watch before checking, so a change made while we check or compile
    // expires the entry we are about to publish
    auto trigger = fileProvider_.watch(watchedPaths(path));

    auto fileInfo = fileProvider_.getFileInfo(path);
    if (!fileInfo) {
        notFound_.fetch_add(1, std::memory_order_relaxed);
        if (options_.debugLogging) {
            std::cerr << "[CompilerCache] '" << path << "' not found\n";
        }
        publish(key, CompilerCacheEntry::notFound(path, std::move(trigger)));
        return CompilerCacheResult::fileNotFound();
    }

    RelativeFileInfo file(std::move(*fileInfo), path, fileProvider_);
    ResultPtr result;
    try {
        result = compile(file);
        if (!result) {
            throw std::runtime_error("CompilerCache: compile callback returned no result for '" + path + "'");
        }
        result->ensureSuccessful();
    } catch (const std::exception& e) {
        if (options_.debugLogging) {
            std::cerr << "[CompilerCache] Compilation of '" << path << "' failed: " << e.what() << "\n";
        }
        throw;
    }

    compilations_.fetch_add(1, std::memory_order_relaxed);
    if (options_.debugLogging) {
        std::cerr << "[CompilerCache] Compiled '" << path << "'\n";
    }

    publish(key, CompilerCacheEntry::runtimeCompiled(result, std::move(trigger)));
    return CompilerCacheResult::found(std::move(result), false);
}

std::vector<std::string> CompilerCache::watchedPaths(const std::string& path) const {
    std::vector<std::string> paths;
    paths.push_back(path);
    for (auto importPath : AncestorImportPaths(path, options_.importFileName)) {
        paths.push_back(std::move(importPath));
    }
    return paths;
}

CompilerCache::EntryPtr CompilerCache::findEntry(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

void CompilerCache::publish(const std::string& key, EntryPtr entry) {
    std::unique_lock lock(mutex_);
    entries_[key] = std::move(entry);
}

size_t CompilerCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

CompilerCache::Stats CompilerCache::stats() const {
    Stats stats;
    stats.entries = size();
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.compilations = compilations_.load(std::memory_order_relaxed);
    stats.notFound = notFound_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace fineview
