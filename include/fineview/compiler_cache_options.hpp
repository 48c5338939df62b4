#pragma once

#include "fineview/path_utils.hpp"
#include <filesystem>
#include <string>

namespace fineview {

class ConfigFile;

// Settings for CompilerCache
//
// Config keys (see ConfigFile):
//   cache.import_file_name: _ViewImports.cshtml
//   cache.case_sensitive: false
//   debug.logging: false
struct CompilerCacheOptions {
    // Name of the per-directory import file whose changes invalidate views
    // in that directory and below
    std::string importFileName = std::string(DEFAULT_IMPORT_FILE_NAME);

    // When false, "Views/Index.cshtml" and "views/index.cshtml" share an entry
    bool caseSensitive = false;

    // Trace lookups, compiles and invalidations to stderr
    bool debugLogging = false;

    // Read options from a parsed config, missing keys keep their defaults
    [[nodiscard]] static CompilerCacheOptions fromConfig(const ConfigFile& config);

    // Load options from a config file. Returns defaults if the file doesn't exist.
    [[nodiscard]] static CompilerCacheOptions load(const std::filesystem::path& configPath);

    // Throws std::invalid_argument for unusable settings
    void validate() const;
};

}  // namespace fineview
