#include "fineview/compiler_cache_options.hpp"
#include "fineview/config_file.hpp"
#include <iostream>
#include <stdexcept>

namespace fineview {

CompilerCacheOptions CompilerCacheOptions::fromConfig(const ConfigFile& config) {
    CompilerCacheOptions options;
    options.importFileName = config.getString("cache.import_file_name", options.importFileName);
    options.caseSensitive = config.getBool("cache.case_sensitive", options.caseSensitive);
    options.debugLogging = config.getBool("debug.logging", options.debugLogging);
    return options;
}

CompilerCacheOptions CompilerCacheOptions::load(const std::filesystem::path& configPath) {
    ConfigFile config;
    if (!config.load(configPath)) {
        return {};
    }

    auto options = fromConfig(config);
    if (options.debugLogging) {
        std::cerr << "[CompilerCacheOptions] Loaded " << configPath.string()
                  << " (import file: " << options.importFileName
                  << ", case sensitive: " << (options.caseSensitive ? "yes" : "no") << ")\n";
    }
    return options;
}

void CompilerCacheOptions::validate() const {
    if (importFileName.empty()) {
        throw std::invalid_argument("CompilerCacheOptions: import file name must not be empty");
    }
    if (importFileName.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("CompilerCacheOptions: import file name must not contain a directory: " +
                                    importFileName);
    }
}

}  // namespace fineview
