#pragma once

/**
 * @file config_file.hpp
 * @brief Reader for "key: value" configuration files
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace fineview {

// ============================================================================
// ConfigFile - parsed "key: value" configuration
// ============================================================================
//
// Format:
//   # comment
//   cache.import_file_name: _ViewImports.cshtml
//   cache.case_sensitive: false
//   debug.logging: yes
//
// Values are typed on load: true/yes/false/no are booleans, decimal or 0x
// hex integers are integers, other numbers are floats, anything else is a
// string. Later lines override earlier ones for the same key. Lines that
// start with whitespace or have no ':' are ignored.
//
// Usage:
//   ConfigFile config;
//   if (config.load("fineview.conf")) {
//       auto name = config.getString("cache.import_file_name", "_ViewImports.cshtml");
//   }
//
class ConfigFile {
public:
    using Value = std::variant<bool, int64_t, double, std::string>;

    ConfigFile() = default;

    // Load from file (returns false if file doesn't exist or can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Parse from a string (replaces any loaded content)
    void parse(std::string_view content);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] bool has(std::string_view key) const;
    [[nodiscard]] size_t size() const { return values_.size(); }

    // Typed reads. Return the default when the key is missing or holds a
    // different type (integers are accepted where floats are asked for).
    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;
    [[nodiscard]] double getFloat(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

private:
    [[nodiscard]] const Value* find(std::string_view key) const;
    [[nodiscard]] static Value parseValue(std::string_view text);

    std::filesystem::path path_;
    std::unordered_map<std::string, Value> values_;
    bool loaded_ = false;
};

}  // namespace fineview
