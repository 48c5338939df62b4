#include "fineview/config_file.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fineview {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    values_.clear();
    loaded_ = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());

    loaded_ = true;
    return true;
}

void ConfigFile::parse(std::string_view content) {
    values_.clear();
    size_t pos = 0;

    while (pos < content.size()) {
        // Find end of line
        size_t lineEnd = content.find('\n', pos);
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = content.substr(pos);
            pos = content.size();
        } else {
            line = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        // Remove trailing \r
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        // Skip if empty, comment, or starts with whitespace
        if (line.empty() || line[0] == '#' ||
            std::isspace(static_cast<unsigned char>(line[0]))) {
            continue;
        }

        auto colonPos = line.find(':');
        if (colonPos == std::string_view::npos) {
            continue;
        }

        auto key = trim(line.substr(0, colonPos));
        auto value = trim(line.substr(colonPos + 1));
        if (key.empty() || value.empty()) {
            continue;
        }

        values_[std::string(key)] = parseValue(value);
    }
}

ConfigFile::Value ConfigFile::parseValue(std::string_view text) {
    if (text == "true" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "no") {
        return false;
    }

    // strtoll/strtod need a terminated buffer
    std::string buffer(text);
    char* end = nullptr;

    long long intVal;
    if (buffer.size() > 2 && buffer[0] == '0' && (buffer[1] == 'x' || buffer[1] == 'X')) {
        intVal = std::strtoll(buffer.c_str(), &end, 16);
    } else {
        intVal = std::strtoll(buffer.c_str(), &end, 10);
    }
    if (end != buffer.c_str() && end == buffer.c_str() + buffer.size()) {
        return static_cast<int64_t>(intVal);
    }

    double floatVal = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() && end == buffer.c_str() + buffer.size()) {
        return floatVal;
    }

    return buffer;
}

const ConfigFile::Value* ConfigFile::find(std::string_view key) const {
    auto it = values_.find(std::string(key));
    return it == values_.end() ? nullptr : &it->second;
}

bool ConfigFile::has(std::string_view key) const {
    return find(key) != nullptr;
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    const auto* value = find(key);
    if (value) {
        if (const auto* str = std::get_if<std::string>(value)) {
            return *str;
        }
    }
    return std::string(defaultVal);
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    const auto* value = find(key);
    if (value) {
        if (const auto* i = std::get_if<int64_t>(value)) {
            return *i;
        }
    }
    return defaultVal;
}

double ConfigFile::getFloat(std::string_view key, double defaultVal) const {
    const auto* value = find(key);
    if (value) {
        if (const auto* d = std::get_if<double>(value)) {
            return *d;
        }
        if (const auto* i = std::get_if<int64_t>(value)) {
            return static_cast<double>(*i);
        }
    }
    return defaultVal;
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    const auto* value = find(key);
    if (value) {
        if (const auto* b = std::get_if<bool>(value)) {
            return *b;
        }
    }
    return defaultVal;
}

}  // namespace fineview
