#include "snowcity/core/config_file.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace snowcity {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

ConfigFile::ConfigFile(std::filesystem::path path)
    : path_(std::move(path)) {
    (void)load(path_);
}

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    loaded_ = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        lines_.clear();
        keyToLine_.clear();
        values_.clear();
        dirty_ = false;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
    return true;
}

void ConfigFile::loadFromString(std::string_view content) {
    lines_.clear();
    keyToLine_.clear();
    values_.clear();
    dirty_ = false;
    parseLines(content);
    loaded_ = true;
}

void ConfigFile::parseLines(std::string_view content) {
    size_t pos = 0;

    while (pos < content.size()) {
        size_t lineEnd = content.find('\n', pos);
        std::string_view lineView;
        if (lineEnd == std::string_view::npos) {
            lineView = content.substr(pos);
            pos = content.size();
        } else {
            lineView = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        // Remove trailing \r
        if (!lineView.empty() && lineView.back() == '\r') {
            lineView.remove_suffix(1);
        }

        Line line;
        line.content = std::string(lineView);

        // Skip if empty, comment, or starts with whitespace
        if (!lineView.empty() && lineView[0] != '#' &&
            !std::isspace(static_cast<unsigned char>(lineView[0]))) {

            auto colonPos = lineView.find(':');
            if (colonPos != std::string_view::npos) {
                std::string key(trim(lineView.substr(0, colonPos)));

                size_t valueStart = colonPos + 1;
                while (valueStart < lineView.size() &&
                       std::isspace(static_cast<unsigned char>(lineView[valueStart]))) {
                    valueStart++;
                }

                line.key = key;
                line.valueStart = valueStart;
                line.isKeyValue = true;

                // Later lines override earlier for the same key
                keyToLine_[key] = lines_.size();

                auto valueStr = trim(lineView.substr(valueStart));
                if (!valueStr.empty()) {
                    values_[key] = parseValue(valueStr);
                } else {
                    values_.erase(key);
                }
            }
        }

        lines_.push_back(std::move(line));
    }
}

ConfigValue ConfigFile::parseValue(std::string_view valueStr) {
    if (valueStr == "true" || valueStr == "yes") {
        return true;
    }
    if (valueStr == "false" || valueStr == "no") {
        return false;
    }

    // strtoll/strtod need a terminated buffer
    std::string text(valueStr);
    const char* begin = text.c_str();
    const char* endOfText = begin + text.size();
    char* end = nullptr;

    long long intVal;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        intVal = std::strtoll(begin, &end, 16);
    } else {
        intVal = std::strtoll(begin, &end, 10);
    }
    if (end != begin && end == endOfText) {
        return static_cast<int64_t>(intVal);
    }

    double floatVal = std::strtod(begin, &end);
    if (end != begin && end == endOfText) {
        return floatVal;
    }

    return text;
}

bool ConfigFile::save() {
    return saveAs(path_);
}

bool ConfigFile::saveAs(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    if (lines_.empty() && !header_.empty()) {
        file << header_;
        if (header_.back() != '\n') {
            file << '\n';
        }
    }

    for (const auto& line : lines_) {
        file << line.content << '\n';
    }

    if (!file.good()) {
        return false;
    }

    path_ = path;
    dirty_ = false;
    return true;
}

bool ConfigFile::has(std::string_view key) const {
    return keyToLine_.find(std::string(key)) != keyToLine_.end();
}

const ConfigValue* ConfigFile::getRaw(std::string_view key) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* raw = getRaw(key)) {
        if (auto* val = std::get_if<std::string>(raw)) {
            return *val;
        }
    }
    return std::string(defaultVal);
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    if (auto* raw = getRaw(key)) {
        if (auto* val = std::get_if<int64_t>(raw)) {
            return *val;
        }
    }
    return defaultVal;
}

double ConfigFile::getFloat(std::string_view key, double defaultVal) const {
    if (auto* raw = getRaw(key)) {
        if (auto* val = std::get_if<double>(raw)) {
            return *val;
        }
        if (auto* val = std::get_if<int64_t>(raw)) {
            return static_cast<double>(*val);
        }
    }
    return defaultVal;
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    if (auto* raw = getRaw(key)) {
        if (auto* val = std::get_if<bool>(raw)) {
            return *val;
        }
        if (auto* val = std::get_if<int64_t>(raw)) {
            return *val != 0;
        }
    }
    return defaultVal;
}

std::vector<std::string> ConfigFile::keys() const {
    std::vector<std::string> result;
    for (const auto& line : lines_) {
        if (line.isKeyValue && keyToLine_.count(line.key) != 0) {
            result.push_back(line.key);
        }
    }
    return result;
}

int ConfigFile::findLine(std::string_view key) const {
    auto it = keyToLine_.find(std::string(key));
    if (it != keyToLine_.end()) {
        return static_cast<int>(it->second);
    }
    return -1;
}

void ConfigFile::setImpl(std::string_view key, const std::string& formattedValue, ConfigValue value) {
    int lineIdx = findLine(key);

    if (lineIdx >= 0) {
        // Replace just the value portion of the existing line
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = line.content.substr(0, line.valueStart) + formattedValue;
    } else {
        Line newLine;
        newLine.key = std::string(key);
        newLine.content = std::string(key) + ": " + formattedValue;
        newLine.valueStart = key.size() + 2;  // "key: " length
        newLine.isKeyValue = true;

        keyToLine_[std::string(key)] = lines_.size();
        lines_.push_back(std::move(newLine));
    }

    values_[std::string(key)] = std::move(value);
    dirty_ = true;
}

void ConfigFile::set(std::string_view key, std::string_view value) {
    setImpl(key, std::string(value), std::string(value));
}

void ConfigFile::set(std::string_view key, int64_t value) {
    setImpl(key, std::to_string(value), value);
}

void ConfigFile::set(std::string_view key, double value) {
    setImpl(key, formatValue(value), value);
}

void ConfigFile::set(std::string_view key, bool value) {
    setImpl(key, value ? "true" : "false", value);
}

void ConfigFile::remove(std::string_view key) {
    int lineIdx = findLine(key);
    if (lineIdx >= 0) {
        // Comment out the line instead of removing it
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = "# " + line.content;
        line.isKeyValue = false;

        keyToLine_.erase(std::string(key));
        values_.erase(std::string(key));
        dirty_ = true;
    }
}

std::string ConfigFile::formatValue(double value) {
    std::ostringstream oss;
    oss << value;
    std::string text = oss.str();
    // Keep a decimal point so the value reloads as a float
    if (text.find_first_of(".eEni") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace snowcity
