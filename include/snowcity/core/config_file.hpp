#pragma once

/**
 * @file config_file.hpp
 * @brief Config file parsing with comment preservation
 *
 * File format (one setting per line):
 *   # comment
 *   player.run_speed: 0.15
 *   city.seed: 0x5eed
 *   debug.logging: yes
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace snowcity {

// Parsed value of one config line
using ConfigValue = std::variant<bool, int64_t, double, std::string>;

// ============================================================================
// ConfigFile - A configuration file that preserves structure when modified
// ============================================================================
//
// Comments, blank lines, and ordering survive a load/modify/save cycle.
// When a value is modified, only that line changes. New keys are appended
// at the end.
//
// Usage:
//   ConfigFile config;
//   if (config.load("snowcity.conf")) {
//       auto speed = config.getFloat("player.run_speed", 0.15);
//       config.set("player.run_speed", 0.2);
//       config.save();
//   }
//
class ConfigFile {
public:
    ConfigFile() = default;
    explicit ConfigFile(std::filesystem::path path);

    // Load from file (returns false if file doesn't exist or can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Parse from an in-memory string (path is left unchanged)
    void loadFromString(std::string_view content);

    // Save to file (creates directories if needed)
    [[nodiscard]] bool save();

    // Save to a different path
    [[nodiscard]] bool saveAs(const std::filesystem::path& path);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] bool isDirty() const { return dirty_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // ========================================================================
    // Value access (read)
    // ========================================================================

    [[nodiscard]] bool has(std::string_view key) const;

    // Typed getters return the default when the key is missing or holds an
    // incompatible type. getFloat accepts integer values.
    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;
    [[nodiscard]] double getFloat(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    [[nodiscard]] const ConfigValue* getRaw(std::string_view key) const;

    // Keys in file order
    [[nodiscard]] std::vector<std::string> keys() const;

    // ========================================================================
    // Value access (write)
    // ========================================================================

    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, const char* value) { set(key, std::string_view(value)); }
    void set(std::string_view key, int64_t value);
    void set(std::string_view key, double value);
    void set(std::string_view key, bool value);

    // Remove a key (comments out the line rather than deleting)
    void remove(std::string_view key);

    // Set header comment (written at top of file if no content exists)
    void setHeader(std::string_view header) { header_ = header; }

private:
    // A line in the config file
    struct Line {
        std::string content;      // Original line content
        std::string key;          // Key if this is a key-value line, empty otherwise
        size_t valueStart = 0;    // Position where value starts (after ": ")
        bool isKeyValue = false;
    };

    void parseLines(std::string_view content);
    [[nodiscard]] static ConfigValue parseValue(std::string_view text);

    [[nodiscard]] int findLine(std::string_view key) const;
    void setImpl(std::string_view key, const std::string& formattedValue, ConfigValue value);

    [[nodiscard]] static std::string formatValue(double value);

    std::filesystem::path path_;
    std::vector<Line> lines_;
    std::unordered_map<std::string, size_t> keyToLine_;  // Key -> line index
    std::unordered_map<std::string, ConfigValue> values_;
    std::string header_;
    bool loaded_ = false;
    bool dirty_ = false;
};

}  // namespace snowcity
