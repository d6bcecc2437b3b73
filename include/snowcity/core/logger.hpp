#pragma once

/**
 * @file logger.hpp
 * @brief Tagged console logging for simulation components
 *
 * Each component owns a Logger carrying its tag. Output format:
 *   info:  [tag] message              (stdout)
 *   warn:  [tag] WARNING: message     (stderr)
 *   error: [tag] ERROR: message       (stderr)
 *   debug: [tag] DEBUG: message       (stdout, only when debug is enabled)
 */

#include <string>
#include <string_view>
#include <utility>

namespace snowcity {

class Logger {
public:
    explicit Logger(std::string tag) : tag_(std::move(tag)) {}

    void info(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;
    void debug(std::string_view message) const;

    [[nodiscard]] const std::string& tag() const { return tag_; }

    // Global debug switch (config key: debug.logging)
    static void setDebugEnabled(bool enabled);
    [[nodiscard]] static bool debugEnabled();

private:
    std::string tag_;
};

}  // namespace snowcity
