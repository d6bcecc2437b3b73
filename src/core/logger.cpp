#include "snowcity/core/logger.hpp"
#include <atomic>
#include <iostream>

namespace snowcity {

namespace {
std::atomic<bool> g_debugEnabled{false};
}

void Logger::info(std::string_view message) const {
    std::cout << "[" << tag_ << "] " << message << "\n";
}

void Logger::warn(std::string_view message) const {
    std::cerr << "[" << tag_ << "] WARNING: " << message << "\n";
}

void Logger::error(std::string_view message) const {
    std::cerr << "[" << tag_ << "] ERROR: " << message << "\n";
}

void Logger::debug(std::string_view message) const {
    if (!g_debugEnabled.load(std::memory_order_relaxed)) return;
    std::cout << "[" << tag_ << "] DEBUG: " << message << "\n";
}

void Logger::setDebugEnabled(bool enabled) {
    g_debugEnabled.store(enabled, std::memory_order_relaxed);
}

bool Logger::debugEnabled() {
    return g_debugEnabled.load(std::memory_order_relaxed);
}

}  // namespace snowcity
