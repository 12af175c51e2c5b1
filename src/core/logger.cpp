/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"
#include "core/request_id.hpp"

#include <json/json.h>

#include <chrono>
#include <sstream>

namespace sandbox_gate {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error}) {
        if (to_string(level) == name) return level;
    }
    if (name == "warning") return LogLevel::Warn;
    return std::nullopt;
}

std::string json_quote(std::string_view text) {
    return Json::valueToQuotedString(std::string(text).c_str());
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message, const LogFields& fields) {
    log(LogLevel::Debug, message, fields);
}

void Logger::info(std::string_view message, const LogFields& fields) {
    log(LogLevel::Info, message, fields);
}

void Logger::warn(std::string_view message, const LogFields& fields) {
    log(LogLevel::Warn, message, fields);
}

void Logger::error(std::string_view message, const LogFields& fields) {
    log(LogLevel::Error, message, fields);
}

void Logger::log(LogLevel level, std::string_view message, const LogFields& fields) {
    if (level < min_level_) return;

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")" << format_timestamp(std::chrono::system_clock::now()) << R"(",)"
        << R"("msg":)" << json_quote(message);
    for (const auto& [key, value] : fields) {
        oss << ',' << json_quote(key) << ':' << json_quote(value);
    }
    oss << '}';

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

}  // namespace sandbox_gate
