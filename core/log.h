#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace bimview::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

// Receives fully formatted records instead of stdout/stderr when installed.
using LogSink = std::function<void(LogLevel level, std::string_view category, std::string_view message)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();
[[nodiscard]] const char* logLevelName(LogLevel level);
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);

// Passing an empty sink restores console output.
void setLogSink(LogSink sink);

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

} // namespace bimview::core

#define BIM_LOG_STREAM(level, category) \
    if (!::bimview::core::shouldLog(level)) {} else ::bimview::core::LogLine((level), (category)).stream()

#define BIM_LOGE(category) BIM_LOG_STREAM(::bimview::core::LogLevel::Error, (category))
#define BIM_LOGW(category) BIM_LOG_STREAM(::bimview::core::LogLevel::Warn, (category))
#define BIM_LOGI(category) BIM_LOG_STREAM(::bimview::core::LogLevel::Info, (category))
#define BIM_LOGD(category) BIM_LOG_STREAM(::bimview::core::LogLevel::Debug, (category))
#define BIM_LOGT(category) BIM_LOG_STREAM(::bimview::core::LogLevel::Trace, (category))
