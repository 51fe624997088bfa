#include "linkgl/core/logging.hpp"

#include <cstdio>
#include <ctime>
#include <chrono>

namespace linkgl {

namespace {

// "src/engine/renderer_data.cpp" -> "renderer_data.cpp"
const char* baseName(const char* path) {
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

} // anonymous namespace

Logger& Logger::global() {
    static Logger instance;
    return instance;
}

bool Logger::isEnabled(LogLevel level, LogCategory category) const {
    auto it = categoryLevels_.find(category);
    LogLevel threshold = (it != categoryLevels_.end()) ? it->second : minLevel_;
    return level >= threshold;
}

void Logger::log(LogLevel level, LogCategory category, std::string_view message,
                 const char* file, int line) {
    if (!isEnabled(level, category)) {
        return;
    }

    LogRecord record{level, category, message, file, line};
    if (sink_) {
        sink_(record);
    } else {
        writeConsole(record);
    }
}

void Logger::writeConsole(const LogRecord& record) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    int ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    char clock[16];
    std::strftime(clock, sizeof(clock), "%H:%M:%S", std::localtime(&time));

    FILE* out = (record.level >= LogLevel::Warning) ? stderr : stdout;

    // [12:00:00.042] [INFO   ] [Graph      ] message (file.cpp:17)
    std::fprintf(out, "[%s.%03d] [%-7s] [%-11s] %.*s",
                 clock, ms,
                 levelToString(record.level), categoryToString(record.category),
                 static_cast<int>(record.message.size()), record.message.data());
    if (record.file && record.line > 0) {
        std::fprintf(out, " (%s:%d)", baseName(record.file), record.line);
    }
    std::fputc('\n', out);
    std::fflush(out);
}

void Logger::trace(LogCategory category, std::string_view message) {
    log(LogLevel::Trace, category, message);
}

void Logger::debug(LogCategory category, std::string_view message) {
    log(LogLevel::Debug, category, message);
}

void Logger::info(LogCategory category, std::string_view message) {
    log(LogLevel::Info, category, message);
}

void Logger::warning(LogCategory category, std::string_view message) {
    log(LogLevel::Warning, category, message);
}

void Logger::error(LogCategory category, std::string_view message) {
    log(LogLevel::Error, category, message);
}

void Logger::fatal(LogCategory category, std::string_view message) {
    log(LogLevel::Fatal, category, message);
}

void Logger::glMessage(GlDebugSeverity severity, std::string_view message) {
    LogLevel level = LogLevel::Trace;
    switch (severity) {
        case GlDebugSeverity::High:         level = LogLevel::Error; break;
        case GlDebugSeverity::Medium:       level = LogLevel::Warning; break;
        case GlDebugSeverity::Low:          level = LogLevel::Info; break;
        case GlDebugSeverity::Notification: level = LogLevel::Trace; break;
    }

    log(level, LogCategory::Gl, message);
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "?";
}

const char* Logger::categoryToString(LogCategory category) {
    switch (category) {
        case LogCategory::Core:        return "Core";
        case LogCategory::Graph:       return "Graph";
        case LogCategory::Resource:    return "Resource";
        case LogCategory::Render:      return "Render";
        case LogCategory::Animation:   return "Animation";
        case LogCategory::Gl:          return "GL";
        case LogCategory::Performance: return "Performance";
    }
    return "?";
}

} // namespace linkgl
