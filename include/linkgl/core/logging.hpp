#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace linkgl {

// Log levels
enum class LogLevel {
    Trace,      // Per-resource creation and realization steps
    Debug,      // Sort order, driver state changes
    Info,       // Build and free summaries
    Warning,    // Recoverable misuse
    Error,      // Failed builds and release errors
    Fatal       // Unrecoverable errors
};

// Log categories
enum class LogCategory {
    Core,       // Window, context and frame loop
    Graph,      // Link registration and dependency resolution
    Resource,   // Native handle creation and release
    Render,     // Rendering operations
    Animation,  // Frame scheduling
    Gl,         // Graphics API debug output
    Performance // Performance warnings
};

// Severity reported by the graphics driver's debug output (KHR_debug)
enum class GlDebugSeverity {
    Notification,
    Low,
    Medium,
    High
};

/**
 * @brief One log message as handed to a sink
 *
 * The message view is only valid for the duration of the sink call.
 * file is null and line is 0 for messages logged without a location.
 */
struct LogRecord {
    LogLevel level;
    LogCategory category;
    std::string_view message;
    const char* file;
    int line;
};

/// Receives every record that passes the level filter. Must not throw.
using LogSink = std::function<void(const LogRecord& record)>;

/**
 * @brief Process-wide logger
 *
 * Records are filtered by a global minimum level, optionally overridden per
 * category, and written to the console (warnings and above to stderr) unless
 * a sink has been installed.
 */
class Logger {
public:
    static Logger& global();

    void setMinLevel(LogLevel level) { minLevel_ = level; }
    LogLevel minLevel() const { return minLevel_; }

    /// Override the minimum level for one category
    void setCategoryLevel(LogCategory category, LogLevel level) { categoryLevels_[category] = level; }
    void clearCategoryLevels() { categoryLevels_.clear(); }

    bool isEnabled(LogLevel level, LogCategory category) const;

    /// Install a sink; an empty sink restores console output
    void setSink(LogSink sink) { sink_ = std::move(sink); }
    bool hasSink() const { return static_cast<bool>(sink_); }

    void log(LogLevel level, LogCategory category, std::string_view message,
             const char* file = nullptr, int line = 0);

    // Convenience methods
    void trace(LogCategory category, std::string_view message);
    void debug(LogCategory category, std::string_view message);
    void info(LogCategory category, std::string_view message);
    void warning(LogCategory category, std::string_view message);
    void error(LogCategory category, std::string_view message);
    void fatal(LogCategory category, std::string_view message);

    // Graphics driver debug message integration
    void glMessage(GlDebugSeverity severity, std::string_view message);

    static const char* levelToString(LogLevel level);
    static const char* categoryToString(LogCategory category);

private:
    Logger() = default;

    static void writeConsole(const LogRecord& record);

    LogLevel minLevel_ = LogLevel::Debug;
    std::map<LogCategory, LogLevel> categoryLevels_;
    LogSink sink_;
};

// Logging macros with file/line info. The message expression is only
// evaluated when the record would be written.
#define LINKGL_LOG(level, category, msg)                                          \
    do {                                                                          \
        if (linkgl::Logger::global().isEnabled(level, category)) {                \
            linkgl::Logger::global().log(level, category, msg, __FILE__, __LINE__); \
        }                                                                         \
    } while (0)

#define LINKGL_TRACE(category, msg)   LINKGL_LOG(linkgl::LogLevel::Trace, category, msg)
#define LINKGL_DEBUG(category, msg)   LINKGL_LOG(linkgl::LogLevel::Debug, category, msg)
#define LINKGL_INFO(category, msg)    LINKGL_LOG(linkgl::LogLevel::Info, category, msg)
#define LINKGL_WARN(category, msg)    LINKGL_LOG(linkgl::LogLevel::Warning, category, msg)
#define LINKGL_ERROR(category, msg)   LINKGL_LOG(linkgl::LogLevel::Error, category, msg)
#define LINKGL_FATAL(category, msg)   LINKGL_LOG(linkgl::LogLevel::Fatal, category, msg)

} // namespace linkgl
