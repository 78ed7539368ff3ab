#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_relay {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// One log line. `session` is the relay session the calling thread is
// working for, empty outside of any session.
struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string_view session;
    std::string_view message;
};

// Abstract log sink — implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Text sink — one human-readable line per record:
//   2026-01-01T12:00:00.000Z INFO  [component] <session> message
// With use_color the level tag is colored and the rest is dimmed.
class TextSink : public ILogSink {
public:
    explicit TextSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink — machine-readable JSON lines to a stream.
// Records written inside a session carry a "session" member.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// Tags every record logged on this thread with a session id until the
// object goes out of scope. Scopes nest; the previous id is restored.
class ScopedLogSession {
public:
    explicit ScopedLogSession(std::string session_id);
    ~ScopedLogSession();

    ScopedLogSession(const ScopedLogSession&) = delete;
    ScopedLogSession& operator=(const ScopedLogSession&) = delete;

private:
    std::string previous_;
};

/// Session id of the innermost ScopedLogSession on this thread.
const std::string& CurrentLogSession();

/// Returns true when stderr is a terminal and NO_COLOR is not set.
bool StderrSupportsColor();

// ---------------------------------------------------------------------------
// Global logger — set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Install the global logger. Until then messages go to a null sink.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_relay
