#include <mcp_relay/core/log.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace mcp_relay {

namespace {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return kDim;
        case LogLevel::Info:  return kCyan;
        case LogLevel::Warn:  return kYellow;
        case LogLevel::Error: return kRed;
    }
    return "";
}

// Level name right-padded to five columns.
std::string PaddedLevel(LogLevel level) {
    std::string name = LevelName(level);
    name.resize(5, ' ');
    return name;
}

thread_local std::string t_log_session;

} // anonymous namespace

// ---------------------------------------------------------------------------
// TextSink
// ---------------------------------------------------------------------------
TextSink::TextSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void TextSink::Write(const LogRecord& record) {
    const char* dim = use_color_ ? kDim : "";
    const char* reset = use_color_ ? kReset : "";
    const char* level_color = use_color_ ? LevelAnsi(record.level) : "";

    out_ << dim << Iso8601Now() << reset << ' '
         << level_color << PaddedLevel(record.level) << reset << ' '
         << dim << '[' << record.component << ']' << reset << ' ';
    if (!record.session.empty()) {
        out_ << dim << '<' << record.session << '>' << reset << ' ';
    }
    if (use_color_ && record.level == LogLevel::Error) {
        out_ << level_color << record.message << reset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::json line;
    line["ts"] = Iso8601Now();
    line["level"] = LevelName(record.level);
    line["component"] = std::string(record.component);
    if (!record.session.empty()) {
        line["session"] = std::string(record.session);
    }
    line["message"] = std::string(record.message);
    // Replace invalid UTF-8 instead of throwing from inside the logger.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(LogRecord{level, component, t_log_session, message});
    }
}

// ---------------------------------------------------------------------------
// ScopedLogSession
// ---------------------------------------------------------------------------
ScopedLogSession::ScopedLogSession(std::string session_id)
    : previous_(std::exchange(t_log_session, std::move(session_id))) {}

ScopedLogSession::~ScopedLogSession() {
    t_log_session = std::move(previous_);
}

const std::string& CurrentLogSession() {
    return t_log_session;
}

bool StderrSupportsColor() {
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

// ---------------------------------------------------------------------------
// NullSink — discards all messages (used before InitGlobalLogger is called).
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace mcp_relay
