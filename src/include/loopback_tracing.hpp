#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>

namespace oauth2_loopback {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

enum class TraceOutput {
    console,
    file,
    both
};

class LoopbackTracer {
public:
    static LoopbackTracer& Instance();

    // Parse "NONE", "ERROR", "WARN", "INFO", "DEBUG" or "TRACE" (case-insensitive).
    // Throws std::invalid_argument on anything else.
    static TraceLevel ParseLevel(const std::string& level_str);
    static TraceOutput ParseOutput(const std::string& output_str);
    static std::string LevelToString(TraceLevel level);

    // Reads OAUTH2_LOOPBACK_TRACE, OAUTH2_LOOPBACK_TRACE_LEVEL,
    // OAUTH2_LOOPBACK_TRACE_OUTPUT and OAUTH2_LOOPBACK_TRACE_DIR.
    void ConfigureFromEnvironment();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutput(TraceOutput output);

    bool IsEnabled() const;
    TraceLevel GetLevel() const;
    TraceOutput GetOutput() const;
    std::string GetTraceFilePath() const;

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    void Error(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);

private:
    LoopbackTracer();
    ~LoopbackTracer() = default;
    LoopbackTracer(const LoopbackTracer&) = delete;
    LoopbackTracer& operator=(const LoopbackTracer&) = delete;

    void OpenTraceFile();
    void CloseTraceFile();
    void Write(const std::string& line);
    static std::string GetTimestamp();

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    TraceOutput output = TraceOutput::console;
    std::string trace_directory = ".";
    std::unique_ptr<std::ofstream> trace_file;
    mutable std::mutex trace_mutex;
};

// Shortens secrets such as authorization codes before they reach a trace line
std::string RedactSecret(const std::string& secret);

#define OAUTH2_LOOPBACK_TRACE_ERROR(component, message) \
    ::oauth2_loopback::LoopbackTracer::Instance().Error(component, message)

#define OAUTH2_LOOPBACK_TRACE_WARN(component, message) \
    ::oauth2_loopback::LoopbackTracer::Instance().Warn(component, message)

#define OAUTH2_LOOPBACK_TRACE_INFO(component, message) \
    ::oauth2_loopback::LoopbackTracer::Instance().Info(component, message)

#define OAUTH2_LOOPBACK_TRACE_DEBUG(component, message) \
    ::oauth2_loopback::LoopbackTracer::Instance().Debug(component, message)

#define OAUTH2_LOOPBACK_TRACE_DEBUG_DATA(component, message, data) \
    ::oauth2_loopback::LoopbackTracer::Instance().Debug(component, message, data)

} // namespace oauth2_loopback
