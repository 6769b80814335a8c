#include "loopback_tracing.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace oauth2_loopback {

namespace {

const char* const TRACE_FILE_NAME = "oauth2_loopback_trace.log";

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool IsTruthy(const std::string& value) {
    auto upper = ToUpper(value);
    return upper == "1" || upper == "TRUE" || upper == "ON" || upper == "YES";
}

} // namespace

LoopbackTracer& LoopbackTracer::Instance() {
    static LoopbackTracer instance;
    return instance;
}

LoopbackTracer::LoopbackTracer() {
    ConfigureFromEnvironment();
}

TraceLevel LoopbackTracer::ParseLevel(const std::string& level_str) {
    auto upper = ToUpper(level_str);
    if (upper == "NONE") {
        return TraceLevel::NONE;
    } else if (upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (upper == "WARN") {
        return TraceLevel::WARN;
    } else if (upper == "INFO") {
        return TraceLevel::INFO;
    } else if (upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (upper == "TRACE") {
        return TraceLevel::TRACE;
    }
    throw std::invalid_argument("Invalid trace level: " + level_str +
                                ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

TraceOutput LoopbackTracer::ParseOutput(const std::string& output_str) {
    auto upper = ToUpper(output_str);
    if (upper == "CONSOLE") {
        return TraceOutput::console;
    } else if (upper == "FILE") {
        return TraceOutput::file;
    } else if (upper == "BOTH") {
        return TraceOutput::both;
    }
    throw std::invalid_argument("Invalid trace output: " + output_str +
                                ". Valid outputs are: console, file, both");
}

std::string LoopbackTracer::LevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

void LoopbackTracer::ConfigureFromEnvironment() {
    // Settings are applied one by one so a bad value only loses that setting
    if (const char* dir = std::getenv("OAUTH2_LOOPBACK_TRACE_DIR")) {
        SetTraceDirectory(dir);
    }
    if (const char* level_str = std::getenv("OAUTH2_LOOPBACK_TRACE_LEVEL")) {
        try {
            SetLevel(ParseLevel(level_str));
        } catch (const std::invalid_argument& e) {
            std::cerr << "oauth2_loopback: " << e.what() << std::endl;
        }
    }
    if (const char* output_str = std::getenv("OAUTH2_LOOPBACK_TRACE_OUTPUT")) {
        try {
            SetOutput(ParseOutput(output_str));
        } catch (const std::invalid_argument& e) {
            std::cerr << "oauth2_loopback: " << e.what() << std::endl;
        }
    }
    if (const char* enabled_str = std::getenv("OAUTH2_LOOPBACK_TRACE")) {
        SetEnabled(IsTruthy(enabled_str));
    }
}

void LoopbackTracer::SetEnabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->enabled = enabled;
        if (enabled && output != TraceOutput::console) {
            OpenTraceFile();
        } else if (!enabled) {
            CloseTraceFile();
        }
    }
    Info("TRACER", std::string("Tracing ") + (enabled ? "enabled" : "disabled"));
}

void LoopbackTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + LevelToString(level));
}

void LoopbackTracer::SetTraceDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    trace_directory = directory;

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "oauth2_loopback: cannot create trace directory " << directory
                  << ": " << ec.message() << std::endl;
    }

    // Reopen in the new location
    if (trace_file) {
        CloseTraceFile();
        OpenTraceFile();
    }
}

void LoopbackTracer::SetOutput(TraceOutput output) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    this->output = output;
    if (enabled && output != TraceOutput::console) {
        OpenTraceFile();
    } else {
        CloseTraceFile();
    }
}

bool LoopbackTracer::IsEnabled() const {
    std::lock_guard<std::mutex> lock(trace_mutex);
    return enabled;
}

TraceLevel LoopbackTracer::GetLevel() const {
    std::lock_guard<std::mutex> lock(trace_mutex);
    return level;
}

TraceOutput LoopbackTracer::GetOutput() const {
    std::lock_guard<std::mutex> lock(trace_mutex);
    return output;
}

std::string LoopbackTracer::GetTraceFilePath() const {
    std::lock_guard<std::mutex> lock(trace_mutex);
    return (std::filesystem::path(trace_directory) / TRACE_FILE_NAME).string();
}

void LoopbackTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    Trace(msg_level, component, message, "");
}

void LoopbackTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    if (!enabled || msg_level > level || msg_level == TraceLevel::NONE) {
        return;
    }

    std::string log_message;
    log_message.reserve(64 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += LevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    Write(log_message);
}

void LoopbackTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void LoopbackTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void LoopbackTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void LoopbackTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void LoopbackTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

// Callers hold trace_mutex
void LoopbackTracer::OpenTraceFile() {
    if (trace_file && trace_file->is_open()) {
        return;
    }
    auto trace_path = std::filesystem::path(trace_directory) / TRACE_FILE_NAME;
    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "oauth2_loopback: failed to open trace file: " << trace_path.string() << std::endl;
        trace_file.reset();
    }
}

void LoopbackTracer::CloseTraceFile() {
    if (trace_file) {
        trace_file->close();
        trace_file.reset();
    }
}

void LoopbackTracer::Write(const std::string& line) {
    if (output != TraceOutput::file) {
        std::clog << line << std::endl;
    }
    if (output != TraceOutput::console && trace_file && trace_file->is_open()) {
        *trace_file << line << std::endl;
    }
}

std::string LoopbackTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", &local_tm);

    char ms_buffer[8];
    std::snprintf(ms_buffer, sizeof(ms_buffer), ".%03d", static_cast<int>(ms.count()));

    return std::string(time_buffer) + ms_buffer;
}

std::string RedactSecret(const std::string& secret) {
    if (secret.size() <= 6) {
        return std::string(secret.size(), '*');
    }
    return secret.substr(0, 6) + "...";
}

} // namespace oauth2_loopback
