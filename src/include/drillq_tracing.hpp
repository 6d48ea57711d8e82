#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <sstream>
#include <iostream>

namespace drillq {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

enum class TraceOutput {
    CONSOLE,
    FILE,
    BOTH
};

class DrillqTracer {
public:
    static DrillqTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutputMode(const std::string& output_mode);
    void SetMaxFileSize(int64_t max_size);
    void SetRotation(bool rotation);

    // Read without trace_mutex; scans check these while a SET may change them
    bool IsEnabled() const { return enabled.load(); }
    TraceLevel GetLevel() const { return level.load(); }
    std::string GetOutputMode() const;
    std::string GetTraceDirectory() const { return trace_directory; }
    std::string GetTraceFilePath() const;
    int64_t GetMaxFileSize() const { return max_file_size; }
    bool GetRotation() const { return rotation_enabled; }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    // Convenience methods for different trace levels
    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

    static std::string LevelToString(TraceLevel level);

private:
    DrillqTracer() = default;
    ~DrillqTracer() = default;
    DrillqTracer(const DrillqTracer&) = delete;
    DrillqTracer& operator=(const DrillqTracer&) = delete;

    // Callers must hold trace_mutex
    void Emit(TraceLevel msg_level, const std::string& component, const std::string& message);
    void OpenTraceFile();
    void RotateIfNeeded();
    std::string GetTimestamp();

    std::atomic<bool> enabled{false};
    std::atomic<TraceLevel> level{TraceLevel::INFO};
    std::string trace_directory = ".";
    TraceOutput output_mode = TraceOutput::CONSOLE;
    int64_t max_file_size = 10485760; // 10MB default
    bool rotation_enabled = true;
    std::unique_ptr<std::ofstream> trace_file;
    std::mutex trace_mutex;
};

// Convenience macros for tracing
#define DRILLQ_TRACE_ERROR(component, message) \
    ::drillq::DrillqTracer::Instance().Error(component, message)

#define DRILLQ_TRACE_ERROR_DATA(component, message, data) \
    ::drillq::DrillqTracer::Instance().Error(component, message, data)

#define DRILLQ_TRACE_WARN(component, message) \
    ::drillq::DrillqTracer::Instance().Warn(component, message)

#define DRILLQ_TRACE_WARN_DATA(component, message, data) \
    ::drillq::DrillqTracer::Instance().Warn(component, message, data)

#define DRILLQ_TRACE_INFO(component, message) \
    ::drillq::DrillqTracer::Instance().Info(component, message)

#define DRILLQ_TRACE_INFO_DATA(component, message, data) \
    ::drillq::DrillqTracer::Instance().Info(component, message, data)

#define DRILLQ_TRACE_DEBUG(component, message) \
    ::drillq::DrillqTracer::Instance().Debug(component, message)

#define DRILLQ_TRACE_DEBUG_DATA(component, message, data) \
    ::drillq::DrillqTracer::Instance().Debug(component, message, data)

#define DRILLQ_TRACE_TRACE(component, message) \
    ::drillq::DrillqTracer::Instance().Trace(component, message)

#define DRILLQ_TRACE_TRACE_DATA(component, message, data) \
    ::drillq::DrillqTracer::Instance().Trace(component, message, data)

} // namespace drillq
