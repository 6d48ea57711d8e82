#include "drillq_tracing.hpp"
#include <filesystem>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace drillq {

static const char *TRACE_FILE_NAME = "drillq_trace.log";

DrillqTracer& DrillqTracer::Instance() {
    static DrillqTracer instance;
    return instance;
}

void DrillqTracer::SetEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    if (enabled && !this->enabled) {
        this->enabled = true;
        if (output_mode != TraceOutput::CONSOLE) {
            OpenTraceFile();
        }
        Emit(TraceLevel::INFO, "TRACER", "Tracing enabled, output: " + GetOutputMode());
    } else if (!enabled && this->enabled) {
        Emit(TraceLevel::INFO, "TRACER", "Tracing disabled");
        this->enabled = false;
        if (trace_file) {
            trace_file->close();
            trace_file.reset();
        }
    }
}

void DrillqTracer::SetLevel(TraceLevel level) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    this->level = level;
    Emit(TraceLevel::INFO, "TRACER", "Trace level set to: " + LevelToString(level));
}

void DrillqTracer::SetTraceDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    trace_directory = directory.empty() ? "." : directory;

    std::filesystem::path dir_path(trace_directory);
    if (!std::filesystem::exists(dir_path)) {
        std::filesystem::create_directories(dir_path);
    }

    Emit(TraceLevel::INFO, "TRACER", "Trace directory set to: " + trace_directory);

    // Reopen trace file in the new location
    if (trace_file) {
        trace_file->close();
        trace_file.reset();
    }
    if (enabled && output_mode != TraceOutput::CONSOLE) {
        OpenTraceFile();
    }
}

void DrillqTracer::SetOutputMode(const std::string& output_mode) {
    std::string mode = output_mode;
    std::transform(mode.begin(), mode.end(), mode.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::lock_guard<std::mutex> lock(trace_mutex);
    if (mode == "file") {
        this->output_mode = TraceOutput::FILE;
    } else if (mode == "both") {
        this->output_mode = TraceOutput::BOTH;
    } else {
        this->output_mode = TraceOutput::CONSOLE;
    }

    if (this->output_mode == TraceOutput::CONSOLE) {
        if (trace_file) {
            trace_file->close();
            trace_file.reset();
        }
    } else if (enabled && !trace_file) {
        OpenTraceFile();
    }
    Emit(TraceLevel::INFO, "TRACER", "Trace output mode set to: " + GetOutputMode());
}

void DrillqTracer::SetMaxFileSize(int64_t max_size) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    max_file_size = max_size;
    Emit(TraceLevel::INFO, "TRACER", "Trace max file size set to: " + std::to_string(max_size));
}

void DrillqTracer::SetRotation(bool rotation) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    rotation_enabled = rotation;
    Emit(TraceLevel::INFO, "TRACER", "Trace rotation " + std::string(rotation ? "enabled" : "disabled"));
}

std::string DrillqTracer::GetOutputMode() const {
    switch (output_mode) {
        case TraceOutput::FILE: return "file";
        case TraceOutput::BOTH: return "both";
        default: return "console";
    }
}

std::string DrillqTracer::GetTraceFilePath() const {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;
    return trace_path.string();
}

void DrillqTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    Emit(msg_level, component, message);
}

void DrillqTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    if (data.empty()) {
        Emit(msg_level, component, message);
        return;
    }
    Emit(msg_level, component, message + "\nData: " + data);
}

void DrillqTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void DrillqTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void DrillqTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void DrillqTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void DrillqTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void DrillqTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void DrillqTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void DrillqTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void DrillqTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void DrillqTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void DrillqTracer::Emit(TraceLevel msg_level, const std::string& component, const std::string& message) {
    if (!enabled.load() || msg_level > level.load() || msg_level == TraceLevel::NONE) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += LevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (output_mode != TraceOutput::FILE) {
        std::cout << log_message << std::endl;
    }
    if (output_mode != TraceOutput::CONSOLE && trace_file && trace_file->is_open()) {
        RotateIfNeeded();
        *trace_file << log_message << std::endl;
        trace_file->flush();
    }
}

void DrillqTracer::OpenTraceFile() {
    auto trace_path = GetTraceFilePath();
    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path << std::endl;
        trace_file.reset();
    }
}

void DrillqTracer::RotateIfNeeded() {
    if (!rotation_enabled || max_file_size <= 0) {
        return;
    }
    auto position = static_cast<int64_t>(trace_file->tellp());
    if (position < max_file_size) {
        return;
    }

    trace_file->close();
    auto trace_path = GetTraceFilePath();
    std::error_code ec;
    std::filesystem::rename(trace_path, trace_path + ".1", ec);
    if (ec) {
        std::cerr << "Failed to rotate trace file: " << ec.message() << std::endl;
    }
    trace_file->open(trace_path, std::ios::trunc);
}

std::string DrillqTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t));

    std::ostringstream timestamp;
    timestamp << time_buffer << "." << std::setw(3) << std::setfill('0') << ms.count();
    return timestamp.str();
}

std::string DrillqTracer::LevelToString(TraceLevel level) {
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

} // namespace drillq
