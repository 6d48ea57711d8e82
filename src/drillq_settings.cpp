#include "drillq_settings.hpp"
#include "parameter_validation.hpp"

#include <sstream>

// Windows headers may redefine the trace level names as macros
#ifdef _WIN32
#ifdef ERROR
    #undef ERROR
#endif
#ifdef NONE
    #undef NONE
#endif
#endif

using namespace duckdb;

namespace drillq {

static void OnDefaultLimit(ClientContext &context, SetScope scope, Value &parameter) {
    auto limit = parameter.GetValue<int64_t>();
    if (limit < ParameterValidation::MIN_LIMIT) {
        throw BinderException(std::string(DrillqSettings::DEFAULT_LIMIT_OPTION) + " must be at least " +
                              std::to_string(ParameterValidation::MIN_LIMIT));
    }
}

static void OnTraceEnabled(ClientContext &context, SetScope scope, Value &parameter) {
    DrillqTracer::Instance().SetEnabled(parameter.GetValue<bool>());
}

static void OnTraceLevel(ClientContext &context, SetScope scope, Value &parameter) {
    DrillqTracer::Instance().SetLevel(DrillqSettings::ParseTraceLevel(parameter.GetValue<std::string>()));
}

static void OnTraceOutput(ClientContext &context, SetScope scope, Value &parameter) {
    auto output = StringUtil::Lower(parameter.GetValue<std::string>());
    if (output != "console" && output != "file" && output != "both") {
        throw BinderException("Invalid trace output: " + parameter.GetValue<std::string>() +
                              ". Valid outputs are: console, file, both");
    }
    DrillqTracer::Instance().SetOutputMode(output);
}

static void OnTraceFilePath(ClientContext &context, SetScope scope, Value &parameter) {
    auto directory = parameter.GetValue<std::string>();
    if (!directory.empty()) {
        DrillqTracer::Instance().SetTraceDirectory(directory);
    }
}

static void OnTraceMaxFileSize(ClientContext &context, SetScope scope, Value &parameter) {
    auto max_size = parameter.GetValue<int64_t>();
    if (max_size < 0) {
        throw BinderException("Trace max file size must be non-negative");
    }
    DrillqTracer::Instance().SetMaxFileSize(max_size);
}

static void OnTraceRotation(ClientContext &context, SetScope scope, Value &parameter) {
    DrillqTracer::Instance().SetRotation(parameter.GetValue<bool>());
}

struct OptionDefinition {
    const char *name;
    const char *description;
    LogicalTypeId type;
    Value default_value;
    set_option_callback_t on_change;
};

void DrillqSettings::Register(DBConfig &config) {
    const OptionDefinition options[] = {
        {DEFAULT_LIMIT_OPTION, "Row limit of drill-down queries that do not pass one (clamped to 1..10000)",
         LogicalTypeId::BIGINT, Value::BIGINT(ParameterValidation::DEFAULT_LIMIT), OnDefaultLimit},
        {"drillq_trace_enabled", "Enable drillq tracing",
         LogicalTypeId::BOOLEAN, Value::BOOLEAN(false), OnTraceEnabled},
        {"drillq_trace_level", "drillq trace level (NONE, ERROR, WARN, INFO, DEBUG, TRACE)",
         LogicalTypeId::VARCHAR, Value("INFO"), OnTraceLevel},
        {"drillq_trace_output", "drillq trace output (console, file, both)",
         LogicalTypeId::VARCHAR, Value("console"), OnTraceOutput},
        {"drillq_trace_file_path", "Directory of the drillq trace file",
         LogicalTypeId::VARCHAR, Value(""), OnTraceFilePath},
        {"drillq_trace_max_file_size", "drillq trace file size in bytes before rotation",
         LogicalTypeId::BIGINT, Value::BIGINT(10485760), OnTraceMaxFileSize},
        {"drillq_trace_rotation", "Rotate the drillq trace file when it reaches its maximum size",
         LogicalTypeId::BOOLEAN, Value::BOOLEAN(true), OnTraceRotation},
    };

    for (const auto &option : options) {
        config.AddExtensionOption(option.name, option.description, option.type, option.default_value, option.on_change);
    }
}

int64_t DrillqSettings::DefaultLimit(ClientContext &context) {
    Value setting;
    if (context.TryGetCurrentSetting(DEFAULT_LIMIT_OPTION, setting) && !setting.IsNull()) {
        return ParameterValidation::ClampLimit(setting.GetValue<int64_t>());
    }
    return ParameterValidation::DEFAULT_LIMIT;
}

TraceLevel DrillqSettings::ParseTraceLevel(const std::string &level) {
    auto upper = StringUtil::Upper(level);

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
    throw BinderException("Invalid trace level: " + level + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string DrillqSettings::StatusReport(ClientContext &context) {
    auto &tracer = DrillqTracer::Instance();

    std::stringstream result;
    result << "drillq status:\n";
    result << "  Default limit: " << DefaultLimit(context) << "\n";
    result << "  Tracing enabled: " << (tracer.IsEnabled() ? "true" : "false") << "\n";
    result << "  Trace level: " << DrillqTracer::LevelToString(tracer.GetLevel()) << "\n";
    result << "  Trace output: " << tracer.GetOutputMode() << "\n";
    result << "  Trace file: " << tracer.GetTraceFilePath();
    return result.str();
}

} // namespace drillq
