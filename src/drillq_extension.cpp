#include "duckdb.hpp"
#include "duckdb/function/pragma_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "drillq_extension.hpp"
#include "drillq_functions.hpp"
#include "drillq_settings.hpp"
#include "drillq_tracing.hpp"

namespace duckdb {

static string TraceEnablePragma(ClientContext &context, const FunctionParameters &parameters) {
    auto enabled = parameters.values[0].GetValue<bool>();
    drillq::DrillqTracer::Instance().SetEnabled(enabled);
    return enabled ? "Tracing enabled" : "Tracing disabled";
}

static string TraceLevelPragma(ClientContext &context, const FunctionParameters &parameters) {
    auto level = drillq::DrillqSettings::ParseTraceLevel(parameters.values[0].GetValue<string>());
    drillq::DrillqTracer::Instance().SetLevel(level);
    return "Trace level set to: " + drillq::DrillqTracer::LevelToString(level);
}

static string TraceDirectoryPragma(ClientContext &context, const FunctionParameters &parameters) {
    auto directory = parameters.values[0].GetValue<string>();
    drillq::DrillqTracer::Instance().SetTraceDirectory(directory);
    return "Trace directory set to: " + drillq::DrillqTracer::Instance().GetTraceDirectory();
}

static string StatusPragma(ClientContext &context, const FunctionParameters &parameters) {
    return drillq::DrillqSettings::StatusReport(context);
}

static void RegisterPragmas(ExtensionLoader &loader) {
    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "drillq_trace_enable", TraceEnablePragma, {LogicalType::BOOLEAN})));
    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "drillq_trace_level", TraceLevelPragma, {LogicalType::VARCHAR})));
    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "drillq_trace_directory", TraceDirectoryPragma, {LogicalType::VARCHAR})));
    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "drillq_trace_status", StatusPragma, {})));
}

static void LoadInternal(ExtensionLoader &loader) {
    auto &instance = loader.GetDatabaseInstance();

    drillq::DrillqSettings::Register(DBConfig::GetConfig(instance));
    drillq::DrillqFunctions::Register(loader);
    RegisterPragmas(loader);

    DRILLQ_TRACE_INFO("EXTENSION", "drillq extension loaded");
}

void DrillqExtension::Load(ExtensionLoader &loader) {
    LoadInternal(loader);
}

std::string DrillqExtension::Name() {
    return "drillq";
}

std::string DrillqExtension::Version() {
#ifdef EXT_VERSION_DRILLQ
    return EXT_VERSION_DRILLQ;
#else
    return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(drillq, loader) {
    duckdb::DrillqExtension::Load(loader);
}

}
