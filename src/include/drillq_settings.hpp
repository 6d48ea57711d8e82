#pragma once

#include "duckdb.hpp"
#include "drillq_tracing.hpp"

#include <string>

namespace drillq {

/**
 * Extension options of drillq, registered on the database config.
 *
 * Options:
 *   drillq_default_limit        BIGINT   row limit when a call passes none
 *   drillq_trace_enabled        BOOLEAN
 *   drillq_trace_level          VARCHAR  NONE, ERROR, WARN, INFO, DEBUG, TRACE
 *   drillq_trace_output         VARCHAR  console, file, both
 *   drillq_trace_file_path      VARCHAR  trace directory
 *   drillq_trace_max_file_size  BIGINT   bytes before rotation
 *   drillq_trace_rotation       BOOLEAN
 *
 * Trace options are pushed into DrillqTracer by their change callbacks.
 * Invalid values raise duckdb::BinderException.
 */
class DrillqSettings {
public:
    static constexpr const char *DEFAULT_LIMIT_OPTION = "drillq_default_limit";

    static void Register(duckdb::DBConfig &config);

    // Current drillq_default_limit of the session, clamped to the allowed range
    static int64_t DefaultLimit(duckdb::ClientContext &context);

    // Case-insensitive; "DEBUG" maps to TraceLevel::DEBUG_LEVEL
    static TraceLevel ParseTraceLevel(const std::string &level);

    // Human-readable summary for PRAGMA drillq_trace_status
    static std::string StatusReport(duckdb::ClientContext &context);
};

} // namespace drillq
