#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "query_request.hpp"

#include <map>
#include <string>
#include <vector>

namespace drillq {

// Which compiler a drillq_* table function runs
enum class CompileMode {
    DRILLDOWN,
    FLAT,
    TRACKING_MATCH,
    VISITOR_MATCH
};

/**
 * SQL surface of the compilers.
 *
 * drillq_compile, drillq_compile_flat, drillq_tracking_match and
 * drillq_visitor_match return one row (sql VARCHAR, parameters VARCHAR[]).
 * drillq_dimensions(source) lists a source's registry.
 */
class DrillqFunctions {
public:
    static void Register(duckdb::ExtensionLoader &loader);

    // VARCHAR[] to dimension ids; NULL elements are rejected
    static std::vector<std::string> ParseDimensionList(const duckdb::Value &value);

    // MAP(VARCHAR, VARCHAR) to ancestor filters; a NULL value means UNKNOWN_VALUE
    static std::map<std::string, std::string> ParseAncestorFilters(const duckdb::Value &value);

    // STRUCT(field, operator, value)[] to user filters; a NULL value means ""
    static std::vector<TableFilter> ParseTableFilters(const duckdb::Value &value);

    /**
     * Build a request from positional and named table function arguments.
     * Positional: dimensions, [depth,] start_date, end_date.
     *
     * @param default_limit Used when the call has no "limit"
     */
    static QueryRequest BuildQueryRequest(
        const duckdb::vector<duckdb::Value> &inputs,
        const duckdb::named_parameter_map_t &named_parameters,
        CompileMode mode,
        int64_t default_limit);

    static CompiledQuery CompileRequest(const QueryRequest &request, CompileMode mode);

private:
    static duckdb::unique_ptr<duckdb::FunctionData> CompileBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    static duckdb::unique_ptr<duckdb::FunctionData> CompileFlatBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    static duckdb::unique_ptr<duckdb::FunctionData> TrackingMatchBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    static duckdb::unique_ptr<duckdb::FunctionData> VisitorMatchBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    static void CompiledQueryScan(
        duckdb::ClientContext &context,
        duckdb::TableFunctionInput &data,
        duckdb::DataChunk &output);

    // drillq_dimensions(source)
    static duckdb::unique_ptr<duckdb::FunctionData> DimensionsBind(
        duckdb::ClientContext &context,
        duckdb::TableFunctionBindInput &input,
        duckdb::vector<duckdb::LogicalType> &return_types,
        duckdb::vector<std::string> &names);

    static void DimensionsScan(
        duckdb::ClientContext &context,
        duckdb::TableFunctionInput &data,
        duckdb::DataChunk &output);
};

} // namespace drillq
