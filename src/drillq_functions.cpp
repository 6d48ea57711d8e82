#include "drillq_functions.hpp"
#include "attribution_matcher.hpp"
#include "dimension_registry.hpp"
#include "drilldown_query_compiler.hpp"
#include "drillq_settings.hpp"
#include "drillq_tracing.hpp"
#include "flat_query_compiler.hpp"
#include "parameter_validation.hpp"

using namespace duckdb;

namespace drillq {

// =============================================================================
// Bind Data Structures
// =============================================================================

struct CompiledQueryBindData : public TableFunctionData {
    CompiledQuery query;
    bool done = false;
};

struct DimensionsBindData : public TableFunctionData {
    std::vector<std::string> dimension_ids;
    std::vector<std::string> kinds;
    std::vector<std::string> join_specificities;
    std::vector<bool> event_levels;
    idx_t current_idx = 0;
    bool done = false;
};

// =============================================================================
// Argument Conversion
// =============================================================================

static std::string StructField(const Value &entry, const std::string &field_name) {
    auto &child_types = StructType::GetChildTypes(entry.type());
    auto &children = StructValue::GetChildren(entry);
    for (idx_t i = 0; i < child_types.size() && i < children.size(); i++) {
        if (StringUtil::Lower(child_types[i].first) == field_name) {
            return children[i].IsNull() ? "" : children[i].ToString();
        }
    }
    throw InvalidInputException("Filter entry is missing field '" + field_name + "'");
}

std::vector<std::string> DrillqFunctions::ParseDimensionList(const Value &value) {
    if (value.IsNull()) {
        throw InvalidInputException("Parameter 'dimensions' must not be NULL");
    }

    std::vector<std::string> dimensions;
    for (auto &child : ListValue::GetChildren(value)) {
        if (child.IsNull()) {
            throw InvalidInputException("Parameter 'dimensions' must not contain NULL");
        }
        dimensions.push_back(child.ToString());
    }
    return dimensions;
}

std::map<std::string, std::string> DrillqFunctions::ParseAncestorFilters(const Value &value) {
    std::map<std::string, std::string> filters;
    if (value.IsNull()) {
        return filters;
    }

    // MAPs are a list of (key, value) structs
    for (auto &entry : MapValue::GetChildren(value)) {
        auto &children = StructValue::GetChildren(entry);
        if (children.size() < 2 || children[0].IsNull()) {
            throw InvalidInputException("Ancestor filter keys must not be NULL");
        }
        filters[children[0].ToString()] = children[1].IsNull() ? UNKNOWN_VALUE : children[1].ToString();
    }
    return filters;
}

std::vector<TableFilter> DrillqFunctions::ParseTableFilters(const Value &value) {
    std::vector<TableFilter> filters;
    if (value.IsNull()) {
        return filters;
    }

    for (auto &entry : ListValue::GetChildren(value)) {
        if (entry.IsNull()) {
            continue;
        }
        TableFilter filter;
        filter.field = ParameterValidation::ValidateRequired("field", StructField(entry, "field"));
        filter.op = ParseFilterOperator(StructField(entry, "operator"));
        filter.value = StructField(entry, "value");
        filters.push_back(std::move(filter));
    }
    return filters;
}

static date_t DateArgument(const Value &value, const std::string &param_name) {
    if (value.IsNull()) {
        throw InvalidInputException("Parameter '" + param_name + "' must not be NULL");
    }
    return value.GetValue<date_t>();
}

QueryRequest DrillqFunctions::BuildQueryRequest(
    const vector<Value> &inputs,
    const named_parameter_map_t &named_parameters,
    CompileMode mode,
    int64_t default_limit) {

    bool has_depth = mode != CompileMode::FLAT;
    idx_t expected = has_depth ? 4 : 3;
    if (inputs.size() < expected) {
        throw BinderException("Expected " + std::to_string(expected) + " positional arguments, got " +
                              std::to_string(inputs.size()));
    }

    QueryRequest request;
    idx_t position = 0;
    request.dimensions = ParseDimensionList(inputs[position++]);
    if (has_depth) {
        if (inputs[position].IsNull()) {
            throw InvalidInputException("Parameter 'depth' must not be NULL");
        }
        request.depth = inputs[position++].GetValue<int64_t>();
    }
    request.date_range.start = DateArgument(inputs[position++], "start_date");
    request.date_range.end = DateArgument(inputs[position++], "end_date");
    request.limit = default_limit;

    for (auto &[name, value] : named_parameters) {
        auto key = StringUtil::Lower(name);
        if (value.IsNull()) {
            continue;
        }
        if (key == "source") {
            request.source = ParseEventSource(value.ToString());
        } else if (key == "ancestor_filters") {
            request.ancestor_filters = ParseAncestorFilters(value);
        } else if (key == "filters") {
            request.user_filters = ParseTableFilters(value);
        } else if (key == "sort_by") {
            request.sort_by = value.ToString();
        } else if (key == "sort_direction") {
            request.sort_direction = ParseSortDirection(value.ToString());
        } else if (key == "limit") {
            request.limit = value.GetValue<int64_t>();
        }
    }

    return request;
}

CompiledQuery DrillqFunctions::CompileRequest(const QueryRequest &request, CompileMode mode) {
    switch (mode) {
        case CompileMode::DRILLDOWN:
            return DrilldownQueryCompiler::Compile(request);
        case CompileMode::FLAT:
            return FlatQueryCompiler::Compile(request);
        case CompileMode::TRACKING_MATCH:
            return AttributionMatcher::BuildTrackingMatch(request);
        case CompileMode::VISITOR_MATCH:
            return AttributionMatcher::BuildVisitorMatch(request);
        default:
            throw InternalException("Unhandled compile mode");
    }
}

// =============================================================================
// drillq_compile / drillq_compile_flat / drillq_*_match
// =============================================================================

static unique_ptr<FunctionData> BindCompiled(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names,
    CompileMode mode) {

    auto bind_data = make_uniq<CompiledQueryBindData>();

    auto request = DrillqFunctions::BuildQueryRequest(input.inputs, input.named_parameters, mode, DrillqSettings::DefaultLimit(context));
    bind_data->query = DrillqFunctions::CompileRequest(request, mode);

    names = {"sql", "parameters"};
    return_types = {LogicalType::VARCHAR, LogicalType::LIST(LogicalType::VARCHAR)};

    return std::move(bind_data);
}

unique_ptr<FunctionData> DrillqFunctions::CompileBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {
    return BindCompiled(context, input, return_types, names, CompileMode::DRILLDOWN);
}

unique_ptr<FunctionData> DrillqFunctions::CompileFlatBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {
    return BindCompiled(context, input, return_types, names, CompileMode::FLAT);
}

unique_ptr<FunctionData> DrillqFunctions::TrackingMatchBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {
    return BindCompiled(context, input, return_types, names, CompileMode::TRACKING_MATCH);
}

unique_ptr<FunctionData> DrillqFunctions::VisitorMatchBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {
    return BindCompiled(context, input, return_types, names, CompileMode::VISITOR_MATCH);
}

void DrillqFunctions::CompiledQueryScan(
    ClientContext &context,
    TableFunctionInput &data,
    DataChunk &output) {

    auto &bind_data = data.bind_data->CastNoConst<CompiledQueryBindData>();

    if (bind_data.done) {
        output.SetCardinality(0);
        return;
    }

    vector<Value> parameters;
    for (auto &parameter : bind_data.query.ParameterStrings()) {
        parameters.emplace_back(parameter);
    }

    output.SetValue(0, 0, Value(bind_data.query.text));
    output.SetValue(1, 0, Value::LIST(LogicalType::VARCHAR, std::move(parameters)));
    output.SetCardinality(1);
    bind_data.done = true;
}

// =============================================================================
// drillq_dimensions
// =============================================================================

unique_ptr<FunctionData> DrillqFunctions::DimensionsBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<std::string> &names) {

    auto bind_data = make_uniq<DimensionsBindData>();

    if (input.inputs.empty() || input.inputs[0].IsNull()) {
        throw BinderException("drillq_dimensions requires a source parameter");
    }
    auto source = ParseEventSource(input.inputs[0].GetValue<std::string>());

    for (auto &descriptor : DimensionRegistry::ForSource(source).Dimensions()) {
        bind_data->dimension_ids.push_back(descriptor.id);
        bind_data->kinds.push_back(DimensionKindToString(descriptor.Kind()));

        auto specificity = JoinSpecificity::NONE;
        if (auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution)) {
            specificity = enriched->specificity;
        }
        bind_data->join_specificities.push_back(JoinSpecificityToString(specificity));
        bind_data->event_levels.push_back(descriptor.IsEventOnly());
    }

    names = {"dimension_id", "kind", "join_specificity", "event_level"};
    return_types = {
        LogicalType::VARCHAR,
        LogicalType::VARCHAR,
        LogicalType::VARCHAR,
        LogicalType::BOOLEAN
    };

    DRILLQ_TRACE_DEBUG("DRILLQ_FUNCTIONS", "Listing " + std::to_string(bind_data->dimension_ids.size()) +
                       " dimensions of " + EventSourceToString(source));
    return std::move(bind_data);
}

void DrillqFunctions::DimensionsScan(
    ClientContext &context,
    TableFunctionInput &data,
    DataChunk &output) {

    auto &bind_data = data.bind_data->CastNoConst<DimensionsBindData>();

    if (bind_data.done) {
        output.SetCardinality(0);
        return;
    }

    idx_t count = 0;
    idx_t max_count = STANDARD_VECTOR_SIZE;

    while (bind_data.current_idx < bind_data.dimension_ids.size() && count < max_count) {
        idx_t i = bind_data.current_idx;

        output.SetValue(0, count, Value(bind_data.dimension_ids[i]));
        output.SetValue(1, count, Value(bind_data.kinds[i]));
        output.SetValue(2, count, Value(bind_data.join_specificities[i]));
        output.SetValue(3, count, Value::BOOLEAN(bind_data.event_levels[i]));

        bind_data.current_idx++;
        count++;
    }

    if (bind_data.current_idx >= bind_data.dimension_ids.size()) {
        bind_data.done = true;
    }

    output.SetCardinality(count);
}

// =============================================================================
// Registration
// =============================================================================

static void AddRequestParameters(TableFunction &function, bool drilldown) {
    function.named_parameters["source"] = LogicalType::VARCHAR;
    function.named_parameters["filters"] = LogicalType::LIST(LogicalType::STRUCT({
        {"field", LogicalType::VARCHAR},
        {"operator", LogicalType::VARCHAR},
        {"value", LogicalType::VARCHAR},
    }));
    if (drilldown) {
        function.named_parameters["ancestor_filters"] = LogicalType::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR);
        function.named_parameters["sort_by"] = LogicalType::VARCHAR;
        function.named_parameters["sort_direction"] = LogicalType::VARCHAR;
        function.named_parameters["limit"] = LogicalType::BIGINT;
    }
}

void DrillqFunctions::Register(ExtensionLoader &loader) {
    auto dimensions_type = LogicalType::LIST(LogicalType::VARCHAR);

    // drillq_compile(dimensions, depth, start_date, end_date)
    TableFunction compile_func("drillq_compile",
                               {dimensions_type, LogicalType::INTEGER, LogicalType::DATE, LogicalType::DATE},
                               CompiledQueryScan, CompileBind);
    AddRequestParameters(compile_func, true);
    loader.RegisterFunction(compile_func);

    // drillq_compile_flat(dimensions, start_date, end_date)
    TableFunction flat_func("drillq_compile_flat",
                            {dimensions_type, LogicalType::DATE, LogicalType::DATE},
                            CompiledQueryScan, CompileFlatBind);
    AddRequestParameters(flat_func, false);
    loader.RegisterFunction(flat_func);

    // drillq_tracking_match(dimensions, depth, start_date, end_date)
    TableFunction tracking_func("drillq_tracking_match",
                                {dimensions_type, LogicalType::INTEGER, LogicalType::DATE, LogicalType::DATE},
                                CompiledQueryScan, TrackingMatchBind);
    AddRequestParameters(tracking_func, true);
    loader.RegisterFunction(tracking_func);

    // drillq_visitor_match(dimensions, depth, start_date, end_date)
    TableFunction visitor_func("drillq_visitor_match",
                               {dimensions_type, LogicalType::INTEGER, LogicalType::DATE, LogicalType::DATE},
                               CompiledQueryScan, VisitorMatchBind);
    AddRequestParameters(visitor_func, true);
    loader.RegisterFunction(visitor_func);

    // drillq_dimensions(source)
    TableFunction dimensions_func("drillq_dimensions", {LogicalType::VARCHAR}, DimensionsScan, DimensionsBind);
    loader.RegisterFunction(dimensions_func);
}

} // namespace drillq
