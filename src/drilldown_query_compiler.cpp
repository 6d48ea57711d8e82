#include "drilldown_query_compiler.hpp"
#include "dimension_registry.hpp"
#include "dimension_renderer.hpp"
#include "drillq_tracing.hpp"
#include "join_planner.hpp"
#include "parameter_validation.hpp"
#include "request_validator.hpp"
#include "session_funnel_builder.hpp"
#include "sql_query_builder.hpp"
#include "table_filter_builder.hpp"

namespace drillq {

// Ancestor filters in dimension order, independent of map ordering
static std::vector<std::pair<std::string, std::string>> OrderedAncestors(const QueryRequest& request) {
    std::vector<std::pair<std::string, std::string>> ancestors;
    for (int64_t i = 0; i < request.depth; ++i) {
        auto it = request.ancestor_filters.find(request.dimensions[i]);
        if (it != request.ancestor_filters.end()) {
            ancestors.emplace_back(it->first, it->second);
        }
    }
    return ancestors;
}

static void AddOrdering(SqlQueryBuilder& builder, const QueryRequest& request, const DimensionDescriptor& current) {
    if (current.IsDate()) {
        // Newest day first whatever the requested direction
        builder.AddOrderBy("dimension_value", SortDirection::DESC, true);
    } else {
        builder.AddOrderBy(ResolveSortMetric(request.sort_by), request.sort_direction, true);
    }
    builder.SetLimit(ParameterValidation::ClampLimit(request.limit));
}

CompiledQuery DrilldownQueryCompiler::Compile(const QueryRequest& request) {
    const auto& registry = DimensionRegistry::ForSource(request.source);
    RequestValidator::ValidateDrilldown(request, registry);

    const auto& source = registry.Source();
    const auto& current_id = request.dimensions[request.depth];
    const auto& current = registry.Resolve(current_id);
    auto ancestors = OrderedAncestors(request);

    std::vector<std::string> ancestor_keys;
    for (const auto& ancestor : ancestors) {
        ancestor_keys.push_back(ancestor.first);
    }

    ParameterBinder binder;
    auto start = binder.Bind(duckdb::Value::DATE(request.date_range.start));
    auto end = binder.Bind(duckdb::Value::DATE(request.date_range.end));

    SqlQueryBuilder builder;

    if (request.source == EventSource::SESSIONS &&
        SessionFunnelBuilder::IsFunnelRequest(registry, {current_id}, ancestor_keys, request.user_filters)) {

        SessionFunnelBuilder funnel(registry, binder, start, end);
        auto columns = funnel.Apply(builder, {current_id}, ancestors, request.user_filters);
        const auto& column = columns.front();

        auto rendered = DimensionRenderer::Grouped(
            *column.descriptor, column.prefix, DimensionAliases::Drilldown(), column.use_event_expression);
        builder.AddSelect(rendered.select_items)
               .AddSelect(DimensionRenderer::RateMetrics(DimensionRegistry::PageViews().Source(), funnel.EventPrefix()))
               .AddGroupBy(rendered.group_by);
        AddOrdering(builder, request, current);
    } else {
        JoinPlanner planner(registry);
        std::vector<std::string> filter_fields;
        for (const auto& filter : request.user_filters) {
            filter_fields.push_back(filter.field);
        }
        auto plan = planner.Plan(current_id, ancestor_keys, filter_fields);
        const auto& prefix = plan.column_prefix;

        auto rendered = DimensionRenderer::Grouped(current, prefix, DimensionAliases::Drilldown());
        builder.AddSelect(rendered.select_items)
               .AddSelect(DimensionRenderer::RateMetrics(source, prefix))
               .SetFrom(source.table, plan.NeedsJoin() ? source.alias : "");
        for (const auto& join : planner.RenderJoins(plan, prefix)) {
            builder.AddJoin(join);
        }

        builder.AddWhere(DimensionRenderer::DateRangePredicates(plan.Column(source.date_column), start, end));
        for (const auto& [key, value] : ancestors) {
            builder.AddWhere(DimensionRenderer::AncestorPredicate(registry.Resolve(key), prefix, value, binder));
        }
        TableFilterBuilder filter_builder(registry, binder, start, end);
        builder.AddWhere(filter_builder.Build(request.user_filters, prefix).predicates);

        builder.AddGroupBy(rendered.group_by);
        if (source.exclude_single_event_groups) {
            builder.AddHaving("COUNT(*) > 1");
        }
        AddOrdering(builder, request, current);
    }

    CompiledQuery query;
    query.text = builder.Build();
    query.parameters = binder.Release();

    DRILLQ_TRACE_DEBUG_DATA("DRILLDOWN_COMPILER",
                            "Compiled depth " + std::to_string(request.depth) + " query for " + current_id,
                            query.text);
    return query;
}

} // namespace drillq
