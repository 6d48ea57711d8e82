#include "flat_query_compiler.hpp"
#include "dimension_registry.hpp"
#include "dimension_renderer.hpp"
#include "drillq_tracing.hpp"
#include "join_planner.hpp"
#include "request_validator.hpp"
#include "session_funnel_builder.hpp"
#include "sql_query_builder.hpp"
#include "table_filter_builder.hpp"

namespace drillq {

CompiledQuery FlatQueryCompiler::Compile(const QueryRequest& request) {
    const auto& registry = DimensionRegistry::ForSource(request.source);
    RequestValidator::ValidateFlat(request, registry);

    const auto& source = registry.Source();

    ParameterBinder binder;
    auto start = binder.Bind(duckdb::Value::DATE(request.date_range.start));
    auto end = binder.Bind(duckdb::Value::DATE(request.date_range.end));

    SqlQueryBuilder builder;
    bool funnel_mode = request.source == EventSource::SESSIONS &&
                       SessionFunnelBuilder::IsFunnelRequest(registry, request.dimensions, {}, request.user_filters);

    if (funnel_mode) {
        SessionFunnelBuilder funnel(registry, binder, start, end);
        auto columns = funnel.Apply(builder, request.dimensions, {}, request.user_filters);

        for (const auto& column : columns) {
            auto rendered = DimensionRenderer::Grouped(*column.descriptor, column.prefix,
                                                       DimensionAliases::Flat(column.descriptor->id),
                                                       column.use_event_expression);
            builder.AddSelect(rendered.select_items).AddGroupBy(rendered.group_by);
        }
        builder.AddSelect(DimensionRenderer::CountMetrics(DimensionRegistry::PageViews().Source(), funnel.EventPrefix()));
    } else {
        // One join covering every dimension and filter field of the request
        std::vector<std::string> referenced = request.dimensions;
        for (const auto& filter : request.user_filters) {
            referenced.push_back(filter.field);
        }
        JoinPlanner planner(registry);
        auto plan = planner.Plan(referenced);
        const auto& prefix = plan.column_prefix;

        for (const auto& dimension_id : request.dimensions) {
            auto rendered = DimensionRenderer::Grouped(registry.Resolve(dimension_id), prefix,
                                                       DimensionAliases::Flat(dimension_id));
            builder.AddSelect(rendered.select_items).AddGroupBy(rendered.group_by);
        }
        builder.AddSelect(DimensionRenderer::CountMetrics(source, prefix))
               .SetFrom(source.table, plan.NeedsJoin() ? source.alias : "");
        for (const auto& join : planner.RenderJoins(plan, prefix)) {
            builder.AddJoin(join);
        }

        builder.AddWhere(DimensionRenderer::DateRangePredicates(plan.Column(source.date_column), start, end));
        TableFilterBuilder filter_builder(registry, binder, start, end);
        builder.AddWhere(filter_builder.Build(request.user_filters, prefix).predicates);

        if (source.exclude_single_event_groups) {
            builder.AddHaving("COUNT(*) > 1");
        }
    }

    builder.AddOrderBy("page_views", SortDirection::DESC);

    CompiledQuery query;
    query.text = builder.Build();
    query.parameters = binder.Release();

    DRILLQ_TRACE_DEBUG_DATA("FLAT_COMPILER",
                            "Compiled flat query over " + std::to_string(request.dimensions.size()) +
                                " dimension(s)" + (funnel_mode ? " in funnel mode" : ""),
                            query.text);
    return query;
}

} // namespace drillq
