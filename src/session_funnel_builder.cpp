#include "session_funnel_builder.hpp"
#include "dimension_renderer.hpp"
#include "drillq_tracing.hpp"
#include "table_filter_builder.hpp"

#include <algorithm>

namespace drillq {

SessionFunnelBuilder::SessionFunnelBuilder(
    const DimensionRegistry& sessions,
    ParameterBinder& binder,
    std::string start_placeholder,
    std::string end_placeholder)
    : sessions_(sessions),
      page_views_(DimensionRegistry::PageViews()),
      planner_(sessions),
      binder_(binder),
      start_placeholder_(std::move(start_placeholder)),
      end_placeholder_(std::move(end_placeholder)) {
}

bool SessionFunnelBuilder::IsEventLevel(const DimensionDescriptor& descriptor) {
    return descriptor.HasEventExpression();
}

bool SessionFunnelBuilder::IsFunnelRequest(
    const DimensionRegistry& registry,
    const std::vector<std::string>& grouped_dimensions,
    const std::vector<std::string>& ancestor_keys,
    const std::vector<TableFilter>& user_filters) {

    auto event_only = [&registry](const std::string& dimension_id) {
        auto descriptor = registry.Find(dimension_id);
        return descriptor && descriptor->IsEventOnly();
    };

    return std::any_of(grouped_dimensions.begin(), grouped_dimensions.end(), event_only) ||
           std::any_of(ancestor_keys.begin(), ancestor_keys.end(), event_only) ||
           std::any_of(user_filters.begin(), user_filters.end(),
                       [&](const TableFilter& filter) { return event_only(filter.field); });
}

std::string SessionFunnelBuilder::EventPrefix() const {
    return page_views_.Source().alias + ".";
}

std::vector<FunnelColumn> SessionFunnelBuilder::Apply(
    SqlQueryBuilder& builder,
    const std::vector<std::string>& grouped_dimensions,
    const std::vector<std::pair<std::string, std::string>>& ancestors,
    const std::vector<TableFilter>& user_filters) {

    std::vector<std::pair<std::string, std::string>> entry_ancestors;
    std::vector<std::pair<std::string, std::string>> event_ancestors;
    for (const auto& ancestor : ancestors) {
        if (IsEventLevel(sessions_.Resolve(ancestor.first, "ancestor_filter"))) {
            event_ancestors.push_back(ancestor);
        } else {
            entry_ancestors.push_back(ancestor);
        }
    }

    std::vector<TableFilter> entry_filters;
    std::vector<TableFilter> event_filters;
    for (const auto& filter : user_filters) {
        if (IsEventLevel(sessions_.Resolve(filter.field, "user_filter"))) {
            event_filters.push_back(filter);
        } else {
            entry_filters.push_back(filter);
        }
    }

    std::vector<std::string> outer_entry_dimensions;
    for (const auto& dimension_id : grouped_dimensions) {
        if (!IsEventLevel(sessions_.Resolve(dimension_id))) {
            outer_entry_dimensions.push_back(dimension_id);
        }
    }
    auto outer_plan = planner_.Plan(outer_entry_dimensions);

    // Entry columns the outer query groups by or joins on
    const auto& source = sessions_.Source();
    std::vector<std::string> cte_columns;
    auto add_columns = [&cte_columns](const std::string& column_template) {
        for (auto& column : ReferencedColumns(column_template)) {
            if (std::find(cte_columns.begin(), cte_columns.end(), column) == cte_columns.end()) {
                cte_columns.push_back(std::move(column));
            }
        }
    };
    add_columns(source.session_column);
    for (const auto& dimension_id : outer_entry_dimensions) {
        const auto& descriptor = sessions_.Resolve(dimension_id);
        if (auto plain = std::get_if<PlainDimension>(&descriptor.resolution)) {
            add_columns(plain->expression);
        } else if (auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution)) {
            add_columns(enriched->raw_column);
        }
    }
    if (outer_plan.enriched_join_level >= JoinSpecificity::CAMPAIGN) {
        add_columns(source.campaign_column);
    }
    if (outer_plan.enriched_join_level >= JoinSpecificity::ADSET) {
        add_columns(source.adset_column);
    }
    if (outer_plan.enriched_join_level >= JoinSpecificity::AD) {
        add_columns(source.ad_column);
    }
    if (outer_plan.needs_classification_join) {
        add_columns(source.url_column);
    }

    builder.AddCommonTableExpression(CTE_NAME, BuildMatchingSessions(cte_columns, entry_ancestors, entry_filters));

    const auto& events = page_views_.Source();
    auto event_prefix = EventPrefix();
    auto session_prefix = std::string(CTE_ALIAS) + ".";

    builder.SetFrom(events.table, events.alias);
    builder.AddJoin("JOIN " + std::string(CTE_NAME) + " " + CTE_ALIAS + " ON " +
                    RenderTemplate(events.session_column, event_prefix) + " = " +
                    RenderTemplate(source.session_column, session_prefix));
    for (const auto& join : planner_.RenderJoins(outer_plan, session_prefix)) {
        builder.AddJoin(join);
    }

    builder.AddWhere(DimensionRenderer::DateRangePredicates(
        RenderTemplate(events.date_column, event_prefix), start_placeholder_, end_placeholder_));
    for (const auto& [key, value] : event_ancestors) {
        builder.AddWhere(DimensionRenderer::AncestorPredicate(
            sessions_.Resolve(key, "ancestor_filter"), event_prefix, value, binder_, true));
    }
    TableFilterBuilder filter_builder(sessions_, binder_, start_placeholder_, end_placeholder_);
    builder.AddWhere(filter_builder.Build(event_filters, event_prefix, true).predicates);

    DRILLQ_TRACE_DEBUG("SESSION_FUNNEL", "Funnel split: " + std::to_string(entry_ancestors.size() + entry_filters.size()) +
                       " entry condition(s), " + std::to_string(event_ancestors.size() + event_filters.size()) +
                       " event condition(s), outer join " + outer_plan.ToString());

    std::vector<FunnelColumn> columns;
    for (const auto& dimension_id : grouped_dimensions) {
        const auto& descriptor = sessions_.Resolve(dimension_id);
        if (IsEventLevel(descriptor)) {
            columns.push_back(FunnelColumn{&descriptor, event_prefix, true});
        } else {
            columns.push_back(FunnelColumn{&descriptor, session_prefix, false});
        }
    }
    return columns;
}

std::string SessionFunnelBuilder::BuildMatchingSessions(
    const std::vector<std::string>& cte_columns,
    const std::vector<std::pair<std::string, std::string>>& entry_ancestors,
    const std::vector<TableFilter>& entry_filters) {

    const auto& source = sessions_.Source();
    auto prefix = source.alias + ".";

    std::vector<std::string> referenced;
    for (const auto& ancestor : entry_ancestors) {
        referenced.push_back(ancestor.first);
    }
    for (const auto& filter : entry_filters) {
        referenced.push_back(filter.field);
    }
    auto plan = planner_.Plan(referenced);

    SqlQueryBuilder cte;
    cte.SetDistinct(true);
    for (const auto& column : cte_columns) {
        cte.AddSelect(prefix + column);
    }
    cte.SetFrom(source.table, source.alias);
    for (const auto& join : planner_.RenderJoins(plan, prefix)) {
        cte.AddJoin(join);
    }

    cte.AddWhere(DimensionRenderer::DateRangePredicates(
        RenderTemplate(source.date_column, prefix), start_placeholder_, end_placeholder_));
    for (const auto& [key, value] : entry_ancestors) {
        cte.AddWhere(DimensionRenderer::AncestorPredicate(
            sessions_.Resolve(key, "ancestor_filter"), prefix, value, binder_));
    }
    TableFilterBuilder filter_builder(sessions_, binder_, start_placeholder_, end_placeholder_);
    cte.AddWhere(filter_builder.Build(entry_filters, prefix).predicates);

    return cte.Build();
}

} // namespace drillq
