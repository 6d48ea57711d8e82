#pragma once

#include "dimension_registry.hpp"
#include "sql_query_builder.hpp"

#include <string>
#include <vector>

namespace drillq {

struct RenderedDimension {
    std::vector<std::string> select_items;
    std::vector<std::string> group_by;
};

struct DimensionAliases {
    std::string value_alias;
    std::string id_alias;

    // dimension_value / dimension_id, used by drill-down queries
    static DimensionAliases Drilldown();
    // "<id>" / "_<id>_id", used by flat queries
    static DimensionAliases Flat(const std::string& dimension_id);
};

/**
 * Rendering of dimension descriptors into SQL fragments. Every compiler goes
 * through these functions, so a dimension renders identically in drill-down,
 * flat and attribution queries.
 *
 * `prefix` is applied to PREFIX_TOKEN in column templates. With
 * `use_event_expression` the dimension's event-table template is used
 * instead of its entry template (session funnel mode).
 */
class DimensionRenderer {
public:
    // SELECT items and GROUP BY expressions for an aggregated query
    static RenderedDimension Grouped(
        const DimensionDescriptor& descriptor,
        const std::string& prefix,
        const DimensionAliases& aliases,
        bool use_event_expression = false);

    // Non-aggregated per-row value; enriched dimensions yield the raw id as text
    static std::string Row(
        const DimensionDescriptor& descriptor,
        const std::string& prefix,
        bool use_event_expression = false);

    // Expression compared against a shallower level's key
    static std::string ParentFilterExpression(
        const DimensionDescriptor& descriptor,
        const std::string& prefix,
        bool use_event_expression = false);

    // Expression compared against a user-typed value
    static std::string TableFilterExpression(
        const DimensionDescriptor& descriptor,
        const std::string& prefix,
        bool use_event_expression = false);

    /**
     * Ancestor filter predicate. The UNKNOWN_VALUE sentinel becomes IS NULL
     * and binds nothing; any other value is bound as a parameter.
     */
    static std::string AncestorPredicate(
        const DimensionDescriptor& descriptor,
        const std::string& prefix,
        const std::string& value,
        ParameterBinder& binder,
        bool use_event_expression = false);

    // created_at >= $1::date AND created_at < ($2::date + interval '1 day')
    static std::vector<std::string> DateRangePredicates(
        const std::string& date_column,
        const std::string& start_placeholder,
        const std::string& end_placeholder);

    // Rate metrics of drill-down queries (page_views, bounce_rate, ...)
    static std::vector<std::string> RateMetrics(const SourceDescriptor& source, const std::string& prefix);

    // Raw counts of flat queries (page_views, bounced_count, ...)
    static std::vector<std::string> CountMetrics(const SourceDescriptor& source, const std::string& prefix);

private:
    static std::string PlainExpression(
        const DimensionDescriptor& descriptor,
        const PlainDimension& plain,
        const std::string& prefix,
        bool use_event_expression);
};

} // namespace drillq
