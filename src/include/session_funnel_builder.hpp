#pragma once

#include "dimension_registry.hpp"
#include "join_planner.hpp"
#include "sql_query_builder.hpp"

#include <string>
#include <utility>
#include <vector>

namespace drillq {

// How a grouped dimension renders in the outer query of a funnel statement
struct FunnelColumn {
    const DimensionDescriptor *descriptor;
    std::string prefix;
    bool use_event_expression;
};

/**
 * Two-stage session funnel statement.
 *
 * A `matching_sessions` CTE selects the session ids (plus the entry columns
 * the outer query groups by or joins on) that satisfy every entry-level
 * filter. The outer query reads the page-view table joined to that CTE and
 * applies the event-level filters, so an event-level filter never has to hold
 * for the entry page.
 */
class SessionFunnelBuilder {
public:
    static constexpr const char *CTE_NAME = "matching_sessions";
    static constexpr const char *CTE_ALIAS = "ms";

    /**
     * @param sessions Registry of the session source
     * @param start_placeholder Placeholder of the bound range start
     * @param end_placeholder Placeholder of the bound range end
     */
    SessionFunnelBuilder(
        const DimensionRegistry& sessions,
        ParameterBinder& binder,
        std::string start_placeholder,
        std::string end_placeholder);

    // True when any referenced id only exists at event level
    static bool IsFunnelRequest(
        const DimensionRegistry& registry,
        const std::vector<std::string>& grouped_dimensions,
        const std::vector<std::string>& ancestor_keys,
        const std::vector<TableFilter>& user_filters);

    // Evaluated against the page-view row in funnel mode
    static bool IsEventLevel(const DimensionDescriptor& descriptor);

    /**
     * Fill CTE, FROM, joins and WHERE of the funnel statement.
     *
     * @param ancestors Ancestor filters in dimension order
     * @return Outer rendering of each grouped dimension, in input order
     */
    std::vector<FunnelColumn> Apply(
        SqlQueryBuilder& builder,
        const std::vector<std::string>& grouped_dimensions,
        const std::vector<std::pair<std::string, std::string>>& ancestors,
        const std::vector<TableFilter>& user_filters);

    // Page-view table prefix of the outer query
    std::string EventPrefix() const;

private:
    std::string BuildMatchingSessions(
        const std::vector<std::string>& cte_columns,
        const std::vector<std::pair<std::string, std::string>>& entry_ancestors,
        const std::vector<TableFilter>& entry_filters);

    const DimensionRegistry& sessions_;
    const DimensionRegistry& page_views_;
    JoinPlanner planner_;
    ParameterBinder& binder_;
    std::string start_placeholder_;
    std::string end_placeholder_;
};

} // namespace drillq
