#pragma once

#include "dimension_registry.hpp"
#include "sql_query_builder.hpp"

#include <string>
#include <vector>

namespace drillq {

struct WhereFragment {
    // AND'ed together by the caller
    std::vector<std::string> predicates;

    bool IsEmpty() const {
        return predicates.empty();
    }
};

/**
 * Translates user-typed (field, operator, value) filters into WHERE predicates.
 *
 * - Filters on the same field are OR'ed, different fields are AND'ed, in
 *   first-appearance order.
 * - Comparisons are case-insensitive on both sides.
 * - Enriched fields also match rows whose raw id resolves from the typed
 *   display name in the spend-tracking table, within the request's date range.
 * - Negated operators keep rows whose value is NULL.
 * - An empty value means IS [NOT] NULL for equals/not_equals and is dropped
 *   for contains/not_contains.
 */
class TableFilterBuilder {
public:
    /**
     * @param start_placeholder Placeholder of the already bound range start ("$1")
     * @param end_placeholder Placeholder of the already bound range end ("$2")
     */
    TableFilterBuilder(
        const DimensionRegistry& registry,
        ParameterBinder& binder,
        std::string start_placeholder,
        std::string end_placeholder);

    /**
     * @throws UnknownDimensionException for a field missing from the registry
     */
    WhereFragment Build(
        const std::vector<TableFilter>& filters,
        const std::string& column_prefix,
        bool use_event_expression = false);

private:
    // Empty when the filter is dropped
    std::string BuildCondition(
        const DimensionDescriptor& descriptor,
        const TableFilter& filter,
        const std::string& column_prefix,
        bool use_event_expression);

    std::string NameLookupSubquery(
        const EnrichedDimension& enriched,
        const std::string& name_predicate) const;

    const DimensionRegistry& registry_;
    ParameterBinder& binder_;
    std::string start_placeholder_;
    std::string end_placeholder_;
};

} // namespace drillq
