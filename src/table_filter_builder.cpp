#include "table_filter_builder.hpp"
#include "dimension_renderer.hpp"
#include "drillq_tracing.hpp"

#include <utility>

namespace drillq {

TableFilterBuilder::TableFilterBuilder(
    const DimensionRegistry& registry,
    ParameterBinder& binder,
    std::string start_placeholder,
    std::string end_placeholder)
    : registry_(registry),
      binder_(binder),
      start_placeholder_(std::move(start_placeholder)),
      end_placeholder_(std::move(end_placeholder)) {
}

WhereFragment TableFilterBuilder::Build(
    const std::vector<TableFilter>& filters,
    const std::string& column_prefix,
    bool use_event_expression) {

    // Group by field, keeping the order in which fields first appear
    std::vector<std::pair<std::string, std::vector<const TableFilter*>>> by_field;
    for (const auto& filter : filters) {
        registry_.Resolve(filter.field, "user_filter");

        auto it = by_field.begin();
        for (; it != by_field.end(); ++it) {
            if (it->first == filter.field) {
                break;
            }
        }
        if (it == by_field.end()) {
            by_field.emplace_back(filter.field, std::vector<const TableFilter*>{});
            it = std::prev(by_field.end());
        }
        it->second.push_back(&filter);
    }

    WhereFragment fragment;
    for (const auto& [field, field_filters] : by_field) {
        const auto& descriptor = registry_.Resolve(field, "user_filter");

        std::vector<std::string> conditions;
        for (auto filter : field_filters) {
            auto condition = BuildCondition(descriptor, *filter, column_prefix, use_event_expression);
            if (condition.empty()) {
                DRILLQ_TRACE_DEBUG("TABLE_FILTER", "Dropping empty '" + FilterOperatorToString(filter->op) +
                                   "' filter on " + field);
                continue;
            }
            conditions.push_back(std::move(condition));
        }

        if (conditions.empty()) {
            continue;
        }
        if (conditions.size() == 1) {
            fragment.predicates.push_back(conditions.front());
            continue;
        }

        std::string combined = "(";
        for (size_t i = 0; i < conditions.size(); ++i) {
            if (i > 0) {
                combined += " OR ";
            }
            combined += conditions[i];
        }
        combined += ")";
        fragment.predicates.push_back(std::move(combined));
    }

    DRILLQ_TRACE_DEBUG("TABLE_FILTER", "Built " + std::to_string(fragment.predicates.size()) +
                       " predicate(s) from " + std::to_string(filters.size()) + " filter(s)");
    return fragment;
}

std::string TableFilterBuilder::BuildCondition(
    const DimensionDescriptor& descriptor,
    const TableFilter& filter,
    const std::string& column_prefix,
    bool use_event_expression) {

    auto column = DimensionRenderer::TableFilterExpression(descriptor, column_prefix, use_event_expression);
    auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution);
    bool matches_null = filter.value.empty() || filter.value == UNKNOWN_VALUE;

    if (matches_null) {
        if (filter.op == FilterOperator::EQUALS) {
            return column + " IS NULL";
        }
        if (filter.op == FilterOperator::NOT_EQUALS) {
            return column + " IS NOT NULL";
        }
        if (filter.value.empty()) {
            return "";
        }
    }

    auto placeholder = binder_.Bind(duckdb::Value(filter.value));
    bool like = filter.op == FilterOperator::CONTAINS || filter.op == FilterOperator::NOT_CONTAINS;
    bool negated = IsNegated(filter.op);
    auto operand = like ? "('%' || LOWER(" + placeholder + ") || '%')" : "LOWER(" + placeholder + ")";
    auto comparison = like ? (negated ? " NOT LIKE " : " LIKE ") : (negated ? " != " : " = ");

    auto condition = "LOWER(" + column + "::text)" + comparison + operand;
    std::string lookup;
    if (enriched) {
        // Names are always matched positively; negation applies to the id set
        lookup = NameLookupSubquery(*enriched, "LOWER(" + enriched->name_column + ")" + (like ? " LIKE " : " = ") + operand);
    }

    if (!negated) {
        if (!enriched) {
            return condition;
        }
        return "(" + condition + " OR " + column + "::text IN (" + lookup + "))";
    }

    // Negated filters keep rows where the value is missing
    if (enriched) {
        condition = "(" + condition + " AND " + column + "::text NOT IN (" + lookup + "))";
    }
    return "(" + column + " IS NULL OR " + condition + ")";
}

std::string TableFilterBuilder::NameLookupSubquery(
    const EnrichedDimension& enriched,
    const std::string& name_predicate) const {

    // The id IS NOT NULL guard keeps NOT IN from collapsing to NULL
    return "SELECT DISTINCT " + enriched.id_column + "::text FROM merged_ads_spending WHERE date::date BETWEEN " +
           start_placeholder_ + "::date AND " + end_placeholder_ + "::date AND " + enriched.id_column +
           " IS NOT NULL AND " + name_predicate;
}

} // namespace drillq
