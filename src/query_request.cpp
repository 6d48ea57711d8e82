#include "query_request.hpp"
#include "parameter_validation.hpp"

namespace drillq {

const char *const UNKNOWN_VALUE = "Unknown";

EventSource ParseEventSource(const std::string &value) {
    auto lowered = duckdb::StringUtil::Lower(value);
    ParameterValidation::ValidateOneOf("source", lowered, {"page_views", "sessions"});
    return lowered == "sessions" ? EventSource::SESSIONS : EventSource::PAGE_VIEWS;
}

std::string EventSourceToString(EventSource source) {
    return source == EventSource::SESSIONS ? "sessions" : "page_views";
}

FilterOperator ParseFilterOperator(const std::string &value) {
    auto lowered = duckdb::StringUtil::Lower(value);
    ParameterValidation::ValidateOneOf("operator", lowered,
                                       {"equals", "not_equals", "contains", "not_contains"});
    if (lowered == "not_equals") {
        return FilterOperator::NOT_EQUALS;
    } else if (lowered == "contains") {
        return FilterOperator::CONTAINS;
    } else if (lowered == "not_contains") {
        return FilterOperator::NOT_CONTAINS;
    }
    return FilterOperator::EQUALS;
}

std::string FilterOperatorToString(FilterOperator op) {
    switch (op) {
        case FilterOperator::EQUALS: return "equals";
        case FilterOperator::NOT_EQUALS: return "not_equals";
        case FilterOperator::CONTAINS: return "contains";
        case FilterOperator::NOT_CONTAINS: return "not_contains";
        default: return "unknown";
    }
}

bool IsNegated(FilterOperator op) {
    return op == FilterOperator::NOT_EQUALS || op == FilterOperator::NOT_CONTAINS;
}

SortDirection ParseSortDirection(const std::string &value) {
    auto upper = duckdb::StringUtil::Upper(value);
    ParameterValidation::ValidateOneOf("sort_direction", upper, {"ASC", "DESC"});
    return upper == "ASC" ? SortDirection::ASC : SortDirection::DESC;
}

std::string SortDirectionToString(SortDirection direction) {
    return direction == SortDirection::ASC ? "ASC" : "DESC";
}

std::vector<std::string> CompiledQuery::ParameterStrings() const {
    std::vector<std::string> result;
    result.reserve(parameters.size());
    for (const auto &parameter : parameters) {
        result.push_back(parameter.IsNull() ? "NULL" : parameter.ToString());
    }
    return result;
}

} // namespace drillq
