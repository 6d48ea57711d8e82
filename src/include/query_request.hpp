#pragma once

#include "duckdb.hpp"

#include <map>
#include <string>
#include <vector>

namespace drillq {

// Ancestor and user filter value that stands for a NULL dimension value.
extern const char *const UNKNOWN_VALUE;

enum class EventSource {
    PAGE_VIEWS,
    SESSIONS
};

enum class FilterOperator {
    EQUALS,
    NOT_EQUALS,
    CONTAINS,
    NOT_CONTAINS
};

enum class SortDirection {
    ASC,
    DESC
};

EventSource ParseEventSource(const std::string &value);
std::string EventSourceToString(EventSource source);

FilterOperator ParseFilterOperator(const std::string &value);
std::string FilterOperatorToString(FilterOperator op);
bool IsNegated(FilterOperator op);

SortDirection ParseSortDirection(const std::string &value);
std::string SortDirectionToString(SortDirection direction);

struct DateRange {
    duckdb::date_t start;
    duckdb::date_t end;
};

struct TableFilter {
    std::string field;
    FilterOperator op = FilterOperator::EQUALS;
    std::string value;
};

struct QueryRequest {
    EventSource source = EventSource::PAGE_VIEWS;
    DateRange date_range;
    std::vector<std::string> dimensions;
    int64_t depth = 0;
    // Ordered map so that iteration never depends on insertion order
    std::map<std::string, std::string> ancestor_filters;
    std::vector<TableFilter> user_filters;
    std::string sort_by = "pageViews";
    SortDirection sort_direction = SortDirection::DESC;
    int64_t limit = 1000;
};

struct CompiledQuery {
    std::string text;
    std::vector<duckdb::Value> parameters;

    // Parameters rendered as text, used by the table functions and in traces
    std::vector<std::string> ParameterStrings() const;
};

} // namespace drillq
