#include "request_validator.hpp"
#include "drillq_exceptions.hpp"
#include "parameter_validation.hpp"

#include <set>

namespace drillq {

static ErrorContext RequestContext(const QueryRequest& request) {
    ErrorContext context;
    context.Set("source", EventSourceToString(request.source));
    return context;
}

void RequestValidator::ValidateDimensions(const QueryRequest& request, const DimensionRegistry& registry) {
    std::set<std::string> seen;
    for (const auto& dimension_id : request.dimensions) {
        registry.Resolve(dimension_id, "dimension");
        if (!seen.insert(dimension_id).second) {
            throw duckdb::InvalidInputException(
                RequestContext(request).Set("dimension", dimension_id).Format("Dimension requested more than once"));
        }
    }
}

void RequestValidator::ValidateUserFilters(const QueryRequest& request, const DimensionRegistry& registry) {
    for (const auto& filter : request.user_filters) {
        registry.Resolve(filter.field, "user_filter");
    }
}

void RequestValidator::ValidateDrilldown(const QueryRequest& request, const DimensionRegistry& registry) {
    ValidateDimensions(request, registry);

    if (request.depth < 0 || request.depth >= static_cast<int64_t>(request.dimensions.size())) {
        throw InvalidDepthException(request.depth, request.dimensions.size());
    }

    for (const auto& [key, value] : request.ancestor_filters) {
        registry.Resolve(key, "ancestor_filter");
    }

    // Keys must be exactly dimensions[0..depth), one value per level above the current one
    auto key_count = static_cast<int64_t>(request.ancestor_filters.size());
    if (key_count != request.depth) {
        throw MalformedAncestorFiltersException(
            "Ancestor filters must cover every dimension above the current depth",
            RequestContext(request)
                .Set("depth", std::to_string(request.depth))
                .Set("ancestor_filters", std::to_string(key_count)));
    }
    for (int64_t i = 0; i < request.depth; ++i) {
        const auto& expected = request.dimensions[i];
        if (request.ancestor_filters.find(expected) == request.ancestor_filters.end()) {
            throw MalformedAncestorFiltersException(
                "Ancestor filters must be a prefix of the requested dimension order",
                RequestContext(request)
                    .Set("missing", expected)
                    .Set("position", std::to_string(i)));
        }
    }

    ValidateUserFilters(request, registry);

    for (const auto& filter : request.user_filters) {
        if (request.ancestor_filters.count(filter.field) > 0) {
            throw MalformedAncestorFiltersException(
                "Field is used both as ancestor filter and as user filter",
                RequestContext(request).Set("field", filter.field));
        }
    }

    ParameterValidation::ValidateDateRange(request.date_range.start, request.date_range.end);
}

void RequestValidator::ValidateFlat(const QueryRequest& request, const DimensionRegistry& registry) {
    if (request.dimensions.empty()) {
        throw duckdb::InvalidInputException(
            RequestContext(request).Format("At least one dimension is required"));
    }
    ValidateDimensions(request, registry);

    if (!request.ancestor_filters.empty()) {
        throw MalformedAncestorFiltersException(
            "Flat queries group by every dimension and take no ancestor filters",
            RequestContext(request).Set("ancestor_filters", std::to_string(request.ancestor_filters.size())));
    }

    ValidateUserFilters(request, registry);
    ParameterValidation::ValidateDateRange(request.date_range.start, request.date_range.end);
}

void RequestValidator::ValidateAttribution(const QueryRequest& request, const DimensionRegistry& registry) {
    ValidateDrilldown(request, registry);

    const auto& current = registry.Resolve(request.dimensions[request.depth]);
    if (current.IsEventOnly()) {
        throw duckdb::InvalidInputException(
            RequestContext(request).Set("dimension", current.id).Format("Dimension has no entry-level tracking value"));
    }
    for (const auto& [key, value] : request.ancestor_filters) {
        if (registry.Resolve(key).IsEventOnly()) {
            throw duckdb::InvalidInputException(
                RequestContext(request).Set("dimension", key).Format("Dimension has no entry-level tracking value"));
        }
    }
    for (const auto& filter : request.user_filters) {
        if (registry.Resolve(filter.field).IsEventOnly()) {
            throw duckdb::InvalidInputException(
                RequestContext(request).Set("dimension", filter.field).Format("Dimension has no entry-level tracking value"));
        }
    }
}

} // namespace drillq
