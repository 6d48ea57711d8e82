#pragma once

#include "dimension_registry.hpp"
#include "query_request.hpp"

namespace drillq {

/**
 * Rejects malformed requests before any query text is built.
 *
 * Checks run in a fixed order so the first problem reported is stable:
 * dimensions, depth, ancestor filters, user filters, ancestor/user overlap,
 * date range.
 */
class RequestValidator {
public:
    /**
     * @throws UnknownDimensionException
     * @throws InvalidDepthException
     * @throws MalformedAncestorFiltersException
     * @throws duckdb::InvalidInputException for an inverted date range
     */
    static void ValidateDrilldown(const QueryRequest& request, const DimensionRegistry& registry);

    // Flat queries take no depth and no ancestor filters
    static void ValidateFlat(const QueryRequest& request, const DimensionRegistry& registry);

    // Attribution queries group by dims[depth] and need it to exist on the entry table
    static void ValidateAttribution(const QueryRequest& request, const DimensionRegistry& registry);

private:
    static void ValidateDimensions(const QueryRequest& request, const DimensionRegistry& registry);
    static void ValidateUserFilters(const QueryRequest& request, const DimensionRegistry& registry);
};

} // namespace drillq
