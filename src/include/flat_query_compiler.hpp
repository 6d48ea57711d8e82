#pragma once

#include "query_request.hpp"

namespace drillq {

/**
 * Flat compiler: groups by every requested dimension in a single statement,
 * so a client can build the whole tree from one round trip.
 *
 * Each dimension yields a column named after its id (enriched dimensions add
 * a `_<id>_id` column). Metrics are raw counts the client can re-aggregate.
 * `depth`, `sort_by` and `limit` of the request are ignored.
 *
 * Requests touching `funnelStep` compile to the two-stage session funnel
 * shape; everything else groups the entry rows directly.
 */
class FlatQueryCompiler {
public:
    /**
     * @throws UnknownDimensionException
     * @throws MalformedAncestorFiltersException if ancestor filters are given
     */
    static CompiledQuery Compile(const QueryRequest& request);
};

} // namespace drillq
