#pragma once

#include "query_request.hpp"

namespace drillq {

/**
 * Depth-recursive compiler: one aggregated query for the dimension at
 * `request.depth`, restricted by the values chosen at shallower depths.
 *
 * Stateless. Compiling the same request twice yields byte-identical text and
 * parameters. Every request error is raised before any SQL is built.
 *
 * Parameters: $1 and $2 are the date range boundaries, ancestor and user
 * filter values follow in the order they appear in the text.
 */
class DrilldownQueryCompiler {
public:
    /**
     * @throws UnknownDimensionException
     * @throws InvalidDepthException
     * @throws MalformedAncestorFiltersException
     */
    static CompiledQuery Compile(const QueryRequest& request);
};

} // namespace drillq
