#pragma once

#include "query_request.hpp"

namespace drillq {

/**
 * Analytics-side keying queries for cross-engine attribution.
 *
 * Both queries read raw tracking identifiers straight from the event source
 * and never join the spend-tracking table: their output is matched against
 * the CRM's key space, not shown to users. Ancestor and user filters of the
 * request restrict the rows exactly like the drill-down query of the same
 * depth. An empty result is a valid outcome.
 */
class AttributionMatcher {
public:
    /**
     * Rows (dimension_value, source, campaign_id, adset_id, ad_id,
     * unique_visitors), ids as text with NULL mapped to ''.
     */
    static CompiledQuery BuildTrackingMatch(const QueryRequest& request);

    // Distinct rows (dimension_value, visitor_id)
    static CompiledQuery BuildVisitorMatch(const QueryRequest& request);
};

} // namespace drillq
