#pragma once

#include "query_executor.hpp"
#include "query_request.hpp"

#include <set>
#include <string>
#include <vector>

namespace drillq {

// One analytics tracking-match row; NULL ids arrive as ""
struct TrackingMatchRow {
    std::string dimension_value;
    bool dimension_is_null = false;
    std::string source;
    std::string campaign_id;
    std::string adset_id;
    std::string ad_id;
    double unique_visitors = 0;
};

struct VisitorMatchRow {
    std::string dimension_value;
    bool dimension_is_null = false;
    std::string visitor_id;
};

struct CrmTrackingRow {
    std::string source;
    std::string campaign_id;
    std::string adset_id;
    std::string ad_id;
    double trials = 0;
    double approved = 0;
};

struct CrmVisitorRow {
    std::string visitor_id;
    double trials = 0;
    double approved = 0;
};

struct DimensionConversions {
    // Lower-cased; "unknown" for NULL
    std::string dimension_value;
    double trials = 0;
    double approved = 0;
};

struct AttributionReport {
    // Sorted by trials descending
    std::vector<DimensionConversions> conversions;
    double total_crm_trials = 0;
    double matched_crm_trials = 0;
    size_t unmatched_keys = 0;

    const DimensionConversions* Find(const std::string& dimension_value) const;
};

/**
 * In-memory join of analytics match rows and CRM rows that share a key but
 * live in different stores.
 */
class AttributionCorrelator {
public:
    // "source::campaign::adset::ad" without the excluded fields; NULL and "null" count as ""
    static std::string TrackingKey(
        const std::string& source,
        const std::string& campaign_id,
        const std::string& adset_id,
        const std::string& ad_id,
        const std::set<std::string>& excluded_fields = {});

    /**
     * Key fields already fixed by the grouped dimension or an ancestor filter
     * (source, campaign_id, adset_id, ad_id).
     */
    static std::set<std::string> ExcludedTrackingFields(const QueryRequest& request);

    /**
     * Split each CRM key's conversions across the dimension values sharing
     * that key, in proportion to their unique visitors.
     */
    static AttributionReport CorrelateByTracking(
        const std::vector<CrmTrackingRow>& crm_rows,
        const std::vector<TrackingMatchRow>& analytics_rows,
        const std::set<std::string>& excluded_fields = {});

    // Split each CRM visitor's conversions evenly across the dimension values the visitor appears in
    static AttributionReport CorrelateByVisitor(
        const std::vector<CrmVisitorRow>& crm_rows,
        const std::vector<VisitorMatchRow>& analytics_rows);

    static std::vector<TrackingMatchRow> ParseTrackingMatch(const QueryRows& rows);
    static std::vector<VisitorMatchRow> ParseVisitorMatch(const QueryRows& rows);
    static std::vector<CrmTrackingRow> ParseCrmTracking(const QueryRows& rows);
    static std::vector<CrmVisitorRow> ParseCrmVisitors(const QueryRows& rows);
};

} // namespace drillq
