#pragma once

#include "query_request.hpp"

#include <string>
#include <utility>
#include <vector>

namespace drillq {

// CRM-side grouping and filtering of an analytics dimension
struct CrmDimensionMapping {
    std::string group_by;
    std::string filter_field;
    bool is_source = false;
};

/**
 * CRM-side queries (MariaDB dialect, `?` placeholders) for attribution.
 *
 * Every query reads trial subscriptions joined to their primary invoice and
 * traffic source, excluding deleted subscriptions and upsells. Parent filters
 * on dimensions without a CRM mapping are skipped, the UNKNOWN_VALUE sentinel
 * becomes IS NULL, and source filters match every synonym of the source.
 *
 * Columns: trials, approved, plus the grouping columns of each query.
 */
class CrmQueryBuilder {
public:
    using ParentFilters = std::vector<std::pair<std::string, std::string>>;

    // nullptr for dimensions with no CRM counterpart
    static const CrmDimensionMapping* FindMapping(const std::string& dimension_id);

    // Grouped by source, campaign_id, adset_id, ad_id
    static CompiledQuery BuildTrackingQuery(const DateRange& date_range, const ParentFilters& parent_filters);

    // Grouped by ff_vid
    static CompiledQuery BuildVisitorQuery(const DateRange& date_range, const ParentFilters& parent_filters);

    /**
     * Grouped by the CRM expression of dimension_id, as dimension_value.
     *
     * @throws duckdb::InvalidInputException if the dimension has no CRM mapping
     */
    static CompiledQuery BuildDimensionQuery(
        const std::string& dimension_id,
        const DateRange& date_range,
        const ParentFilters& parent_filters);
};

} // namespace drillq
