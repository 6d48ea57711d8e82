#pragma once

#include "query_request.hpp"

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace drillq {

// Marks where the table alias prefix goes in a column template ("{p}url_path").
extern const char *const PREFIX_TOKEN;

enum class DimensionKind {
    PLAIN,
    ENRICHED,
    CLASSIFICATION
};

// Ordered by specificity; an AD join also carries ad-set and campaign columns.
enum class JoinSpecificity {
    NONE = 0,
    CAMPAIGN = 1,
    ADSET = 2,
    AD = 3
};

std::string DimensionKindToString(DimensionKind kind);
std::string JoinSpecificityToString(JoinSpecificity specificity);

struct PlainDimension {
    // Column template; empty when the dimension only exists on the event table
    std::string expression;
    bool is_date = false;
};

struct EnrichedDimension {
    // Raw tracking id on the event source
    std::string raw_column;
    // Columns of the spend-tracking table
    std::string id_column;
    std::string name_column;
    JoinSpecificity specificity = JoinSpecificity::CAMPAIGN;
};

// Expressions reference the classification join aliases (uc, ap) directly.
struct ClassificationDimension {
    // Optional dimension_id column
    std::string id_expression;
    // Display value, valid in an aggregated SELECT
    std::string select_expression;
    std::string group_by_expression;
    // Compared against the key produced by a shallower level
    std::string parent_filter_expression;
    // Compared against the name a user typed
    std::string table_filter_expression;
    // Per-row value for ungrouped or attribution queries
    std::string row_expression;
};

using DimensionResolution = std::variant<PlainDimension, EnrichedDimension, ClassificationDimension>;

struct DimensionDescriptor {
    std::string id;
    DimensionResolution resolution;
    // Template over the page-view table used in session funnel mode
    std::string event_expression;

    DimensionKind Kind() const;
    bool IsDate() const;
    bool HasEventExpression() const {
        return !event_expression.empty();
    }
    // Not available on the entry table at all (funnelStep)
    bool IsEventOnly() const;
};

struct SourceDescriptor {
    EventSource source;
    std::string table;
    std::string alias;
    std::string date_column;
    std::string visitor_column;
    std::string active_time_column;
    std::string hero_scroll_column;
    std::string form_view_column;
    std::string form_started_column;
    std::string utm_source_column;
    // Enriched join keys, in specificity order
    std::string campaign_column;
    std::string adset_column;
    std::string ad_column;
    // Classification join key
    std::string url_column;
    std::string session_column;
    // Entry-level session groups with a single event are dropped
    bool exclude_single_event_groups = false;
};

/**
 * Static mapping from dimension id to its resolution descriptor, one registry
 * per event source. Populated once on first use, read-only afterwards.
 */
class DimensionRegistry {
public:
    static const DimensionRegistry& PageViews();
    static const DimensionRegistry& Sessions();
    static const DimensionRegistry& ForSource(EventSource source);

    const SourceDescriptor& Source() const {
        return source_;
    }

    /**
     * @param role Where the id appeared (dimension, ancestor_filter, user_filter)
     * @throws UnknownDimensionException if absent
     */
    const DimensionDescriptor& Resolve(const std::string& dimension_id, const std::string& role = "dimension") const;

    // nullptr if absent
    const DimensionDescriptor* Find(const std::string& dimension_id) const;

    const std::vector<DimensionDescriptor>& Dimensions() const {
        return dimensions_;
    }

private:
    DimensionRegistry(SourceDescriptor source, std::vector<DimensionDescriptor> dimensions);

    SourceDescriptor source_;
    std::vector<DimensionDescriptor> dimensions_;
    std::unordered_map<std::string, size_t> index_;
};

// Replace every PREFIX_TOKEN in a column template with prefix ("pv." or "").
std::string RenderTemplate(const std::string& column_template, const std::string& prefix);

// Bare column names referenced through PREFIX_TOKEN, in first-appearance order.
std::vector<std::string> ReferencedColumns(const std::string& column_template);

// Sort key to metric column alias; unknown keys fall back to page_views.
std::string ResolveSortMetric(const std::string& sort_by);

} // namespace drillq
