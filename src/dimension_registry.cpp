#include "dimension_registry.hpp"
#include "drillq_exceptions.hpp"
#include "drillq_tracing.hpp"

#include <algorithm>
#include <regex>

namespace drillq {

const char *const PREFIX_TOKEN = "{p}";

std::string DimensionKindToString(DimensionKind kind) {
    switch (kind) {
        case DimensionKind::PLAIN: return "plain";
        case DimensionKind::ENRICHED: return "enriched";
        case DimensionKind::CLASSIFICATION: return "classification";
        default: return "unknown";
    }
}

std::string JoinSpecificityToString(JoinSpecificity specificity) {
    switch (specificity) {
        case JoinSpecificity::NONE: return "none";
        case JoinSpecificity::CAMPAIGN: return "campaign";
        case JoinSpecificity::ADSET: return "adset";
        case JoinSpecificity::AD: return "ad";
        default: return "unknown";
    }
}

// ============================================================================
// DimensionDescriptor
// ============================================================================

DimensionKind DimensionDescriptor::Kind() const {
    if (std::holds_alternative<EnrichedDimension>(resolution)) {
        return DimensionKind::ENRICHED;
    }
    if (std::holds_alternative<ClassificationDimension>(resolution)) {
        return DimensionKind::CLASSIFICATION;
    }
    return DimensionKind::PLAIN;
}

bool DimensionDescriptor::IsDate() const {
    auto plain = std::get_if<PlainDimension>(&resolution);
    return plain && plain->is_date;
}

bool DimensionDescriptor::IsEventOnly() const {
    auto plain = std::get_if<PlainDimension>(&resolution);
    return plain && plain->expression.empty();
}

// ============================================================================
// Registry contents
// ============================================================================

static DimensionDescriptor Plain(const std::string& id, const std::string& expression,
                                 bool is_date = false, const std::string& event_expression = "") {
    DimensionDescriptor descriptor;
    descriptor.id = id;
    descriptor.resolution = PlainDimension{expression, is_date};
    descriptor.event_expression = event_expression;
    return descriptor;
}

static DimensionDescriptor Enriched(const std::string& id, const std::string& raw_column,
                                    const std::string& id_column, const std::string& name_column,
                                    JoinSpecificity specificity) {
    DimensionDescriptor descriptor;
    descriptor.id = id;
    descriptor.resolution = EnrichedDimension{raw_column, id_column, name_column, specificity};
    return descriptor;
}

static DimensionDescriptor ClassifiedProduct(const std::string& id) {
    DimensionDescriptor descriptor;
    descriptor.id = id;
    ClassificationDimension classification;
    classification.id_expression = "ap.id::text";
    classification.select_expression = "COALESCE(MAX(ap.name), 'Unknown')";
    classification.group_by_expression = "ap.id::text";
    classification.parent_filter_expression = "ap.id::text";
    classification.table_filter_expression = "ap.name";
    classification.row_expression = "COALESCE(ap.name, 'Unknown')";
    descriptor.resolution = classification;
    return descriptor;
}

static DimensionDescriptor ClassifiedCountry(const std::string& id) {
    DimensionDescriptor descriptor;
    descriptor.id = id;
    ClassificationDimension classification;
    classification.select_expression = "COALESCE(uc.country_code, 'Unknown')";
    classification.group_by_expression = "uc.country_code";
    classification.parent_filter_expression = "uc.country_code";
    classification.table_filter_expression = "uc.country_code";
    classification.row_expression = "COALESCE(uc.country_code, 'Unknown')";
    descriptor.resolution = classification;
    return descriptor;
}

static SourceDescriptor PageViewSource() {
    SourceDescriptor source;
    source.source = EventSource::PAGE_VIEWS;
    source.table = "remote_session_tracker.event_page_view_enriched_v2";
    source.alias = "pv";
    source.date_column = "{p}created_at";
    source.visitor_column = "{p}ff_visitor_id";
    source.active_time_column = "{p}active_time_s";
    source.hero_scroll_column = "{p}hero_scroll_passed";
    source.form_view_column = "{p}form_view";
    source.form_started_column = "{p}form_started";
    source.utm_source_column = "{p}utm_source";
    source.campaign_column = "{p}utm_campaign";
    source.adset_column = "{p}utm_content";
    source.ad_column = "{p}utm_medium";
    source.url_column = "{p}url_path";
    source.session_column = "{p}session_id";
    source.exclude_single_event_groups = false;
    return source;
}

static SourceDescriptor SessionSource() {
    SourceDescriptor source;
    source.source = EventSource::SESSIONS;
    source.table = "remote_session_tracker.session_entries";
    source.alias = "se";
    source.date_column = "{p}session_start";
    source.visitor_column = "{p}ff_visitor_id";
    source.active_time_column = "{p}entry_active_time_s";
    source.hero_scroll_column = "{p}entry_hero_scroll_passed";
    source.form_view_column = "{p}entry_form_view";
    source.form_started_column = "{p}entry_form_started";
    source.utm_source_column = "{p}entry_utm_source";
    source.campaign_column = "{p}entry_utm_campaign";
    source.adset_column = "{p}entry_utm_content";
    source.ad_column = "{p}entry_utm_medium";
    source.url_column = "{p}entry_url_path";
    source.session_column = "{p}session_id";
    source.exclude_single_event_groups = true;
    return source;
}

const DimensionRegistry& DimensionRegistry::PageViews() {
    static const DimensionRegistry registry(PageViewSource(), {
        Plain("urlPath", "{p}url_path"),
        Plain("pageType", "{p}page_type"),
        Plain("utmSource", "{p}utm_source"),
        Plain("country", "{p}country_code"),
        Plain("deviceType", "{p}device_type"),
        Plain("osName", "{p}os_name"),
        Plain("browserName", "{p}browser_name"),
        Plain("date", "{p}created_at::date", true),
        Enriched("campaign", "{p}utm_campaign", "campaign_id", "campaign_name", JoinSpecificity::CAMPAIGN),
        Enriched("adset", "{p}utm_content", "adset_id", "adset_name", JoinSpecificity::ADSET),
        Enriched("ad", "{p}utm_medium", "ad_id", "ad_name", JoinSpecificity::AD),
        ClassifiedProduct("classifiedProduct"),
        ClassifiedCountry("classifiedCountry"),
    });
    return registry;
}

const DimensionRegistry& DimensionRegistry::Sessions() {
    static const DimensionRegistry registry(SessionSource(), {
        Plain("entryUrlPath", "{p}entry_url_path"),
        Plain("entryPageType", "{p}entry_page_type"),
        Plain("entryUtmSource", "{p}entry_utm_source"),
        Plain("entryUtmTerm", "{p}entry_utm_term"),
        Plain("entryKeyword", "{p}entry_keyword"),
        Plain("entryPlacement", "{p}entry_placement"),
        Plain("entryReferrer", "{p}entry_referrer"),
        Plain("funnelId", "{p}ff_funnel_id"),
        Plain("entryCountryCode", "{p}entry_country_code"),
        Plain("entryDeviceType", "{p}entry_device_type"),
        Plain("entryOsName", "{p}entry_os_name"),
        Plain("entryBrowserName", "{p}entry_browser_name"),
        Plain("visitNumber", "{p}visit_number"),
        Plain("date", "{p}session_start::date", true, "{p}created_at::date"),
        Enriched("entryCampaign", "{p}entry_utm_campaign", "campaign_id", "campaign_name", JoinSpecificity::CAMPAIGN),
        Enriched("entryAdset", "{p}entry_utm_content", "adset_id", "adset_name", JoinSpecificity::ADSET),
        Enriched("entryAd", "{p}entry_utm_medium", "ad_id", "ad_name", JoinSpecificity::AD),
        ClassifiedProduct("entryProduct"),
        Plain("funnelStep", "", false, "REGEXP_REPLACE({p}url_path, '^https?://', '')"),
    });
    return registry;
}

const DimensionRegistry& DimensionRegistry::ForSource(EventSource source) {
    return source == EventSource::SESSIONS ? Sessions() : PageViews();
}

// ============================================================================
// DimensionRegistry
// ============================================================================

DimensionRegistry::DimensionRegistry(SourceDescriptor source, std::vector<DimensionDescriptor> dimensions)
    : source_(std::move(source)), dimensions_(std::move(dimensions)) {
    for (size_t i = 0; i < dimensions_.size(); ++i) {
        index_.emplace(dimensions_[i].id, i);
    }
}

const DimensionDescriptor* DimensionRegistry::Find(const std::string& dimension_id) const {
    auto it = index_.find(dimension_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &dimensions_[it->second];
}

const DimensionDescriptor& DimensionRegistry::Resolve(const std::string& dimension_id, const std::string& role) const {
    auto descriptor = Find(dimension_id);
    if (!descriptor) {
        ErrorContext context;
        context.Set("source", EventSourceToString(source_.source)).Set("role", role);
        DRILLQ_TRACE_DEBUG("DIMENSION_REGISTRY", context.Format("Unknown dimension '" + dimension_id + "'"));
        throw UnknownDimensionException(dimension_id, context);
    }
    return *descriptor;
}

// ============================================================================
// Helpers
// ============================================================================

std::string RenderTemplate(const std::string& column_template, const std::string& prefix) {
    static const std::string token = PREFIX_TOKEN;

    std::string result;
    result.reserve(column_template.size() + 8);
    size_t position = 0;
    while (true) {
        auto found = column_template.find(token, position);
        if (found == std::string::npos) {
            result.append(column_template, position, std::string::npos);
            break;
        }
        result.append(column_template, position, found - position);
        result.append(prefix);
        position = found + token.size();
    }
    return result;
}

std::vector<std::string> ReferencedColumns(const std::string& column_template) {
    static const std::regex column_pattern(R"(\{p\}([A-Za-z_][A-Za-z0-9_]*))");

    std::vector<std::string> columns;
    auto begin = std::sregex_iterator(column_template.begin(), column_template.end(), column_pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        auto column = (*it)[1].str();
        if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
            columns.push_back(column);
        }
    }
    return columns;
}

std::string ResolveSortMetric(const std::string& sort_by) {
    static const std::unordered_map<std::string, std::string> metric_columns = {
        {"pageViews", "page_views"},
        {"uniqueVisitors", "unique_visitors"},
        {"bounceRate", "bounce_rate"},
        {"avgActiveTime", "avg_active_time"},
        {"scrollPastHero", "scroll_past_hero"},
        {"scrollRate", "scroll_rate"},
        {"formViews", "form_views"},
        {"formViewRate", "form_view_rate"},
        {"formStarters", "form_starters"},
        {"formStartRate", "form_start_rate"},
    };

    auto it = metric_columns.find(sort_by);
    if (it == metric_columns.end()) {
        return "page_views";
    }
    return it->second;
}

} // namespace drillq
