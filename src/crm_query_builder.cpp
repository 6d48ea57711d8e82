#include "crm_query_builder.hpp"
#include "drillq_tracing.hpp"
#include "parameter_validation.hpp"
#include "source_normalizer.hpp"
#include "sql_query_builder.hpp"

#include <unordered_map>

namespace drillq {

static const char *const NORMALIZED_SOURCE_COLUMN = "sr.source";

const CrmDimensionMapping* CrmQueryBuilder::FindMapping(const std::string& dimension_id) {
    static const CrmDimensionMapping source{"LOWER(COALESCE(sr.source, 'unknown'))", "sr.source", true};
    static const CrmDimensionMapping campaign{"s.tracking_id_4", "s.tracking_id_4", false};
    static const CrmDimensionMapping adset{"s.tracking_id_2", "s.tracking_id_2", false};
    static const CrmDimensionMapping ad{"s.tracking_id", "s.tracking_id", false};
    static const CrmDimensionMapping date{"DATE_FORMAT(s.date_create, '%Y-%m-%d')", "DATE(s.date_create)", false};

    // Page-view ids and their session entry counterparts
    static const std::unordered_map<std::string, const CrmDimensionMapping*> mappings = {
        {"utmSource", &source},
        {"entryUtmSource", &source},
        {"campaign", &campaign},
        {"entryCampaign", &campaign},
        {"adset", &adset},
        {"entryAdset", &adset},
        {"ad", &ad},
        {"entryAd", &ad},
        {"date", &date},
    };

    auto it = mappings.find(dimension_id);
    return it == mappings.end() ? nullptr : it->second;
}

// FROM, joins and WHERE shared by every CRM query
static void ApplyBase(
    SqlQueryBuilder& builder,
    ParameterBinder& binder,
    const DateRange& date_range,
    const CrmQueryBuilder::ParentFilters& parent_filters) {

    ParameterValidation::ValidateDateRange(date_range.start, date_range.end);

    builder.SetFrom("subscription", "s")
           .AddJoin("INNER JOIN invoice i ON i.subscription_id = s.id AND i.type = 1")
           .AddJoin("LEFT JOIN source sr ON sr.id = s.source_id");

    auto start = binder.Bind(duckdb::Value(duckdb::Date::ToString(date_range.start) + " 00:00:00"));
    auto end = binder.Bind(duckdb::Value(duckdb::Date::ToString(date_range.end) + " 23:59:59"));
    builder.AddWhere("s.date_create BETWEEN " + start + " AND " + end)
           .AddWhere("s.deleted = 0")
           .AddWhere("(i.tag IS NULL OR i.tag NOT LIKE '%parent-sub-id=%')");

    for (const auto& [dimension_id, value] : parent_filters) {
        auto mapping = CrmQueryBuilder::FindMapping(dimension_id);
        if (!mapping) {
            DRILLQ_TRACE_DEBUG("CRM_QUERY", "No CRM mapping for parent filter " + dimension_id + ", skipping");
            continue;
        }

        if (value == UNKNOWN_VALUE) {
            builder.AddWhere(mapping->filter_field + " IS NULL");
            continue;
        }

        if (mapping->is_source) {
            auto spellings = SourceNormalizer::Expand(value);
            std::string placeholders;
            for (size_t i = 0; i < spellings.size(); ++i) {
                if (i > 0) {
                    placeholders += ", ";
                }
                placeholders += binder.Bind(duckdb::Value(spellings[i]));
            }
            if (spellings.size() == 1) {
                builder.AddWhere("LOWER(" + std::string(NORMALIZED_SOURCE_COLUMN) + ") = " + placeholders);
            } else {
                builder.AddWhere("LOWER(" + std::string(NORMALIZED_SOURCE_COLUMN) + ") IN (" + placeholders + ")");
            }
        } else {
            builder.AddWhere(mapping->filter_field + " = " + binder.Bind(duckdb::Value(value)));
        }
    }
}

static std::vector<std::string> ConversionCounts() {
    return {
        "COUNT(DISTINCT s.id) AS trials",
        "COUNT(DISTINCT CASE WHEN i.is_marked = 1 AND i.deleted = 0 THEN s.id END) AS approved",
    };
}

static CompiledQuery Finish(const SqlQueryBuilder& builder, ParameterBinder& binder, const std::string& description) {
    CompiledQuery query;
    query.text = builder.Build();
    query.parameters = binder.Release();
    DRILLQ_TRACE_DEBUG_DATA("CRM_QUERY", "Compiled CRM " + description + " query", query.text);
    return query;
}

CompiledQuery CrmQueryBuilder::BuildTrackingQuery(const DateRange& date_range, const ParentFilters& parent_filters) {
    auto source = SourceNormalizer::RenderSql(NORMALIZED_SOURCE_COLUMN);
    std::vector<std::string> keys = {
        source,
        "COALESCE(s.tracking_id_4, '')",
        "COALESCE(s.tracking_id_2, '')",
        "COALESCE(s.tracking_id, '')",
    };

    SqlQueryBuilder builder;
    builder.AddSelect(keys[0] + " AS source")
           .AddSelect(keys[1] + " AS campaign_id")
           .AddSelect(keys[2] + " AS adset_id")
           .AddSelect(keys[3] + " AS ad_id")
           .AddSelect(ConversionCounts());

    ParameterBinder binder(PlaceholderStyle::QUESTION);
    ApplyBase(builder, binder, date_range, parent_filters);
    builder.AddGroupBy(keys);

    return Finish(builder, binder, "tracking");
}

CompiledQuery CrmQueryBuilder::BuildVisitorQuery(const DateRange& date_range, const ParentFilters& parent_filters) {
    SqlQueryBuilder builder;
    builder.AddSelect("s.ff_vid AS ff_vid").AddSelect(ConversionCounts());

    ParameterBinder binder(PlaceholderStyle::QUESTION);
    ApplyBase(builder, binder, date_range, parent_filters);
    builder.AddWhere("s.ff_vid IS NOT NULL").AddGroupBy("s.ff_vid");

    return Finish(builder, binder, "visitor");
}

CompiledQuery CrmQueryBuilder::BuildDimensionQuery(
    const std::string& dimension_id,
    const DateRange& date_range,
    const ParentFilters& parent_filters) {

    auto mapping = FindMapping(dimension_id);
    if (!mapping) {
        throw duckdb::InvalidInputException("Dimension '" + dimension_id + "' has no CRM equivalent");
    }

    SqlQueryBuilder builder;
    builder.AddSelect(mapping->group_by + " AS dimension_value").AddSelect(ConversionCounts());

    ParameterBinder binder(PlaceholderStyle::QUESTION);
    ApplyBase(builder, binder, date_range, parent_filters);
    builder.AddGroupBy(mapping->group_by);

    return Finish(builder, binder, dimension_id);
}

} // namespace drillq
