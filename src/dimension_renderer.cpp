#include "dimension_renderer.hpp"

namespace drillq {

DimensionAliases DimensionAliases::Drilldown() {
    return DimensionAliases{"dimension_value", "dimension_id"};
}

DimensionAliases DimensionAliases::Flat(const std::string& dimension_id) {
    return DimensionAliases{"\"" + dimension_id + "\"", "\"_" + dimension_id + "_id\""};
}

std::string DimensionRenderer::PlainExpression(
    const DimensionDescriptor& descriptor,
    const PlainDimension& plain,
    const std::string& prefix,
    bool use_event_expression) {

    if (use_event_expression && descriptor.HasEventExpression()) {
        return RenderTemplate(descriptor.event_expression, prefix);
    }
    if (plain.expression.empty()) {
        throw duckdb::InternalException("Dimension '" + descriptor.id + "' is only available on the event table");
    }
    return RenderTemplate(plain.expression, prefix);
}

RenderedDimension DimensionRenderer::Grouped(
    const DimensionDescriptor& descriptor,
    const std::string& prefix,
    const DimensionAliases& aliases,
    bool use_event_expression) {

    RenderedDimension rendered;

    if (auto plain = std::get_if<PlainDimension>(&descriptor.resolution)) {
        auto expression = PlainExpression(descriptor, *plain, prefix, use_event_expression);
        rendered.select_items.push_back(expression + " AS " + aliases.value_alias);
        rendered.group_by.push_back(expression);
    } else if (auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution)) {
        auto raw_id = RenderTemplate(enriched->raw_column, prefix) + "::text";
        rendered.select_items.push_back(raw_id + " AS " + aliases.id_alias);
        // Never NULL: joined name, then raw id, then the sentinel
        rendered.select_items.push_back("COALESCE(MAX(mas." + enriched->name_column + "), " + raw_id +
                                        ", 'Unknown') AS " + aliases.value_alias);
        rendered.group_by.push_back(raw_id);
    } else if (auto classification = std::get_if<ClassificationDimension>(&descriptor.resolution)) {
        if (!classification->id_expression.empty()) {
            rendered.select_items.push_back(classification->id_expression + " AS " + aliases.id_alias);
        }
        rendered.select_items.push_back(classification->select_expression + " AS " + aliases.value_alias);
        rendered.group_by.push_back(classification->group_by_expression);
    }

    return rendered;
}

std::string DimensionRenderer::Row(
    const DimensionDescriptor& descriptor,
    const std::string& prefix,
    bool use_event_expression) {

    if (auto plain = std::get_if<PlainDimension>(&descriptor.resolution)) {
        return PlainExpression(descriptor, *plain, prefix, use_event_expression);
    }
    if (auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution)) {
        return RenderTemplate(enriched->raw_column, prefix) + "::text";
    }
    return std::get<ClassificationDimension>(descriptor.resolution).row_expression;
}

std::string DimensionRenderer::ParentFilterExpression(
    const DimensionDescriptor& descriptor,
    const std::string& prefix,
    bool use_event_expression) {

    if (auto plain = std::get_if<PlainDimension>(&descriptor.resolution)) {
        return PlainExpression(descriptor, *plain, prefix, use_event_expression);
    }
    if (auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution)) {
        return RenderTemplate(enriched->raw_column, prefix) + "::text";
    }
    return std::get<ClassificationDimension>(descriptor.resolution).parent_filter_expression;
}

std::string DimensionRenderer::TableFilterExpression(
    const DimensionDescriptor& descriptor,
    const std::string& prefix,
    bool use_event_expression) {

    if (auto plain = std::get_if<PlainDimension>(&descriptor.resolution)) {
        return PlainExpression(descriptor, *plain, prefix, use_event_expression);
    }
    if (auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution)) {
        return RenderTemplate(enriched->raw_column, prefix);
    }
    return std::get<ClassificationDimension>(descriptor.resolution).table_filter_expression;
}

std::string DimensionRenderer::AncestorPredicate(
    const DimensionDescriptor& descriptor,
    const std::string& prefix,
    const std::string& value,
    ParameterBinder& binder,
    bool use_event_expression) {

    auto expression = ParentFilterExpression(descriptor, prefix, use_event_expression);
    if (value == UNKNOWN_VALUE) {
        return expression + " IS NULL";
    }

    auto placeholder = binder.Bind(duckdb::Value(value));
    if (descriptor.IsDate()) {
        return expression + " = " + placeholder + "::date";
    }
    return expression + " = " + placeholder;
}

std::vector<std::string> DimensionRenderer::DateRangePredicates(
    const std::string& date_column,
    const std::string& start_placeholder,
    const std::string& end_placeholder) {

    return {
        date_column + " >= " + start_placeholder + "::date",
        date_column + " < (" + end_placeholder + "::date + interval '1 day')",
    };
}

static std::string Ratio(const std::string& numerator, const std::string& denominator, int digits) {
    return "ROUND(CAST(" + numerator + " AS DOUBLE) / NULLIF(" + denominator + ", 0), " +
           std::to_string(digits) + ")";
}

std::vector<std::string> DimensionRenderer::RateMetrics(const SourceDescriptor& source, const std::string& prefix) {
    auto visitor = RenderTemplate(source.visitor_column, prefix);
    auto active = RenderTemplate(source.active_time_column, prefix);
    auto hero = RenderTemplate(source.hero_scroll_column, prefix);
    auto form_view = RenderTemplate(source.form_view_column, prefix);
    auto form_started = RenderTemplate(source.form_started_column, prefix);

    auto bounced = "COUNT(*) FILTER (WHERE " + active + " IS NOT NULL AND " + active + " < 5)";
    auto timed = "COUNT(*) FILTER (WHERE " + active + " IS NOT NULL)";
    auto scrolled = "COUNT(*) FILTER (WHERE " + hero + " = true)";
    auto viewed = "COUNT(*) FILTER (WHERE " + form_view + " = true)";
    auto started = "COUNT(*) FILTER (WHERE " + form_started + " = true)";

    return {
        "COUNT(*) AS page_views",
        "COUNT(DISTINCT " + visitor + ") AS unique_visitors",
        Ratio(bounced, timed, 4) + " AS bounce_rate",
        "ROUND(CAST(AVG(" + active + ") AS DOUBLE), 2) AS avg_active_time",
        scrolled + " AS scroll_past_hero",
        Ratio(scrolled, "COUNT(*)", 4) + " AS scroll_rate",
        viewed + " AS form_views",
        Ratio(viewed, "COUNT(*)", 4) + " AS form_view_rate",
        started + " AS form_starters",
        Ratio(started, viewed, 4) + " AS form_start_rate",
    };
}

std::vector<std::string> DimensionRenderer::CountMetrics(const SourceDescriptor& source, const std::string& prefix) {
    auto visitor = RenderTemplate(source.visitor_column, prefix);
    auto active = RenderTemplate(source.active_time_column, prefix);
    auto hero = RenderTemplate(source.hero_scroll_column, prefix);
    auto form_view = RenderTemplate(source.form_view_column, prefix);
    auto form_started = RenderTemplate(source.form_started_column, prefix);

    return {
        "COUNT(*) AS page_views",
        "COUNT(DISTINCT " + visitor + ") AS unique_visitors",
        "COUNT(*) FILTER (WHERE " + active + " IS NOT NULL AND " + active + " < 5) AS bounced_count",
        "COUNT(*) FILTER (WHERE " + active + " IS NOT NULL) AS active_time_count",
        "COALESCE(SUM(" + active + "), 0) AS total_active_time",
        "COUNT(*) FILTER (WHERE " + hero + " = true) AS scroll_past_hero",
        "COUNT(*) FILTER (WHERE " + form_view + " = true) AS form_views",
        "COUNT(*) FILTER (WHERE " + form_started + " = true) AS form_starters",
    };
}

} // namespace drillq
