#include "attribution_matcher.hpp"
#include "dimension_registry.hpp"
#include "dimension_renderer.hpp"
#include "drillq_tracing.hpp"
#include "join_planner.hpp"
#include "request_validator.hpp"
#include "source_normalizer.hpp"
#include "sql_query_builder.hpp"
#include "table_filter_builder.hpp"

namespace drillq {

namespace {

// FROM and WHERE shared by both match queries
class MatchQueryBase {
public:
    explicit MatchQueryBase(const QueryRequest& request)
        : request_(request), registry_(DimensionRegistry::ForSource(request.source)) {
        RequestValidator::ValidateAttribution(request_, registry_);

        std::vector<std::string> ancestor_keys;
        for (const auto& ancestor : request_.ancestor_filters) {
            ancestor_keys.push_back(ancestor.first);
        }
        std::vector<std::string> filter_fields;
        for (const auto& filter : request_.user_filters) {
            filter_fields.push_back(filter.field);
        }

        // Only the classification join is taken over; ids stay raw
        auto planned = JoinPlanner(registry_).Plan(CurrentId(), ancestor_keys, filter_fields);
        plan_.needs_classification_join = planned.needs_classification_join;
        if (plan_.NeedsJoin()) {
            plan_.column_prefix = registry_.Source().alias + ".";
        }
    }

    const std::string& CurrentId() const {
        return request_.dimensions[request_.depth];
    }

    const DimensionRegistry& Registry() const {
        return registry_;
    }

    const JoinPlan& Plan() const {
        return plan_;
    }

    std::string DimensionValue() const {
        return DimensionRenderer::Row(registry_.Resolve(CurrentId()), plan_.column_prefix);
    }

    void ApplySource(SqlQueryBuilder& builder, ParameterBinder& binder) const {
        const auto& source = registry_.Source();
        const auto& prefix = plan_.column_prefix;

        auto start = binder.Bind(duckdb::Value::DATE(request_.date_range.start));
        auto end = binder.Bind(duckdb::Value::DATE(request_.date_range.end));

        builder.SetFrom(source.table, plan_.NeedsJoin() ? source.alias : "");
        JoinPlanner planner(registry_);
        for (const auto& join : planner.RenderJoins(plan_, prefix)) {
            builder.AddJoin(join);
        }

        builder.AddWhere(DimensionRenderer::DateRangePredicates(plan_.Column(source.date_column), start, end));
        for (int64_t i = 0; i < request_.depth; ++i) {
            auto it = request_.ancestor_filters.find(request_.dimensions[i]);
            if (it != request_.ancestor_filters.end()) {
                builder.AddWhere(DimensionRenderer::AncestorPredicate(
                    registry_.Resolve(it->first), prefix, it->second, binder));
            }
        }
        TableFilterBuilder filter_builder(registry_, binder, start, end);
        builder.AddWhere(filter_builder.Build(request_.user_filters, prefix).predicates);
    }

private:
    const QueryRequest& request_;
    const DimensionRegistry& registry_;
    JoinPlan plan_;
};

} // namespace

CompiledQuery AttributionMatcher::BuildTrackingMatch(const QueryRequest& request) {
    MatchQueryBase base(request);
    const auto& source = base.Registry().Source();
    const auto& plan = base.Plan();

    auto dimension_value = base.DimensionValue();
    auto normalized_source = SourceNormalizer::RenderSql(plan.Column(source.utm_source_column));
    auto campaign = "COALESCE(" + plan.Column(source.campaign_column) + "::text, '')";
    auto adset = "COALESCE(" + plan.Column(source.adset_column) + "::text, '')";
    auto ad = "COALESCE(" + plan.Column(source.ad_column) + "::text, '')";

    SqlQueryBuilder builder;
    builder.AddSelect({
        dimension_value + " AS dimension_value",
        normalized_source + " AS source",
        campaign + " AS campaign_id",
        adset + " AS adset_id",
        ad + " AS ad_id",
        "COUNT(DISTINCT " + plan.Column(source.visitor_column) + ") AS unique_visitors",
    });

    ParameterBinder binder;
    base.ApplySource(builder, binder);

    builder.AddGroupBy({dimension_value, normalized_source, campaign, adset, ad})
           .AddOrderBy("unique_visitors", SortDirection::DESC);

    CompiledQuery query;
    query.text = builder.Build();
    query.parameters = binder.Release();

    DRILLQ_TRACE_DEBUG_DATA("ATTRIBUTION_MATCHER", "Compiled tracking match for " + base.CurrentId(), query.text);
    return query;
}

CompiledQuery AttributionMatcher::BuildVisitorMatch(const QueryRequest& request) {
    MatchQueryBase base(request);
    const auto& source = base.Registry().Source();
    auto visitor = base.Plan().Column(source.visitor_column);

    SqlQueryBuilder builder;
    builder.SetDistinct(true)
           .AddSelect(base.DimensionValue() + " AS dimension_value")
           .AddSelect(visitor + " AS visitor_id");

    ParameterBinder binder;
    base.ApplySource(builder, binder);
    builder.AddWhere(visitor + " IS NOT NULL");

    CompiledQuery query;
    query.text = builder.Build();
    query.parameters = binder.Release();

    DRILLQ_TRACE_DEBUG_DATA("ATTRIBUTION_MATCHER", "Compiled visitor match for " + base.CurrentId(), query.text);
    return query;
}

} // namespace drillq
