#include "join_planner.hpp"
#include "drillq_tracing.hpp"

#include <algorithm>

namespace drillq {

std::string JoinPlan::Column(const std::string& column_template) const {
    return RenderTemplate(column_template, column_prefix);
}

std::string JoinPlan::ToString() const {
    return "enriched=" + JoinSpecificityToString(enriched_join_level) +
           ", classification=" + std::string(needs_classification_join ? "true" : "false") +
           ", prefix='" + column_prefix + "'";
}

JoinPlanner::JoinPlanner(const DimensionRegistry& registry) : registry_(registry) {
}

JoinPlan JoinPlanner::Plan(
    const std::string& current_dimension,
    const std::vector<std::string>& ancestor_filter_keys,
    const std::vector<std::string>& user_filter_fields) const {

    // Validate each group under its own role so the error names where the id came from
    registry_.Resolve(current_dimension, "dimension");
    for (const auto& key : ancestor_filter_keys) {
        registry_.Resolve(key, "ancestor_filter");
    }
    for (const auto& field : user_filter_fields) {
        registry_.Resolve(field, "user_filter");
    }

    std::vector<std::string> referenced;
    referenced.reserve(1 + ancestor_filter_keys.size() + user_filter_fields.size());
    referenced.push_back(current_dimension);
    referenced.insert(referenced.end(), ancestor_filter_keys.begin(), ancestor_filter_keys.end());
    referenced.insert(referenced.end(), user_filter_fields.begin(), user_filter_fields.end());
    return Plan(referenced);
}

JoinPlan JoinPlanner::Plan(const std::vector<std::string>& dimension_ids) const {
    JoinPlan plan;

    for (const auto& dimension_id : dimension_ids) {
        const auto& descriptor = registry_.Resolve(dimension_id);
        if (auto enriched = std::get_if<EnrichedDimension>(&descriptor.resolution)) {
            plan.enriched_join_level = std::max(plan.enriched_join_level, enriched->specificity);
        } else if (std::holds_alternative<ClassificationDimension>(descriptor.resolution)) {
            plan.needs_classification_join = true;
        }
    }

    if (plan.NeedsJoin()) {
        plan.column_prefix = registry_.Source().alias + ".";
    }

    DRILLQ_TRACE_DEBUG("JOIN_PLANNER", "Join plan: " + plan.ToString());
    return plan;
}

std::vector<std::string> JoinPlanner::RenderJoins(const JoinPlan& plan, const std::string& key_prefix) const {
    std::vector<std::string> joins;
    if (plan.enriched_join_level != JoinSpecificity::NONE) {
        joins.push_back(RenderEnrichedJoin(plan.enriched_join_level, key_prefix));
    }
    if (plan.needs_classification_join) {
        joins.push_back(RenderClassificationJoin(key_prefix));
    }
    return joins;
}

std::string JoinPlanner::RenderEnrichedJoin(JoinSpecificity level, const std::string& key_prefix) const {
    const auto& source = registry_.Source();

    struct JoinLevel {
        JoinSpecificity specificity;
        const char *id_column;
        const char *name_column;
        const std::string *key_column;
    };
    const JoinLevel levels[] = {
        {JoinSpecificity::CAMPAIGN, "campaign_id", "campaign_name", &source.campaign_column},
        {JoinSpecificity::ADSET, "adset_id", "adset_name", &source.adset_column},
        {JoinSpecificity::AD, "ad_id", "ad_name", &source.ad_column},
    };

    std::vector<std::string> ids;
    std::vector<std::string> names;
    std::vector<std::string> conditions;
    for (const auto& join_level : levels) {
        if (join_level.specificity > level) {
            break;
        }
        ids.emplace_back(join_level.id_column);
        names.push_back(std::string("MAX(") + join_level.name_column + ") AS " + join_level.name_column);
        conditions.push_back(RenderTemplate(*join_level.key_column, key_prefix) + "::text = mas." +
                             join_level.id_column + "::text");
    }

    auto join_list = [](const std::vector<std::string>& items, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out += separator;
            }
            out += items[i];
        }
        return out;
    };

    // Grouped by id tuple so the join never multiplies event rows
    return "LEFT JOIN (SELECT " + join_list(ids, ", ") + ", " + join_list(names, ", ") +
           " FROM merged_ads_spending GROUP BY " + join_list(ids, ", ") + ") mas ON " +
           join_list(conditions, " AND ");
}

std::string JoinPlanner::RenderClassificationJoin(const std::string& key_prefix) const {
    return "LEFT JOIN app_url_classifications uc ON " +
           RenderTemplate(registry_.Source().url_column, key_prefix) +
           " = uc.url_path AND uc.is_ignored = false\n"
           "LEFT JOIN app_products ap ON uc.product_id = ap.id";
}

} // namespace drillq
