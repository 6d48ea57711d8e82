#pragma once

#include "dimension_registry.hpp"

#include <string>
#include <vector>

namespace drillq {

struct JoinPlan {
    JoinSpecificity enriched_join_level = JoinSpecificity::NONE;
    bool needs_classification_join = false;
    // Empty without joins, otherwise the base table alias plus '.'
    std::string column_prefix;

    bool NeedsJoin() const {
        return enriched_join_level != JoinSpecificity::NONE || needs_classification_join;
    }

    // Render a column template with this plan's prefix
    std::string Column(const std::string& column_template) const;

    std::string ToString() const;
};

/**
 * Decides which joins a query needs from every dimension id it references,
 * and renders those joins.
 *
 * The enriched join level is the most specific one required by any referenced
 * enriched dimension. Classification dimensions add the URL classification
 * join. Once any join exists the base table is aliased and every column is
 * prefixed through JoinPlan::Column.
 */
class JoinPlanner {
public:
    explicit JoinPlanner(const DimensionRegistry& registry);

    /**
     * @throws UnknownDimensionException for any id missing from the registry
     */
    JoinPlan Plan(
        const std::string& current_dimension,
        const std::vector<std::string>& ancestor_filter_keys,
        const std::vector<std::string>& user_filter_fields) const;

    JoinPlan Plan(const std::vector<std::string>& dimension_ids) const;

    /**
     * Join clauses in FROM order: enriched join first, then classification.
     *
     * @param key_prefix Prefix of the columns holding the join keys; differs
     *        from the plan prefix when the keys live in a CTE ("ms.")
     */
    std::vector<std::string> RenderJoins(const JoinPlan& plan, const std::string& key_prefix) const;

    std::string RenderEnrichedJoin(JoinSpecificity level, const std::string& key_prefix) const;

    std::string RenderClassificationJoin(const std::string& key_prefix) const;

private:
    const DimensionRegistry& registry_;
};

} // namespace drillq
