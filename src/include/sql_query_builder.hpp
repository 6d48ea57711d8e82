#pragma once

#include "duckdb.hpp"
#include "query_request.hpp"

#include <string>
#include <vector>

namespace drillq {

/**
 * SQL Literal Encoder
 *
 * Encodes constant strings for inlining into generated SQL. Only compile-time
 * constants (source synonyms, sentinels) go through here; anything that came
 * from a request is bound through ParameterBinder instead.
 *
 * Example:
 *   SqlLiteralEncoder::Quote("o'brien");
 *   // Result: "'o''brien'"
 */
class SqlLiteralEncoder {
public:
    /**
     * Double every single quote.
     *
     * Examples:
     *   Encode("simple") -> "simple"
     *   Encode("test'value") -> "test''value"
     */
    static std::string Encode(const std::string& value);

    // Encode and wrap in single quotes
    static std::string Quote(const std::string& value);
};

enum class PlaceholderStyle {
    NUMBERED, // $1, $2, ... (analytics store)
    QUESTION  // ?, ?, ...   (CRM store)
};

/**
 * Parameter Binder
 *
 * Hands out positional placeholders and records the matching values in order.
 * With NUMBERED placeholders a placeholder may be referenced more than once.
 */
class ParameterBinder {
public:
    explicit ParameterBinder(PlaceholderStyle style = PlaceholderStyle::NUMBERED);

    // Append a value and return the placeholder that refers to it
    std::string Bind(duckdb::Value value);

    size_t Count() const {
        return parameters_.size();
    }

    const std::vector<duckdb::Value>& Parameters() const {
        return parameters_;
    }

    std::vector<duckdb::Value> Release();

private:
    PlaceholderStyle style_;
    std::vector<duckdb::Value> parameters_;
};

/**
 * SQL Query Builder
 *
 * Collects the fragments of a single SELECT statement (common table
 * expressions, select list, joins, predicates, grouping, ordering, limit) and
 * renders them once in Build(). Fragments are stored verbatim; callers pass
 * column references that already carry the right alias prefix.
 *
 * Example:
 *   SqlQueryBuilder builder;
 *   builder.AddSelect("country_code AS dimension_value")
 *          .AddSelect("COUNT(*) AS page_views")
 *          .SetFrom("remote_session_tracker.event_page_view_enriched_v2")
 *          .AddWhere("created_at >= $1::date")
 *          .AddGroupBy("country_code")
 *          .SetLimit(100);
 *   auto sql = builder.Build();
 */
class SqlQueryBuilder {
public:
    SqlQueryBuilder() = default;

    SqlQueryBuilder& AddCommonTableExpression(const std::string& name, const std::string& body);

    SqlQueryBuilder& SetDistinct(bool distinct);

    SqlQueryBuilder& AddSelect(const std::string& item);

    SqlQueryBuilder& AddSelect(const std::vector<std::string>& items);

    /**
     * @param table Fully qualified table name
     * @param alias Table alias; empty renders the bare table
     */
    SqlQueryBuilder& SetFrom(const std::string& table, const std::string& alias = "");

    // Complete join clause, e.g. "LEFT JOIN app_products ap ON uc.product_id = ap.id"
    SqlQueryBuilder& AddJoin(const std::string& join_clause);

    // Predicates are AND'ed together
    SqlQueryBuilder& AddWhere(const std::string& predicate);

    SqlQueryBuilder& AddWhere(const std::vector<std::string>& predicates);

    SqlQueryBuilder& AddGroupBy(const std::string& expression);

    SqlQueryBuilder& AddGroupBy(const std::vector<std::string>& expressions);

    SqlQueryBuilder& AddHaving(const std::string& predicate);

    SqlQueryBuilder& AddOrderBy(
        const std::string& expression,
        SortDirection direction = SortDirection::ASC,
        bool nulls_last = false);

    // Only values already clamped by ParameterValidation::ClampLimit belong here
    SqlQueryBuilder& SetLimit(int64_t limit);

    /**
     * Render the statement.
     *
     * @throws duckdb::InternalException if the select list or FROM is missing
     */
    std::string Build() const;

private:
    std::vector<std::pair<std::string, std::string>> ctes_;
    bool distinct_ = false;
    std::vector<std::string> select_items_;
    std::string from_;
    std::vector<std::string> joins_;
    std::vector<std::string> where_;
    std::vector<std::string> group_by_;
    std::vector<std::string> having_;
    std::vector<std::string> order_by_;
    int64_t limit_ = 0;
};

} // namespace drillq
