#include "sql_query_builder.hpp"
#include <algorithm>

namespace drillq {

// ===== SqlLiteralEncoder =====

std::string SqlLiteralEncoder::Encode(const std::string& value) {
    std::string result;
    result.reserve(value.size() + 8);

    for (char ch : value) {
        if (ch == '\'') {
            result += "''";
        } else {
            result += ch;
        }
    }

    return result;
}

std::string SqlLiteralEncoder::Quote(const std::string& value) {
    return "'" + Encode(value) + "'";
}

// ===== ParameterBinder =====

ParameterBinder::ParameterBinder(PlaceholderStyle style) : style_(style) {
}

std::string ParameterBinder::Bind(duckdb::Value value) {
    parameters_.push_back(std::move(value));
    if (style_ == PlaceholderStyle::QUESTION) {
        return "?";
    }
    return "$" + std::to_string(parameters_.size());
}

std::vector<duckdb::Value> ParameterBinder::Release() {
    auto released = std::move(parameters_);
    parameters_.clear();
    return released;
}

// ===== SqlQueryBuilder =====

SqlQueryBuilder& SqlQueryBuilder::AddCommonTableExpression(const std::string& name, const std::string& body) {
    ctes_.emplace_back(name, body);
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::SetDistinct(bool distinct) {
    distinct_ = distinct;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddSelect(const std::string& item) {
    select_items_.push_back(item);
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddSelect(const std::vector<std::string>& items) {
    select_items_.insert(select_items_.end(), items.begin(), items.end());
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::SetFrom(const std::string& table, const std::string& alias) {
    from_ = alias.empty() ? table : table + " " + alias;
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddJoin(const std::string& join_clause) {
    joins_.push_back(join_clause);
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddWhere(const std::string& predicate) {
    where_.push_back(predicate);
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddWhere(const std::vector<std::string>& predicates) {
    where_.insert(where_.end(), predicates.begin(), predicates.end());
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddGroupBy(const std::string& expression) {
    // Two dimensions can share a grouping expression; group once
    if (std::find(group_by_.begin(), group_by_.end(), expression) == group_by_.end()) {
        group_by_.push_back(expression);
    }
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddGroupBy(const std::vector<std::string>& expressions) {
    for (const auto& expression : expressions) {
        AddGroupBy(expression);
    }
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddHaving(const std::string& predicate) {
    having_.push_back(predicate);
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::AddOrderBy(
    const std::string& expression,
    SortDirection direction,
    bool nulls_last) {

    std::string order = expression + " " + SortDirectionToString(direction);
    if (nulls_last) {
        order += " NULLS LAST";
    }
    order_by_.push_back(std::move(order));
    return *this;
}

SqlQueryBuilder& SqlQueryBuilder::SetLimit(int64_t limit) {
    limit_ = limit;
    return *this;
}

static void AppendJoined(std::string& out, const std::vector<std::string>& items, const std::string& separator) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out.append(items[i]);
    }
}

std::string SqlQueryBuilder::Build() const {
    if (select_items_.empty() || from_.empty()) {
        throw duckdb::InternalException("SqlQueryBuilder requires a select list and a FROM clause");
    }

    std::string result;
    result.reserve(512);

    if (!ctes_.empty()) {
        result.append("WITH ");
        for (size_t i = 0; i < ctes_.size(); ++i) {
            if (i > 0) {
                result.append(",\n");
            }
            result.append(ctes_[i].first);
            result.append(" AS (\n");
            result.append(ctes_[i].second);
            result.append("\n)");
        }
        result.append("\n");
    }

    result.append(distinct_ ? "SELECT DISTINCT\n  " : "SELECT\n  ");
    AppendJoined(result, select_items_, ",\n  ");

    result.append("\nFROM ");
    result.append(from_);

    for (const auto& join : joins_) {
        result.append("\n");
        result.append(join);
    }

    if (!where_.empty()) {
        result.append("\nWHERE ");
        AppendJoined(result, where_, "\n  AND ");
    }

    if (!group_by_.empty()) {
        result.append("\nGROUP BY ");
        AppendJoined(result, group_by_, ", ");
    }

    if (!having_.empty()) {
        result.append("\nHAVING ");
        AppendJoined(result, having_, " AND ");
    }

    if (!order_by_.empty()) {
        result.append("\nORDER BY ");
        AppendJoined(result, order_by_, ", ");
    }

    if (limit_ > 0) {
        result.append("\nLIMIT ");
        result.append(std::to_string(limit_));
    }

    return result;
}

} // namespace drillq
