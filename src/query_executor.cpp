#include "query_executor.hpp"
#include "drillq_exceptions.hpp"
#include "drillq_tracing.hpp"

namespace drillq {

size_t QueryRows::ColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return i;
        }
    }
    throw duckdb::InvalidInputException("Result has no column '" + name + "'");
}

DuckDBQueryExecutor::DuckDBQueryExecutor(duckdb::DatabaseInstance& db) : db_(db) {
}

QueryRows DuckDBQueryExecutor::Execute(const CompiledQuery& query) {
    DRILLQ_TRACE_DEBUG_DATA("QUERY_EXECUTOR",
                            "Executing query with " + std::to_string(query.parameters.size()) + " parameter(s)",
                            query.text);

    duckdb::Connection conn(db_);

    auto prepared = conn.Prepare(query.text);
    if (prepared->HasError()) {
        DRILLQ_TRACE_ERROR("QUERY_EXECUTOR", "Prepare failed: " + prepared->GetError());
        throw ExecutionFailureException("Failed to prepare query",
                                        ErrorContext().Set("error", prepared->GetError()));
    }

    duckdb::vector<duckdb::Value> values;
    for (const auto& parameter : query.parameters) {
        values.push_back(parameter);
    }

    auto result = prepared->Execute(values, false);
    if (result->HasError()) {
        DRILLQ_TRACE_ERROR("QUERY_EXECUTOR", "Execution failed: " + result->GetError());
        throw ExecutionFailureException("Failed to execute query",
                                        ErrorContext().Set("error", result->GetError()));
    }

    auto& materialized = result->Cast<duckdb::MaterializedQueryResult>();

    QueryRows rows;
    rows.names.assign(materialized.names.begin(), materialized.names.end());
    for (duckdb::idx_t row = 0; row < materialized.RowCount(); row++) {
        std::vector<duckdb::Value> values_of_row;
        values_of_row.reserve(materialized.ColumnCount());
        for (duckdb::idx_t col = 0; col < materialized.ColumnCount(); col++) {
            values_of_row.push_back(materialized.GetValue(col, row));
        }
        rows.rows.push_back(std::move(values_of_row));
    }

    DRILLQ_TRACE_DEBUG("QUERY_EXECUTOR", "Query returned " + std::to_string(rows.rows.size()) + " row(s)");
    return rows;
}

} // namespace drillq
