#pragma once

#include "duckdb.hpp"
#include "query_request.hpp"

#include <string>
#include <vector>

namespace drillq {

struct QueryRows {
    std::vector<std::string> names;
    std::vector<std::vector<duckdb::Value>> rows;

    /**
     * @throws duckdb::InvalidInputException if the column is missing
     */
    size_t ColumnIndex(const std::string& name) const;

    bool IsEmpty() const {
        return rows.empty();
    }
};

/**
 * Execution collaborator for compiled queries. Implementations own their
 * connection handling and must release every connection before returning.
 */
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    /**
     * @throws ExecutionFailureException when the store rejects or fails the query
     */
    virtual QueryRows Execute(const CompiledQuery& query) = 0;
};

// Runs compiled analytics queries on a DuckDB database, one connection per call
class DuckDBQueryExecutor : public QueryExecutor {
public:
    explicit DuckDBQueryExecutor(duckdb::DatabaseInstance& db);

    QueryRows Execute(const CompiledQuery& query) override;

private:
    duckdb::DatabaseInstance& db_;
};

} // namespace drillq
