#pragma once

#include "duckdb.hpp"
#include "error_context.hpp"

#include <string>

namespace drillq {

// Request rejected because a dimension id is absent from the source's registry.
class UnknownDimensionException : public duckdb::InvalidInputException {
public:
    UnknownDimensionException(const std::string &dimension_id, const ErrorContext &context)
        : duckdb::InvalidInputException(context.Format("Unknown dimension '" + dimension_id + "'")),
          dimension_id(dimension_id) {
    }

    const std::string &DimensionId() const {
        return dimension_id;
    }

private:
    std::string dimension_id;
};

// Depth outside [0, len(dimensions)) in drill-down mode.
class InvalidDepthException : public duckdb::InvalidInputException {
public:
    InvalidDepthException(int64_t depth, size_t dimension_count)
        : duckdb::InvalidInputException(
              ErrorContext()
                  .Set("depth", std::to_string(depth))
                  .Set("dimensions", std::to_string(dimension_count))
                  .Format("Depth must satisfy 0 <= depth < number of dimensions")) {
    }
};

// Ancestor filter keys that are not a prefix of the requested dimension order,
// or that collide with a user filter on the same field.
class MalformedAncestorFiltersException : public duckdb::InvalidInputException {
public:
    MalformedAncestorFiltersException(const std::string &message, const ErrorContext &context)
        : duckdb::InvalidInputException(context.Format(message)) {
    }
};

// Raised by the execution layer; the compiler never produces it.
class ExecutionFailureException : public duckdb::IOException {
public:
    ExecutionFailureException(const std::string &message, const ErrorContext &context)
        : duckdb::IOException(context.Format(message)) {
    }
};

} // namespace drillq
