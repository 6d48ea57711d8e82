#pragma once

#include <string>
#include <vector>
#include "duckdb.hpp"

namespace drillq {

/**
 * Parameter Validation Helper
 *
 * Consistent validation and error messages for values that reach the
 * compilers from the table functions or from embedding code.
 *
 * Usage:
 *   auto limit = ParameterValidation::ClampLimit(request.limit);
 *   ParameterValidation::ValidateDateRange(request.date_range.start, request.date_range.end);
 */
class ParameterValidation {
public:
    static constexpr int64_t MIN_LIMIT = 1;
    static constexpr int64_t MAX_LIMIT = 10000;
    static constexpr int64_t DEFAULT_LIMIT = 1000;

    /**
     * Validate that a required string parameter is provided (not empty)
     *
     * @throws duckdb::InvalidInputException if value is empty
     */
    static std::string ValidateRequired(
        const std::string& param_name,
        const std::string& value);

    /**
     * Validate that a value is one of the allowed options (case-sensitive)
     *
     * @throws duckdb::InvalidInputException if not in allowed list
     *
     * Example:
     *   ParameterValidation::ValidateOneOf("operator", op, {"equals", "not_equals"});
     */
    static std::string ValidateOneOf(
        const std::string& param_name,
        const std::string& value,
        const std::vector<std::string>& allowed_values);

    /**
     * Clamp a row limit into [MIN_LIMIT, MAX_LIMIT]. Never throws; the
     * result is safe to inline into query text.
     */
    static int64_t ClampLimit(int64_t limit);

    /**
     * @throws duckdb::InvalidInputException if start is after end
     */
    static void ValidateDateRange(duckdb::date_t start, duckdb::date_t end);
};

} // namespace drillq
