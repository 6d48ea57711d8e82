#include "parameter_validation.hpp"
#include "duckdb.hpp"
#include <algorithm>

namespace drillq {

std::string ParameterValidation::ValidateRequired(
    const std::string& param_name,
    const std::string& value) {

    if (value.empty()) {
        throw duckdb::InvalidInputException(
            "Required parameter '" + param_name + "' is missing or empty");
    }
    return value;
}

std::string ParameterValidation::ValidateOneOf(
    const std::string& param_name,
    const std::string& value,
    const std::vector<std::string>& allowed_values) {

    if (std::find(allowed_values.begin(), allowed_values.end(), value) ==
        allowed_values.end()) {

        std::string allowed_str;
        for (size_t i = 0; i < allowed_values.size(); ++i) {
            if (i > 0) allowed_str += ", ";
            allowed_str += "'" + allowed_values[i] + "'";
        }
        throw duckdb::InvalidInputException(
            "Parameter '" + param_name + "' value '" + value +
            "' is not valid. Allowed values: " + allowed_str);
    }
    return value;
}

int64_t ParameterValidation::ClampLimit(int64_t limit) {
    return std::max(MIN_LIMIT, std::min(MAX_LIMIT, limit));
}

void ParameterValidation::ValidateDateRange(duckdb::date_t start, duckdb::date_t end) {
    if (start > end) {
        throw duckdb::InvalidInputException(
            "Date range start " + duckdb::Date::ToString(start) +
            " is after end " + duckdb::Date::ToString(end));
    }
}

} // namespace drillq
