#pragma once

#include <string>
#include <vector>
#include <utility>

namespace drillq {

/**
 * Error Context Helper
 *
 * Collects key/value context that is appended to exception messages, so a
 * rejected request explains which dimension, role and source were involved.
 * Keys keep their insertion order; setting an existing key replaces its value.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.Set("source", "page_views")
 *      .Set("role", "ancestor_filter");
 *   throw UnknownDimensionException("fooBar", ctx);
 */
class ErrorContext {
public:
    ErrorContext() = default;

    /**
     * Set a context variable
     *
     * @param key The context key
     * @param value The context value
     * @return Reference to this context (for chaining)
     */
    ErrorContext& Set(const std::string& key, const std::string& value);

    /**
     * Build a formatted error message with context
     *
     * Example:
     *   ctx.Set("source", "sessions").Set("depth", "3");
     *   ctx.Format("Invalid depth");
     *   // Returns: "Invalid depth [source: sessions, depth: 3]"
     */
    std::string Format(const std::string& base_message) const;

private:
    std::vector<std::pair<std::string, std::string>> context_;
};

} // namespace drillq
