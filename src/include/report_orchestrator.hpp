#pragma once

#include "query_executor.hpp"

#include <string>
#include <vector>

namespace drillq {

struct ReportSource {
    std::string name;
    QueryExecutor *executor;
    CompiledQuery query;
};

struct SourceResult {
    std::string name;
    bool failed = false;
    std::string error;
    // Empty when failed
    QueryRows rows;
};

/**
 * Runs the queries behind one report concurrently, one task per source.
 *
 * Sources fail independently: an exception from one executor degrades that
 * source to an empty result flagged `failed` and leaves the others intact.
 * Nothing is retried.
 */
class ReportOrchestrator {
public:
    // Results in the order of `sources`; returns once every source finished
    std::vector<SourceResult> Run(const std::vector<ReportSource>& sources) const;

    // The result named `name`, nullptr if absent
    static const SourceResult* Find(const std::vector<SourceResult>& results, const std::string& name);
};

} // namespace drillq
