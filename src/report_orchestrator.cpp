#include "report_orchestrator.hpp"
#include "drillq_tracing.hpp"

#include <future>

namespace drillq {

std::vector<SourceResult> ReportOrchestrator::Run(const std::vector<ReportSource>& sources) const {
    DRILLQ_TRACE_DEBUG("REPORT_ORCHESTRATOR", "Launching " + std::to_string(sources.size()) + " source(s)");

    std::vector<std::future<QueryRows>> futures;
    futures.reserve(sources.size());
    for (const auto& source : sources) {
        if (!source.executor) {
            throw duckdb::InternalException("Report source '" + source.name + "' has no executor");
        }
        futures.push_back(std::async(std::launch::async, [&source]() {
            return source.executor->Execute(source.query);
        }));
    }

    std::vector<SourceResult> results;
    results.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        SourceResult result;
        result.name = sources[i].name;
        try {
            result.rows = futures[i].get();
            DRILLQ_TRACE_DEBUG("REPORT_ORCHESTRATOR", "Source '" + result.name + "' returned " +
                               std::to_string(result.rows.rows.size()) + " row(s)");
        } catch (const std::exception& e) {
            DRILLQ_TRACE_WARN("REPORT_ORCHESTRATOR", "Source '" + result.name + "' failed: " + std::string(e.what()));
            result.failed = true;
            result.error = e.what();
            result.rows = QueryRows();
        }
        results.push_back(std::move(result));
    }

    return results;
}

const SourceResult* ReportOrchestrator::Find(const std::vector<SourceResult>& results, const std::string& name) {
    for (const auto& result : results) {
        if (result.name == name) {
            return &result;
        }
    }
    return nullptr;
}

} // namespace drillq
