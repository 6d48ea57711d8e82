#include "catch.hpp"
#include "drillq_exceptions.hpp"
#include "report_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace drillq;

// Returns a single row echoing the query text
class EchoExecutor : public QueryExecutor {
public:
    explicit EchoExecutor(std::chrono::milliseconds delay = std::chrono::milliseconds(0)) : delay(delay) {}

    QueryRows Execute(const CompiledQuery& query) override {
        std::this_thread::sleep_for(delay);
        calls++;
        QueryRows rows;
        rows.names = {"sql"};
        rows.rows.push_back({duckdb::Value(query.text)});
        return rows;
    }

    std::chrono::milliseconds delay;
    std::atomic<int> calls{0};
};

class FailingExecutor : public QueryExecutor {
public:
    QueryRows Execute(const CompiledQuery&) override {
        throw ExecutionFailureException("Connection refused", ErrorContext().Set("store", "crm"));
    }
};

static CompiledQuery Query(const std::string& text) {
    CompiledQuery query;
    query.text = text;
    return query;
}

TEST_CASE("ReportOrchestrator runs every source", "[report_orchestrator]") {
    EchoExecutor analytics(std::chrono::milliseconds(20));
    EchoExecutor crm;
    ReportOrchestrator orchestrator;

    auto results = orchestrator.Run({
        {"analytics", &analytics, Query("SELECT 1")},
        {"crm", &crm, Query("SELECT 2")},
    });

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].name == "analytics");
    REQUIRE(results[1].name == "crm");
    REQUIRE_FALSE(results[0].failed);
    REQUIRE(results[0].rows.rows[0][0].ToString() == "SELECT 1");
    REQUIRE(results[1].rows.rows[0][0].ToString() == "SELECT 2");
    REQUIRE(analytics.calls == 1);
    REQUIRE(crm.calls == 1);
}

TEST_CASE("A failing source degrades to an empty result", "[report_orchestrator]") {
    EchoExecutor analytics;
    FailingExecutor crm;
    ReportOrchestrator orchestrator;

    auto results = orchestrator.Run({
        {"analytics", &analytics, Query("SELECT 1")},
        {"crm", &crm, Query("SELECT 2")},
    });

    auto analytics_result = ReportOrchestrator::Find(results, "analytics");
    auto crm_result = ReportOrchestrator::Find(results, "crm");
    REQUIRE(analytics_result != nullptr);
    REQUIRE(crm_result != nullptr);
    REQUIRE(ReportOrchestrator::Find(results, "missing") == nullptr);

    REQUIRE_FALSE(analytics_result->failed);
    REQUIRE(analytics_result->rows.rows.size() == 1);

    REQUIRE(crm_result->failed);
    REQUIRE(crm_result->rows.IsEmpty());
    REQUIRE(crm_result->error.find("Connection refused") != std::string::npos);
}

TEST_CASE("ReportOrchestrator edge cases", "[report_orchestrator]") {
    ReportOrchestrator orchestrator;

    SECTION("No sources") {
        REQUIRE(orchestrator.Run({}).empty());
    }

    SECTION("Missing executor") {
        REQUIRE_THROWS_AS(orchestrator.Run({{"analytics", nullptr, Query("SELECT 1")}}), duckdb::InternalException);
    }
}
