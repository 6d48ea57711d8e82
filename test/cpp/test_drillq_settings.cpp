#include "catch.hpp"
#include "drillq_settings.hpp"
#include "duckdb.hpp"

using namespace drillq;
using namespace duckdb;

static unique_ptr<MaterializedResult> Run(Connection& conn, const std::string& sql) {
    return conn.Query(sql);
}

TEST_CASE("Trace levels parse case-insensitively", "[drillq_settings]") {
    REQUIRE(DrillqSettings::ParseTraceLevel("debug") == TraceLevel::DEBUG_LEVEL);
    REQUIRE(DrillqSettings::ParseTraceLevel("Warn") == TraceLevel::WARN);
    REQUIRE(DrillqSettings::ParseTraceLevel("NONE") == TraceLevel::NONE);
    REQUIRE_THROWS_AS(DrillqSettings::ParseTraceLevel("verbose"), BinderException);
}

TEST_CASE("Extension options are registered on the database config", "[drillq_settings]") {
    DuckDB db(nullptr);
    DrillqSettings::Register(DBConfig::GetConfig(*db.instance));
    Connection conn(db);

    SECTION("Default limit") {
        REQUIRE(DrillqSettings::DefaultLimit(*conn.context) == 1000);

        REQUIRE_FALSE(Run(conn, "SET drillq_default_limit = 50")->HasError());
        REQUIRE(DrillqSettings::DefaultLimit(*conn.context) == 50);

        REQUIRE_FALSE(Run(conn, "SET drillq_default_limit = 20000")->HasError());
        REQUIRE(DrillqSettings::DefaultLimit(*conn.context) == 10000);
    }

    SECTION("Non-positive default limit is rejected") {
        REQUIRE_FALSE(Run(conn, "SET drillq_default_limit = 50")->HasError());

        auto result = Run(conn, "SET drillq_default_limit = 0");
        REQUIRE(result->HasError());
        REQUIRE_THAT(result->GetError(), Catch::Contains("drillq_default_limit must be at least 1"));
        REQUIRE(DrillqSettings::DefaultLimit(*conn.context) == 50);
    }

    SECTION("Trace options reach the tracer") {
        auto &tracer = DrillqTracer::Instance();

        REQUIRE_FALSE(Run(conn, "SET drillq_trace_level = 'warn'")->HasError());
        REQUIRE(tracer.GetLevel() == TraceLevel::WARN);

        auto bad_level = Run(conn, "SET drillq_trace_level = 'verbose'");
        REQUIRE(bad_level->HasError());
        REQUIRE_THAT(bad_level->GetError(), Catch::Contains("Invalid trace level"));
        REQUIRE(tracer.GetLevel() == TraceLevel::WARN);

        auto bad_output = Run(conn, "SET drillq_trace_output = 'syslog'");
        REQUIRE(bad_output->HasError());
        REQUIRE_THAT(bad_output->GetError(), Catch::Contains("console, file, both"));

        REQUIRE(Run(conn, "SET drillq_trace_max_file_size = -1")->HasError());

        tracer.SetLevel(TraceLevel::INFO);
    }

    SECTION("Status report") {
        REQUIRE_FALSE(Run(conn, "SET drillq_default_limit = 75")->HasError());

        auto status = DrillqSettings::StatusReport(*conn.context);
        REQUIRE_THAT(status, Catch::StartsWith("drillq status:\n"));
        REQUIRE_THAT(status, Catch::Contains("Default limit: 75"));
        auto &tracer = DrillqTracer::Instance();
        REQUIRE_THAT(status, Catch::Contains("Trace level: " + DrillqTracer::LevelToString(tracer.GetLevel())));
        REQUIRE_THAT(status, Catch::Contains(std::string("Tracing enabled: ") + (tracer.IsEnabled() ? "true" : "false")));
    }
}
