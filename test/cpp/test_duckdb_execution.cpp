#include "catch.hpp"
#include "attribution_correlator.hpp"
#include "attribution_matcher.hpp"
#include "drilldown_query_compiler.hpp"
#include "drillq_exceptions.hpp"
#include "flat_query_compiler.hpp"
#include "query_executor.hpp"
#include "duckdb.hpp"

using namespace drillq;
using namespace duckdb;

static void Execute(Connection& conn, const std::string& sql) {
    auto result = conn.Query(sql);
    if (result->HasError()) {
        FAIL(result->GetError());
    }
}

// Analytics tables with a handful of events in the first week of January 2024
static void CreateAnalyticsFixture(Connection& conn) {
    Execute(conn, "CREATE SCHEMA remote_session_tracker");
    Execute(conn, R"(
        CREATE TABLE remote_session_tracker.event_page_view_enriched_v2 (
            created_at TIMESTAMP, ff_visitor_id VARCHAR, session_id VARCHAR,
            active_time_s DOUBLE, hero_scroll_passed BOOLEAN, form_view BOOLEAN, form_started BOOLEAN,
            utm_source VARCHAR, utm_campaign VARCHAR, utm_content VARCHAR, utm_medium VARCHAR,
            url_path VARCHAR, page_type VARCHAR, country_code VARCHAR, device_type VARCHAR,
            os_name VARCHAR, browser_name VARCHAR))");
    Execute(conn, R"(
        INSERT INTO remote_session_tracker.event_page_view_enriched_v2 VALUES
        ('2024-01-02 10:00:00', 'v1', 's1', 3.0, true, true, true, 'google', '111', '211', '311', '/pricing', 'landing', 'DE', 'mobile', 'ios', 'safari'),
        ('2024-01-02 10:05:00', 'v1', 's1', 20.0, false, true, false, 'google', '111', '211', '311', '/checkout', 'checkout', 'DE', 'mobile', 'ios', 'safari'),
        ('2024-01-03 09:00:00', 'v2', 's2', 12.0, true, false, false, 'facebook', '999', '299', '399', '/blog', 'content', 'AT', 'desktop', 'windows', 'chrome'),
        ('2024-01-07 23:30:00', 'v3', 's3', NULL, false, false, false, 'AdWords', NULL, NULL, NULL, '/pricing', 'landing', NULL, 'desktop', 'macos', 'safari'),
        ('2024-01-08 00:30:00', 'v4', 's4', 5.0, false, false, false, 'google', '111', '211', '311', '/pricing', 'landing', 'DE', 'mobile', 'ios', 'safari'),
        ('2023-12-31 23:59:00', 'v5', 's5', 5.0, false, false, false, 'google', '111', '211', '311', '/pricing', 'landing', 'DE', 'mobile', 'ios', 'safari')
    )");

    Execute(conn, R"(
        CREATE TABLE remote_session_tracker.session_entries (
            session_id VARCHAR, session_start TIMESTAMP, ff_visitor_id VARCHAR,
            entry_active_time_s DOUBLE, entry_hero_scroll_passed BOOLEAN, entry_form_view BOOLEAN,
            entry_form_started BOOLEAN, entry_utm_source VARCHAR, entry_utm_campaign VARCHAR,
            entry_utm_content VARCHAR, entry_utm_medium VARCHAR, entry_url_path VARCHAR, entry_page_type VARCHAR,
            entry_utm_term VARCHAR, entry_keyword VARCHAR, entry_placement VARCHAR, entry_referrer VARCHAR,
            ff_funnel_id VARCHAR, entry_country_code VARCHAR, entry_device_type VARCHAR, entry_os_name VARCHAR,
            entry_browser_name VARCHAR, visit_number INTEGER))");
    Execute(conn, R"(
        INSERT INTO remote_session_tracker.session_entries VALUES
        ('s1', '2024-01-02 10:00:00', 'v1', 3.0, true, true, true, 'google', '111', '211', '311', '/pricing', 'landing', NULL, NULL, NULL, NULL, 'f1', 'DE', 'mobile', 'ios', 'safari', 1),
        ('s2', '2024-01-03 09:00:00', 'v2', 12.0, true, false, false, 'facebook', '999', '299', '399', '/blog', 'content', NULL, NULL, NULL, NULL, 'f1', 'AT', 'desktop', 'windows', 'chrome', 1),
        ('s3', '2024-01-07 23:30:00', 'v3', NULL, false, false, false, 'AdWords', NULL, NULL, NULL, '/pricing', 'landing', NULL, NULL, NULL, NULL, 'f2', NULL, 'desktop', 'macos', 'safari', 2),
        ('s6', '2024-01-05 08:00:00', 'v6', 40.0, true, true, true, 'google', '111', '212', '312', '/pricing', 'landing', NULL, NULL, NULL, NULL, 'f1', 'DE', 'desktop', 'linux', 'firefox', 1)
    )");

    // Two spend rows for the same ids must not multiply event rows
    Execute(conn, R"(
        CREATE TABLE merged_ads_spending (
            date DATE, campaign_id VARCHAR, campaign_name VARCHAR, adset_id VARCHAR, adset_name VARCHAR,
            ad_id VARCHAR, ad_name VARCHAR))");
    Execute(conn, R"(
        INSERT INTO merged_ads_spending VALUES
        ('2024-01-03', '111', 'Summer Sale', '211', 'Retargeting', '311', 'Video A'),
        ('2024-01-04', '111', 'Summer Sale', '211', 'Retargeting', '311', 'Video A')
    )");

    Execute(conn, "CREATE TABLE app_products (id INTEGER, name VARCHAR)");
    Execute(conn, "INSERT INTO app_products VALUES (1, 'Widget'), (2, 'Gadget')");
    Execute(conn, R"(
        CREATE TABLE app_url_classifications (
            url_path VARCHAR, product_id INTEGER, country_code VARCHAR, is_ignored BOOLEAN))");
    Execute(conn, R"(
        INSERT INTO app_url_classifications VALUES
        ('/pricing', 1, 'DE', false),
        ('/blog', 2, 'AT', true)
    )");
}

static QueryRequest FirstWeek(EventSource source, const std::vector<std::string>& dimensions, int64_t depth = 0) {
    QueryRequest request;
    request.source = source;
    request.date_range.start = Date::FromDate(2024, 1, 1);
    request.date_range.end = Date::FromDate(2024, 1, 7);
    request.dimensions = dimensions;
    request.depth = depth;
    return request;
}

static const std::vector<Value>* FindRow(const QueryRows& rows, const std::string& column, const std::string& value) {
    auto index = rows.ColumnIndex(column);
    for (const auto& row : rows.rows) {
        if (!row[index].IsNull() && row[index].ToString() == value) {
            return &row;
        }
    }
    return nullptr;
}

static int64_t Count(const QueryRows& rows, const std::vector<Value>& row, const std::string& column) {
    return row[rows.ColumnIndex(column)].GetValue<int64_t>();
}

TEST_CASE("Drill-down queries execute on DuckDB", "[duckdb_execution]") {
    DuckDB db(nullptr);
    Connection conn(db);
    CreateAnalyticsFixture(conn);
    DuckDBQueryExecutor executor(*db.instance);

    SECTION("Top level counts only events inside the inclusive range") {
        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(FirstWeek(EventSource::PAGE_VIEWS, {"country", "campaign"})));

        REQUIRE(rows.rows.size() == 3);
        REQUIRE(rows.rows[0][rows.ColumnIndex("dimension_value")].ToString() == "DE");
        REQUIRE(Count(rows, rows.rows[0], "page_views") == 2);
        REQUIRE(Count(rows, rows.rows[0], "unique_visitors") == 1);
        REQUIRE(rows.rows[0][rows.ColumnIndex("bounce_rate")].GetValue<double>() == Approx(0.5));

        bool has_null = false;
        for (const auto& row : rows.rows) {
            has_null = has_null || row[rows.ColumnIndex("dimension_value")].IsNull();
        }
        REQUIRE(has_null);
    }

    SECTION("Unknown ancestor selects the NULL group") {
        auto request = FirstWeek(EventSource::PAGE_VIEWS, {"country", "campaign"}, 1);
        request.ancestor_filters["country"] = UNKNOWN_VALUE;
        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(request));

        REQUIRE(rows.rows.size() == 1);
        REQUIRE(rows.rows[0][rows.ColumnIndex("dimension_value")].ToString() == "Unknown");
        REQUIRE(rows.rows[0][rows.ColumnIndex("dimension_id")].IsNull());
        REQUIRE(Count(rows, rows.rows[0], "page_views") == 1);
    }

    SECTION("Enriched dimension shows display names without multiplying rows") {
        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(FirstWeek(EventSource::PAGE_VIEWS, {"campaign"})));

        REQUIRE(rows.rows.size() == 3);
        auto summer = FindRow(rows, "dimension_value", "Summer Sale");
        REQUIRE(summer != nullptr);
        REQUIRE((*summer)[rows.ColumnIndex("dimension_id")].ToString() == "111");
        REQUIRE(Count(rows, *summer, "page_views") == 2);
        REQUIRE(FindRow(rows, "dimension_value", "999") != nullptr);
        REQUIRE(FindRow(rows, "dimension_value", "Unknown") != nullptr);
    }

    SECTION("User filter matches the display name case-insensitively") {
        auto request = FirstWeek(EventSource::PAGE_VIEWS, {"country"});
        TableFilter filter;
        filter.field = "campaign";
        filter.op = FilterOperator::EQUALS;
        filter.value = "summer sale";
        request.user_filters.push_back(filter);

        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(request));
        REQUIRE(rows.rows.size() == 1);
        REQUIRE(rows.rows[0][rows.ColumnIndex("dimension_value")].ToString() == "DE");

        request.user_filters[0].op = FilterOperator::NOT_EQUALS;
        rows = executor.Execute(DrilldownQueryCompiler::Compile(request));
        REQUIRE(rows.rows.size() == 2);
        REQUIRE(FindRow(rows, "dimension_value", "DE") == nullptr);
    }

    SECTION("Classification dimension skips ignored URLs") {
        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(FirstWeek(EventSource::PAGE_VIEWS, {"classifiedProduct"})));
        REQUIRE(rows.rows.size() == 2);
        auto widget = FindRow(rows, "dimension_value", "Widget");
        REQUIRE(widget != nullptr);
        REQUIRE(Count(rows, *widget, "page_views") == 2);
        REQUIRE(FindRow(rows, "dimension_value", "Gadget") == nullptr);
    }

    SECTION("Date ancestor") {
        auto request = FirstWeek(EventSource::PAGE_VIEWS, {"date", "deviceType"}, 1);
        request.ancestor_filters["date"] = "2024-01-02";
        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(request));
        REQUIRE(rows.rows.size() == 1);
        REQUIRE(rows.rows[0][rows.ColumnIndex("dimension_value")].ToString() == "mobile");
    }

    SECTION("Session groups with a single entry are dropped") {
        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(FirstWeek(EventSource::SESSIONS, {"entryUtmSource"})));
        REQUIRE(rows.rows.size() == 1);
        REQUIRE(rows.rows[0][rows.ColumnIndex("dimension_value")].ToString() == "google");
        REQUIRE(Count(rows, rows.rows[0], "page_views") == 2);
    }

    SECTION("Session funnel counts page views of matching sessions") {
        auto request = FirstWeek(EventSource::SESSIONS, {"entryUtmSource", "funnelStep"}, 1);
        request.ancestor_filters["entryUtmSource"] = "google";
        auto rows = executor.Execute(DrilldownQueryCompiler::Compile(request));

        REQUIRE(rows.rows.size() == 2);
        REQUIRE(FindRow(rows, "dimension_value", "/pricing") != nullptr);
        REQUIRE(FindRow(rows, "dimension_value", "/checkout") != nullptr);
        REQUIRE(FindRow(rows, "dimension_value", "/blog") == nullptr);
    }
}

TEST_CASE("Flat queries execute on DuckDB", "[duckdb_execution]") {
    DuckDB db(nullptr);
    Connection conn(db);
    CreateAnalyticsFixture(conn);
    DuckDBQueryExecutor executor(*db.instance);

    SECTION("Entry mode") {
        auto rows = executor.Execute(FlatQueryCompiler::Compile(FirstWeek(EventSource::PAGE_VIEWS, {"country", "deviceType"})));
        REQUIRE(rows.names[0] == "country");
        REQUIRE(rows.names[1] == "deviceType");
        REQUIRE(rows.rows.size() == 3);
        REQUIRE(Count(rows, rows.rows[0], "page_views") == 2);
        REQUIRE(rows.rows[0][rows.ColumnIndex("total_active_time")].GetValue<double>() == Approx(23.0));
    }

    SECTION("Funnel mode with entry and funnel-step filters") {
        auto request = FirstWeek(EventSource::SESSIONS, {"entryUtmSource", "funnelStep"});
        TableFilter entry;
        entry.field = "entryCountryCode";
        entry.value = "de";
        TableFilter step;
        step.field = "funnelStep";
        step.op = FilterOperator::CONTAINS;
        step.value = "CHECK";
        request.user_filters = {entry, step};

        auto rows = executor.Execute(FlatQueryCompiler::Compile(request));
        REQUIRE(rows.rows.size() == 1);
        REQUIRE(rows.rows[0][rows.ColumnIndex("entryUtmSource")].ToString() == "google");
        REQUIRE(rows.rows[0][rows.ColumnIndex("funnelStep")].ToString() == "/checkout");
        REQUIRE(Count(rows, rows.rows[0], "page_views") == 1);
    }
}

TEST_CASE("Attribution against DuckDB results", "[duckdb_execution]") {
    DuckDB db(nullptr);
    Connection conn(db);
    CreateAnalyticsFixture(conn);
    DuckDBQueryExecutor executor(*db.instance);

    SECTION("Tracking match normalizes sources and splits CRM trials") {
        auto request = FirstWeek(EventSource::PAGE_VIEWS, {"country"});
        auto rows = executor.Execute(AttributionMatcher::BuildTrackingMatch(request));
        auto analytics = AttributionCorrelator::ParseTrackingMatch(rows);
        REQUIRE(analytics.size() == 3);

        std::vector<CrmTrackingRow> crm(2);
        crm[0].source = "google";
        crm[0].campaign_id = "111";
        crm[0].adset_id = "211";
        crm[0].ad_id = "311";
        crm[0].trials = 4;
        crm[0].approved = 2;
        crm[1].source = "google";
        crm[1].trials = 1;

        auto report = AttributionCorrelator::CorrelateByTracking(
            crm, analytics, AttributionCorrelator::ExcludedTrackingFields(request));
        REQUIRE(report.unmatched_keys == 0);
        REQUIRE(report.Find("de")->trials == Approx(4));
        REQUIRE(report.Find("de")->approved == Approx(2));
        REQUIRE(report.Find("unknown")->trials == Approx(1));
        REQUIRE(report.Find("at") == nullptr);
    }

    SECTION("Visitor match with no qualifying events is empty, not an error") {
        auto request = FirstWeek(EventSource::PAGE_VIEWS, {"country"});
        TableFilter filter;
        filter.field = "country";
        filter.value = "FR";
        request.user_filters.push_back(filter);

        auto rows = executor.Execute(AttributionMatcher::BuildVisitorMatch(request));
        REQUIRE(rows.IsEmpty());
        REQUIRE(rows.names.size() == 2);

        auto analytics = AttributionCorrelator::ParseVisitorMatch(rows);
        REQUIRE(analytics.empty());
        auto report = AttributionCorrelator::CorrelateByVisitor({{"v1", 1, 1}}, analytics);
        REQUIRE(report.conversions.empty());
        REQUIRE(report.unmatched_keys == 1);
    }

    SECTION("Visitor match on sessions") {
        auto rows = executor.Execute(AttributionMatcher::BuildVisitorMatch(FirstWeek(EventSource::SESSIONS, {"entryDeviceType"})));
        auto analytics = AttributionCorrelator::ParseVisitorMatch(rows);
        REQUIRE(analytics.size() == 4);

        auto report = AttributionCorrelator::CorrelateByVisitor({{"v1", 2, 1}, {"v6", 1, 0}}, analytics);
        REQUIRE(report.Find("mobile")->trials == Approx(2));
        REQUIRE(report.Find("desktop")->trials == Approx(1));
    }
}

TEST_CASE("Store errors surface as execution failures", "[duckdb_execution]") {
    DuckDB db(nullptr);
    DuckDBQueryExecutor executor(*db.instance);

    // No fixture: the source table does not exist
    REQUIRE_THROWS_AS(executor.Execute(DrilldownQueryCompiler::Compile(FirstWeek(EventSource::PAGE_VIEWS, {"country"}))),
                      ExecutionFailureException);
}
