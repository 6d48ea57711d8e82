#include "catch.hpp"
#include "sql_query_builder.hpp"
#include "error_context.hpp"
#include "parameter_validation.hpp"

using namespace drillq;

TEST_CASE("SqlLiteralEncoder doubles single quotes", "[sql_query_builder]") {
    REQUIRE(SqlLiteralEncoder::Encode("simple") == "simple");
    REQUIRE(SqlLiteralEncoder::Encode("test'value") == "test''value");
    REQUIRE(SqlLiteralEncoder::Quote("o'brien") == "'o''brien'");
}

TEST_CASE("ParameterBinder hands out placeholders in order", "[sql_query_builder]") {
    SECTION("Numbered placeholders") {
        ParameterBinder binder;
        REQUIRE(binder.Bind(duckdb::Value("a")) == "$1");
        REQUIRE(binder.Bind(duckdb::Value::BIGINT(2)) == "$2");
        REQUIRE(binder.Count() == 2);

        auto values = binder.Release();
        REQUIRE(values.size() == 2);
        REQUIRE(values[0].ToString() == "a");
        REQUIRE(binder.Count() == 0);
    }

    SECTION("Question placeholders") {
        ParameterBinder binder(PlaceholderStyle::QUESTION);
        REQUIRE(binder.Bind(duckdb::Value("x")) == "?");
        REQUIRE(binder.Bind(duckdb::Value("y")) == "?");
        REQUIRE(binder.Parameters().size() == 2);
    }
}

TEST_CASE("SqlQueryBuilder renders a full statement", "[sql_query_builder]") {
    SqlQueryBuilder builder;
    builder.AddSelect("country_code AS dimension_value")
           .AddSelect("COUNT(*) AS page_views")
           .SetFrom("remote_session_tracker.event_page_view_enriched_v2")
           .AddWhere("created_at >= $1::date")
           .AddWhere("created_at < ($2::date + interval '1 day')")
           .AddGroupBy("country_code")
           .AddOrderBy("page_views", SortDirection::DESC, true)
           .SetLimit(100);

    REQUIRE(builder.Build() ==
            "SELECT\n"
            "  country_code AS dimension_value,\n"
            "  COUNT(*) AS page_views\n"
            "FROM remote_session_tracker.event_page_view_enriched_v2\n"
            "WHERE created_at >= $1::date\n"
            "  AND created_at < ($2::date + interval '1 day')\n"
            "GROUP BY country_code\n"
            "ORDER BY page_views DESC NULLS LAST\n"
            "LIMIT 100");
}

TEST_CASE("SqlQueryBuilder optional clauses", "[sql_query_builder]") {
    SECTION("CTE, alias, joins, DISTINCT and HAVING") {
        SqlQueryBuilder builder;
        builder.AddCommonTableExpression("matching_sessions", "SELECT 1 AS session_id")
               .SetDistinct(true)
               .AddSelect("pv.url_path")
               .SetFrom("events", "pv")
               .AddJoin("JOIN matching_sessions ms ON pv.session_id = ms.session_id")
               .AddGroupBy("pv.url_path")
               .AddHaving("COUNT(*) > 1");

        REQUIRE(builder.Build() ==
                "WITH matching_sessions AS (\n"
                "SELECT 1 AS session_id\n"
                ")\n"
                "SELECT DISTINCT\n"
                "  pv.url_path\n"
                "FROM events pv\n"
                "JOIN matching_sessions ms ON pv.session_id = ms.session_id\n"
                "GROUP BY pv.url_path\n"
                "HAVING COUNT(*) > 1");
    }

    SECTION("Duplicate grouping expressions collapse") {
        SqlQueryBuilder builder;
        builder.AddSelect("a").SetFrom("t").AddGroupBy({"a", "b", "a"});
        REQUIRE(builder.Build() == "SELECT\n  a\nFROM t\nGROUP BY a, b");
    }

    SECTION("No LIMIT unless set") {
        SqlQueryBuilder builder;
        builder.AddSelect("a").SetFrom("t");
        REQUIRE(builder.Build().find("LIMIT") == std::string::npos);
    }

    SECTION("Missing select list or FROM") {
        SqlQueryBuilder builder;
        REQUIRE_THROWS_AS(builder.Build(), duckdb::InternalException);
        builder.AddSelect("a");
        REQUIRE_THROWS_AS(builder.Build(), duckdb::InternalException);
    }
}

TEST_CASE("ParameterValidation", "[parameter_validation]") {
    SECTION("Limit clamping") {
        REQUIRE(ParameterValidation::ClampLimit(0) == 1);
        REQUIRE(ParameterValidation::ClampLimit(-50) == 1);
        REQUIRE(ParameterValidation::ClampLimit(250) == 250);
        REQUIRE(ParameterValidation::ClampLimit(20000) == 10000);
    }

    SECTION("Date range") {
        auto jan1 = duckdb::Date::FromDate(2024, 1, 1);
        auto jan7 = duckdb::Date::FromDate(2024, 1, 7);
        REQUIRE_NOTHROW(ParameterValidation::ValidateDateRange(jan1, jan7));
        REQUIRE_NOTHROW(ParameterValidation::ValidateDateRange(jan1, jan1));
        REQUIRE_THROWS_AS(ParameterValidation::ValidateDateRange(jan7, jan1), duckdb::InvalidInputException);
    }

    SECTION("Required and one-of") {
        REQUIRE(ParameterValidation::ValidateRequired("field", "country") == "country");
        REQUIRE_THROWS_AS(ParameterValidation::ValidateRequired("field", ""), duckdb::InvalidInputException);
        REQUIRE(ParameterValidation::ValidateOneOf("source", "sessions", {"page_views", "sessions"}) == "sessions");
        REQUIRE_THROWS_WITH(ParameterValidation::ValidateOneOf("source", "clicks", {"page_views", "sessions"}),
                            Catch::Contains("'page_views', 'sessions'"));
    }
}

TEST_CASE("ErrorContext formats key/value context", "[error_context]") {
    ErrorContext context;
    REQUIRE(context.Format("Plain") == "Plain");

    context.Set("source", "sessions").Set("depth", "3");
    REQUIRE(context.Format("Invalid depth") == "Invalid depth [source: sessions, depth: 3]");

    context.Set("source", "page_views");
    REQUIRE(context.Format("x") == "x [source: page_views, depth: 3]");
}

TEST_CASE("Request enums parse case-insensitively", "[query_request]") {
    REQUIRE(ParseEventSource("Sessions") == EventSource::SESSIONS);
    REQUIRE(ParseEventSource("page_views") == EventSource::PAGE_VIEWS);
    REQUIRE_THROWS_AS(ParseEventSource("clicks"), duckdb::InvalidInputException);

    REQUIRE(ParseFilterOperator("NOT_CONTAINS") == FilterOperator::NOT_CONTAINS);
    REQUIRE(FilterOperatorToString(FilterOperator::NOT_EQUALS) == "not_equals");
    REQUIRE_THROWS_AS(ParseFilterOperator("starts_with"), duckdb::InvalidInputException);

    REQUIRE(ParseSortDirection("asc") == SortDirection::ASC);
    REQUIRE(SortDirectionToString(SortDirection::DESC) == "DESC");
}
