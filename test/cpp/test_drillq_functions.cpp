#include "catch.hpp"
#include "drillq_functions.hpp"

using namespace drillq;
using namespace duckdb;

static Value Dimensions(const std::vector<std::string>& ids) {
    vector<Value> values;
    for (const auto& id : ids) {
        values.push_back(Value(id));
    }
    return Value::LIST(LogicalType::VARCHAR, values);
}

static Value FilterEntry(const std::string& field, const std::string& op, const Value& value) {
    child_list_t<Value> children;
    children.push_back(std::make_pair("field", Value(field)));
    children.push_back(std::make_pair("operator", Value(op)));
    children.push_back(std::make_pair("value", value));
    return Value::STRUCT(std::move(children));
}

static vector<Value> DrilldownInputs(const std::vector<std::string>& ids, int64_t depth) {
    return {Dimensions(ids), Value::BIGINT(depth), Value::DATE(Date::FromDate(2024, 1, 1)),
            Value::DATE(Date::FromDate(2024, 1, 7))};
}

TEST_CASE("Dimension list argument", "[drillq_functions]") {
    REQUIRE(DrillqFunctions::ParseDimensionList(Dimensions({"country", "campaign"})) ==
            std::vector<std::string>{"country", "campaign"});
    REQUIRE_THROWS_AS(DrillqFunctions::ParseDimensionList(Value(LogicalType::LIST(LogicalType::VARCHAR))),
                      InvalidInputException);
    REQUIRE_THROWS_AS(DrillqFunctions::ParseDimensionList(Value::LIST(LogicalType::VARCHAR, {Value("a"), Value(LogicalType::VARCHAR)})),
                      InvalidInputException);
}

TEST_CASE("Ancestor filter map argument", "[drillq_functions]") {
    auto map = Value::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR,
                          {Value("country"), Value("campaign")}, {Value("DE"), Value(LogicalType::VARCHAR)});

    auto filters = DrillqFunctions::ParseAncestorFilters(map);
    REQUIRE(filters.size() == 2);
    REQUIRE(filters["country"] == "DE");
    REQUIRE(filters["campaign"] == UNKNOWN_VALUE);

    REQUIRE(DrillqFunctions::ParseAncestorFilters(Value()).empty());
}

TEST_CASE("Table filter list argument", "[drillq_functions]") {
    auto list = Value::LIST({
        FilterEntry("campaign", "equals", Value("Summer Sale")),
        FilterEntry("urlPath", "NOT_CONTAINS", Value(LogicalType::VARCHAR)),
    });

    auto filters = DrillqFunctions::ParseTableFilters(list);
    REQUIRE(filters.size() == 2);
    REQUIRE(filters[0].field == "campaign");
    REQUIRE(filters[0].op == FilterOperator::EQUALS);
    REQUIRE(filters[0].value == "Summer Sale");
    REQUIRE(filters[1].op == FilterOperator::NOT_CONTAINS);
    REQUIRE(filters[1].value.empty());

    auto bad_operator = Value::LIST({FilterEntry("campaign", "starts_with", Value("x"))});
    REQUIRE_THROWS_AS(DrillqFunctions::ParseTableFilters(bad_operator), InvalidInputException);

    auto empty_field = Value::LIST({FilterEntry("", "equals", Value("x"))});
    REQUIRE_THROWS_AS(DrillqFunctions::ParseTableFilters(empty_field), InvalidInputException);
}

TEST_CASE("Requests from table function arguments", "[drillq_functions]") {
    SECTION("Defaults") {
        named_parameter_map_t named;
        auto request = DrillqFunctions::BuildQueryRequest(DrilldownInputs({"country"}, 0), named,
                                                          CompileMode::DRILLDOWN, 250);
        REQUIRE(request.source == EventSource::PAGE_VIEWS);
        REQUIRE(request.dimensions == std::vector<std::string>{"country"});
        REQUIRE(request.depth == 0);
        REQUIRE(request.limit == 250);
        REQUIRE(request.sort_by == "pageViews");
        REQUIRE(request.sort_direction == SortDirection::DESC);
        REQUIRE(request.date_range.end == Date::FromDate(2024, 1, 7));
    }

    SECTION("Named parameters") {
        named_parameter_map_t named;
        named["source"] = Value("SESSIONS");
        named["sort_by"] = Value("uniqueVisitors");
        named["sort_direction"] = Value("asc");
        named["limit"] = Value::BIGINT(20);
        named["ancestor_filters"] = Value::MAP(LogicalType::VARCHAR, LogicalType::VARCHAR,
                                               {Value("entryUtmSource")}, {Value("google")});
        named["filters"] = Value::LIST({FilterEntry("entryCountryCode", "equals", Value("DE"))});

        auto request = DrillqFunctions::BuildQueryRequest(DrilldownInputs({"entryUtmSource", "entryCampaign"}, 1),
                                                          named, CompileMode::DRILLDOWN, 1000);
        REQUIRE(request.source == EventSource::SESSIONS);
        REQUIRE(request.sort_by == "uniqueVisitors");
        REQUIRE(request.sort_direction == SortDirection::ASC);
        REQUIRE(request.limit == 20);
        REQUIRE(request.ancestor_filters.at("entryUtmSource") == "google");
        REQUIRE(request.user_filters.size() == 1);

        auto query = DrillqFunctions::CompileRequest(request, CompileMode::DRILLDOWN);
        REQUIRE(query.text.find("GROUP BY se.entry_utm_campaign::text") != std::string::npos);
        REQUIRE(query.text.find("ORDER BY unique_visitors ASC NULLS LAST") != std::string::npos);
        REQUIRE(query.text.find("LIMIT 20") != std::string::npos);
        REQUIRE(query.parameters.size() == 4);
    }

    SECTION("Flat mode takes no depth") {
        named_parameter_map_t named;
        vector<Value> inputs = {Dimensions({"country", "deviceType"}), Value::DATE(Date::FromDate(2024, 1, 1)),
                                Value::DATE(Date::FromDate(2024, 1, 7))};
        auto request = DrillqFunctions::BuildQueryRequest(inputs, named, CompileMode::FLAT, 1000);
        auto query = DrillqFunctions::CompileRequest(request, CompileMode::FLAT);
        REQUIRE(query.text.find("device_type AS \"deviceType\"") != std::string::npos);
    }

    SECTION("Match modes") {
        named_parameter_map_t named;
        auto request = DrillqFunctions::BuildQueryRequest(DrilldownInputs({"country"}, 0), named,
                                                          CompileMode::VISITOR_MATCH, 1000);
        auto visitor = DrillqFunctions::CompileRequest(request, CompileMode::VISITOR_MATCH);
        REQUIRE(visitor.text.rfind("SELECT DISTINCT", 0) == 0);
        auto tracking = DrillqFunctions::CompileRequest(request, CompileMode::TRACKING_MATCH);
        REQUIRE(tracking.text.find("AS unique_visitors") != std::string::npos);
    }

    SECTION("Invalid arguments") {
        named_parameter_map_t named;
        vector<Value> too_few = {Dimensions({"country"}), Value::BIGINT(0)};
        REQUIRE_THROWS_AS(DrillqFunctions::BuildQueryRequest(too_few, named, CompileMode::DRILLDOWN, 1000),
                          BinderException);

        auto null_date = DrilldownInputs({"country"}, 0);
        null_date[2] = Value(LogicalType::DATE);
        REQUIRE_THROWS_AS(DrillqFunctions::BuildQueryRequest(null_date, named, CompileMode::DRILLDOWN, 1000),
                          InvalidInputException);

        named["source"] = Value("clicks");
        REQUIRE_THROWS_AS(DrillqFunctions::BuildQueryRequest(DrilldownInputs({"country"}, 0), named,
                                                             CompileMode::DRILLDOWN, 1000),
                          InvalidInputException);
    }
}
