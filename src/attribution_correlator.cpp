#include "attribution_correlator.hpp"
#include "drillq_tracing.hpp"

#include "duckdb/common/string_util.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>

namespace drillq {

const DimensionConversions* AttributionReport::Find(const std::string& dimension_value) const {
    for (const auto& entry : conversions) {
        if (entry.dimension_value == dimension_value) {
            return &entry;
        }
    }
    return nullptr;
}

static std::string NormalizeKeyPart(const std::string& value) {
    return value == "null" ? "" : value;
}

static std::string DimensionKey(const std::string& value, bool is_null) {
    return is_null ? "unknown" : duckdb::StringUtil::Lower(value);
}

static std::string TextOrEmpty(const duckdb::Value& value) {
    return value.IsNull() ? "" : value.ToString();
}

static double NumberOrZero(const duckdb::Value& value) {
    return value.IsNull() ? 0.0 : value.GetValue<double>();
}

// Ordered accumulation, flattened into trials-descending order
static AttributionReport Finalize(const std::map<std::string, DimensionConversions>& accumulated,
                                  double total_trials, double matched_trials, size_t unmatched_keys) {
    AttributionReport report;
    report.total_crm_trials = total_trials;
    report.matched_crm_trials = matched_trials;
    report.unmatched_keys = unmatched_keys;
    for (const auto& entry : accumulated) {
        report.conversions.push_back(entry.second);
    }
    std::stable_sort(report.conversions.begin(), report.conversions.end(),
                     [](const DimensionConversions& a, const DimensionConversions& b) {
                         return a.trials > b.trials;
                     });
    return report;
}

std::string AttributionCorrelator::TrackingKey(
    const std::string& source,
    const std::string& campaign_id,
    const std::string& adset_id,
    const std::string& ad_id,
    const std::set<std::string>& excluded_fields) {

    const std::pair<const char *, const std::string *> parts[] = {
        {"source", &source},
        {"campaign_id", &campaign_id},
        {"adset_id", &adset_id},
        {"ad_id", &ad_id},
    };

    std::string key;
    bool first = true;
    for (const auto& [field, value] : parts) {
        if (excluded_fields.count(field) > 0) {
            continue;
        }
        if (!first) {
            key += "::";
        }
        key += NormalizeKeyPart(*value);
        first = false;
    }
    return key;
}

std::set<std::string> AttributionCorrelator::ExcludedTrackingFields(const QueryRequest& request) {
    static const std::unordered_map<std::string, std::string> tracking_fields = {
        {"utmSource", "source"},
        {"entryUtmSource", "source"},
        {"campaign", "campaign_id"},
        {"entryCampaign", "campaign_id"},
        {"adset", "adset_id"},
        {"entryAdset", "adset_id"},
        {"ad", "ad_id"},
        {"entryAd", "ad_id"},
    };

    std::set<std::string> excluded;
    auto exclude = [&](const std::string& dimension_id) {
        auto it = tracking_fields.find(dimension_id);
        if (it != tracking_fields.end()) {
            excluded.insert(it->second);
        }
    };

    if (request.depth >= 0 && request.depth < static_cast<int64_t>(request.dimensions.size())) {
        exclude(request.dimensions[request.depth]);
    }
    for (const auto& ancestor : request.ancestor_filters) {
        exclude(ancestor.first);
    }
    return excluded;
}

AttributionReport AttributionCorrelator::CorrelateByTracking(
    const std::vector<CrmTrackingRow>& crm_rows,
    const std::vector<TrackingMatchRow>& analytics_rows,
    const std::set<std::string>& excluded_fields) {

    struct Totals {
        double trials = 0;
        double approved = 0;
    };

    std::map<std::string, Totals> crm_index;
    double total_trials = 0;
    for (const auto& row : crm_rows) {
        auto& totals = crm_index[TrackingKey(row.source, row.campaign_id, row.adset_id, row.ad_id, excluded_fields)];
        totals.trials += row.trials;
        totals.approved += row.approved;
        total_trials += row.trials;
    }

    std::unordered_map<std::string, double> visitors_per_key;
    for (const auto& row : analytics_rows) {
        visitors_per_key[TrackingKey(row.source, row.campaign_id, row.adset_id, row.ad_id, excluded_fields)] +=
            row.unique_visitors;
    }

    std::map<std::string, DimensionConversions> accumulated;
    for (const auto& row : analytics_rows) {
        auto key = TrackingKey(row.source, row.campaign_id, row.adset_id, row.ad_id, excluded_fields);
        auto crm = crm_index.find(key);
        if (crm == crm_index.end()) {
            continue;
        }

        auto total_visitors = visitors_per_key[key];
        // A key whose rows report no visitors attributes nothing
        double proportion = total_visitors > 0 ? row.unique_visitors / total_visitors : 0.0;

        auto dimension = DimensionKey(row.dimension_value, row.dimension_is_null);
        auto& entry = accumulated[dimension];
        entry.dimension_value = dimension;
        entry.trials += crm->second.trials * proportion;
        entry.approved += crm->second.approved * proportion;
    }

    double matched_trials = 0;
    size_t unmatched_keys = 0;
    for (const auto& [key, totals] : crm_index) {
        if (visitors_per_key.count(key) > 0) {
            matched_trials += totals.trials;
        } else {
            unmatched_keys++;
        }
    }

    DRILLQ_TRACE_DEBUG("ATTRIBUTION", "Tracking correlation: " + std::to_string(crm_index.size()) + " CRM key(s), " +
                       std::to_string(unmatched_keys) + " unmatched");
    return Finalize(accumulated, total_trials, matched_trials, unmatched_keys);
}

AttributionReport AttributionCorrelator::CorrelateByVisitor(
    const std::vector<CrmVisitorRow>& crm_rows,
    const std::vector<VisitorMatchRow>& analytics_rows) {

    std::map<std::string, CrmVisitorRow> crm_index;
    double total_trials = 0;
    for (const auto& row : crm_rows) {
        auto& entry = crm_index[row.visitor_id];
        entry.visitor_id = row.visitor_id;
        entry.trials += row.trials;
        entry.approved += row.approved;
        total_trials += row.trials;
    }

    // Distinct dimension values per matched visitor
    std::unordered_map<std::string, std::set<std::string>> dimensions_per_visitor;
    for (const auto& row : analytics_rows) {
        if (crm_index.count(row.visitor_id) > 0) {
            dimensions_per_visitor[row.visitor_id].insert(DimensionKey(row.dimension_value, row.dimension_is_null));
        }
    }

    std::map<std::string, DimensionConversions> accumulated;
    for (const auto& [visitor_id, dimensions] : dimensions_per_visitor) {
        const auto& crm = crm_index[visitor_id];
        auto share = static_cast<double>(dimensions.size());
        for (const auto& dimension : dimensions) {
            auto& entry = accumulated[dimension];
            entry.dimension_value = dimension;
            entry.trials += crm.trials / share;
            entry.approved += crm.approved / share;
        }
    }

    double matched_trials = 0;
    size_t unmatched_keys = 0;
    for (const auto& [visitor_id, crm] : crm_index) {
        if (dimensions_per_visitor.count(visitor_id) > 0) {
            matched_trials += crm.trials;
        } else {
            unmatched_keys++;
        }
    }

    DRILLQ_TRACE_DEBUG("ATTRIBUTION", "Visitor correlation: " + std::to_string(crm_index.size()) + " CRM visitor(s), " +
                       std::to_string(unmatched_keys) + " unmatched");
    return Finalize(accumulated, total_trials, matched_trials, unmatched_keys);
}

std::vector<TrackingMatchRow> AttributionCorrelator::ParseTrackingMatch(const QueryRows& rows) {
    std::vector<TrackingMatchRow> parsed;
    if (rows.IsEmpty()) {
        return parsed;
    }

    auto dimension = rows.ColumnIndex("dimension_value");
    auto source = rows.ColumnIndex("source");
    auto campaign = rows.ColumnIndex("campaign_id");
    auto adset = rows.ColumnIndex("adset_id");
    auto ad = rows.ColumnIndex("ad_id");
    auto visitors = rows.ColumnIndex("unique_visitors");

    for (const auto& row : rows.rows) {
        TrackingMatchRow match;
        match.dimension_is_null = row[dimension].IsNull();
        match.dimension_value = TextOrEmpty(row[dimension]);
        match.source = TextOrEmpty(row[source]);
        match.campaign_id = TextOrEmpty(row[campaign]);
        match.adset_id = TextOrEmpty(row[adset]);
        match.ad_id = TextOrEmpty(row[ad]);
        match.unique_visitors = NumberOrZero(row[visitors]);
        parsed.push_back(std::move(match));
    }
    return parsed;
}

std::vector<VisitorMatchRow> AttributionCorrelator::ParseVisitorMatch(const QueryRows& rows) {
    std::vector<VisitorMatchRow> parsed;
    if (rows.IsEmpty()) {
        return parsed;
    }

    auto dimension = rows.ColumnIndex("dimension_value");
    auto visitor = rows.ColumnIndex("visitor_id");

    for (const auto& row : rows.rows) {
        if (row[visitor].IsNull()) {
            continue;
        }
        VisitorMatchRow match;
        match.dimension_is_null = row[dimension].IsNull();
        match.dimension_value = TextOrEmpty(row[dimension]);
        match.visitor_id = row[visitor].ToString();
        parsed.push_back(std::move(match));
    }
    return parsed;
}

std::vector<CrmTrackingRow> AttributionCorrelator::ParseCrmTracking(const QueryRows& rows) {
    std::vector<CrmTrackingRow> parsed;
    if (rows.IsEmpty()) {
        return parsed;
    }

    auto source = rows.ColumnIndex("source");
    auto campaign = rows.ColumnIndex("campaign_id");
    auto adset = rows.ColumnIndex("adset_id");
    auto ad = rows.ColumnIndex("ad_id");
    auto trials = rows.ColumnIndex("trials");
    auto approved = rows.ColumnIndex("approved");

    for (const auto& row : rows.rows) {
        CrmTrackingRow crm;
        crm.source = TextOrEmpty(row[source]);
        crm.campaign_id = TextOrEmpty(row[campaign]);
        crm.adset_id = TextOrEmpty(row[adset]);
        crm.ad_id = TextOrEmpty(row[ad]);
        crm.trials = NumberOrZero(row[trials]);
        crm.approved = NumberOrZero(row[approved]);
        parsed.push_back(std::move(crm));
    }
    return parsed;
}

std::vector<CrmVisitorRow> AttributionCorrelator::ParseCrmVisitors(const QueryRows& rows) {
    std::vector<CrmVisitorRow> parsed;
    if (rows.IsEmpty()) {
        return parsed;
    }

    auto visitor = rows.ColumnIndex("ff_vid");
    auto trials = rows.ColumnIndex("trials");
    auto approved = rows.ColumnIndex("approved");

    for (const auto& row : rows.rows) {
        if (row[visitor].IsNull()) {
            continue;
        }
        CrmVisitorRow crm;
        crm.visitor_id = row[visitor].ToString();
        crm.trials = NumberOrZero(row[trials]);
        crm.approved = NumberOrZero(row[approved]);
        parsed.push_back(std::move(crm));
    }
    return parsed;
}

} // namespace drillq
