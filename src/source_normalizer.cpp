#include "source_normalizer.hpp"
#include "sql_query_builder.hpp"

#include "duckdb/common/string_util.hpp"

namespace drillq {

const std::vector<SourceSynonyms>& SourceNormalizer::Synonyms() {
    static const std::vector<SourceSynonyms> synonyms = {
        {"google", {"google", "adwords"}},
        {"facebook", {"facebook", "meta"}},
    };
    return synonyms;
}

std::string SourceNormalizer::Normalize(const std::string& source) {
    auto lowered = duckdb::StringUtil::Lower(source);
    for (const auto& entry : Synonyms()) {
        for (const auto& spelling : entry.spellings) {
            if (spelling == lowered) {
                return entry.canonical;
            }
        }
    }
    return lowered;
}

std::vector<std::string> SourceNormalizer::Expand(const std::string& source) {
    auto canonical = Normalize(source);
    for (const auto& entry : Synonyms()) {
        if (entry.canonical == canonical) {
            return entry.spellings;
        }
    }
    return {canonical};
}

std::string SourceNormalizer::RenderSql(const std::string& column) {
    auto lowered = "LOWER(" + column + ")";
    std::string sql = "CASE";
    for (const auto& entry : Synonyms()) {
        sql += " WHEN " + lowered + " IN (";
        for (size_t i = 0; i < entry.spellings.size(); ++i) {
            if (i > 0) {
                sql += ", ";
            }
            sql += SqlLiteralEncoder::Quote(entry.spellings[i]);
        }
        sql += ") THEN " + SqlLiteralEncoder::Quote(entry.canonical);
    }
    sql += " ELSE COALESCE(" + lowered + ", '') END";
    return sql;
}

} // namespace drillq
