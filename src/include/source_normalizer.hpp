#pragma once

#include <string>
#include <vector>

namespace drillq {

struct SourceSynonyms {
    std::string canonical;
    // Lower-case spellings, canonical one included
    std::vector<std::string> spellings;
};

/**
 * Collapses the spellings different systems use for the same ad network
 * into one token, so analytics and CRM keys agree.
 */
class SourceNormalizer {
public:
    static const std::vector<SourceSynonyms>& Synonyms();

    // Lower-cased canonical token; unknown sources are lower-cased as is
    static std::string Normalize(const std::string& source);

    // Every spelling that normalizes to the same token as source
    static std::vector<std::string> Expand(const std::string& source);

    // SQL expression normalizing a source column, NULL becoming ''
    static std::string RenderSql(const std::string& column);
};

} // namespace drillq
