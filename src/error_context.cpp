#include "error_context.hpp"
#include <sstream>

namespace drillq {

ErrorContext& ErrorContext::Set(const std::string& key, const std::string& value) {
    for (auto& entry : context_) {
        if (entry.first == key) {
            entry.second = value;
            return *this;
        }
    }
    context_.emplace_back(key, value);
    return *this;
}

std::string ErrorContext::Format(const std::string& base_message) const {
    if (context_.empty()) {
        return base_message;
    }

    std::ostringstream result;
    result << base_message << " [";

    bool first = true;
    for (const auto& [key, value] : context_) {
        if (!first) {
            result << ", ";
        }
        result << key << ": " << value;
        first = false;
    }

    result << "]";
    return result.str();
}

} // namespace drillq
