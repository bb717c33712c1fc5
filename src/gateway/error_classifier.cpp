#include "gateway/error_classifier.hpp"
#include "core/utils.hpp"

#include <array>

namespace dpgw {

namespace {

// Caller can fix these by changing the SQL or the data it references
constexpr std::array<std::string_view, 9> kDataCorrectionPatterns = {
    "no such table", "no such column", "undefined column", "does not exist",
    "permission denied", "ambiguous column", "invalid input syntax",
    "could not convert", "cannot convert"
};

constexpr std::array<std::string_view, 5> kConnectionPatterns = {
    "connection refused", "could not connect", "server closed",
    "failed to acquire", "not connected"
};

constexpr std::array<std::string_view, 3> kCancellationPatterns = {
    "interrupted", "canceling statement due to statement timeout", "timeout"
};

template <size_t N>
bool contains_any(const std::string& haystack, const std::array<std::string_view, N>& patterns) {
    for (const auto p : patterns) {
        if (haystack.find(p) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

ErrorClassification classify_backend_error(std::string_view message) {
    const std::string lower = utils::to_lower(message);
    ErrorClassification result;

    if (contains_any(lower, kDataCorrectionPatterns)) {
        result.human_action_required = true;
        result.human_action_type = "data_correction";
        return result;
    }
    if (contains_any(lower, kConnectionPatterns)) {
        result.code = ErrorCode::CONNECTION_ERROR;
        return result;
    }
    if (contains_any(lower, kCancellationPatterns)) {
        result.code = ErrorCode::QUERY_TIMEOUT;
        return result;
    }
    return result;
}

} // namespace dpgw
