#include <anvil/data/validation.hpp>

namespace anvil::data {

void ValidationReport::merge(const ValidationReport& other) {
    issues.insert(issues.end(), other.issues.begin(), other.issues.end());
}

std::string ValidationReport::to_string() const {
    std::string result;
    for (const auto& issue : issues) {
        if (!result.empty()) result += '\n';
        result += "  - ";
        result += issue;
    }
    return result;
}

DataValidationError::DataValidationError(const std::string& source, ValidationReport report)
    : std::runtime_error(source + " data validation failed (" +
                         std::to_string(report.issue_count()) + " issues):\n" + report.to_string())
    , m_source(source)
    , m_report(std::move(report)) {}

} // namespace anvil::data
