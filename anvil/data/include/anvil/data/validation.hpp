#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace anvil::data {

// ============================================================================
// ValidationReport - Every issue found by a validation pass
// ============================================================================

struct ValidationReport {
    std::vector<std::string> issues;

    bool ok() const { return issues.empty(); }
    size_t issue_count() const { return issues.size(); }

    void add(std::string issue) { issues.push_back(std::move(issue)); }
    void merge(const ValidationReport& other);

    // One issue per line, each prefixed with "  - "
    std::string to_string() const;
};

// ============================================================================
// DataValidationError - Reference data failed validation at load time
// ============================================================================

class DataValidationError : public std::runtime_error {
public:
    DataValidationError(const std::string& source, ValidationReport report);

    const std::string& source() const { return m_source; }
    const std::vector<std::string>& issues() const { return m_report.issues; }
    const ValidationReport& report() const { return m_report; }

private:
    std::string m_source;
    ValidationReport m_report;
};

} // namespace anvil::data
