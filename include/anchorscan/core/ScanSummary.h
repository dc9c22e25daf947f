#pragma once

#include "anchorscan/core/Finding.h"
#include "anchorscan/core/Severity.h"

#include <array>
#include <map>
#include <string>
#include <vector>

namespace anchorscan {

inline constexpr size_t kSeverityLevels = 4;

struct ScanSummary {
    std::array<unsigned, kSeverityLevels> bySeverity{}; // indexed by Severity
    std::map<std::string, unsigned> byDetector;
    unsigned total = 0;
    unsigned score = 0;         // weighted total
    std::string label = "A";

    unsigned count(Severity s) const {
        return bySeverity[static_cast<size_t>(s)];
    }
};

// Critical 10, High 5, Medium 2, Low 1.
constexpr unsigned severityWeight(Severity s) {
    switch (s) {
        case Severity::Critical: return 10;
        case Severity::High:     return 5;
        case Severity::Medium:   return 2;
        case Severity::Low:      return 1;
    }
    return 0;
}

// A, B+, B, C, D or F for a weighted total.
const char *scoreLabelFor(unsigned score);

ScanSummary summarize(const std::vector<Finding> &findings);

} // namespace anchorscan
