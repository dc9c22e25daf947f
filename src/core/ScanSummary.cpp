#include "anchorscan/core/ScanSummary.h"

#include <algorithm>
#include <tuple>

namespace anchorscan {

const char *scoreLabelFor(unsigned score) {
    if (score == 0)  return "A";
    if (score < 5)   return "B+";
    if (score < 10)  return "B";
    if (score < 15)  return "C";
    if (score < 20)  return "D";
    return "F";
}

ScanSummary summarize(const std::vector<Finding> &findings) {
    ScanSummary summary;
    for (const auto &f : findings) {
        ++summary.bySeverity[static_cast<size_t>(f.severity)];
        ++summary.byDetector[f.detectorID];
        summary.score += severityWeight(f.severity);
    }
    summary.total = static_cast<unsigned>(findings.size());
    summary.label = scoreLabelFor(summary.score);
    return summary;
}

void sortFindings(std::vector<Finding> &findings) {
    std::stable_sort(findings.begin(), findings.end(),
                     [](const Finding &a, const Finding &b) {
                         return std::tie(a.location.file, a.location.line, a.detectorID) <
                                std::tie(b.location.file, b.location.line, b.detectorID);
                     });
}

} // namespace anchorscan
