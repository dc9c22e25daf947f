#include "anchorscan/output/OutputFormatter.h"

#include <llvm/ADT/StringRef.h>

#include <sstream>

namespace anchorscan {

namespace {

void writeIndented(std::ostringstream &os, llvm::StringRef text,
                   llvm::StringRef indent) {
    while (!text.empty()) {
        auto [line, rest] = text.split('\n');
        os << indent.str() << line.str() << "\n";
        text = rest;
    }
}

} // anonymous namespace

std::string CLIOutputFormatter::format(const std::vector<Finding> &findings,
                                       const ScanSummary &summary,
                                       const ExecutionMetadata &meta) {
    std::ostringstream os;

    if (meta.frameworkVersion)
        os << "anchorscan: anchor-lang " << *meta.frameworkVersion << "\n\n";

    for (const auto &f : findings) {
        os << f.location.file << ":" << f.location.line << ": ";
        os << "[" << severityToString(f.severity) << "] "
           << f.detectorID << " - " << f.title << "\n";

        os << "  " << f.description << "\n";
        if (!f.rootCause.empty())
            os << "  Root cause: " << f.rootCause << "\n";
        if (!f.affectedVersions.empty())
            os << "  Affected: " << f.affectedVersions << "\n";
        if (!f.remediation.empty()) {
            os << "  Fix:\n";
            writeIndented(os, f.remediation, "    ");
        }
        os << "  Reference: " << f.reference << "\n";
        if (!f.codeSnippet.empty())
            writeIndented(os, f.codeSnippet, "  ");

        os << "\n";
    }

    if (findings.empty()) {
        os << "anchorscan: no findings in " << meta.filesScanned
           << " file(s). Score: " << summary.label << "\n";
        return os.str();
    }

    os << "anchorscan: " << summary.total << " finding(s) in "
       << meta.filesScanned << " file(s) ("
       << "Critical: " << summary.count(Severity::Critical)
       << ", High: " << summary.count(Severity::High)
       << ", Medium: " << summary.count(Severity::Medium)
       << ", Low: " << summary.count(Severity::Low) << "). "
       << "Score: " << summary.label << " (" << summary.score << ")\n";

    return os.str();
}

} // namespace anchorscan
