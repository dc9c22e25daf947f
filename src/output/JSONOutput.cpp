#include "anchorscan/output/OutputFormatter.h"

#include <cstdio>
#include <sstream>

namespace anchorscan {

std::string jsonEscape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string JSONOutputFormatter::format(const std::vector<Finding> &findings,
                                        const ScanSummary &summary,
                                        const ExecutionMetadata &meta) {
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": \"" << jsonEscape(meta.toolVersion) << "\",\n";

    os << "  \"metadata\": {\n";
    os << "    \"timestampEpochSec\": " << meta.timestampEpochSec << ",\n";
    os << "    \"configPath\": \"" << jsonEscape(meta.configPath) << "\",\n";
    os << "    \"targets\": [";
    for (size_t i = 0; i < meta.targets.size(); ++i) {
        os << "\"" << jsonEscape(meta.targets[i]) << "\"";
        if (i + 1 < meta.targets.size()) os << ", ";
    }
    os << "],\n";
    os << "    \"filesScanned\": " << meta.filesScanned << ",\n";
    os << "    \"detectorsRun\": " << meta.detectorsRun << ",\n";
    os << "    \"frameworkVersion\": ";
    if (meta.frameworkVersion)
        os << "\"" << jsonEscape(*meta.frameworkVersion) << "\"\n";
    else
        os << "null\n";
    os << "  },\n";

    os << "  \"summary\": {\n";
    os << "    \"total\": " << summary.total << ",\n";
    os << "    \"critical\": " << summary.count(Severity::Critical) << ",\n";
    os << "    \"high\": " << summary.count(Severity::High) << ",\n";
    os << "    \"medium\": " << summary.count(Severity::Medium) << ",\n";
    os << "    \"low\": " << summary.count(Severity::Low) << ",\n";
    os << "    \"byDetector\": {";
    size_t n = 0;
    for (const auto &[id, count] : summary.byDetector) {
        os << "\"" << jsonEscape(id) << "\": " << count;
        if (++n < summary.byDetector.size()) os << ", ";
    }
    os << "},\n";
    os << "    \"score\": " << summary.score << ",\n";
    os << "    \"label\": \"" << jsonEscape(summary.label) << "\"\n";
    os << "  },\n";

    os << "  \"findings\": [\n";
    for (size_t i = 0; i < findings.size(); ++i) {
        const auto &f = findings[i];
        os << "    {\n";
        os << "      \"id\": \"" << jsonEscape(f.detectorID) << "\",\n";
        os << "      \"title\": \"" << jsonEscape(f.title) << "\",\n";
        os << "      \"severity\": \"" << severityToString(f.severity) << "\",\n";
        os << "      \"location\": {\n";
        os << "        \"file\": \"" << jsonEscape(f.location.file) << "\",\n";
        os << "        \"line\": " << f.location.line << "\n";
        os << "      },\n";
        os << "      \"description\": \"" << jsonEscape(f.description) << "\",\n";
        os << "      \"rootCause\": \"" << jsonEscape(f.rootCause) << "\",\n";
        os << "      \"exploitScenario\": \"" << jsonEscape(f.exploitScenario) << "\",\n";
        os << "      \"remediation\": \"" << jsonEscape(f.remediation) << "\",\n";
        os << "      \"affectedVersions\": \"" << jsonEscape(f.affectedVersions) << "\",\n";
        os << "      \"reference\": \"" << jsonEscape(f.reference) << "\",\n";
        os << "      \"codeSnippet\": \"" << jsonEscape(f.codeSnippet) << "\"\n";
        os << "    }";
        if (i + 1 < findings.size()) os << ",";
        os << "\n";
    }
    os << "  ]\n}\n";
    return os.str();
}

} // namespace anchorscan
