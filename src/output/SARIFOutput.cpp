#include "anchorscan/output/OutputFormatter.h"

#include <sstream>

namespace anchorscan {

namespace {

std::string sarifLevel(Severity sev) {
    switch (sev) {
        case Severity::Critical: return "error";
        case Severity::High:     return "error";
        case Severity::Medium:   return "warning";
        default:                 return "note";
    }
}

} // anonymous namespace

std::string SARIFOutputFormatter::format(const std::vector<Finding> &findings,
                                         const ScanSummary &summary,
                                         const ExecutionMetadata &meta) {
    std::ostringstream os;

    os << "{\n";
    os << "  \"$schema\": \"https://raw.githubusercontent.com/oasis-tcs/sarif-spec/main/sarif-2.1/schema/sarif-schema-2.1.0.json\",\n";
    os << "  \"version\": \"2.1.0\",\n";
    os << "  \"runs\": [{\n";

    os << "    \"tool\": {\n";
    os << "      \"driver\": {\n";
    os << "        \"name\": \"anchorscan\",\n";
    os << "        \"version\": \"" << jsonEscape(meta.toolVersion) << "\",\n";
    os << "        \"rules\": [";

    // One rule entry per detector id, in first-seen order.
    std::vector<const Finding *> ruleSources;
    for (const auto &f : findings) {
        bool found = false;
        for (const auto *r : ruleSources)
            if (r->detectorID == f.detectorID) { found = true; break; }
        if (!found)
            ruleSources.push_back(&f);
    }

    for (size_t i = 0; i < ruleSources.size(); ++i) {
        const Finding &r = *ruleSources[i];
        os << "\n          {\n";
        os << "            \"id\": \"" << jsonEscape(r.detectorID) << "\",\n";
        os << "            \"shortDescription\": { \"text\": \"" << jsonEscape(r.title) << "\" },\n";
        os << "            \"fullDescription\": { \"text\": \"" << jsonEscape(r.rootCause) << "\" },\n";
        os << "            \"help\": { \"text\": \"" << jsonEscape(r.remediation) << "\" },\n";
        os << "            \"helpUri\": \"" << jsonEscape(r.reference) << "\",\n";
        os << "            \"properties\": { \"tags\": [\"security\", \"solana\", \"anchor\"] }\n";
        os << "          }";
        if (i + 1 < ruleSources.size()) os << ",";
    }

    os << "\n        ]\n";
    os << "      }\n";
    os << "    },\n";

    // Invocations: execution provenance.
    os << "    \"invocations\": [{\n";
    os << "      \"executionSuccessful\": true,\n";
    os << "      \"properties\": {\n";
    os << "        \"timestampEpochSec\": " << meta.timestampEpochSec << ",\n";
    os << "        \"configPath\": \"" << jsonEscape(meta.configPath) << "\",\n";
    os << "        \"filesScanned\": " << meta.filesScanned << ",\n";
    os << "        \"detectorsRun\": " << meta.detectorsRun << ",\n";
    if (meta.frameworkVersion)
        os << "        \"frameworkVersion\": \"" << jsonEscape(*meta.frameworkVersion) << "\",\n";
    os << "        \"score\": " << summary.score << ",\n";
    os << "        \"label\": \"" << jsonEscape(summary.label) << "\"\n";
    os << "      }\n";
    os << "    }],\n";

    if (!meta.targets.empty()) {
        os << "    \"artifacts\": [";
        for (size_t i = 0; i < meta.targets.size(); ++i) {
            os << "\n      { \"location\": { \"uri\": \"" << jsonEscape(meta.targets[i]) << "\" } }";
            if (i + 1 < meta.targets.size()) os << ",";
        }
        os << "\n    ],\n";
    }

    os << "    \"results\": [";

    for (size_t i = 0; i < findings.size(); ++i) {
        const auto &f = findings[i];

        os << "\n      {\n";
        os << "        \"ruleId\": \"" << jsonEscape(f.detectorID) << "\",\n";
        os << "        \"level\": \"" << sarifLevel(f.severity) << "\",\n";
        os << "        \"message\": { \"text\": \"" << jsonEscape(f.description) << "\" },\n";

        os << "        \"locations\": [{\n";
        os << "          \"physicalLocation\": {\n";
        os << "            \"artifactLocation\": { \"uri\": \"" << jsonEscape(f.location.file) << "\" },\n";
        os << "            \"region\": {\n";
        os << "              \"startLine\": " << (f.location.line > 0 ? f.location.line : 1) << "\n";
        os << "            }\n";
        os << "          }\n";
        os << "        }],\n";

        os << "        \"properties\": {\n";
        os << "          \"severity\": \"" << severityToString(f.severity) << "\",\n";
        os << "          \"exploitScenario\": \"" << jsonEscape(f.exploitScenario) << "\",\n";
        os << "          \"affectedVersions\": \"" << jsonEscape(f.affectedVersions) << "\"\n";
        os << "        }\n";
        os << "      }";
        if (i + 1 < findings.size()) os << ",";
    }

    os << "\n    ]\n";
    os << "  }]\n";
    os << "}\n";

    return os.str();
}

} // namespace anchorscan
