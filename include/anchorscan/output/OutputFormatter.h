#pragma once

#include "anchorscan/core/ExecutionMetadata.h"
#include "anchorscan/core/Finding.h"
#include "anchorscan/core/ScanSummary.h"

#include <string>
#include <vector>

namespace anchorscan {

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<Finding> &findings,
                               const ScanSummary &summary,
                               const ExecutionMetadata &meta) = 0;
};

class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Finding> &findings,
                       const ScanSummary &summary,
                       const ExecutionMetadata &meta) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Finding> &findings,
                       const ScanSummary &summary,
                       const ExecutionMetadata &meta) override;
};

class SARIFOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Finding> &findings,
                       const ScanSummary &summary,
                       const ExecutionMetadata &meta) override;
};

// JSON string body escaping shared by the JSON and SARIF writers.
std::string jsonEscape(const std::string &s);

} // namespace anchorscan
