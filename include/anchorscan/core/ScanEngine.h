#pragma once

#include "anchorscan/core/DetectorSet.h"
#include "anchorscan/core/Finding.h"

#include <string>
#include <vector>

namespace anchorscan {

class SourceFile;

struct SourceInput {
    std::string id;
    std::string text;
};

struct ScanResult {
    std::vector<Finding> findings;
    unsigned filesScanned = 0;
    unsigned detectorsRun = 0;
    // One line per detector failure, e.g. "ANCHOR-003 failed on lib.rs: ...".
    std::vector<std::string> notes;
};

// Runs a DetectorSet over source files. A detector that throws contributes
// no findings for that file and leaves a note; the others still run.
class ScanEngine {
public:
    explicit ScanEngine(DetectorSet detectors, unsigned jobs = 0);

    const DetectorSet &detectors() const { return detectors_; }

    ScanResult scanFile(const SourceFile &file) const;
    ScanResult scanFile(std::string id, std::string text) const;

    // Files are scanned concurrently; results keep input order.
    ScanResult scanFiles(const std::vector<SourceInput> &inputs) const;

private:
    DetectorSet detectors_;
    unsigned jobs_;
};

// Scans one buffer with the default detector set and returns its findings.
std::vector<Finding> scanFile(std::string id, std::string text);

} // namespace anchorscan
