#include "anchorscan/core/ScanEngine.h"
#include "anchorscan/core/Config.h"
#include "anchorscan/source/FieldRegistry.h"
#include "anchorscan/source/SourceFile.h"

#include <algorithm>
#include <exception>
#include <future>
#include <semaphore>
#include <set>
#include <thread>
#include <tuple>

namespace anchorscan {

namespace {

using FindingKey = std::tuple<std::string, std::string, unsigned, std::string>;

// Drops repeats of (detector id, file, line, description), keeping the first.
void dedupFindings(std::vector<Finding> &findings) {
    std::set<FindingKey> seen;
    std::vector<Finding> unique;
    unique.reserve(findings.size());
    for (auto &f : findings) {
        FindingKey key{f.detectorID, f.location.file, f.location.line, f.description};
        if (seen.insert(std::move(key)).second)
            unique.push_back(std::move(f));
    }
    findings = std::move(unique);
}

void append(ScanResult &into, ScanResult &&from) {
    into.findings.insert(into.findings.end(),
                         std::make_move_iterator(from.findings.begin()),
                         std::make_move_iterator(from.findings.end()));
    into.notes.insert(into.notes.end(),
                      std::make_move_iterator(from.notes.begin()),
                      std::make_move_iterator(from.notes.end()));
    into.filesScanned += from.filesScanned;
}

} // anonymous namespace

ScanEngine::ScanEngine(DetectorSet detectors, unsigned jobs)
    : detectors_(std::move(detectors)), jobs_(jobs) {}

ScanResult ScanEngine::scanFile(const SourceFile &file) const {
    ScanResult result;
    result.filesScanned = 1;
    result.detectorsRun = static_cast<unsigned>(detectors_.size());

    ExtractionResult ER(file);

    for (const auto &detector : detectors_.detectors()) {
        std::vector<Finding> local;
        try {
            detector->analyze(ER, local);
        } catch (const std::exception &e) {
            result.notes.push_back(std::string(detector->getID()) +
                                   " failed on " + file.id() + ": " + e.what());
            continue;
        }
        result.findings.insert(result.findings.end(),
                               std::make_move_iterator(local.begin()),
                               std::make_move_iterator(local.end()));
    }

    dedupFindings(result.findings);
    return result;
}

ScanResult ScanEngine::scanFile(std::string id, std::string text) const {
    SourceFile file(std::move(id), std::move(text));
    return scanFile(file);
}

ScanResult ScanEngine::scanFiles(const std::vector<SourceInput> &inputs) const {
    ScanResult merged;
    merged.detectorsRun = static_cast<unsigned>(detectors_.size());
    if (inputs.empty())
        return merged;

    // Bounded parallel scan; each task owns one output slot.
    unsigned maxWorkers = jobs_ ? jobs_ : std::max(1u, std::thread::hardware_concurrency());
    maxWorkers = std::min(maxWorkers, static_cast<unsigned>(inputs.size()));
    std::counting_semaphore<> sem(maxWorkers);

    std::vector<ScanResult> slots(inputs.size());
    std::vector<std::future<void>> futures;
    futures.reserve(inputs.size());

    for (size_t i = 0; i < inputs.size(); ++i) {
        futures.push_back(std::async(std::launch::async, [this, &sem, &slots, &inputs, i] {
            sem.acquire();
            struct Release {
                std::counting_semaphore<> &s;
                ~Release() { s.release(); }
            } guard{sem};
            SourceFile file(inputs[i].id, inputs[i].text);
            slots[i] = scanFile(file);
        }));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        futures[i].get();
        append(merged, std::move(slots[i]));
    }
    return merged;
}

std::vector<Finding> scanFile(std::string id, std::string text) {
    ScanEngine engine(DetectorSet::defaults(Config::defaults()));
    return engine.scanFile(std::move(id), std::move(text)).findings;
}

} // namespace anchorscan
