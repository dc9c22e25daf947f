#pragma once

#include "anchorscan/core/Detector.h"

#include <memory>
#include <string_view>
#include <vector>

namespace anchorscan {

struct Config;

// Ordered, caller-owned collection of detectors handed to ScanEngine.
class DetectorSet {
public:
    DetectorSet() = default;
    DetectorSet(DetectorSet &&) = default;
    DetectorSet &operator=(DetectorSet &&) = default;

    // The six built-in detectors, minus those disabled in `cfg`.
    static DetectorSet defaults(const Config &cfg);

    void add(std::unique_ptr<Detector> detector);
    bool remove(std::string_view id);

    const std::vector<std::unique_ptr<Detector>> &detectors() const { return detectors_; }
    size_t size() const { return detectors_.size(); }
    bool empty() const { return detectors_.empty(); }

    const Detector *findByID(std::string_view id) const;

private:
    std::vector<std::unique_ptr<Detector>> detectors_;
};

} // namespace anchorscan
