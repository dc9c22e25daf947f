#include "anchorscan/core/DetectorSet.h"
#include "anchorscan/core/Config.h"
#include "anchorscan/detectors/Detectors.h"

#include <algorithm>

namespace anchorscan {

DetectorSet DetectorSet::defaults(const Config &cfg) {
    using Factory = std::unique_ptr<Detector> (*)(const Config &);
    static constexpr Factory kFactories[] = {
        createInitIfNeededDetector,
        createDuplicateMutableDetector,
        createReallocPayerDetector,
        createTypeCosplayDetector,
        createCloseReinitDetector,
        createMissingOwnerDetector,
    };

    DetectorSet set;
    for (Factory make : kFactories) {
        auto detector = make(cfg);
        if (!cfg.isDetectorDisabled(detector->getID()))
            set.add(std::move(detector));
    }
    return set;
}

void DetectorSet::add(std::unique_ptr<Detector> detector) {
    if (detector)
        detectors_.push_back(std::move(detector));
}

bool DetectorSet::remove(std::string_view id) {
    auto it = std::remove_if(detectors_.begin(), detectors_.end(),
                             [id](const auto &d) { return d->getID() == id; });
    if (it == detectors_.end())
        return false;
    detectors_.erase(it, detectors_.end());
    return true;
}

const Detector *DetectorSet::findByID(std::string_view id) const {
    auto it = std::find_if(detectors_.begin(), detectors_.end(),
                           [id](const auto &d) { return d->getID() == id; });
    return (it != detectors_.end()) ? it->get() : nullptr;
}

} // namespace anchorscan
