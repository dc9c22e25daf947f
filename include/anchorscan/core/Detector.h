#pragma once

#include "anchorscan/core/Finding.h"
#include "anchorscan/core/Severity.h"

#include <string_view>
#include <vector>

namespace anchorscan {

class ExtractionResult;

// A single structural rule. Implementations hold only configuration fixed
// at construction, so one instance may analyze many files concurrently.
class Detector {
public:
    virtual ~Detector() = default;

    virtual std::string_view getID() const = 0;
    virtual std::string_view getTitle() const = 0;
    virtual Severity getBaseSeverity() const = 0;
    virtual std::string_view getReference() const { return kDefaultReference; }

    // Appends one Finding per hazard to `out`. Elements the rule cannot
    // classify are skipped.
    virtual void analyze(const ExtractionResult &ER,
                         std::vector<Finding> &out) const = 0;
};

} // namespace anchorscan
