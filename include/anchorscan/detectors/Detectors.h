#pragma once

#include "anchorscan/core/Config.h"
#include "anchorscan/core/Detector.h"

#include <memory>

namespace anchorscan {

// ANCHOR-001: init_if_needed token account without delegate/close_authority checks.
std::unique_ptr<Detector> createInitIfNeededDetector(const Config &cfg);

// ANCHOR-002: init_if_needed field sharing an element type with a mut field.
std::unique_ptr<Detector> createDuplicateMutableDetector(const Config &cfg);

// ANCHOR-003: realloc::payer not typed as Signer.
std::unique_ptr<Detector> createReallocPayerDetector(const Config &cfg);

// ANCHOR-004: raw AccountInfo/UncheckedAccount without discriminator check.
std::unique_ptr<Detector> createTypeCosplayDetector(const Config &cfg);

// ANCHOR-005: close and init_if_needed on the same account type.
std::unique_ptr<Detector> createCloseReinitDetector(const Config &cfg);

// ANCHOR-006: raw AccountInfo/UncheckedAccount without owner validation.
std::unique_ptr<Detector> createMissingOwnerDetector(const Config &cfg);

} // namespace anchorscan
