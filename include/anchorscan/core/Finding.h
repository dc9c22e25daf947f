#pragma once

#include "anchorscan/core/Severity.h"

#include <string>
#include <vector>

namespace anchorscan {

inline constexpr const char *kDefaultReference =
    "https://github.com/solana-foundation/anchor/pull/4229";

struct SourceLocation {
    std::string file;
    unsigned line = 0;
};

struct Finding {
    std::string    detectorID;
    std::string    title;
    Severity       severity = Severity::Low;
    SourceLocation location;
    std::string    description;
    std::string    remediation;
    std::string    reference = kDefaultReference;

    std::string    rootCause;
    std::string    exploitScenario;
    std::string    codeSnippet;      // +/-3 lines, finding line marked ">>>"
    std::string    affectedVersions; // framework versions the pattern applies to
};

// Presentation order: file, then line, then detector id.
void sortFindings(std::vector<Finding> &findings);

} // namespace anchorscan
