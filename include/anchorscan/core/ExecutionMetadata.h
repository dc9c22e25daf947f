#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace anchorscan {

struct ExecutionMetadata {
    std::string toolVersion;
    std::string configPath;
    uint64_t timestampEpochSec = 0;
    std::vector<std::string> targets;     // paths given on the command line
    unsigned filesScanned = 0;
    unsigned detectorsRun = 0;
    std::optional<std::string> frameworkVersion; // anchor-lang from Cargo.toml
};

} // namespace anchorscan
