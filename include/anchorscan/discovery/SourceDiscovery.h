#pragma once

#include "anchorscan/core/Config.h"
#include "anchorscan/core/ScanEngine.h"

#include <llvm/ADT/StringRef.h>

#include <optional>
#include <string>
#include <vector>

namespace anchorscan {

// `.rs` files under `root`, sorted. A regular file yields itself whatever
// its extension. Directories named in `cfg.excludeDirs` are not entered.
std::vector<std::string> discoverSources(llvm::StringRef root, const Config &cfg);

// Reads each path; unreadable files produce a warning and are left out.
std::vector<SourceInput> loadSources(const std::vector<std::string> &paths);

// anchor-lang version declared in a Cargo manifest, e.g. "0.29.0".
std::optional<std::string> detectFrameworkVersion(llvm::StringRef manifestText);

// First anchor-lang version found in any Cargo.toml under `root`.
std::optional<std::string> findFrameworkVersion(llvm::StringRef root,
                                                const Config &cfg);

} // namespace anchorscan
