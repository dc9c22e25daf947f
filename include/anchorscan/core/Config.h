#pragma once

#include "anchorscan/core/Severity.h"

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace anchorscan {

enum class CloseReinitScope : uint8_t {
    File,   // close and init_if_needed may sit in different structs
    Struct, // both sites must share one accounts struct
};

struct Config {
    // Minimum severity to emit
    Severity minSeverity             = Severity::Low;

    // Detector enable/disable (by id, e.g. "ANCHOR-004")
    std::vector<std::string> disabledDetectors;

    // ANCHOR-001: lines above/below an init_if_needed block searched for
    // delegate / close_authority constraints.
    unsigned initIfNeededWindow      = 30;
    bool initIfNeededRequireAll      = false;

    // ANCHOR-004 / ANCHOR-006
    unsigned rawHandleWindow         = 10;
    std::vector<std::string> extraAllowedFields;
    bool downgradeUncheckedHandles   = true;
    Severity uncheckedHandleSeverity = Severity::Low;

    // ANCHOR-005
    CloseReinitScope closeReinitScope = CloseReinitScope::File;

    // Discovery
    std::vector<std::string> excludeDirs = {"target", "node_modules", ".git"};

    // Output
    std::string outputFormat         = "cli";
    std::string outputFile;          // empty = stdout

    // Worker threads; 0 = hardware concurrency
    unsigned jobs                    = 0;

    bool isDetectorDisabled(llvm::StringRef id) const;

    static Config loadFromFile(const std::string &path);
    static std::optional<Config> parse(llvm::StringRef yaml);
    static Config defaults();
};

} // namespace anchorscan
