#include "anchorscan/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

// YAML mapping for Config via llvm::yaml.

namespace llvm {
namespace yaml {

template <>
struct ScalarEnumerationTraits<anchorscan::Severity> {
    static void enumeration(IO &io, anchorscan::Severity &value) {
        io.enumCase(value, "Low",      anchorscan::Severity::Low);
        io.enumCase(value, "low",      anchorscan::Severity::Low);
        io.enumCase(value, "Medium",   anchorscan::Severity::Medium);
        io.enumCase(value, "medium",   anchorscan::Severity::Medium);
        io.enumCase(value, "High",     anchorscan::Severity::High);
        io.enumCase(value, "high",     anchorscan::Severity::High);
        io.enumCase(value, "Critical", anchorscan::Severity::Critical);
        io.enumCase(value, "critical", anchorscan::Severity::Critical);
    }
};

template <>
struct ScalarEnumerationTraits<anchorscan::CloseReinitScope> {
    static void enumeration(IO &io, anchorscan::CloseReinitScope &value) {
        io.enumCase(value, "file",   anchorscan::CloseReinitScope::File);
        io.enumCase(value, "struct", anchorscan::CloseReinitScope::Struct);
    }
};

template <>
struct MappingTraits<anchorscan::Config> {
    static void mapping(IO &io, anchorscan::Config &cfg) {
        io.mapOptional("min_severity",                      cfg.minSeverity);
        io.mapOptional("disabled_detectors",                cfg.disabledDetectors);
        io.mapOptional("init_if_needed_window",             cfg.initIfNeededWindow);
        io.mapOptional("init_if_needed_require_all_checks", cfg.initIfNeededRequireAll);
        io.mapOptional("raw_handle_window",                 cfg.rawHandleWindow);
        io.mapOptional("extra_allowed_fields",              cfg.extraAllowedFields);
        io.mapOptional("downgrade_unchecked_handles",       cfg.downgradeUncheckedHandles);
        io.mapOptional("unchecked_handle_severity",         cfg.uncheckedHandleSeverity);
        io.mapOptional("close_reinit_scope",                cfg.closeReinitScope);
        // A user list replaces the defaults instead of overwriting a prefix.
        std::vector<std::string> excludeDirs;
        io.mapOptional("exclude_dirs",                      excludeDirs, cfg.excludeDirs);
        cfg.excludeDirs = std::move(excludeDirs);
        io.mapOptional("output_format",                     cfg.outputFormat);
        io.mapOptional("output_file",                       cfg.outputFile);
        io.mapOptional("jobs",                              cfg.jobs);
    }
};

} // namespace yaml
} // namespace llvm

namespace anchorscan {

namespace {

// Swallow llvm::yaml's own diagnostics; callers report a single warning.
void silentDiagHandler(const llvm::SMDiagnostic &, void *) {}

} // anonymous namespace

bool Config::isDetectorDisabled(llvm::StringRef id) const {
    return std::any_of(disabledDetectors.begin(), disabledDetectors.end(),
                       [id](const std::string &d) {
                           return llvm::StringRef(d).trim().equals_insensitive(id);
                       });
}

Config Config::defaults() {
    return Config{};
}

std::optional<Config> Config::parse(llvm::StringRef yaml) {
    Config cfg = defaults();
    if (yaml.trim().empty())
        return cfg;

    llvm::yaml::Input yin(yaml, nullptr, silentDiagHandler);
    yin >> cfg;

    if (yin.error())
        return std::nullopt;
    return cfg;
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "anchorscan: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    auto cfg = parse(bufOrErr.get()->getBuffer());
    if (!cfg) {
        llvm::errs() << "anchorscan: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return *cfg;
}

} // namespace anchorscan
