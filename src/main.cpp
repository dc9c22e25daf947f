#include "anchorscan/core/Config.h"
#include "anchorscan/core/DetectorSet.h"
#include "anchorscan/core/ExecutionMetadata.h"
#include "anchorscan/core/Finding.h"
#include "anchorscan/core/ScanEngine.h"
#include "anchorscan/core/ScanSummary.h"
#include "anchorscan/core/Severity.h"
#include "anchorscan/core/Version.h"
#include "anchorscan/discovery/SourceDiscovery.h"
#include "anchorscan/output/OutputFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

static llvm::cl::OptionCategory AnchorscanCat("anchorscan options");

static llvm::cl::list<std::string> Paths(
    llvm::cl::Positional,
    llvm::cl::desc("<path>..."),
    llvm::cl::ZeroOrMore,
    llvm::cl::cat(AnchorscanCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to anchorscan.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(AnchorscanCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json|sarif)"),
    llvm::cl::cat(AnchorscanCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(AnchorscanCat));

static llvm::cl::opt<std::string> MinSev(
    "min-severity",
    llvm::cl::desc("Minimum severity to report (Low|Medium|High|Critical)"),
    llvm::cl::cat(AnchorscanCat));

static llvm::cl::list<std::string> Disable(
    "disable",
    llvm::cl::desc("Detector ids to skip, comma separated (e.g. ANCHOR-004)"),
    llvm::cl::CommaSeparated,
    llvm::cl::cat(AnchorscanCat));

static llvm::cl::opt<unsigned> Jobs(
    "jobs",
    llvm::cl::desc("Worker threads (0 = hardware concurrency)"),
    llvm::cl::cat(AnchorscanCat));

static llvm::cl::opt<bool> ListDetectors(
    "list-detectors",
    llvm::cl::desc("Print the enabled detectors and exit"),
    llvm::cl::cat(AnchorscanCat));

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(AnchorscanCat);
    llvm::cl::ParseCommandLineOptions(argc, argv,
        "anchorscan: static scanner for Anchor account constraints\n");

    // Load config.
    anchorscan::Config cfg = ConfigPath.empty()
        ? anchorscan::Config::defaults()
        : anchorscan::Config::loadFromFile(ConfigPath);

    // CLI overrides.
    if (OutputFormat.getNumOccurrences())
        cfg.outputFormat = OutputFormat;
    if (!OutputFile.empty())
        cfg.outputFile = OutputFile;
    if (MinSev.getNumOccurrences()) {
        auto sev = anchorscan::parseSeverity(MinSev);
        if (!sev) {
            llvm::errs() << "anchorscan: error: unknown severity '" << MinSev
                         << "' (expected Low, Medium, High or Critical)\n";
            return 2;
        }
        cfg.minSeverity = *sev;
    }
    for (const auto &id : Disable)
        cfg.disabledDetectors.push_back(id);
    if (Jobs.getNumOccurrences())
        cfg.jobs = Jobs;

    std::unique_ptr<anchorscan::OutputFormatter> formatter;
    if (cfg.outputFormat == "sarif")
        formatter = std::make_unique<anchorscan::SARIFOutputFormatter>();
    else if (cfg.outputFormat == "json")
        formatter = std::make_unique<anchorscan::JSONOutputFormatter>();
    else if (cfg.outputFormat == "cli")
        formatter = std::make_unique<anchorscan::CLIOutputFormatter>();
    else {
        llvm::errs() << "anchorscan: error: unknown output format '"
                     << cfg.outputFormat << "' (expected cli, json or sarif)\n";
        return 2;
    }

    auto detectors = anchorscan::DetectorSet::defaults(cfg);

    if (ListDetectors) {
        for (const auto &d : detectors.detectors()) {
            llvm::outs() << d->getID() << "  ["
                         << anchorscan::severityToString(d->getBaseSeverity())
                         << "]  " << d->getTitle() << "\n";
        }
        return 0;
    }

    if (Paths.empty()) {
        llvm::errs() << "anchorscan: error: no input paths\n";
        return 2;
    }

    // Build execution metadata for output provenance.
    anchorscan::ExecutionMetadata execMeta;
    execMeta.toolVersion = anchorscan::kToolVersion;
    execMeta.configPath = ConfigPath.getValue();
    execMeta.timestampEpochSec = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    execMeta.targets.assign(Paths.begin(), Paths.end());

    std::vector<std::string> sourcePaths;
    for (const auto &root : Paths) {
        auto found = anchorscan::discoverSources(root, cfg);
        sourcePaths.insert(sourcePaths.end(), found.begin(), found.end());
        if (!execMeta.frameworkVersion)
            execMeta.frameworkVersion = anchorscan::findFrameworkVersion(root, cfg);
    }
    std::sort(sourcePaths.begin(), sourcePaths.end());
    sourcePaths.erase(std::unique(sourcePaths.begin(), sourcePaths.end()),
                      sourcePaths.end());

    if (sourcePaths.empty())
        llvm::errs() << "anchorscan: warning: no Rust sources found\n";

    // Run analysis.
    anchorscan::ScanEngine engine(std::move(detectors), cfg.jobs);
    anchorscan::ScanResult result =
        engine.scanFiles(anchorscan::loadSources(sourcePaths));

    for (const auto &note : result.notes)
        llvm::errs() << "anchorscan: note: " << note << "\n";

    execMeta.filesScanned = result.filesScanned;
    execMeta.detectorsRun = result.detectorsRun;

    // Filter minimum severity.
    auto &findings = result.findings;
    findings.erase(
        std::remove_if(findings.begin(), findings.end(),
                       [&](const anchorscan::Finding &f) {
                           return !(f.severity >= cfg.minSeverity);
                       }),
        findings.end());
    anchorscan::sortFindings(findings);

    anchorscan::ScanSummary summary = anchorscan::summarize(findings);
    std::string output = formatter->format(findings, summary, execMeta);

    // Emit.
    if (cfg.outputFile.empty()) {
        llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(cfg.outputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "anchorscan: error: cannot open output file '"
                         << cfg.outputFile << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
    }

    return findings.empty() ? 0 : 1;
}
