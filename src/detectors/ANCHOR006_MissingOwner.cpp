#include "anchorscan/core/Config.h"
#include "anchorscan/detectors/DetectorSupport.h"
#include "anchorscan/detectors/Detectors.h"

#include <sstream>

namespace anchorscan {

class ANCHOR006_MissingOwner : public Detector {
public:
    explicit ANCHOR006_MissingOwner(const Config &cfg)
        : window_(cfg.rawHandleWindow),
          downgrade_(cfg.downgradeUncheckedHandles),
          uncheckedSeverity_(cfg.uncheckedHandleSeverity) {
        for (const char *name : {"system_program", "token_program", "rent",
                                 "clock", "associated_token_program",
                                 "sysvar_rent", "sysvar_clock"})
            allowList_.insert(name);
        for (const auto &name : cfg.extraAllowedFields)
            allowList_.insert(normalizedFieldName(name));
    }

    std::string_view getID() const override { return "ANCHOR-006"; }
    std::string_view getTitle() const override { return "Missing Owner Validation"; }
    Severity getBaseSeverity() const override { return Severity::High; }

    void analyze(const ExtractionResult &ER,
                 std::vector<Finding> &out) const override {
        // Only the leading docs and attributes count; a field named `signer`
        // or a trailing comment on the declaration is not a constraint.
        for (const auto &raw : unverifiedRawHandles(ER, allowList_, window_, false)) {
            const char *typeName = rawHandleName(raw.kind);

            Finding f = makeFinding(*this, ER, raw.field->line);
            if (downgrade_ && raw.kind == RawHandleKind::UncheckedAccount)
                f.severity = uncheckedSeverity_;

            std::ostringstream desc;
            desc << "In struct " << raw.owner->name << ": field '"
                 << raw.field->name << "' uses raw " << typeName
                 << " without owner validation or CHECK documentation.";
            f.description = desc.str();

            f.rootCause =
                "Any program can create accounts holding arbitrary data. "
                "Account<T> checks the owner and discriminator; a raw handle "
                "checks neither.";
            f.exploitScenario =
                "1. The program uses the account without an owner check\n"
                "2. Attacker creates a matching account in their own program\n"
                "3. Attacker passes the fake account to the instruction\n"
                "4. The program operates on forged data";
            f.remediation =
                "Use Account<'info, T> for the automatic owner and discriminator "
                "check, or add:\n"
                "  #[account(owner = my_program::ID)]\n"
                "  /// CHECK: owner verified via constraint";
            f.affectedVersions = "All versions (developer-side pattern)";
            out.push_back(std::move(f));
        }
    }

private:
    llvm::StringSet<> allowList_;
    unsigned window_;
    bool downgrade_;
    Severity uncheckedSeverity_;
};

std::unique_ptr<Detector> createMissingOwnerDetector(const Config &cfg) {
    return std::make_unique<ANCHOR006_MissingOwner>(cfg);
}

} // namespace anchorscan
