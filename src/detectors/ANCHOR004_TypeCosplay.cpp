#include "anchorscan/core/Config.h"
#include "anchorscan/detectors/DetectorSupport.h"
#include "anchorscan/detectors/Detectors.h"

#include <sstream>

namespace anchorscan {

class ANCHOR004_TypeCosplay : public Detector {
public:
    explicit ANCHOR004_TypeCosplay(const Config &cfg)
        : window_(cfg.rawHandleWindow),
          downgrade_(cfg.downgradeUncheckedHandles),
          uncheckedSeverity_(cfg.uncheckedHandleSeverity) {
        for (const char *name : {"system_program", "token_program", "rent",
                                 "clock", "associated_token_program",
                                 "authority", "payer", "owner", "signer",
                                 "fee_payer", "rent_sysvar"})
            allowList_.insert(name);
        for (const auto &name : cfg.extraAllowedFields)
            allowList_.insert(normalizedFieldName(name));
    }

    std::string_view getID() const override { return "ANCHOR-004"; }
    std::string_view getTitle() const override {
        return "Account Type Cosplay: Missing Discriminator Check";
    }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    void analyze(const ExtractionResult &ER,
                 std::vector<Finding> &out) const override {
        for (const auto &raw : unverifiedRawHandles(ER, allowList_, window_, true)) {
            const char *typeName = rawHandleName(raw.kind);

            Finding f = makeFinding(*this, ER, raw.field->line);
            if (downgrade_ && raw.kind == RawHandleKind::UncheckedAccount)
                f.severity = uncheckedSeverity_;

            std::ostringstream desc;
            desc << "In struct " << raw.owner->name << ": field '"
                 << raw.field->name << "' uses raw " << typeName
                 << " without owner or discriminator verification. An "
                 << "attacker can substitute a fake account from another "
                 << "program.";
            f.description = desc.str();

            f.rootCause =
                "Account<'info, T> verifies the 8-byte discriminator and the "
                "owning program before deserializing. A raw handle skips both "
                "checks, so any account whose data layout happens to match is "
                "accepted.";
            f.exploitScenario =
                "1. The program reads a data account declared as a raw handle\n"
                "2. Attacker creates an account in their own program with a "
                "matching layout\n"
                "3. Attacker sets a balance field to an arbitrary value\n"
                "4. Attacker passes the fake account to the instruction\n"
                "5. The program acts on the forged data";
            std::ostringstream fix;
            fix << "Replace " << typeName << "<'info> with Account<'info, T>, "
                << "which checks discriminator and owner. If the raw handle is "
                << "required, add an owner check and document it:\n"
                << "  #[account(owner = my_program::ID)]\n"
                << "  /// CHECK: validated via owner constraint\n"
                << "  pub " << raw.field->name << ": " << typeName << "<'info>,";
            f.remediation = fix.str();
            f.affectedVersions = "All versions (developer error, not framework bug)";
            out.push_back(std::move(f));
        }
    }

private:
    llvm::StringSet<> allowList_;
    unsigned window_;
    bool downgrade_;
    Severity uncheckedSeverity_;
};

std::unique_ptr<Detector> createTypeCosplayDetector(const Config &cfg) {
    return std::make_unique<ANCHOR004_TypeCosplay>(cfg);
}

} // namespace anchorscan
