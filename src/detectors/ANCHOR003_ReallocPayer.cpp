#include "anchorscan/detectors/DetectorSupport.h"
#include "anchorscan/detectors/Detectors.h"
#include "anchorscan/source/TextUtils.h"

#include <sstream>

namespace anchorscan {

class ANCHOR003_ReallocPayer : public Detector {
public:
    std::string_view getID() const override { return "ANCHOR-003"; }
    std::string_view getTitle() const override {
        return "Realloc Payer Missing Signer Verification";
    }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    void analyze(const ExtractionResult &ER,
                 std::vector<Finding> &out) const override {
        llvm::Regex payerRe(
            "realloc[[:space:]]*::[[:space:]]*payer[[:space:]]*=[[:space:]]*"
            "([A-Za-z_][A-Za-z0-9_]*)");

        for (const auto &s : ER.structs()) {
            for (const auto &holder : s.fields) {
                if (!holder.attribute)
                    continue;
                const AttributeBlock &block = *holder.attribute;

                forEachMatch(payerRe, block.text,
                             [&](llvm::ArrayRef<llvm::StringRef> groups, size_t offset) {
                    if (groups.size() < 2)
                        return;
                    const FieldRecord *payer = s.findField(groups[1]);
                    if (!payer || payer->type.empty())
                        return;
                    if (isSignerType(payer->type))
                        return;
                    if (containsWord(payer->attributeText(), "signer"))
                        return;

                    Finding f = makeFinding(*this, ER, block.lineOfBodyOffset(offset));

                    std::ostringstream desc;
                    desc << "In struct " << s.name << ": realloc payer '"
                         << payer->name << "' is typed as '" << payer->type
                         << "' instead of Signer<'info>. Lamports transferred "
                         << "without signer verification.";
                    f.description = desc.str();

                    f.rootCause =
                        "Anchor's realloc code moves lamports with a direct "
                        "borrow_mut() instead of a CPI, so the runtime never "
                        "checks the payer's signature. Signer status depends "
                        "only on the declared field type.";
                    f.exploitScenario =
                        "1. The program reallocs with a non-Signer payer\n"
                        "2. Attacker calls with a smaller size to shrink the "
                        "account\n"
                        "3. Excess lamports go to the payer without a signer "
                        "check\n"
                        "4. Attacker receives the lamports at an address of "
                        "their choosing";
                    f.remediation =
                        "Declare the realloc payer as Signer<'info>:\n"
                        "  pub " + payer->name + ": Signer<'info>,\n"
                        "or add a `signer` constraint to its account attribute.";
                    f.affectedVersions = "0.26.0 - 0.30.x";
                    out.push_back(std::move(f));
                });
            }
        }
    }
};

std::unique_ptr<Detector> createReallocPayerDetector(const Config &) {
    return std::make_unique<ANCHOR003_ReallocPayer>();
}

} // namespace anchorscan
