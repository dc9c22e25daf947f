#include "anchorscan/detectors/DetectorSupport.h"
#include "anchorscan/detectors/Detectors.h"
#include "anchorscan/source/TextUtils.h"

#include <sstream>

namespace anchorscan {

class ANCHOR002_DuplicateMutable : public Detector {
public:
    std::string_view getID() const override { return "ANCHOR-002"; }
    std::string_view getTitle() const override {
        return "Duplicate Mutable Account Bypass";
    }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    void analyze(const ExtractionResult &ER,
                 std::vector<Finding> &out) const override {
        for (const auto &s : ER.structs()) {
            std::vector<const FieldRecord *> initFields;
            std::vector<const FieldRecord *> mutFields;

            for (const auto &f : s.fields) {
                llvm::StringRef attrs = f.attributeText();
                if (containsWord(attrs, "init_if_needed"))
                    initFields.push_back(&f);
                else if (containsWord(attrs, "mut"))
                    mutFields.push_back(&f);
            }
            if (initFields.empty() || mutFields.empty())
                continue;

            for (const FieldRecord *init : initFields) {
                std::string initType = accountElementType(init->type);
                if (initType.empty())
                    continue;

                for (const FieldRecord *mut : mutFields) {
                    if (accountElementType(mut->type) != initType)
                        continue;

                    Finding f = makeFinding(*this, ER, init->line);

                    std::ostringstream desc;
                    desc << "In struct " << s.name << ": init_if_needed field '"
                         << init->name << "' (" << initType
                         << ") coexists with mutable field '" << mut->name
                         << "' (" << initType << "). The init_if_needed field "
                         << "is excluded from Anchor's duplicate mutable "
                         << "account check.";
                    f.description = desc.str();

                    f.rootCause =
                        "Anchor's generated duplicate mutable account check "
                        "filters out fields carrying an init constraint. An "
                        "init_if_needed account that already exists behaves as "
                        "a regular mutable account without duplicate protection.";
                    f.exploitScenario =
                        "1. The struct has init_if_needed field A and mutable "
                        "field B of the same type\n"
                        "2. Attacker passes the same account for both A and B\n"
                        "3. The duplicate check skips A\n"
                        "4. The account is already initialized, so init does "
                        "nothing\n"
                        "5. The instruction mutates the account twice";
                    f.remediation =
                        "Add an explicit duplicate check in the instruction:\n"
                        "  require!(" + init->name + ".key() != " + mut->name +
                        ".key(), ErrorCode::DuplicateAccount);\n"
                        "or use plain `init`, which the duplicate check covers.";
                    f.affectedVersions = "0.25.0 - 0.30.x";
                    out.push_back(std::move(f));
                    break;
                }
            }
        }
    }
};

std::unique_ptr<Detector> createDuplicateMutableDetector(const Config &) {
    return std::make_unique<ANCHOR002_DuplicateMutable>();
}

} // namespace anchorscan
