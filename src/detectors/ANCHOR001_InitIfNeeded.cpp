#include "anchorscan/core/Config.h"
#include "anchorscan/detectors/DetectorSupport.h"
#include "anchorscan/detectors/Detectors.h"
#include "anchorscan/source/TextUtils.h"

#include <llvm/ADT/Twine.h>

#include <algorithm>
#include <sstream>

namespace anchorscan {

namespace {

// `constraint = <recv>.<member>.is_none()` or `== None` / `== COption::None`.
std::string companionPattern(llvm::StringRef member) {
    return ("constraint[[:space:]]*=[[:space:]]*([^,]*)\\." + member +
            "[[:space:]]*(\\.is_none\\(\\)|==[[:space:]]*(COption::)?None)")
        .str();
}

} // anonymous namespace

class ANCHOR001_InitIfNeeded : public Detector {
public:
    explicit ANCHOR001_InitIfNeeded(const Config &cfg)
        : window_(cfg.initIfNeededWindow),
          requireAll_(cfg.initIfNeededRequireAll) {}

    std::string_view getID() const override { return "ANCHOR-001"; }
    std::string_view getTitle() const override {
        return "init_if_needed Incomplete Field Validation";
    }
    Severity getBaseSeverity() const override { return Severity::High; }

    void analyze(const ExtractionResult &ER,
                 std::vector<Finding> &out) const override {
        llvm::Regex delegateCheck(companionPattern("delegate"));
        llvm::Regex closeAuthCheck(companionPattern("close_authority"));

        for (const auto &block : ER.blocks()) {
            llvm::StringRef body = block.text;
            if (!containsWord(body, "init_if_needed"))
                continue;

            bool isAssoc = findSpaced(body, "associated_token", "::") !=
                           llvm::StringRef::npos;
            bool isToken = findSpaced(body, "token", "::") != llvm::StringRef::npos;
            if (!isAssoc && !isToken)
                continue;

            const FieldRecord *field = fieldForBlock(ER, block);
            llvm::StringRef ctx = contextFor(ER, block);

            bool hasDelegate = hasCompanion(delegateCheck, body, ctx, field);
            bool hasCloseAuth = hasCompanion(closeAuthCheck, body, ctx, field);

            bool mitigated = requireAll_ ? (hasDelegate && hasCloseAuth)
                                         : (hasDelegate || hasCloseAuth);
            if (mitigated)
                continue;

            std::vector<std::string> missing;
            if (!hasDelegate)
                missing.push_back("delegate");
            if (!hasCloseAuth)
                missing.push_back("close_authority");

            Finding f = makeFinding(*this, ER, block.startLine);

            std::ostringstream desc;
            desc << (isAssoc ? "Associated token" : "Token") << " account";
            if (field)
                desc << " '" << field->name << "'";
            desc << " accepted via init_if_needed without validation of ";
            for (size_t i = 0; i < missing.size(); ++i) {
                desc << missing[i];
                if (i + 1 < missing.size()) desc << ", ";
            }
            desc << (missing.size() == 1 ? " field." : " fields.");
            f.description = desc.str();

            f.rootCause =
                "When init_if_needed meets an already-existing token account, "
                "Anchor deserializes it with from_account_info_unchecked and "
                "validates only mint, owner and token_program. Fields such as "
                "delegate, close_authority, state and delegated_amount are not "
                "checked, so a pre-created account with attacker-chosen values "
                "is accepted.";
            f.exploitScenario =
                "1. Attacker creates a token account with delegate=ATTACKER and "
                "close_authority=ATTACKER\n"
                "2. Attacker transfers ownership so the account matches the "
                "expected owner/mint\n"
                "3. The program accepts it via init_if_needed (already exists, "
                "so init is skipped)\n"
                "4. Anchor validates mint, owner, token_program and all pass\n"
                "5. delegate and close_authority are not checked\n"
                "6. Attacker drains funds through the delegate or force-closes "
                "the account";
            f.remediation =
                "Add explicit constraint checks for the fields init_if_needed "
                "does not validate:\n"
                "  constraint = token_account.delegate.is_none(),\n"
                "  constraint = token_account.close_authority.is_none(),\n"
                "or use plain `init` if the account must always be new.";
            f.affectedVersions =
                "0.25.0 - 0.30.x (init_if_needed introduced in 0.25)";
            out.push_back(std::move(f));
        }
    }

private:
    // Lines within the window around the block, clipped to its struct.
    llvm::StringRef contextFor(const ExtractionResult &ER,
                               const AttributeBlock &block) const {
        unsigned lo = block.startLine > window_ ? block.startLine - window_ : 1;
        unsigned hi = block.startLine + window_;
        if (const StructRecord *s = ER.structAtLine(block.startLine)) {
            lo = std::max(lo, s->bodyLine);
            hi = std::min(hi, s->endLine);
        }
        return ER.file().lineRange(lo, hi);
    }

    // A companion in the block counts unconditionally; one elsewhere in the
    // window counts only when its receiver is this field.
    static bool hasCompanion(const llvm::Regex &re, llvm::StringRef body,
                             llvm::StringRef ctx, const FieldRecord *field) {
        if (re.match(body))
            return true;
        bool found = false;
        forEachMatch(re, ctx, [&](llvm::ArrayRef<llvm::StringRef> groups, size_t) {
            if (found || groups.size() < 2)
                return;
            llvm::StringRef recv = groups[1].rtrim();
            llvm::StringRef name = identifierBefore(recv, recv.size());
            if (!field || name == field->name)
                found = true;
        });
        return found;
    }

    unsigned window_;
    bool requireAll_;
};

std::unique_ptr<Detector> createInitIfNeededDetector(const Config &cfg) {
    return std::make_unique<ANCHOR001_InitIfNeeded>(cfg);
}

} // namespace anchorscan
