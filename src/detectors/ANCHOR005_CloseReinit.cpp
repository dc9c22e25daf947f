#include "anchorscan/core/Config.h"
#include "anchorscan/detectors/DetectorSupport.h"
#include "anchorscan/detectors/Detectors.h"
#include "anchorscan/source/TextUtils.h"

#include <map>
#include <sstream>

namespace anchorscan {

namespace {

struct Site {
    const StructRecord *owner = nullptr;
    const FieldRecord  *field = nullptr;
};

// Keyed by element type so findings come out sorted by type.
using SiteMap = std::map<std::string, Site>;

} // anonymous namespace

class ANCHOR005_CloseReinit : public Detector {
public:
    explicit ANCHOR005_CloseReinit(const Config &cfg)
        : scope_(cfg.closeReinitScope) {}

    std::string_view getID() const override { return "ANCHOR-005"; }
    std::string_view getTitle() const override {
        return "Close + Reinit Lifecycle Attack";
    }
    Severity getBaseSeverity() const override { return Severity::Medium; }

    void analyze(const ExtractionResult &ER,
                 std::vector<Finding> &out) const override {
        llvm::Regex closeRe("(^|[^A-Za-z0-9_])close[[:space:]]*=");

        SiteMap closeSites, initSites;
        auto flush = [&] {
            for (const auto &[type, init] : initSites) {
                auto it = closeSites.find(type);
                if (it != closeSites.end())
                    report(ER, type, it->second, init, out);
            }
            closeSites.clear();
            initSites.clear();
        };

        for (const auto &s : ER.structs()) {
            for (const auto &f : s.fields) {
                std::string type = accountElementType(f.type);
                if (type.empty())
                    continue;
                llvm::StringRef attrs = f.attributeText();
                if (closeRe.match(attrs))
                    closeSites[type] = {&s, &f};
                if (containsWord(attrs, "init_if_needed"))
                    initSites[type] = {&s, &f};
            }
            if (scope_ == CloseReinitScope::Struct)
                flush();
        }
        flush();
    }

private:
    void report(const ExtractionResult &ER, const std::string &type,
                const Site &close, const Site &init,
                std::vector<Finding> &out) const {
        Finding f = makeFinding(*this, ER, init.field->line);

        std::ostringstream desc;
        desc << "Account type '" << type << "' is used with close (in "
             << close.owner->name << "." << close.field->name << ", line "
             << close.field->line << ") and init_if_needed (in "
             << init.owner->name << "." << init.field->name << ", line "
             << init.field->line << "). Attacker can close and revive the "
             << "account.";
        f.description = desc.str();

        f.rootCause =
            "After close zeroes an account it looks uninitialized again, so "
            "init_if_needed will re-initialize it. Whoever funds the address "
            "between the two instructions controls the new state.";
        f.exploitScenario =
            "1. Attacker calls the instruction carrying the close constraint\n"
            "2. The account is zeroed and its lamports transferred\n"
            "3. Attacker funds the address with the rent-exempt minimum\n"
            "4. Attacker calls the init_if_needed instruction\n"
            "5. The account is re-initialized with attacker-chosen parameters";
        f.remediation =
            "Use plain `init` instead of init_if_needed, or track lifecycle "
            "state so a closed account cannot be revived:\n"
            "  constraint = !account.is_closed";
        f.affectedVersions = "0.25.0 - 0.30.x";
        out.push_back(std::move(f));
    }

    CloseReinitScope scope_;
};

std::unique_ptr<Detector> createCloseReinitDetector(const Config &cfg) {
    return std::make_unique<ANCHOR005_CloseReinit>(cfg);
}

} // namespace anchorscan
