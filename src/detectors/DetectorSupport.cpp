#include "anchorscan/detectors/DetectorSupport.h"
#include "anchorscan/source/TextUtils.h"

#include <algorithm>

namespace anchorscan {

Finding makeFinding(const Detector &D, const ExtractionResult &ER,
                    unsigned line) {
    Finding f;
    f.detectorID    = std::string(D.getID());
    f.title         = std::string(D.getTitle());
    f.severity      = D.getBaseSeverity();
    f.reference     = std::string(D.getReference());
    f.location.file = ER.file().id();
    f.location.line = line;
    f.codeSnippet   = extractSnippet(ER.file(), line);
    return f;
}

void forEachMatch(const llvm::Regex &re, llvm::StringRef text,
                  llvm::function_ref<void(llvm::ArrayRef<llvm::StringRef>, size_t)> fn) {
    size_t from = 0;
    llvm::SmallVector<llvm::StringRef, 4> groups;
    while (from <= text.size()) {
        groups.clear();
        llvm::StringRef rest = text.drop_front(from);
        if (!re.match(rest, &groups) || groups.empty())
            return;
        size_t offset = from + static_cast<size_t>(groups[0].data() - rest.data());
        fn(groups, offset);
        from = offset + std::max<size_t>(1, groups[0].size());
    }
}

const FieldRecord *fieldForBlock(const ExtractionResult &ER,
                                 const AttributeBlock &block) {
    for (const auto &s : ER.structs()) {
        if (s.name != block.structName)
            continue;
        for (const auto &f : s.fields) {
            if (f.attribute && f.attribute->beginOffset == block.beginOffset)
                return &f;
        }
    }
    return nullptr;
}

llvm::StringRef fieldWindow(const SourceFile &file, const FieldRecord &field,
                            unsigned maxLines, bool withDeclaration) {
    unsigned first = field.leadingLine;
    if (field.line > maxLines)
        first = std::max(first, field.line - maxLines);
    unsigned last = withDeclaration ? field.line : field.line - 1;
    if (last < first)
        return {};
    return file.lineRange(first, last);
}

std::string normalizedFieldName(llvm::StringRef name) {
    return name.rtrim('_').lower();
}

std::vector<RawHandleField>
unverifiedRawHandles(const ExtractionResult &ER,
                     const llvm::StringSet<> &allowList, unsigned window,
                     bool withDeclaration) {
    llvm::Regex ownerAssign("owner[[:space:]]*=");
    llvm::Regex ownerCompare("constraint[[:space:]]*=[[:space:]]*[^,]*\\.owner[[:space:]]*==");
    llvm::Regex checkDoc("///[[:space:]]*CHECK[[:space:]]*:");

    std::vector<RawHandleField> out;
    for (const auto &s : ER.structs()) {
        for (const auto &f : s.fields) {
            RawHandleKind kind = rawHandleKind(f.type);
            if (kind == RawHandleKind::None)
                continue;

            std::string norm = normalizedFieldName(f.name);
            if (allowList.contains(norm))
                continue;
            if (llvm::StringRef(f.name).endswith("_program") || f.name == "program")
                continue;

            llvm::StringRef ctx = fieldWindow(ER.file(), f, window, withDeclaration);
            if (containsWord(ctx, "signer"))
                continue;
            if (ownerAssign.match(ctx) || ownerCompare.match(ctx))
                continue;
            if (checkDoc.match(ctx))
                continue;

            out.push_back({&s, &f, kind});
        }
    }
    return out;
}

} // namespace anchorscan
