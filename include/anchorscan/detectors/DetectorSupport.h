#pragma once

#include "anchorscan/core/Detector.h"
#include "anchorscan/source/FieldRegistry.h"
#include "anchorscan/source/TypeSignature.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/STLFunctionalExtras.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Regex.h>

#include <vector>

namespace anchorscan {

// Finding carrying the detector's identity, base severity, location and a
// code snippet around `line`.
Finding makeFinding(const Detector &D, const ExtractionResult &ER,
                    unsigned line);

// Calls `fn(groups, offset)` for every non-overlapping match of `re` in
// `text`. `groups[0]` is the whole match; `offset` is its start in `text`.
void forEachMatch(const llvm::Regex &re, llvm::StringRef text,
                  llvm::function_ref<void(llvm::ArrayRef<llvm::StringRef>, size_t)> fn);

// The field that owns `block`, searching every struct of the file.
const FieldRecord *fieldForBlock(const ExtractionResult &ER,
                                 const AttributeBlock &block);

// Leading docs and attributes of `field`, capped at `maxLines` lines above
// the declaration. The declaration line itself is included only when
// `withDeclaration` is set; empty when there is nothing to include.
llvm::StringRef fieldWindow(const SourceFile &file, const FieldRecord &field,
                            unsigned maxLines, bool withDeclaration = true);

// "data_" -> "data", "Vault" -> "vault".
std::string normalizedFieldName(llvm::StringRef name);

struct RawHandleField {
    const StructRecord *owner = nullptr;
    const FieldRecord  *field = nullptr;
    RawHandleKind       kind  = RawHandleKind::None;
};

// AccountInfo / UncheckedAccount fields that are not allow-listed, not a
// program handle, and carry no signer, owner or `/// CHECK:` marker in
// their own window (see fieldWindow).
std::vector<RawHandleField>
unverifiedRawHandles(const ExtractionResult &ER,
                     const llvm::StringSet<> &allowList, unsigned window,
                     bool withDeclaration);

} // namespace anchorscan
