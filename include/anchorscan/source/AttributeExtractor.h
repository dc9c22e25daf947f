#pragma once

#include "anchorscan/source/SourceFile.h"

#include <cstddef>
#include <string>
#include <vector>

namespace anchorscan {

// One `#[account(...)]` annotation. `text` is the body between the outer
// parentheses with newlines preserved; its parentheses always balance.
struct AttributeBlock {
    std::string text;
    unsigned startLine   = 0; // line of the leading '#'
    unsigned bodyLine    = 0; // line of text[0]
    unsigned endLine     = 0; // line of the closing ')'
    size_t   beginOffset = 0; // offset of the leading '#'
    size_t   bodyOffset  = 0; // offset of text[0] in the file
    size_t   endOffset   = 0; // one past the closing ']' (or ')')
    std::string structName;   // enclosing accounts struct, empty if none

    // Line of a body-relative offset.
    unsigned lineOfBodyOffset(size_t offset) const;
};

// Locates `#[account(` markers and captures each body by counting
// parenthesis depth, so attribute lists spanning many lines come out whole.
// Bodies that never close are dropped without a diagnostic.
class AttributeExtractor {
public:
    static constexpr const char *kMarker = "#[account";

    std::vector<AttributeBlock> extract(const SourceFile &file) const;
};

} // namespace anchorscan
