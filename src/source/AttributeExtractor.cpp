#include "anchorscan/source/AttributeExtractor.h"
#include "anchorscan/source/TextUtils.h"

#include <llvm/ADT/StringRef.h>

#include <algorithm>

namespace anchorscan {

unsigned AttributeBlock::lineOfBodyOffset(size_t offset) const {
    offset = std::min(offset, text.size());
    return bodyLine + static_cast<unsigned>(
        llvm::StringRef(text).take_front(offset).count('\n'));
}

std::vector<AttributeBlock> AttributeExtractor::extract(const SourceFile &file) const {
    std::vector<AttributeBlock> blocks;
    llvm::StringRef text = file.text();
    const llvm::StringRef marker(kMarker);

    size_t i = 0;
    while (i < text.size()) {
        size_t skipped = skipNonCode(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        if (text[i] != '#' || !text.substr(i).startswith(marker)) {
            ++i;
            continue;
        }

        size_t afterMarker = i + marker.size();
        // `#[accounts...]` or similar is a different attribute.
        if (afterMarker < text.size() && isIdentChar(text[afterMarker])) {
            i = afterMarker;
            continue;
        }

        size_t open = skipTrivia(text, afterMarker);
        if (open >= text.size() || text[open] != '(') {
            // `#[account]` marks a data struct, not a field constraint.
            i = afterMarker;
            continue;
        }

        auto close = findClosing(text, open, '(', ')');
        if (!close) {
            i = afterMarker;
            continue;
        }

        AttributeBlock block;
        block.beginOffset = i;
        block.bodyOffset  = open + 1;
        block.text        = text.slice(open + 1, *close).str();
        block.startLine   = file.lineForOffset(i);
        block.bodyLine    = file.lineForOffset(open + 1);
        block.endLine     = file.lineForOffset(*close);

        size_t end = skipTrivia(text, *close + 1);
        block.endOffset = (end < text.size() && text[end] == ']') ? end + 1
                                                                  : *close + 1;
        blocks.push_back(std::move(block));
        i = blocks.back().endOffset;
    }

    return blocks;
}

} // namespace anchorscan
