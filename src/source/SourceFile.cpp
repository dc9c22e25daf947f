#include "anchorscan/source/SourceFile.h"

#include <algorithm>

namespace anchorscan {

SourceFile::SourceFile(std::string id, std::string text)
    : id_(std::move(id)), text_(std::move(text)) {
    lineStarts_.push_back(0);
    for (size_t i = 0; i < text_.size(); ++i) {
        if (text_[i] == '\n')
            lineStarts_.push_back(i + 1);
    }
}

unsigned SourceFile::lineForOffset(size_t offset) const {
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    return static_cast<unsigned>(it - lineStarts_.begin());
}

size_t SourceFile::lineStartOffset(unsigned line) const {
    if (line == 0)
        return 0;
    if (line > lineStarts_.size())
        return text_.size();
    return lineStarts_[line - 1];
}

llvm::StringRef SourceFile::line(unsigned line) const {
    if (line == 0 || line > lineStarts_.size())
        return {};
    size_t begin = lineStarts_[line - 1];
    size_t end = (line < lineStarts_.size()) ? lineStarts_[line] - 1 : text_.size();
    llvm::StringRef l = llvm::StringRef(text_).slice(begin, end);
    return l.rtrim('\r');
}

llvm::StringRef SourceFile::lineRange(unsigned first, unsigned last) const {
    if (lineStarts_.empty() || text_.empty())
        return {};
    first = std::max(first, 1u);
    last = std::min(last, lineCount());
    if (first > last)
        return {};
    size_t begin = lineStarts_[first - 1];
    size_t end = (last < lineStarts_.size()) ? lineStarts_[last] - 1 : text_.size();
    return llvm::StringRef(text_).slice(begin, end);
}

} // namespace anchorscan
