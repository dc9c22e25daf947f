#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstddef>
#include <string>
#include <vector>

namespace anchorscan {

// Immutable text buffer plus its identifier. Line numbers are 1-based.
class SourceFile {
public:
    SourceFile(std::string id, std::string text);

    const std::string &id() const { return id_; }
    llvm::StringRef text() const { return text_; }

    unsigned lineCount() const { return static_cast<unsigned>(lineStarts_.size()); }
    unsigned lineForOffset(size_t offset) const;
    size_t lineStartOffset(unsigned line) const;

    // Text of one line without its terminator; empty when out of range.
    llvm::StringRef line(unsigned line) const;

    // Lines [first, last] joined with '\n', clamped to the file.
    llvm::StringRef lineRange(unsigned first, unsigned last) const;

private:
    std::string id_;
    std::string text_;
    std::vector<size_t> lineStarts_;
};

} // namespace anchorscan
