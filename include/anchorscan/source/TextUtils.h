#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstddef>
#include <optional>
#include <string>

namespace anchorscan {

class SourceFile;

inline bool isIdentChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

// If a comment, string literal or char literal starts at `pos`, returns
// the offset just past it. Otherwise returns `pos` unchanged. An
// unterminated literal or block comment runs to the end of `text`.
size_t skipNonCode(llvm::StringRef text, size_t pos);

// Skips whitespace and comments starting at `pos`.
size_t skipTrivia(llvm::StringRef text, size_t pos);

// Given `text[openPos] == open`, returns the offset of the matching
// `close`, counting nesting depth and ignoring delimiters inside comments
// and literals. nullopt if depth never returns to zero before `limit`.
std::optional<size_t> findClosing(llvm::StringRef text, size_t openPos,
                                  char open, char close,
                                  size_t limit = llvm::StringRef::npos);

// Net nesting of one delimiter pair, ignoring comments and literals.
int delimiterBalance(llvm::StringRef text, char open, char close);

// First occurrence of `word` at identifier boundaries at or after `from`.
size_t findWord(llvm::StringRef text, llvm::StringRef word, size_t from = 0);

inline bool containsWord(llvm::StringRef text, llvm::StringRef word) {
    return findWord(text, word) != llvm::StringRef::npos;
}

// Offset of `a`, optional whitespace, then `b` (e.g. "token" "::").
size_t findSpaced(llvm::StringRef text, llvm::StringRef a, llvm::StringRef b,
                  size_t from = 0);

// Identifier ending right before `end` (skipping trailing whitespace).
llvm::StringRef identifierBefore(llvm::StringRef text, size_t end);

// Identifier starting at `pos` (after leading whitespace).
llvm::StringRef identifierAt(llvm::StringRef text, size_t pos);

// Collapses runs of whitespace (including newlines) to one space.
std::string collapseWhitespace(llvm::StringRef text);

// Lines around `line`, each prefixed with its number; the focus line
// carries a ">>> " marker.
std::string extractSnippet(const SourceFile &file, unsigned line,
                           unsigned context = 3);

} // namespace anchorscan
