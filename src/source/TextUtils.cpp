#include "anchorscan/source/TextUtils.h"
#include "anchorscan/source/SourceFile.h"

#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace anchorscan {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Rust block comments nest.
size_t skipBlockComment(llvm::StringRef text, size_t pos) {
    unsigned depth = 0;
    size_t i = pos;
    while (i + 1 < text.size()) {
        if (text[i] == '/' && text[i + 1] == '*') {
            ++depth;
            i += 2;
            continue;
        }
        if (text[i] == '*' && text[i + 1] == '/') {
            --depth;
            i += 2;
            if (depth == 0)
                return i;
            continue;
        }
        ++i;
    }
    return text.size();
}

size_t skipQuoted(llvm::StringRef text, size_t pos) {
    size_t i = pos + 1;
    while (i < text.size()) {
        if (text[i] == '\\') {
            i += 2;
            continue;
        }
        if (text[i] == '"')
            return i + 1;
        ++i;
    }
    return text.size();
}

// r"..." / r#"..."# / br"...". Returns pos if no raw string starts here.
size_t skipRawString(llvm::StringRef text, size_t pos) {
    if (pos > 0) {
        char prev = text[pos - 1];
        bool bytePrefix = prev == 'b' && (pos < 2 || !isIdentChar(text[pos - 2]));
        if (isIdentChar(prev) && !bytePrefix)
            return pos;
    }
    size_t j = pos + 1;
    size_t hashes = 0;
    while (j < text.size() && text[j] == '#') {
        ++hashes;
        ++j;
    }
    if (j >= text.size() || text[j] != '"')
        return pos;

    std::string terminator = "\"" + std::string(hashes, '#');
    size_t end = text.find(terminator, j + 1);
    if (end == llvm::StringRef::npos)
        return text.size();
    return end + terminator.size();
}

size_t skipCharLiteral(llvm::StringRef text, size_t pos) {
    if (pos + 2 >= text.size())
        return pos;
    if (text[pos + 1] == '\\') {
        size_t end = text.find('\'', pos + 2);
        if (end == llvm::StringRef::npos || end - pos > 12)
            return pos;
        return end + 1;
    }
    if (text[pos + 2] == '\'')
        return pos + 3;
    // Lifetime ('info) or label.
    return pos;
}

} // anonymous namespace

size_t skipNonCode(llvm::StringRef text, size_t pos) {
    if (pos >= text.size())
        return pos;

    char c = text[pos];
    if (c == '/' && pos + 1 < text.size()) {
        if (text[pos + 1] == '/') {
            size_t eol = text.find('\n', pos);
            return eol == llvm::StringRef::npos ? text.size() : eol;
        }
        if (text[pos + 1] == '*')
            return skipBlockComment(text, pos);
    }
    if (c == '"')
        return skipQuoted(text, pos);
    if (c == 'r')
        return skipRawString(text, pos);
    if (c == '\'')
        return skipCharLiteral(text, pos);
    return pos;
}

size_t skipTrivia(llvm::StringRef text, size_t pos) {
    while (pos < text.size()) {
        if (isSpace(text[pos])) {
            ++pos;
            continue;
        }
        if (text[pos] == '/' && pos + 1 < text.size() &&
            (text[pos + 1] == '/' || text[pos + 1] == '*')) {
            pos = skipNonCode(text, pos);
            continue;
        }
        break;
    }
    return pos;
}

std::optional<size_t> findClosing(llvm::StringRef text, size_t openPos,
                                  char open, char close, size_t limit) {
    size_t end = std::min(limit, text.size());
    if (openPos >= end || text[openPos] != open)
        return std::nullopt;

    int depth = 0;
    size_t i = openPos;
    while (i < end) {
        size_t skipped = skipNonCode(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        char c = text[i];
        if (c == open) {
            ++depth;
        } else if (c == close) {
            if (--depth == 0)
                return i;
        }
        ++i;
    }
    return std::nullopt;
}

int delimiterBalance(llvm::StringRef text, char open, char close) {
    int balance = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t skipped = skipNonCode(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        if (text[i] == open)
            ++balance;
        else if (text[i] == close)
            --balance;
        ++i;
    }
    return balance;
}

size_t findWord(llvm::StringRef text, llvm::StringRef word, size_t from) {
    if (word.empty())
        return llvm::StringRef::npos;
    while (from < text.size()) {
        size_t pos = text.find(word, from);
        if (pos == llvm::StringRef::npos)
            return pos;
        bool leftOk = pos == 0 || !isIdentChar(text[pos - 1]) ||
                      !isIdentChar(word.front());
        size_t after = pos + word.size();
        bool rightOk = after >= text.size() || !isIdentChar(text[after]) ||
                       !isIdentChar(word.back());
        if (leftOk && rightOk)
            return pos;
        from = pos + 1;
    }
    return llvm::StringRef::npos;
}

size_t findSpaced(llvm::StringRef text, llvm::StringRef a, llvm::StringRef b,
                  size_t from) {
    while (from < text.size()) {
        size_t pos = findWord(text, a, from);
        if (pos == llvm::StringRef::npos)
            return pos;
        size_t i = pos + a.size();
        while (i < text.size() && isSpace(text[i]))
            ++i;
        if (text.substr(i).startswith(b))
            return pos;
        from = pos + 1;
    }
    return llvm::StringRef::npos;
}

llvm::StringRef identifierBefore(llvm::StringRef text, size_t end) {
    end = std::min(end, text.size());
    while (end > 0 && isSpace(text[end - 1]))
        --end;
    size_t begin = end;
    while (begin > 0 && isIdentChar(text[begin - 1]))
        --begin;
    return text.slice(begin, end);
}

llvm::StringRef identifierAt(llvm::StringRef text, size_t pos) {
    while (pos < text.size() && isSpace(text[pos]))
        ++pos;
    size_t end = pos;
    while (end < text.size() && isIdentChar(text[end]))
        ++end;
    return text.slice(pos, end);
}

std::string collapseWhitespace(llvm::StringRef text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text.trim()) {
        if (isSpace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty())
            out += ' ';
        pendingSpace = false;
        out += c;
    }
    return out;
}

std::string extractSnippet(const SourceFile &file, unsigned line,
                           unsigned context) {
    if (line == 0 || line > file.lineCount())
        return {};

    unsigned first = line > context ? line - context : 1;
    unsigned last = std::min(file.lineCount(), line + context);

    std::string out;
    llvm::raw_string_ostream os(out);
    for (unsigned l = first; l <= last; ++l) {
        os << (l == line ? ">>> " : "    ")
           << llvm::format_decimal(l, 4) << " | " << file.line(l);
        if (l != last)
            os << "\n";
    }
    os.flush();
    return out;
}

} // namespace anchorscan
