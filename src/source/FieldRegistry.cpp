#include "anchorscan/source/FieldRegistry.h"
#include "anchorscan/source/TextUtils.h"

#include <algorithm>

namespace anchorscan {

namespace {

constexpr llvm::StringLiteral kDeriveMarker("#[derive");

struct StructHeader {
    std::string name;
    size_t openBrace = 0;
};

bool isSpaceChar(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Skips `pub` / `pub(crate)` etc. Returns the offset after it, or `pos`.
size_t skipVisibility(llvm::StringRef text, size_t pos, size_t limit) {
    size_t p = skipTrivia(text, pos);
    if (identifierAt(text, p) != "pub")
        return pos;
    p = skipTrivia(text, p + 3);
    if (p < limit && text[p] == '(') {
        auto close = findClosing(text, p, '(', ')', limit);
        if (!close)
            return pos;
        p = *close + 1;
    }
    return p;
}

// After the derive attribute: further attributes, visibility, `struct Name`,
// then generics up to the opening brace.
std::optional<StructHeader> parseStructHeader(llvm::StringRef text, size_t pos) {
    for (;;) {
        pos = skipTrivia(text, pos);
        if (pos + 1 < text.size() && text[pos] == '#' && text[pos + 1] == '[') {
            auto close = findClosing(text, pos + 1, '[', ']');
            if (!close)
                return std::nullopt;
            pos = *close + 1;
            continue;
        }
        break;
    }

    pos = skipTrivia(text, skipVisibility(text, pos, text.size()));
    if (identifierAt(text, pos) != "struct")
        return std::nullopt;
    pos = skipTrivia(text, pos + 6);

    StructHeader header;
    header.name = identifierAt(text, pos).str();
    if (header.name.empty())
        return std::nullopt;
    pos += header.name.size();

    while (pos < text.size()) {
        size_t skipped = skipNonCode(text, pos);
        if (skipped != pos) {
            pos = skipped;
            continue;
        }
        char c = text[pos];
        if (c == '{') {
            header.openBrace = pos;
            return header;
        }
        // Unit or tuple structs carry no named fields.
        if (c == ';' || c == '(')
            return std::nullopt;
        ++pos;
    }
    return std::nullopt;
}

// Advances past the next comma at nesting depth zero.
size_t skipToComma(llvm::StringRef text, size_t pos, size_t limit) {
    int depth = 0;
    while (pos < limit) {
        size_t skipped = skipNonCode(text, pos);
        if (skipped != pos) {
            pos = skipped;
            continue;
        }
        char c = text[pos];
        if (c == '(' || c == '[' || c == '{' || c == '<')
            ++depth;
        else if ((c == ')' || c == ']' || c == '}' || c == '>') && depth > 0)
            --depth;
        else if (c == ',' && depth == 0)
            return pos + 1;
        ++pos;
    }
    return limit;
}

struct TypeSpan {
    size_t end = 0;  // offset of the terminating comma, or limit
    bool valid = false;
};

// A field type runs to the next comma outside <>, (), [].
TypeSpan scanType(llvm::StringRef text, size_t pos, size_t limit) {
    int angle = 0, paren = 0, bracket = 0;
    bool broken = false;
    size_t i = pos;
    while (i < limit) {
        size_t skipped = skipNonCode(text, i);
        if (skipped != i) {
            i = std::min(skipped, limit);
            continue;
        }
        char c = text[i];
        if (c == ',' && angle == 0 && paren == 0 && bracket == 0)
            break;
        switch (c) {
            case '<': ++angle; break;
            case '>':
                if (i > pos && text[i - 1] == '-')
                    break;
                if (--angle < 0)
                    broken = true;
                break;
            case '(': ++paren; break;
            case ')': if (--paren < 0) broken = true; break;
            case '[': ++bracket; break;
            case ']': if (--bracket < 0) broken = true; break;
            default: break;
        }
        if (broken) {
            // Resynchronize on the next line.
            size_t eol = text.find('\n', i);
            return {eol == llvm::StringRef::npos ? limit : std::min(eol, limit), false};
        }
        ++i;
    }

    TypeSpan span;
    span.end = i;
    span.valid = angle == 0 && paren == 0 && bracket == 0 &&
                 !text.slice(pos, i).trim().empty();
    return span;
}

// Type text with any trailing or embedded comments blanked out.
std::string typeText(llvm::StringRef text) {
    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '/') {
            size_t skipped = skipNonCode(text, i);
            if (skipped != i) {
                out += ' ';
                i = skipped;
                continue;
            }
        }
        out += text[i++];
    }
    return collapseWhitespace(out);
}

const AttributeBlock *blockAt(const std::vector<AttributeBlock> &blocks,
                              size_t offset) {
    auto it = std::lower_bound(blocks.begin(), blocks.end(), offset,
                               [](const AttributeBlock &b, size_t off) {
                                   return b.beginOffset < off;
                               });
    if (it != blocks.end() && it->beginOffset == offset)
        return &*it;
    return nullptr;
}

void collectFields(const SourceFile &file, size_t bodyBegin, size_t bodyEnd,
                   const std::vector<AttributeBlock> &blocks,
                   StructRecord &record) {
    llvm::StringRef text = file.text();

    std::optional<AttributeBlock> pendingBlock;
    std::vector<std::string> pendingDocs;
    size_t leadingOffset = llvm::StringRef::npos;

    auto resetPending = [&] {
        pendingBlock.reset();
        pendingDocs.clear();
        leadingOffset = llvm::StringRef::npos;
    };
    auto markLeading = [&](size_t off) {
        if (leadingOffset == llvm::StringRef::npos)
            leadingOffset = off;
    };

    size_t pos = bodyBegin;
    while (pos < bodyEnd) {
        char c = text[pos];
        if (isSpaceChar(c)) {
            ++pos;
            continue;
        }

        llvm::StringRef rest = text.slice(pos, bodyEnd);
        if (rest.startswith("///") && !rest.startswith("////")) {
            size_t eol = rest.find('\n');
            llvm::StringRef doc = rest.take_front(eol).trim();
            markLeading(pos);
            pendingDocs.push_back(doc.str());
            pos = (eol == llvm::StringRef::npos) ? bodyEnd : pos + eol;
            continue;
        }
        if (rest.startswith("//") || rest.startswith("/*")) {
            pos = std::min(skipNonCode(text, pos), bodyEnd);
            continue;
        }

        if (rest.startswith("#[")) {
            auto close = findClosing(text, pos + 1, '[', ']', bodyEnd);
            if (!close)
                return;
            markLeading(pos);
            if (const AttributeBlock *block = blockAt(blocks, pos))
                pendingBlock = *block;
            pos = *close + 1;
            continue;
        }

        size_t namePos = skipTrivia(text, skipVisibility(text, pos, bodyEnd));
        llvm::StringRef name = identifierAt(text, namePos);
        size_t colon = skipTrivia(text, namePos + name.size());
        bool isField = !name.empty() && colon < bodyEnd && text[colon] == ':' &&
                       !(colon + 1 < bodyEnd && text[colon + 1] == ':');
        if (!isField) {
            resetPending();
            pos = skipToComma(text, pos, bodyEnd);
            continue;
        }

        TypeSpan span = scanType(text, colon + 1, bodyEnd);

        FieldRecord field;
        field.name = name.str();
        if (span.valid)
            field.type = typeText(text.slice(colon + 1, span.end));
        field.attribute = std::move(pendingBlock);
        field.docComments = std::move(pendingDocs);
        field.line = file.lineForOffset(namePos);
        field.leadingLine = leadingOffset == llvm::StringRef::npos
                                ? field.line
                                : file.lineForOffset(leadingOffset);
        field.structName = record.name;
        record.fields.push_back(std::move(field));

        resetPending();
        pos = (span.end < bodyEnd && text[span.end] == ',') ? span.end + 1
                                                            : span.end;
    }
}

} // anonymous namespace

const FieldRecord *StructRecord::findField(llvm::StringRef fieldName) const {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [fieldName](const FieldRecord &f) {
                               return f.name == fieldName;
                           });
    return it != fields.end() ? &*it : nullptr;
}

std::vector<StructRecord>
FieldRegistryBuilder::build(const SourceFile &file,
                            std::vector<AttributeBlock> &blocks) const {
    std::vector<StructRecord> structs;
    llvm::StringRef text = file.text();

    size_t i = 0;
    while (i < text.size()) {
        size_t skipped = skipNonCode(text, i);
        if (skipped != i) {
            i = skipped;
            continue;
        }
        if (text[i] != '#' || !text.substr(i).startswith(kDeriveMarker)) {
            ++i;
            continue;
        }

        size_t afterMarker = i + kDeriveMarker.size();
        size_t open = skipTrivia(text, afterMarker);
        if (open >= text.size() || text[open] != '(') {
            i = afterMarker;
            continue;
        }
        auto closeParen = findClosing(text, open, '(', ')');
        if (!closeParen) {
            i = afterMarker;
            continue;
        }
        if (!containsWord(text.slice(open + 1, *closeParen), "Accounts")) {
            i = *closeParen + 1;
            continue;
        }

        size_t pos = skipTrivia(text, *closeParen + 1);
        if (pos < text.size() && text[pos] == ']')
            ++pos;

        auto header = parseStructHeader(text, pos);
        if (!header) {
            i = afterMarker;
            continue;
        }
        auto closeBrace = findClosing(text, header->openBrace, '{', '}');
        if (!closeBrace) {
            i = afterMarker;
            continue;
        }

        StructRecord record;
        record.name = header->name;
        record.line = file.lineForOffset(i);
        record.bodyLine = file.lineForOffset(header->openBrace);
        record.endLine = file.lineForOffset(*closeBrace);

        for (auto &block : blocks) {
            if (block.beginOffset > header->openBrace &&
                block.beginOffset < *closeBrace)
                block.structName = record.name;
        }

        collectFields(file, header->openBrace + 1, *closeBrace, blocks, record);
        structs.push_back(std::move(record));
        i = *closeBrace + 1;
    }

    return structs;
}

ExtractionResult::ExtractionResult(const SourceFile &file) : file_(file) {
    blocks_ = AttributeExtractor().extract(file);
    structs_ = FieldRegistryBuilder().build(file, blocks_);
}

const StructRecord *ExtractionResult::structAtLine(unsigned line) const {
    for (const auto &s : structs_) {
        if (line >= s.bodyLine && line <= s.endLine)
            return &s;
    }
    return nullptr;
}

} // namespace anchorscan
