#pragma once

#include "anchorscan/source/AttributeExtractor.h"
#include "anchorscan/source/SourceFile.h"

#include <optional>
#include <string>
#include <vector>

namespace anchorscan {

struct FieldRecord {
    std::string name;
    std::string type;        // whitespace-collapsed; empty = unknown
    std::optional<AttributeBlock> attribute;
    std::vector<std::string> docComments; // "///" lines, trimmed
    unsigned line        = 0; // line of the field name
    unsigned leadingLine = 0; // first line of its docs/attributes
    std::string structName;

    bool hasAttribute() const { return attribute.has_value(); }
    llvm::StringRef attributeText() const {
        return attribute ? llvm::StringRef(attribute->text) : llvm::StringRef();
    }
};

struct StructRecord {
    std::string name;
    unsigned line     = 0; // line of the derive marker
    unsigned bodyLine = 0; // line of the opening brace
    unsigned endLine  = 0; // line of the closing brace
    std::vector<FieldRecord> fields;

    const FieldRecord *findField(llvm::StringRef fieldName) const;
};

// Groups fields of every `#[derive(Accounts)]` struct and attaches to each
// field the closest `#[account(...)]` block preceding it.
class FieldRegistryBuilder {
public:
    // `blocks` come from AttributeExtractor over the same file; those that
    // fall inside a struct get their structName filled in.
    std::vector<StructRecord> build(const SourceFile &file,
                                    std::vector<AttributeBlock> &blocks) const;
};

// Read-only input shared by every detector for one file.
class ExtractionResult {
public:
    explicit ExtractionResult(const SourceFile &file);

    const SourceFile &file() const { return file_; }
    const std::vector<AttributeBlock> &blocks() const { return blocks_; }
    const std::vector<StructRecord> &structs() const { return structs_; }

    // Struct whose body contains `line`, or nullptr.
    const StructRecord *structAtLine(unsigned line) const;

private:
    const SourceFile &file_;
    std::vector<AttributeBlock> blocks_;
    std::vector<StructRecord> structs_;
};

} // namespace anchorscan
