#pragma once

#include <llvm/ADT/StringRef.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace anchorscan {

// Shallow parse of a declared field type: `path::Head<arg, arg>`.
// Lifetimes stay in `args` verbatim.
struct TypeSignature {
    std::string head;              // last path segment, e.g. "Account"
    std::vector<std::string> args; // top-level generic arguments, trimmed

    // Strips `Box<...>` wrappers.
    static std::optional<TypeSignature> parse(llvm::StringRef typeText);
};

enum class RawHandleKind : uint8_t {
    None,
    AccountInfo,
    UncheckedAccount,
};

constexpr const char *rawHandleName(RawHandleKind k) {
    switch (k) {
        case RawHandleKind::AccountInfo:      return "AccountInfo";
        case RawHandleKind::UncheckedAccount: return "UncheckedAccount";
        case RawHandleKind::None:             return "";
    }
    return "";
}

// `T` in Account<'info, T> / InterfaceAccount<'info, T>; empty otherwise.
std::string accountElementType(llvm::StringRef typeText);

RawHandleKind rawHandleKind(llvm::StringRef typeText);

bool isSignerType(llvm::StringRef typeText);

} // namespace anchorscan
