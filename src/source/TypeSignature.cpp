#include "anchorscan/source/TypeSignature.h"
#include "anchorscan/source/TextUtils.h"

namespace anchorscan {

namespace {

constexpr unsigned kMaxBoxDepth = 4;

llvm::StringRef lastPathSegment(llvm::StringRef path) {
    path = path.trim();
    size_t sep = path.rfind("::");
    if (sep != llvm::StringRef::npos)
        path = path.drop_front(sep + 2);
    return path.trim();
}

std::optional<TypeSignature> parseOnce(llvm::StringRef text) {
    text = text.trim();
    while (text.consume_front("&") || text.consume_front("mut ")) {
        text = text.ltrim();
        // Drop a reference lifetime: &'a T
        if (text.startswith("'")) {
            size_t end = 1;
            while (end < text.size() && isIdentChar(text[end]))
                ++end;
            text = text.drop_front(end).ltrim();
        }
    }
    if (text.empty())
        return std::nullopt;

    TypeSignature sig;
    size_t lt = text.find('<');
    if (lt == llvm::StringRef::npos) {
        sig.head = lastPathSegment(text).str();
        for (char c : sig.head) {
            if (!isIdentChar(c))
                return std::nullopt;
        }
        return sig.head.empty() ? std::nullopt : std::optional<TypeSignature>(sig);
    }

    auto close = findClosing(text, lt, '<', '>');
    if (!close || !text.drop_front(*close + 1).trim().empty())
        return std::nullopt;

    sig.head = lastPathSegment(text.take_front(lt)).str();
    if (sig.head.empty())
        return std::nullopt;

    llvm::StringRef inner = text.slice(lt + 1, *close);
    int depth = 0;
    size_t argStart = 0;
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '<' || c == '(' || c == '[') {
            ++depth;
        } else if (c == '>' || c == ')' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            llvm::StringRef arg = inner.slice(argStart, i).trim();
            if (!arg.empty())
                sig.args.push_back(arg.str());
            argStart = i + 1;
        }
    }
    llvm::StringRef last = inner.drop_front(argStart).trim();
    if (!last.empty())
        sig.args.push_back(last.str());
    return sig;
}

} // anonymous namespace

std::optional<TypeSignature> TypeSignature::parse(llvm::StringRef typeText) {
    auto sig = parseOnce(typeText);
    for (unsigned depth = 0;
         sig && sig->head == "Box" && sig->args.size() == 1 && depth < kMaxBoxDepth;
         ++depth)
        sig = parseOnce(sig->args.front());
    return sig;
}

std::string accountElementType(llvm::StringRef typeText) {
    auto sig = TypeSignature::parse(typeText);
    if (!sig || (sig->head != "Account" && sig->head != "InterfaceAccount"))
        return {};

    // Last non-lifetime argument.
    for (auto it = sig->args.rbegin(); it != sig->args.rend(); ++it) {
        if (llvm::StringRef(*it).startswith("'"))
            continue;
        auto element = TypeSignature::parse(*it);
        return element ? element->head : std::string();
    }
    return {};
}

RawHandleKind rawHandleKind(llvm::StringRef typeText) {
    auto sig = TypeSignature::parse(typeText);
    if (!sig)
        return RawHandleKind::None;
    if (sig->head == "AccountInfo")
        return RawHandleKind::AccountInfo;
    if (sig->head == "UncheckedAccount")
        return RawHandleKind::UncheckedAccount;
    return RawHandleKind::None;
}

bool isSignerType(llvm::StringRef typeText) {
    auto sig = TypeSignature::parse(typeText);
    return sig && sig->head == "Signer";
}

} // namespace anchorscan
