#include "anchorscan/discovery/SourceDiscovery.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/Regex.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace anchorscan {

namespace {

bool isExcluded(llvm::StringRef dirName, const Config &cfg) {
    return std::find(cfg.excludeDirs.begin(), cfg.excludeDirs.end(), dirName) !=
           cfg.excludeDirs.end();
}

// Calls `fn(path)` for every regular file under `root` whose name passes
// `accept`, skipping excluded directories.
template <typename Accept, typename Fn>
void walkFiles(llvm::StringRef root, const Config &cfg, Accept accept, Fn fn) {
    std::error_code ec;
    llvm::sys::fs::recursive_directory_iterator it(root, ec), end;
    while (!ec && it != end) {
        llvm::StringRef path = it->path();
        llvm::StringRef name = llvm::sys::path::filename(path);
        auto type = it->type();
        bool isDir = type == llvm::sys::fs::file_type::directory_file ||
                     (type == llvm::sys::fs::file_type::type_unknown &&
                      llvm::sys::fs::is_directory(path));

        if (isDir) {
            if (isExcluded(name, cfg))
                it.no_push();
        } else if (accept(name)) {
            fn(path.str());
        }
        it.increment(ec);
    }
    if (ec) {
        llvm::errs() << "anchorscan: warning: error walking '" << root
                     << "': " << ec.message() << "\n";
    }
}

} // anonymous namespace

std::vector<std::string> discoverSources(llvm::StringRef root, const Config &cfg) {
    std::vector<std::string> out;

    if (!llvm::sys::fs::is_directory(root)) {
        if (llvm::sys::fs::exists(root))
            out.push_back(root.str());
        else
            llvm::errs() << "anchorscan: warning: path not found: '" << root << "'\n";
        return out;
    }

    walkFiles(root, cfg,
              [](llvm::StringRef name) { return name.endswith(".rs"); },
              [&out](std::string path) { out.push_back(std::move(path)); });

    std::sort(out.begin(), out.end());
    return out;
}

std::vector<SourceInput> loadSources(const std::vector<std::string> &paths) {
    std::vector<SourceInput> inputs;
    inputs.reserve(paths.size());
    for (const auto &path : paths) {
        auto bufOrErr = llvm::MemoryBuffer::getFile(path);
        if (!bufOrErr) {
            llvm::errs() << "anchorscan: warning: cannot read '" << path
                         << "': " << bufOrErr.getError().message() << "\n";
            continue;
        }
        inputs.push_back({path, bufOrErr.get()->getBuffer().str()});
    }
    return inputs;
}

std::optional<std::string> detectFrameworkVersion(llvm::StringRef manifestText) {
    static const char *const kPatterns[] = {
        // anchor-lang = "0.29.0"
        "anchor-lang[[:space:]]*=[[:space:]]*[\"']?[=^~]?([0-9]+\\.[0-9]+\\.[0-9]+)",
        // anchor-lang = { version = "0.29.0", features = [...] }
        "anchor-lang[[:space:]]*=[[:space:]]*\\{[^}]*version[[:space:]]*=[[:space:]]*"
        "\"[=^~]?([0-9]+\\.[0-9]+\\.[0-9]+)\"",
        // [dependencies.anchor-lang]
        // version = "0.29.0"
        "\\[dependencies\\.anchor-lang\\][^[]*version[[:space:]]*=[[:space:]]*"
        "\"[=^~]?([0-9]+\\.[0-9]+\\.[0-9]+)\"",
    };

    for (const char *pattern : kPatterns) {
        llvm::Regex re(pattern);
        llvm::SmallVector<llvm::StringRef, 2> groups;
        if (re.match(manifestText, &groups) && groups.size() > 1)
            return groups[1].str();
    }
    return std::nullopt;
}

std::optional<std::string> findFrameworkVersion(llvm::StringRef root,
                                                const Config &cfg) {
    std::vector<std::string> manifests;
    if (llvm::sys::fs::is_directory(root)) {
        walkFiles(root, cfg,
                  [](llvm::StringRef name) { return name == "Cargo.toml"; },
                  [&manifests](std::string path) { manifests.push_back(std::move(path)); });
    }
    std::sort(manifests.begin(), manifests.end());

    for (const auto &path : manifests) {
        auto bufOrErr = llvm::MemoryBuffer::getFile(path);
        if (!bufOrErr)
            continue;
        if (auto version = detectFrameworkVersion(bufOrErr.get()->getBuffer()))
            return version;
    }
    return std::nullopt;
}

} // namespace anchorscan
