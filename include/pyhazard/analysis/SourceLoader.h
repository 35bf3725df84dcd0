#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pyhazard {

struct SourceFile {
    std::string path;      // resolved absolute path
    std::string content;
    size_t      lineCount = 0;
};

struct LoadOptions {
    std::string              projectRoot;     // empty: no containment check
    size_t                   maxLines = 10000;
    uint64_t                 maxBytes = 2 * 1024 * 1024;
    std::vector<std::string> extensions = {".py", ".pyi"};
};

// Validates and reads one source file. Relative paths are resolved
// against the project root. Every rejection is an ErrorKind::Access error.
llvm::Expected<SourceFile> loadSource(llvm::StringRef path,
                                      const LoadOptions &opts);

// Number of lines in `buffer`, counting a final unterminated line.
size_t countLines(llvm::StringRef buffer);

} // namespace pyhazard
