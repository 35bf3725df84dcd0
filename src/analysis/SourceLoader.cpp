#include "pyhazard/analysis/SourceLoader.h"
#include "pyhazard/core/Error.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>

#include <algorithm>

namespace pyhazard {

namespace {

bool hasAllowedExtension(llvm::StringRef path,
                         const std::vector<std::string> &extensions) {
    llvm::StringRef ext = llvm::sys::path::extension(path);
    return llvm::any_of(extensions,
                        [ext](const std::string &e) { return ext == e; });
}

// True when `path` equals `root` or lies beneath it. Both are real paths.
bool isWithin(llvm::StringRef path, llvm::StringRef root) {
    if (!path.startswith(root))
        return false;
    if (path.size() == root.size())
        return true;
    return llvm::sys::path::is_separator(path[root.size()]) ||
           llvm::sys::path::is_separator(root.back());
}

} // anonymous namespace

size_t countLines(llvm::StringRef buffer) {
    if (buffer.empty())
        return 0;
    size_t lines = buffer.count('\n');
    if (!buffer.endswith("\n"))
        ++lines;
    return lines;
}

llvm::Expected<SourceFile> loadSource(llvm::StringRef path,
                                      const LoadOptions &opts) {
    if (path.empty())
        return makeError(ErrorKind::Access, "empty file path");

    if (!hasAllowedExtension(path, opts.extensions))
        return makeError(ErrorKind::Access,
                         "unsupported file extension: " + path.str());

    llvm::SmallString<256> absolute(path);
    if (llvm::sys::path::is_relative(absolute) && !opts.projectRoot.empty()) {
        absolute = opts.projectRoot;
        llvm::sys::path::append(absolute, path);
    }

    llvm::SmallString<256> real;
    if (std::error_code ec = llvm::sys::fs::real_path(absolute, real))
        return makeError(ErrorKind::Access,
                         "cannot resolve '" + path.str() + "': " + ec.message());

    if (!opts.projectRoot.empty()) {
        llvm::SmallString<256> realRoot;
        if (std::error_code ec =
                llvm::sys::fs::real_path(opts.projectRoot, realRoot))
            return makeError(ErrorKind::Access,
                             "cannot resolve project root '" +
                                 opts.projectRoot + "': " + ec.message());
        if (!isWithin(real, realRoot))
            return makeError(ErrorKind::Access,
                             "path escapes project root: " + path.str());
    }

    if (llvm::sys::fs::is_directory(real))
        return makeError(ErrorKind::Access, "not a regular file: " + path.str());

    // Symlinks may point at a file with another extension.
    if (!hasAllowedExtension(real, opts.extensions))
        return makeError(ErrorKind::Access,
                         "unsupported file extension: " + real.str().str());

    uint64_t bytes = 0;
    if (std::error_code ec = llvm::sys::fs::file_size(real, bytes))
        return makeError(ErrorKind::Access,
                         "cannot stat '" + path.str() + "': " + ec.message());
    if (bytes > opts.maxBytes)
        return makeError(ErrorKind::Access,
                         "file has " + std::to_string(bytes) +
                             " bytes, limit is " + std::to_string(opts.maxBytes));

    auto buffer = llvm::MemoryBuffer::getFile(real, /*IsText=*/true);
    if (!buffer)
        return makeError(ErrorKind::Access,
                         "cannot read '" + path.str() + "': " +
                             buffer.getError().message());

    llvm::StringRef text = (*buffer)->getBuffer();
    size_t lines = countLines(text);
    if (lines > opts.maxLines)
        return makeError(ErrorKind::Access,
                         "file has " + std::to_string(lines) +
                             " lines, limit is " + std::to_string(opts.maxLines));

    SourceFile file;
    file.path = real.str().str();
    file.content = text.str();
    file.lineCount = lines;
    return file;
}

} // namespace pyhazard
