#include "pyhazard/analysis/TraversalContext.h"
#include "pyhazard/core/Rule.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Path.h>

namespace pyhazard {

bool isFunctionFrame(FrameKind k) {
    return k == FrameKind::Function || k == FrameKind::AsyncFunction ||
           k == FrameKind::Lambda;
}

bool isScopeFrame(FrameKind k) {
    return isFunctionFrame(k) || k == FrameKind::Module || k == FrameKind::Class;
}

bool looksLikeTestFile(std::string_view path) {
    llvm::StringRef p(path.data(), path.size());
    llvm::StringRef name = llvm::sys::path::filename(p);
    if (name.startswith("test_") || name.endswith("_test.py") ||
        name == "conftest.py")
        return true;
    for (auto it = llvm::sys::path::begin(p), end = llvm::sys::path::end(p);
         it != end; ++it) {
        if (*it == "tests" || *it == "test")
            return true;
    }
    return false;
}

TraversalContext::TraversalContext(const SourceFile &file, const Config &cfg)
    : file_(file), config_(cfg), testFile_(looksLikeTestFile(file.path)) {
    std::string_view text = file_.content;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            if (start < text.size())
                lines_.push_back(text.substr(start));
            break;
        }
        std::string_view line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines_.push_back(line);
        start = nl + 1;
    }
}

const python::Node *TraversalContext::ancestor(size_t k) const {
    if (k == 0 || k > ancestors_.size())
        return nullptr;
    return ancestors_[ancestors_.size() - k];
}

const Frame &TraversalContext::enclosingScope() const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (isScopeFrame(it->kind))
            return *it;
    }
    return frames_.front();
}

const Frame *TraversalContext::enclosingFunction() const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (isFunctionFrame(it->kind))
            return &*it;
        if (it->kind == FrameKind::Class || it->kind == FrameKind::Module)
            return nullptr;
    }
    return nullptr;
}

bool TraversalContext::insideGuardedBlock() const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (it->kind == FrameKind::Guarded)
            return true;
        if (isFunctionFrame(it->kind))
            return false;
    }
    return false;
}

bool TraversalContext::insideFinally() const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (it->kind == FrameKind::Finally)
            return true;
        if (isScopeFrame(it->kind))
            return false;
    }
    return false;
}

bool TraversalContext::insideWithItem() const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (it->kind == FrameKind::WithItem)
            return true;
        if (isScopeFrame(it->kind))
            return false;
    }
    return false;
}

std::vector<const Frame *> TraversalContext::loopsInScope() const {
    std::vector<const Frame *> loops;
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (isScopeFrame(it->kind))
            break;
        if (it->kind == FrameKind::Loop || it->kind == FrameKind::Comprehension)
            loops.insert(loops.begin(), &*it);
    }
    return loops;
}

unsigned TraversalContext::blockDepth() const {
    unsigned depth = 0;
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (isScopeFrame(it->kind))
            break;
        switch (it->kind) {
            case FrameKind::Loop:
            case FrameKind::Guarded:
            case FrameKind::Handler:
            case FrameKind::Finally:
            case FrameKind::Conditional:
            case FrameKind::With:
                ++depth;
                break;
            default:
                break;
        }
    }
    return depth;
}

unsigned TraversalContext::functionDepth() const {
    unsigned depth = 0;
    for (const auto &f : frames_) {
        if (f.kind == FrameKind::Function || f.kind == FrameKind::AsyncFunction)
            ++depth;
    }
    return depth;
}

std::string_view TraversalContext::lineText(unsigned line) const {
    if (line == 0 || line > lines_.size())
        return {};
    return lines_[line - 1];
}

Finding TraversalContext::makeFinding(const Rule &rule, const python::Node &at,
                                      std::string message,
                                      std::string suggestion) const {
    Finding f;
    f.ruleID          = std::string(rule.getID());
    f.ruleCode        = std::string(rule.getCode());
    f.category        = rule.getCategory();
    f.severity        = rule.getBaseSeverity();
    f.location.line   = at.line;
    f.location.column = at.column;
    f.message         = std::move(message);
    f.suggestion      = std::move(suggestion);

    std::string_view text = lineText(at.line);
    f.snippet = llvm::StringRef(text.data(), text.size()).trim().str();
    if (f.snippet.size() > 120) {
        // Back off to a code point boundary so the snippet stays valid UTF-8.
        size_t cut = 117;
        while (cut > 0 && (static_cast<unsigned char>(f.snippet[cut]) & 0xC0) == 0x80)
            --cut;
        f.snippet = f.snippet.substr(0, cut) + "...";
    }
    return f;
}

} // namespace pyhazard
