#pragma once

#include "pyhazard/analysis/SourceLoader.h"
#include "pyhazard/core/Config.h"
#include "pyhazard/core/Finding.h"
#include "pyhazard/python/Ast.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pyhazard {

class Rule;

enum class FrameKind : uint8_t {
    Module,
    Function,
    AsyncFunction,
    Lambda,
    Class,
    Loop,
    Guarded,     // try body
    Handler,     // except body
    Finally,
    Conditional,
    With,
    WithItem,    // context expression of a with item
    Comprehension,
};

struct Frame {
    FrameKind                 kind;
    const python::Node       *node = nullptr;
    std::vector<std::string>  boundNames; // loop / comprehension targets
    std::string               iterated;   // dotted name of a for-loop iterable
};

// The stack of enclosing constructs at the node currently being visited.
// The walker owns it; rules only ever see it through a const reference.
class TraversalContext {
public:
    TraversalContext(const SourceFile &file, const Config &cfg);

    void push(Frame frame) { frames_.push_back(std::move(frame)); }
    void pop() { frames_.pop_back(); }
    void enterNode(const python::Node *n) { ancestors_.push_back(n); }
    void leaveNode() { ancestors_.pop_back(); }

    const std::vector<Frame> &frames() const { return frames_; }
    const Config &config() const { return config_; }
    const SourceFile &source() const { return file_; }
    bool isTestFile() const { return testFile_; }

    // Node `k` levels above the node being checked (1 is its parent);
    // nullptr past the root.
    const python::Node *ancestor(size_t k = 1) const;

    // Nearest Module/Function/AsyncFunction/Lambda/Class frame.
    const Frame &enclosingScope() const;

    // Nearest Function/AsyncFunction/Lambda frame, or nullptr.
    const Frame *enclosingFunction() const;

    bool insideFunction() const { return enclosingFunction() != nullptr; }

    // A try body encloses the node within the current function. Guarded
    // context is not inherited across nested function boundaries.
    bool insideGuardedBlock() const;
    bool insideFinally() const;
    bool insideWithItem() const;

    // Loop and comprehension frames of the current scope, innermost last.
    std::vector<const Frame *> loopsInScope() const;
    bool insideLoop() const { return !loopsInScope().empty(); }

    // Control blocks between the node and its scope.
    unsigned blockDepth() const;

    // Function frames on the whole stack.
    unsigned functionDepth() const;

    std::string_view lineText(unsigned line) const;

    Finding makeFinding(const Rule &rule, const python::Node &at,
                        std::string message, std::string suggestion) const;

private:
    const SourceFile &file_;
    const Config &config_;
    bool testFile_ = false;
    std::vector<std::string_view> lines_;
    std::vector<Frame> frames_;
    std::vector<const python::Node *> ancestors_;
};

bool isScopeFrame(FrameKind k);
bool isFunctionFrame(FrameKind k);

// Test modules follow pytest discovery: test_*.py, *_test.py, conftest.py
// or anything under a tests/ directory.
bool looksLikeTestFile(std::string_view path);

} // namespace pyhazard
