#pragma once

#include "pyhazard/python/Ast.h"

#include <llvm/Support/Error.h>

#include <string_view>

namespace pyhazard::python {

// Deepest nesting of syntax the builder converts. Deeper input (long
// operator or attribute chains, deeply nested blocks) is reported as an
// ErrorKind::Syntax error, which keeps every recursive pass over the
// finished tree within a bounded stack.
inline constexpr unsigned kMaxTreeDepth = 1000;

// Parses a whole module with tree-sitter-python and converts the concrete
// syntax tree into a SyntaxTree. ERROR or MISSING nodes anywhere in the
// parse are reported as ErrorKind::Syntax with the position of the first
// one. The returned tree is finalized and owns copies of every string it
// needs, so `source` may be released afterwards.
llvm::Expected<SyntaxTree> parseModule(std::string_view source);

} // namespace pyhazard::python
