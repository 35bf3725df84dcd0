#pragma once

#include "pyhazard/analysis/TraversalContext.h"
#include "pyhazard/core/Rule.h"
#include "pyhazard/core/RuleRegistry.h"
#include "pyhazard/python/Ast.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

#include <string>
#include <string_view>
#include <vector>

// Shared predicates for the rule catalogue.
namespace pyhazard::rules {

using python::ConstantKind;
using python::Node;
using python::NodeKind;

bool oneOf(std::string_view s, llvm::ArrayRef<std::string_view> set);

bool isConstant(const Node *n, ConstantKind kind);
bool isNoneLiteral(const Node *n);
bool isBoolLiteral(const Node *n);

// Literal whose identity is not guaranteed: numbers, strings, bytes and
// container displays.
bool isValueLiteral(const Node *n);

// list / dict / set displays, their comprehensions and bare constructor
// calls such as `list()` or `defaultdict(int)`.
bool isMutableValue(const Node *n);

bool isCallNamed(const Node *n, llvm::ArrayRef<std::string_view> names);
bool isCallDotted(const Node *n, llvm::ArrayRef<std::string_view> names);

const Node *firstArg(const Node &call);
const Node *keywordArg(const Node &call, std::string_view name);

// Expression built from string pieces at runtime: an f-string with fields,
// `%` formatting or `+` concatenation involving a string, or `.format()`.
bool isDynamicString(const Node *n);

// Calls anywhere inside an expression, not descending into nested scopes
// or statements.
bool anyCallInExpression(const Node *n, bool (*pred)(const Node &call));

// Names referenced in `n`'s subtree, including nested scopes.
void collectNames(const Node *n, std::vector<std::string> &out);

// Statements of `fn` returning, excluding nested scopes.
void collectReturns(const Node &fn, std::vector<const Node *> &out);

// Last component of a target: `x` for `x`, `token` for `self.token`.
std::string targetName(const Node *target);

std::string lower(std::string_view s);

std::string plural(unsigned n, const char *noun);

struct Comparison {
    const Node *lhs;
    std::string_view op;
    const Node *rhs;
};

// Splits `a < b < c` into its pairwise comparisons.
std::vector<Comparison> comparisons(const Node &cmp);

bool isEquality(std::string_view op);

// Name an alias binds in the importing scope.
std::string boundName(const Node &import, const Node &alias);

bool isModuleLevel(const TraversalContext &ctx);

// Loop frames only: comprehensions cannot hold statements.
bool insideStatementLoop(const TraversalContext &ctx);

bool containsAny(const std::string &haystack, llvm::ArrayRef<std::string_view> needles);

} // namespace pyhazard::rules
