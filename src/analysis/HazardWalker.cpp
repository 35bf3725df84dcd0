#include "pyhazard/analysis/HazardWalker.h"
#include "pyhazard/core/RuleRegistry.h"

#include <llvm/Support/raw_ostream.h>

#include <exception>

namespace pyhazard {

using python::Node;
using python::NodeKind;

void collectBoundNames(const Node *target, std::vector<std::string> &out) {
    if (!target)
        return;
    switch (target->kind) {
        case NodeKind::Name:
            out.push_back(target->name);
            break;
        case NodeKind::Tuple:
        case NodeKind::List:
            for (const auto *e : target->elts)
                collectBoundNames(e, out);
            break;
        case NodeKind::Starred:
            collectBoundNames(target->value, out);
            break;
        default:
            break;
    }
}

HazardWalker::HazardWalker(const RuleRegistry &registry, const Config &cfg)
    : config_(cfg) {
    for (const auto &rule : registry.rules()) {
        for (NodeKind k : rule->interests())
            table_[static_cast<size_t>(k)].push_back(rule.get());
    }
}

std::vector<Finding> HazardWalker::run(const python::SyntaxTree &tree,
                                       const SourceFile &file) {
    findings_.clear();
    if (!tree.root())
        return {};

    ctx_ = std::make_unique<TraversalContext>(file, config_);
    ctx_->push({FrameKind::Module, tree.root(), {}, {}});
    visit(tree.root());
    ctx_->pop();
    ctx_.reset();

    if (config_.debug) {
        llvm::errs() << "pyhazard: debug: " << tree.size() << " nodes, "
                     << findings_.size() << " raw finding(s) in "
                     << file.path << "\n";
    }
    return std::move(findings_);
}

void HazardWalker::dispatch(const Node &n) {
    for (const Rule *rule : table_[static_cast<size_t>(n.kind)]) {
        try {
            rule->check(n, *ctx_, findings_);
        } catch (const std::exception &e) {
            llvm::errs() << "pyhazard: warning: rule " << rule->getID()
                         << " failed at line " << n.line << ": " << e.what()
                         << "\n";
        }
    }
}

void HazardWalker::visit(const Node *n) {
    if (!n)
        return;

    dispatch(*n);
    ctx_->enterNode(n);
    switch (n->kind) {
        case NodeKind::FunctionDef:
        case NodeKind::AsyncFunctionDef:
        case NodeKind::Lambda:
            walkFunction(*n);
            break;
        case NodeKind::ClassDef:
            walkClass(*n);
            break;
        case NodeKind::For:
        case NodeKind::AsyncFor:
            walkFor(*n);
            break;
        case NodeKind::While:
            walkWhile(*n);
            break;
        case NodeKind::Try:
            walkTry(*n);
            break;
        case NodeKind::If:
            walkIf(*n);
            break;
        case NodeKind::With:
        case NodeKind::AsyncWith:
            walkWith(*n);
            break;
        case NodeKind::Match:
            walkMatch(*n);
            break;
        case NodeKind::ListComp:
        case NodeKind::SetComp:
        case NodeKind::DictComp:
        case NodeKind::GeneratorExp:
            walkComprehension(*n);
            break;
        default:
            visitChildren(*n);
            break;
    }
    ctx_->leaveNode();
}

void HazardWalker::visitAll(const NodeList &ns) {
    for (const auto *n : ns)
        visit(n);
}

void HazardWalker::visitInFrame(const NodeList &ns, Frame frame) {
    if (ns.empty())
        return;
    ctx_->push(std::move(frame));
    visitAll(ns);
    ctx_->pop();
}

void HazardWalker::visitChildren(const Node &n) {
    NodeList kids;
    python::childrenOf(n, kids);
    visitAll(kids);
}

void HazardWalker::walkFunction(const Node &n) {
    // Decorators, defaults and annotations evaluate in the enclosing scope.
    visitAll(n.decorators);
    if (n.args) {
        dispatch(*n.args);
        ctx_->enterNode(n.args);
        for (const auto *arg : n.args->elts) {
            dispatch(*arg);
            ctx_->enterNode(arg);
            visit(arg->annotation);
            visit(arg->value);
            ctx_->leaveNode();
        }
        ctx_->leaveNode();
    }
    visit(n.returns);

    FrameKind kind = n.is(NodeKind::Lambda)           ? FrameKind::Lambda
                     : n.is(NodeKind::AsyncFunctionDef) ? FrameKind::AsyncFunction
                                                        : FrameKind::Function;
    ctx_->push({kind, &n, {}, {}});
    if (n.is(NodeKind::Lambda))
        visit(n.value);
    else
        visitAll(n.body);
    ctx_->pop();
}

void HazardWalker::walkClass(const Node &n) {
    visitAll(n.decorators);
    visitAll(n.elts);
    visitAll(n.keywords);
    ctx_->push({FrameKind::Class, &n, {}, {}});
    visitAll(n.body);
    ctx_->pop();
}

void HazardWalker::walkFor(const Node &n) {
    visit(n.target);
    visit(n.iter);

    Frame loop{FrameKind::Loop, &n, {}, python::dottedName(n.iter)};
    collectBoundNames(n.target, loop.boundNames);
    visitInFrame(n.body, std::move(loop));
    visitAll(n.orelse);
}

void HazardWalker::walkWhile(const Node &n) {
    ctx_->push({FrameKind::Loop, &n, {}, {}});
    visit(n.test);
    visitAll(n.body);
    ctx_->pop();
    visitAll(n.orelse);
}

void HazardWalker::walkTry(const Node &n) {
    visitInFrame(n.body, {FrameKind::Guarded, &n, {}, {}});
    for (const auto *h : n.handlers) {
        dispatch(*h);
        ctx_->enterNode(h);
        visit(h->test);
        visitInFrame(h->body, {FrameKind::Handler, h, {}, {}});
        ctx_->leaveNode();
    }
    visitAll(n.orelse);
    visitInFrame(n.finalbody, {FrameKind::Finally, &n, {}, {}});
}

void HazardWalker::walkIf(const Node &n) {
    visit(n.test);
    visitInFrame(n.body, {FrameKind::Conditional, &n, {}, {}});
    // An elif chain stays at the nesting level of its leading if.
    if (n.orelse.size() == 1 && n.orelse.front()->isElif)
        visit(n.orelse.front());
    else
        visitInFrame(n.orelse, {FrameKind::Conditional, &n, {}, {}});
}

void HazardWalker::walkWith(const Node &n) {
    for (const auto *item : n.items) {
        dispatch(*item);
        ctx_->enterNode(item);
        ctx_->push({FrameKind::WithItem, item, {}, {}});
        visit(item->value);
        ctx_->pop();
        visit(item->target);
        ctx_->leaveNode();
    }
    visitInFrame(n.body, {FrameKind::With, &n, {}, {}});
}

void HazardWalker::walkMatch(const Node &n) {
    visit(n.value);
    for (const auto *c : n.handlers) {
        dispatch(*c);
        ctx_->enterNode(c);
        visit(c->target);
        visit(c->test);
        visitInFrame(c->body, {FrameKind::Conditional, c, {}, {}});
        ctx_->leaveNode();
    }
}

void HazardWalker::walkComprehension(const Node &n) {
    // The first iterable is evaluated in the enclosing scope.
    if (!n.generators.empty())
        visit(n.generators.front()->iter);

    Frame frame{FrameKind::Comprehension, &n, {}, {}};
    for (const auto *g : n.generators)
        collectBoundNames(g->target, frame.boundNames);
    ctx_->push(std::move(frame));

    for (size_t i = 0; i < n.generators.size(); ++i) {
        const Node *g = n.generators[i];
        dispatch(*g);
        ctx_->enterNode(g);
        visit(g->target);
        if (i != 0)
            visit(g->iter);
        visitAll(g->elts);
        ctx_->leaveNode();
    }
    visit(n.key);
    visit(n.value);
    ctx_->pop();
}

} // namespace pyhazard
