// Numify Expression Compiler - Definition Rewriter
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "expr/rewrite.hpp"

namespace numify {

Expr expandDefinitionOnce(const Expr& expr) {
  auto children = expr.children();
  bool changed = false;
  for (auto& child : children) {
    Expr expanded = expandDefinitionOnce(child);
    if (expanded.get() != child.get()) {
      child = std::move(expanded);
      changed = true;
    }
  }

  // Arguments are expanded first; the body itself is expanded on the next pass
  if (auto* application = expr.asApply()) {
    const FunctionRef& fn = application->fn;
    if (fn->definition) {
      std::map<Symbol, Expr> params;
      for (size_t i = 0; i < fn->params.size(); ++i) {
        params.emplace(fn->params[i], children[i]);
      }
      return substitute(*fn->definition, params);
    }
  }

  return changed ? rebuild(expr, std::move(children)) : expr;
}

RewriteResult rewriteToFixedPoint(const Expr& expr, int maxPasses) {
  RewriteResult result{expr, 0, true};

  for (int pass = 0; pass < maxPasses; ++pass) {
    Expr next = expandDefinitionOnce(result.expr);
    if (next == result.expr) {
      return result;
    }
    result.expr = std::move(next);
    result.passes++;
  }

  result.converged = expandDefinitionOnce(result.expr) == result.expr;
  return result;
}

}  // namespace numify
