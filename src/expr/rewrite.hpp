// Numify Expression Compiler - Definition Rewriter Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "expr/expr.hpp"

namespace numify {

// Result of a bounded rewrite
struct RewriteResult {
  Expr expr;
  int passes = 0;       // passes that changed the tree
  bool converged = true;  // false when the pass budget ran out first
};

// One pass: every application of a function with a symbolic definition is
// replaced by the definition with its parameters substituted.
// Returns the same handle when nothing was expanded.
Expr expandDefinitionOnce(const Expr& expr);

// Expand definitions until the tree stops changing or maxPasses is reached
RewriteResult rewriteToFixedPoint(const Expr& expr, int maxPasses = 10);

}  // namespace numify
