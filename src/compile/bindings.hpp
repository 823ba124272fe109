// Numify Expression Compiler - Binding Resolution Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "compile/var_spec.hpp"
#include "expr/expr.hpp"
#include "runtime/value.hpp"

#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace numify {

// A symbol (Expr holding a Symbol), a function application (Expr holding an Apply)
// or a function identity
using BindingKey = std::variant<Expr, FunctionRef>;

// Constant for a symbol or numeric implementation for a function
using BindingValue = std::variant<NumericValue, NumericFnPtr>;

// Explicit bindings in caller order
using Bindings = std::vector<std::pair<BindingKey, BindingValue>>;

struct FunctionBinding {
  FunctionRef fn;
  NumericFnPtr impl;
  bool automatic = false;  // discovered from the definition's numeric metadata
};

// Resolved bindings: constants by symbol, callables by function name
struct BindingSet {
  std::map<Symbol, NumericValue> constants;
  std::map<std::string, FunctionBinding> functions;

  // Function names in table order, the index used by generated code
  std::vector<std::string> functionNames() const;
};

// Split explicit bindings and auto-bind functions carrying a numeric implementation.
// Explicit bindings win over discovered ones. Throws InvalidBinding listing every bad entry.
BindingSet resolveBindings(const Expr& expr, const Bindings& bindings);

// Every free symbol is a variable or a constant (UnboundSymbol), and no
// variable is also a constant (OverlappingBinding)
void checkSymbolCoverage(const Expr& expr, const VarSpec& vars, const BindingSet& bindings);

// Every custom-function application prints as a call to a bound implementation.
// Throws UnboundFunction naming all unresolved functions.
void requireBoundFunctions(const Expr& expr, const BindingSet& bindings);

}  // namespace numify
