// Numify Expression Compiler - Code Printer Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "expr/expr.hpp"

#include <map>
#include <set>
#include <string>

namespace numify {

// What to do with a custom function that has no printed name
enum class UnknownFunctionPolicy {
  Fail,        // throw UnboundFunction
  PassThrough  // print a bare call and record the name in notSupported()
};

// Prints an expression as a C++ numeric expression.
// Symbols print as their allocated identifiers; builtins as <cmath> calls;
// custom functions as calls to the name registered in userFunctions.
class CodePrinter {
public:
  CodePrinter(std::map<Symbol, std::string> identifiers = {},
              std::map<std::string, std::string> userFunctions = {},
              UnknownFunctionPolicy policy = UnknownFunctionPolicy::PassThrough);

  // Resets notSupported() on every call
  std::string print(const Expr& expr);

  // Custom function names printed as bare calls during the last print
  const std::set<std::string>& notSupported() const { return notSupported_; }

  static std::string formatLiteral(double value);

private:
  std::string printNode(const Expr& expr);
  std::string printAdd(const Add& add);
  std::string printMul(const Mul& mul);
  std::string printPow(const Pow& pow);
  std::string printArgs(const std::vector<Expr>& args);
  std::string wrap(const Expr& expr, int minPrecedence);

  std::map<Symbol, std::string> identifiers_;
  std::map<std::string, std::string> userFunctions_;
  UnknownFunctionPolicy policy_;
  std::set<std::string> notSupported_;
};

}  // namespace numify
