// Numify Expression Compiler - Expression Tree Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace numify {

// Numeric implementation of a custom function, evaluated element-wise
using NumericFn = std::function<double(const std::vector<double>&)>;
using NumericFnPtr = std::shared_ptr<const NumericFn>;

NumericFnPtr makeNumericFn(NumericFn fn);

// Symbol identity is (name, tag); the tag separates symbols sharing a display name
class Symbol {
public:
  Symbol() = default;
  explicit Symbol(std::string name, std::string tag = "");

  // Fresh symbol that compares unequal to every other symbol
  static Symbol unique(const std::string& name);

  const std::string& name() const { return name_; }
  const std::string& tag() const { return tag_; }
  bool valid() const { return !name_.empty(); }

  size_t hash() const;
  std::string toString() const;

  bool operator==(const Symbol& other) const {
    return name_ == other.name_ && tag_ == other.tag_;
  }
  bool operator!=(const Symbol& other) const { return !(*this == other); }
  bool operator<(const Symbol& other) const {
    return name_ != other.name_ ? name_ < other.name_ : tag_ < other.tag_;
  }

private:
  std::string name_;
  std::string tag_;
};

struct SymbolHash {
  size_t operator()(const Symbol& symbol) const { return symbol.hash(); }
};

// Built-in elementary functions
enum class Builtin {
  Sin,
  Cos,
  Tan,
  Asin,
  Acos,
  Atan,
  Atan2,
  Sinh,
  Cosh,
  Tanh,
  Exp,
  Log,
  Sqrt,
  Abs,
  Floor,
  Ceil
};

const char* builtinName(Builtin fn);
size_t builtinArity(Builtin fn);
std::optional<Builtin> lookupBuiltin(const std::string& name);
double evaluateBuiltin(Builtin fn, const std::vector<double>& args);

// Shortest decimal text that round-trips; integral values print without a fraction
std::string formatNumber(double value);

class Expr;
struct FunctionDef;
using FunctionRef = std::shared_ptr<const FunctionDef>;

// Expressions
struct Number {
  double value;
};

struct SymbolRef {
  Symbol symbol;
};

struct Add {
  std::vector<Expr> terms;
};

struct Mul {
  std::vector<Expr> factors;
};

struct Pow {
  std::vector<Expr> operands;  // base, exponent
};

struct Call {
  Builtin fn;
  std::vector<Expr> args;
};

struct Apply {
  FunctionRef fn;
  std::vector<Expr> args;
};

struct ExprNode {
  std::variant<Number, SymbolRef, Add, Mul, Pow, Call, Apply> node;
  size_t hash = 0;
};

// Immutable, shared expression handle with structural equality
class Expr {
public:
  Expr();
  Expr(double value);
  Expr(const Symbol& symbol);
  explicit Expr(std::shared_ptr<const ExprNode> node);

  const ExprNode& node() const { return *node_; }
  const ExprNode* get() const { return node_.get(); }
  size_t hash() const { return node_->hash; }

  bool isNumber() const;
  bool isSymbol() const;
  std::optional<double> numberValue() const;
  const Symbol* asSymbol() const;
  const Apply* asApply() const;

  // Children in evaluation order
  std::vector<Expr> children() const;

  // Ordered set of free symbols
  std::set<Symbol> freeSymbols() const;
  bool isConstant() const { return freeSymbols().empty(); }

  // Distinct custom-function applications, in first-seen order
  std::vector<Expr> applications() const;

  std::string toString() const;

  bool operator==(const Expr& other) const;
  bool operator!=(const Expr& other) const { return !(*this == other); }

private:
  std::shared_ptr<const ExprNode> node_;
};

struct ExprHash {
  size_t operator()(const Expr& expr) const { return expr.hash(); }
};

// Custom function: optional symbolic definition and numeric implementation
struct FunctionDef {
  std::string name;
  size_t arity = 0;
  std::vector<Symbol> params;
  std::optional<Expr> definition;  // body in terms of params
  NumericFnPtr numeric;            // auto-discovered by the binding resolver
};

// Opaque function: stays a call unless bound
FunctionRef declareFunction(const std::string& name, size_t arity, NumericFnPtr numeric = nullptr);

// Function whose applications expand to `body` with params substituted
FunctionRef defineFunction(const std::string& name,
                           std::vector<Symbol> params,
                           Expr body,
                           NumericFnPtr numeric = nullptr);

// Constructors
Expr number(double value);
Expr add(std::vector<Expr> terms);
Expr mul(std::vector<Expr> factors);
Expr pow(const Expr& base, const Expr& exponent);
Expr call(Builtin fn, std::vector<Expr> args);
Expr applyFunction(const FunctionRef& fn, std::vector<Expr> args);

Expr operator+(const Expr& lhs, const Expr& rhs);
Expr operator-(const Expr& lhs, const Expr& rhs);
Expr operator*(const Expr& lhs, const Expr& rhs);
Expr operator/(const Expr& lhs, const Expr& rhs);
Expr operator-(const Expr& operand);

Expr sin(const Expr& arg);
Expr cos(const Expr& arg);
Expr exp(const Expr& arg);
Expr log(const Expr& arg);
Expr sqrt(const Expr& arg);

// Rebuild a node around new children through the simplifying constructors
Expr rebuild(const Expr& expr, std::vector<Expr> children);

// Replace symbols; returns the same handle when nothing changes
Expr substitute(const Expr& expr, const std::map<Symbol, Expr>& replacements);

// Direct substitution-and-evaluation
double evaluate(const Expr& expr, const std::map<Symbol, double>& values);

std::string prettyPrint(const Expr& expr);

}  // namespace numify
