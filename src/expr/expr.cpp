// Numify Expression Compiler - Expression Tree
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "expr/expr.hpp"

#include "error/errors.hpp"

#include <atomic>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace numify {

// Helper to visit variants
template <class... Ts>
struct overload : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overload(Ts...) -> overload<Ts...>;

namespace {

size_t hashCombine(size_t seed, size_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

size_t hashChildren(size_t seed, const std::vector<Expr>& children) {
  for (const auto& child : children) {
    seed = hashCombine(seed, child.hash());
  }
  return seed;
}

size_t computeHash(const ExprNode& node) {
  size_t seed = std::hash<size_t>{}(node.node.index());
  return std::visit(
      overload{
          [&](const Number& n) { return hashCombine(seed, std::hash<double>{}(n.value)); },
          [&](const SymbolRef& s) { return hashCombine(seed, s.symbol.hash()); },
          [&](const Add& a) { return hashChildren(seed, a.terms); },
          [&](const Mul& m) { return hashChildren(seed, m.factors); },
          [&](const Pow& p) { return hashChildren(seed, p.operands); },
          [&](const Call& c) {
            return hashChildren(hashCombine(seed, static_cast<size_t>(c.fn)), c.args);
          },
          [&](const Apply& a) {
            return hashChildren(hashCombine(seed, std::hash<std::string>{}(a.fn->name)), a.args);
          }},
      node.node);
}

template <typename T>
Expr makeExpr(T payload) {
  auto node = std::make_shared<ExprNode>();
  node->node = std::move(payload);
  node->hash = computeHash(*node);
  return Expr(std::shared_ptr<const ExprNode>(std::move(node)));
}

bool sameChildren(const std::vector<Expr>& a, const std::vector<Expr>& b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i] != b[i])
      return false;
  }
  return true;
}

}  // namespace

NumericFnPtr makeNumericFn(NumericFn fn) {
  return std::make_shared<const NumericFn>(std::move(fn));
}

// Symbol

Symbol::Symbol(std::string name, std::string tag)
    : name_(std::move(name))
    , tag_(std::move(tag)) {}

Symbol Symbol::unique(const std::string& name) {
  static std::atomic<unsigned long> counter{0};
  return Symbol(name, "#" + std::to_string(++counter));
}

size_t Symbol::hash() const {
  return hashCombine(std::hash<std::string>{}(name_), std::hash<std::string>{}(tag_));
}

std::string Symbol::toString() const {
  if (tag_.empty()) {
    return name_;
  }
  return name_ + "{" + tag_ + "}";
}

// Builtins

const char* builtinName(Builtin fn) {
  switch (fn) {
  case Builtin::Sin:
    return "sin";
  case Builtin::Cos:
    return "cos";
  case Builtin::Tan:
    return "tan";
  case Builtin::Asin:
    return "asin";
  case Builtin::Acos:
    return "acos";
  case Builtin::Atan:
    return "atan";
  case Builtin::Atan2:
    return "atan2";
  case Builtin::Sinh:
    return "sinh";
  case Builtin::Cosh:
    return "cosh";
  case Builtin::Tanh:
    return "tanh";
  case Builtin::Exp:
    return "exp";
  case Builtin::Log:
    return "log";
  case Builtin::Sqrt:
    return "sqrt";
  case Builtin::Abs:
    return "abs";
  case Builtin::Floor:
    return "floor";
  case Builtin::Ceil:
    return "ceil";
  }
  return "?";
}

size_t builtinArity(Builtin fn) {
  return fn == Builtin::Atan2 ? 2 : 1;
}

std::optional<Builtin> lookupBuiltin(const std::string& name) {
  static const std::map<std::string, Builtin> builtins = {
      {"sin", Builtin::Sin},     {"cos", Builtin::Cos},     {"tan", Builtin::Tan},
      {"asin", Builtin::Asin},   {"acos", Builtin::Acos},   {"atan", Builtin::Atan},
      {"atan2", Builtin::Atan2}, {"sinh", Builtin::Sinh},   {"cosh", Builtin::Cosh},
      {"tanh", Builtin::Tanh},   {"exp", Builtin::Exp},     {"log", Builtin::Log},
      {"ln", Builtin::Log},      {"sqrt", Builtin::Sqrt},   {"abs", Builtin::Abs},
      {"floor", Builtin::Floor}, {"ceil", Builtin::Ceil}};

  auto it = builtins.find(name);
  if (it == builtins.end()) {
    return std::nullopt;
  }
  return it->second;
}

double evaluateBuiltin(Builtin fn, const std::vector<double>& args) {
  switch (fn) {
  case Builtin::Sin:
    return std::sin(args[0]);
  case Builtin::Cos:
    return std::cos(args[0]);
  case Builtin::Tan:
    return std::tan(args[0]);
  case Builtin::Asin:
    return std::asin(args[0]);
  case Builtin::Acos:
    return std::acos(args[0]);
  case Builtin::Atan:
    return std::atan(args[0]);
  case Builtin::Atan2:
    return std::atan2(args[0], args[1]);
  case Builtin::Sinh:
    return std::sinh(args[0]);
  case Builtin::Cosh:
    return std::cosh(args[0]);
  case Builtin::Tanh:
    return std::tanh(args[0]);
  case Builtin::Exp:
    return std::exp(args[0]);
  case Builtin::Log:
    return std::log(args[0]);
  case Builtin::Sqrt:
    return std::sqrt(args[0]);
  case Builtin::Abs:
    return std::fabs(args[0]);
  case Builtin::Floor:
    return std::floor(args[0]);
  case Builtin::Ceil:
    return std::ceil(args[0]);
  }
  return 0.0;
}

std::string formatNumber(double value) {
  if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
    std::ostringstream oss;
    oss << static_cast<long long>(value);
    return oss.str();
  }
  // Shortest representation that reads back to the same double
  for (int precision = 1; precision <= 17; ++precision) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << value;
    if (std::stod(oss.str()) == value || precision == 17) {
      return oss.str();
    }
  }
  return std::to_string(value);
}

// Expr

Expr::Expr()
    : Expr(0.0) {}

Expr::Expr(double value)
    : Expr(makeExpr(Number{value})) {}

Expr::Expr(const Symbol& symbol)
    : Expr(makeExpr(SymbolRef{symbol})) {}

Expr::Expr(std::shared_ptr<const ExprNode> node)
    : node_(std::move(node)) {}

bool Expr::isNumber() const {
  return std::holds_alternative<Number>(node_->node);
}

bool Expr::isSymbol() const {
  return std::holds_alternative<SymbolRef>(node_->node);
}

std::optional<double> Expr::numberValue() const {
  if (auto* n = std::get_if<Number>(&node_->node)) {
    return n->value;
  }
  return std::nullopt;
}

const Symbol* Expr::asSymbol() const {
  if (auto* s = std::get_if<SymbolRef>(&node_->node)) {
    return &s->symbol;
  }
  return nullptr;
}

const Apply* Expr::asApply() const {
  return std::get_if<Apply>(&node_->node);
}

std::vector<Expr> Expr::children() const {
  return std::visit(overload{[](const Number&) { return std::vector<Expr>{}; },
                             [](const SymbolRef&) { return std::vector<Expr>{}; },
                             [](const Add& a) { return a.terms; },
                             [](const Mul& m) { return m.factors; },
                             [](const Pow& p) { return p.operands; },
                             [](const Call& c) { return c.args; },
                             [](const Apply& a) { return a.args; }},
                    node_->node);
}

std::set<Symbol> Expr::freeSymbols() const {
  std::set<Symbol> result;
  std::vector<Expr> stack{*this};

  while (!stack.empty()) {
    Expr current = stack.back();
    stack.pop_back();

    if (auto* symbol = current.asSymbol()) {
      result.insert(*symbol);
      continue;
    }
    for (auto& child : current.children()) {
      stack.push_back(std::move(child));
    }
  }

  return result;
}

std::vector<Expr> Expr::applications() const {
  std::vector<Expr> result;
  std::unordered_set<Expr, ExprHash> seen;

  std::function<void(const Expr&)> visit = [&](const Expr& expr) {
    for (const auto& child : expr.children()) {
      visit(child);
    }
    if (expr.asApply() && seen.insert(expr).second) {
      result.push_back(expr);
    }
  };
  visit(*this);

  return result;
}

std::string Expr::toString() const {
  return prettyPrint(*this);
}

bool Expr::operator==(const Expr& other) const {
  if (node_ == other.node_)
    return true;
  if (node_->hash != other.node_->hash || node_->node.index() != other.node_->node.index())
    return false;

  return std::visit(
      overload{[&](const Number& n) { return n.value == std::get<Number>(other.node_->node).value; },
               [&](const SymbolRef& s) {
                 return s.symbol == std::get<SymbolRef>(other.node_->node).symbol;
               },
               [&](const Add& a) {
                 return sameChildren(a.terms, std::get<Add>(other.node_->node).terms);
               },
               [&](const Mul& m) {
                 return sameChildren(m.factors, std::get<Mul>(other.node_->node).factors);
               },
               [&](const Pow& p) {
                 return sameChildren(p.operands, std::get<Pow>(other.node_->node).operands);
               },
               [&](const Call& c) {
                 const auto& o = std::get<Call>(other.node_->node);
                 return c.fn == o.fn && sameChildren(c.args, o.args);
               },
               [&](const Apply& a) {
                 const auto& o = std::get<Apply>(other.node_->node);
                 return a.fn == o.fn && sameChildren(a.args, o.args);
               }},
      node_->node);
}

// Function definitions

FunctionRef declareFunction(const std::string& name, size_t arity, NumericFnPtr numeric) {
  auto def = std::make_shared<FunctionDef>();
  def->name = name;
  def->arity = arity;
  def->numeric = std::move(numeric);
  return def;
}

FunctionRef defineFunction(const std::string& name,
                           std::vector<Symbol> params,
                           Expr body,
                           NumericFnPtr numeric) {
  auto def = std::make_shared<FunctionDef>();
  def->name = name;
  def->arity = params.size();
  def->params = std::move(params);
  def->definition = std::move(body);
  def->numeric = std::move(numeric);
  return def;
}

// Constructors

Expr number(double value) {
  return Expr(value);
}

Expr add(std::vector<Expr> terms) {
  std::vector<Expr> flat;
  double constant = 0.0;
  bool hasConstant = false;

  for (auto& term : terms) {
    if (auto* a = std::get_if<Add>(&term.node().node)) {
      for (const auto& inner : a->terms) {
        if (auto value = inner.numberValue()) {
          constant += *value;
          hasConstant = true;
        } else {
          flat.push_back(inner);
        }
      }
    } else if (auto value = term.numberValue()) {
      constant += *value;
      hasConstant = true;
    } else {
      flat.push_back(std::move(term));
    }
  }

  if (hasConstant && (constant != 0.0 || flat.empty())) {
    flat.push_back(number(constant));
  }
  if (flat.empty())
    return number(0.0);
  if (flat.size() == 1)
    return flat.front();
  return makeExpr(Add{std::move(flat)});
}

Expr mul(std::vector<Expr> factors) {
  std::vector<Expr> flat;
  double constant = 1.0;

  for (auto& factor : factors) {
    if (auto* m = std::get_if<Mul>(&factor.node().node)) {
      for (const auto& inner : m->factors) {
        if (auto value = inner.numberValue()) {
          constant *= *value;
        } else {
          flat.push_back(inner);
        }
      }
    } else if (auto value = factor.numberValue()) {
      constant *= *value;
    } else {
      flat.push_back(std::move(factor));
    }
  }

  if (constant == 0.0 || flat.empty())
    return number(constant);
  if (constant != 1.0)
    flat.insert(flat.begin(), number(constant));
  if (flat.size() == 1)
    return flat.front();
  return makeExpr(Mul{std::move(flat)});
}

Expr pow(const Expr& base, const Expr& exponent) {
  auto e = exponent.numberValue();
  if (e && *e == 1.0)
    return base;
  if (e && *e == 0.0)
    return number(1.0);
  auto b = base.numberValue();
  if (b && e)
    return number(std::pow(*b, *e));
  return makeExpr(Pow{{base, exponent}});
}

Expr call(Builtin fn, std::vector<Expr> args) {
  if (args.size() != builtinArity(fn)) {
    throw std::invalid_argument(std::string(builtinName(fn)) + " expects " +
                                std::to_string(builtinArity(fn)) + " argument(s), got " +
                                std::to_string(args.size()));
  }
  return makeExpr(Call{fn, std::move(args)});
}

Expr applyFunction(const FunctionRef& fn, std::vector<Expr> args) {
  if (!fn) {
    throw std::invalid_argument("applyFunction: null function reference");
  }
  if (args.size() != fn->arity) {
    throw std::invalid_argument(fn->name + " expects " + std::to_string(fn->arity) +
                                " argument(s), got " + std::to_string(args.size()));
  }
  return makeExpr(Apply{fn, std::move(args)});
}

Expr operator+(const Expr& lhs, const Expr& rhs) {
  return add({lhs, rhs});
}

Expr operator-(const Expr& lhs, const Expr& rhs) {
  return add({lhs, -rhs});
}

Expr operator*(const Expr& lhs, const Expr& rhs) {
  return mul({lhs, rhs});
}

Expr operator/(const Expr& lhs, const Expr& rhs) {
  return mul({lhs, pow(rhs, number(-1.0))});
}

Expr operator-(const Expr& operand) {
  return mul({number(-1.0), operand});
}

Expr sin(const Expr& arg) {
  return call(Builtin::Sin, {arg});
}

Expr cos(const Expr& arg) {
  return call(Builtin::Cos, {arg});
}

Expr exp(const Expr& arg) {
  return call(Builtin::Exp, {arg});
}

Expr log(const Expr& arg) {
  return call(Builtin::Log, {arg});
}

Expr sqrt(const Expr& arg) {
  return call(Builtin::Sqrt, {arg});
}

// Rebuild a node with new children through the simplifying constructors
Expr rebuild(const Expr& expr, std::vector<Expr> children) {
  return std::visit(overload{[&](const Number&) { return expr; },
                             [&](const SymbolRef&) { return expr; },
                             [&](const Add&) { return add(std::move(children)); },
                             [&](const Mul&) { return mul(std::move(children)); },
                             [&](const Pow&) { return pow(children[0], children[1]); },
                             [&](const Call& c) { return call(c.fn, std::move(children)); },
                             [&](const Apply& a) {
                               return applyFunction(a.fn, std::move(children));
                             }},
                    expr.node().node);
}

Expr substitute(const Expr& expr, const std::map<Symbol, Expr>& replacements) {
  if (auto* symbol = expr.asSymbol()) {
    auto it = replacements.find(*symbol);
    return it == replacements.end() ? expr : it->second;
  }

  auto children = expr.children();
  bool changed = false;
  for (auto& child : children) {
    Expr replaced = substitute(child, replacements);
    if (replaced.get() != child.get()) {
      child = std::move(replaced);
      changed = true;
    }
  }

  return changed ? rebuild(expr, std::move(children)) : expr;
}

double evaluate(const Expr& expr, const std::map<Symbol, double>& values) {
  auto evalAll = [&](const std::vector<Expr>& args) {
    std::vector<double> out;
    out.reserve(args.size());
    for (const auto& arg : args) {
      out.push_back(evaluate(arg, values));
    }
    return out;
  };

  return std::visit(
      overload{
          [&](const Number& n) { return n.value; },
          [&](const SymbolRef& s) -> double {
            auto it = values.find(s.symbol);
            if (it == values.end()) {
              throw NumifyError(ErrorKind::UnboundSymbol, "No value for symbol")
                  .addName(s.symbol.toString());
            }
            return it->second;
          },
          [&](const Add& a) {
            double sum = 0.0;
            for (double v : evalAll(a.terms))
              sum += v;
            return sum;
          },
          [&](const Mul& m) {
            double product = 1.0;
            for (double v : evalAll(m.factors))
              product *= v;
            return product;
          },
          [&](const Pow& p) {
            return std::pow(evaluate(p.operands[0], values), evaluate(p.operands[1], values));
          },
          [&](const Call& c) { return evaluateBuiltin(c.fn, evalAll(c.args)); },
          [&](const Apply& a) -> double {
            if (a.fn->numeric && *a.fn->numeric) {
              return (*a.fn->numeric)(evalAll(a.args));
            }
            if (a.fn->definition) {
              std::map<Symbol, Expr> params;
              for (size_t i = 0; i < a.fn->params.size(); ++i) {
                params.emplace(a.fn->params[i], a.args[i]);
              }
              return evaluate(substitute(*a.fn->definition, params), values);
            }
            throw NumifyError(ErrorKind::UnboundFunction, "No implementation for function")
                .addName(a.fn->name);
          }},
      expr.node().node);
}

// Pretty printing

namespace {

// Binding strength used to decide parenthesisation
int precedence(const Expr& expr) {
  if (auto value = expr.numberValue()) {
    return *value < 0 ? 1 : 4;
  }
  switch (expr.node().node.index()) {
  case 2:  // Add
    return 1;
  case 3:  // Mul
    return 2;
  case 4:  // Pow
    return 3;
  default:
    return 4;
  }
}

std::string wrap(const Expr& expr, int minPrecedence) {
  std::string text = prettyPrint(expr);
  return precedence(expr) < minPrecedence ? "(" + text + ")" : text;
}

std::string joinArgs(const std::vector<Expr>& args) {
  std::ostringstream oss;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      oss << ", ";
    oss << prettyPrint(args[i]);
  }
  return oss.str();
}

}  // namespace

std::string prettyPrint(const Expr& expr) {
  return std::visit(
      overload{[](const Number& n) { return formatNumber(n.value); },
               [](const SymbolRef& s) { return s.symbol.name(); },
               [](const Add& a) {
                 std::ostringstream oss;
                 for (size_t i = 0; i < a.terms.size(); ++i) {
                   std::string term = wrap(a.terms[i], 1);
                   if (i > 0) {
                     if (!term.empty() && term[0] == '-') {
                       oss << " - " << term.substr(1);
                       continue;
                     }
                     oss << " + ";
                   }
                   oss << term;
                 }
                 return oss.str();
               },
               [](const Mul& m) {
                 std::ostringstream oss;
                 size_t start = 0;
                 auto lead = m.factors.front().numberValue();
                 if (lead && *lead == -1.0 && m.factors.size() > 1) {
                   oss << "-";
                   start = 1;
                 }
                 for (size_t i = start; i < m.factors.size(); ++i) {
                   if (i > start)
                     oss << "*";
                   oss << wrap(m.factors[i], 2);
                 }
                 return oss.str();
               },
               [](const Pow& p) {
                 return wrap(p.operands[0], 4) + "**" + wrap(p.operands[1], 4);
               },
               [](const Call& c) {
                 return std::string(builtinName(c.fn)) + "(" + joinArgs(c.args) + ")";
               },
               [](const Apply& a) { return a.fn->name + "(" + joinArgs(a.args) + ")"; }},
      expr.node().node);
}

}  // namespace numify
