// Numify Expression Compiler - Code Printer
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "expr/printer.hpp"

#include "error/errors.hpp"

#include <cmath>
#include <sstream>

namespace numify {

// Helper to visit variants
template <class... Ts>
struct overload : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overload(Ts...) -> overload<Ts...>;

namespace {

// 1: sum, 2: product or quotient, 4: atom or call
int precedence(const Expr& expr) {
  if (auto value = expr.numberValue()) {
    return *value < 0 ? 1 : 4;
  }
  if (std::holds_alternative<Add>(expr.node().node))
    return 1;
  if (std::holds_alternative<Mul>(expr.node().node))
    return 2;
  return 4;
}

// Negative numeric exponent of a factor, if any
std::optional<double> negativeExponent(const Expr& factor) {
  if (auto* p = std::get_if<Pow>(&factor.node().node)) {
    auto e = p->operands[1].numberValue();
    if (e && *e < 0) {
      return *e;
    }
  }
  return std::nullopt;
}

const char* cmathName(Builtin fn) {
  switch (fn) {
  case Builtin::Abs:
    return "std::fabs";
  case Builtin::Sin:
    return "std::sin";
  case Builtin::Cos:
    return "std::cos";
  case Builtin::Tan:
    return "std::tan";
  case Builtin::Asin:
    return "std::asin";
  case Builtin::Acos:
    return "std::acos";
  case Builtin::Atan:
    return "std::atan";
  case Builtin::Atan2:
    return "std::atan2";
  case Builtin::Sinh:
    return "std::sinh";
  case Builtin::Cosh:
    return "std::cosh";
  case Builtin::Tanh:
    return "std::tanh";
  case Builtin::Exp:
    return "std::exp";
  case Builtin::Log:
    return "std::log";
  case Builtin::Sqrt:
    return "std::sqrt";
  case Builtin::Floor:
    return "std::floor";
  case Builtin::Ceil:
    return "std::ceil";
  }
  return "?";
}

}  // namespace

CodePrinter::CodePrinter(std::map<Symbol, std::string> identifiers,
                         std::map<std::string, std::string> userFunctions,
                         UnknownFunctionPolicy policy)
    : identifiers_(std::move(identifiers))
    , userFunctions_(std::move(userFunctions))
    , policy_(policy) {}

std::string CodePrinter::print(const Expr& expr) {
  notSupported_.clear();
  return printNode(expr);
}

std::string CodePrinter::formatLiteral(double value) {
  if (std::isnan(value))
    return "NAN";
  if (std::isinf(value))
    return value > 0 ? "INFINITY" : "-INFINITY";

  std::string text = formatNumber(value);
  if (text.find_first_of(".e") == std::string::npos) {
    text += ".0";
  }
  return text;
}

std::string CodePrinter::printNode(const Expr& expr) {
  return std::visit(
      overload{[](const Number& n) { return formatLiteral(n.value); },
               [&](const SymbolRef& s) {
                 auto it = identifiers_.find(s.symbol);
                 return it != identifiers_.end() ? it->second : s.symbol.name();
               },
               [&](const Add& a) { return printAdd(a); },
               [&](const Mul& m) { return printMul(m); },
               [&](const Pow& p) { return printPow(p); },
               [&](const Call& c) { return std::string(cmathName(c.fn)) + printArgs(c.args); },
               [&](const Apply& a) {
                 auto it = userFunctions_.find(a.fn->name);
                 if (it != userFunctions_.end()) {
                   return it->second + printArgs(a.args);
                 }
                 if (policy_ == UnknownFunctionPolicy::Fail) {
                   throw NumifyError(ErrorKind::UnboundFunction,
                                     "Function has no numeric implementation")
                       .addName(a.fn->name);
                 }
                 notSupported_.insert(a.fn->name);
                 return a.fn->name + printArgs(a.args);
               }},
      expr.node().node);
}

std::string CodePrinter::printAdd(const Add& add) {
  std::ostringstream oss;
  for (size_t i = 0; i < add.terms.size(); ++i) {
    std::string term = wrap(add.terms[i], 1);
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
}

std::string CodePrinter::printMul(const Mul& mul) {
  std::vector<std::string> numerator;
  std::vector<std::string> denominator;
  bool negate = false;

  for (const auto& factor : mul.factors) {
    auto value = factor.numberValue();
    if (value && *value == -1.0) {
      negate = !negate;
      continue;
    }
    if (auto e = negativeExponent(factor)) {
      const Expr& base = std::get<Pow>(factor.node().node).operands[0];
      denominator.push_back(*e == -1.0 ? wrap(base, 4)
                                       : printPow(Pow{{base, number(-*e)}}));
      continue;
    }
    numerator.push_back(wrap(factor, 2));
  }

  std::ostringstream oss;
  if (negate)
    oss << "-";
  if (numerator.empty()) {
    oss << "1.0";
  }
  for (size_t i = 0; i < numerator.size(); ++i) {
    if (i > 0)
      oss << "*";
    oss << numerator[i];
  }
  if (!denominator.empty()) {
    oss << "/";
    if (denominator.size() > 1)
      oss << "(";
    for (size_t i = 0; i < denominator.size(); ++i) {
      if (i > 0)
        oss << "*";
      oss << denominator[i];
    }
    if (denominator.size() > 1)
      oss << ")";
  }
  return oss.str();
}

std::string CodePrinter::printPow(const Pow& pow) {
  const Expr& base = pow.operands[0];
  auto e = pow.operands[1].numberValue();
  if (e && *e == 0.5) {
    return "std::sqrt(" + printNode(base) + ")";
  }
  if (e && *e == -1.0) {
    return "1.0/" + wrap(base, 4);
  }
  return "std::pow(" + printNode(base) + ", " + printNode(pow.operands[1]) + ")";
}

std::string CodePrinter::printArgs(const std::vector<Expr>& args) {
  std::ostringstream oss;
  oss << "(";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      oss << ", ";
    oss << printNode(args[i]);
  }
  oss << ")";
  return oss.str();
}

std::string CodePrinter::wrap(const Expr& expr, int minPrecedence) {
  std::string text = printNode(expr);
  return precedence(expr) < minPrecedence ? "(" + text + ")" : text;
}

}  // namespace numify
