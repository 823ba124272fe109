// Numify Expression Compiler - Command-Line Driver
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "cli/driver.hpp"

#include "error/errors.hpp"
#include "parser/parser.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace numify {
namespace cli {

using errors::BOLD;
using errors::GREEN;
using errors::RESET;

namespace {

std::vector<std::string> split(const std::string& text, char separator) {
  std::vector<std::string> parts;
  std::stringstream stream(text);
  std::string part;
  while (std::getline(stream, part, separator)) {
    parts.push_back(part);
  }
  return parts;
}

double parseNumber(const std::string& text) {
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (text.empty() || *end != '\0') {
    throw NumifyError(ErrorKind::InvalidSpec, "Not a number").addName(text);
  }
  return value;
}

std::pair<std::string, NumericValue> parseAssignment(const std::string& text) {
  auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) {
    throw NumifyError(ErrorKind::InvalidSpec, "Expected NAME=VALUE").addName(text);
  }
  return {text.substr(0, eq), parseValue(text.substr(eq + 1))};
}

}  // namespace

NumericValue parseValue(const std::string& text) {
  if (text.find(',') == std::string::npos) {
    return NumericValue(parseNumber(text));
  }
  std::vector<double> values;
  for (const auto& part : split(text, ',')) {
    values.push_back(parseNumber(part));
  }
  return NumericValue(std::move(values));
}

VarSpec parseVars(const std::string& text) {
  std::vector<VarSlot> slots;
  for (const auto& entry : split(text, ',')) {
    auto colon = entry.find(':');
    if (colon == std::string::npos) {
      slots.push_back(VarSlot::positional(Symbol(entry)));
    } else {
      slots.push_back(VarSlot::named(entry.substr(0, colon), Symbol(entry.substr(colon + 1))));
    }
  }
  return VarSpec::mixed(slots);
}

Invocation parseInvocation(const std::vector<std::string>& args) {
  Invocation inv;
  auto requireValue = [&](size_t& i, const std::string& flag) -> std::string {
    if (i + 1 >= args.size()) {
      throw NumifyError(ErrorKind::InvalidSpec, "Missing value for option").addName(flag);
    }
    return args[++i];
  };

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--vars") {
      inv.vars = requireValue(i, arg);
    } else if (arg == "--arg") {
      inv.args.push_back(parseValue(requireValue(i, arg)));
    } else if (arg == "--kw") {
      auto [key, value] = parseAssignment(requireValue(i, arg));
      inv.keywords[key] = value;
    } else if (arg == "--bind") {
      inv.constants.push_back(parseAssignment(requireValue(i, arg)));
    } else if (arg == "--freeze") {
      inv.frozen.push_back(parseAssignment(requireValue(i, arg)));
    } else if (arg == "--no-vectorize") {
      inv.options.vectorize = false;
    } else if (arg == "--no-expand") {
      inv.options.expandDefinition = false;
    } else if (arg.size() == 3 && arg[0] == '-' && arg[1] == 'O' && arg[2] >= '0' &&
               arg[2] <= '3') {
      inv.options.optLevel = arg[2] - '0';
    } else if (arg == "--ir") {
      inv.showIr = true;
    } else if (arg == "--debug") {
      inv.debug = true;
    } else if (inv.expression.empty() && (arg.empty() || arg[0] != '-' || arg.size() == 1 ||
                                          std::isdigit(static_cast<unsigned char>(arg[1])))) {
      inv.expression = arg;
    } else {
      throw NumifyError(ErrorKind::InvalidSpec, "Unknown option").addName(arg);
    }
  }

  if (inv.expression.empty()) {
    throw NumifyError(ErrorKind::InvalidSpec, "Missing expression");
  }
  return inv;
}

NumericFunction build(const Invocation& inv, DiagnosticEngine& diags) {
  Expr expr = Parser::parseExpressionFromSource(inv.expression);

  Bindings bindings;
  for (const auto& [name, value] : inv.constants) {
    bindings.emplace_back(Expr(Symbol(name)), value);
  }

  Compiler compiler(nullptr, &diags);
  NumericFunction fn = inv.vars ? compiler.compile(expr, parseVars(*inv.vars), bindings, inv.options)
                                : compiler.compileInferred(expr, bindings, inv.options);
  for (const auto& [name, value] : inv.frozen) {
    fn = fn.freeze(name, value);
  }
  return fn;
}

int runEval(const Invocation& inv, DiagnosticEngine& diags, std::ostream& out) {
  NumericFunction fn = build(inv, diags);
  NumericValue result = fn.call(inv.args, inv.keywords);
  out << result.toString() << std::endl;
  return 0;
}

int runSource(const Invocation& inv, DiagnosticEngine& diags, std::ostream& out) {
  NumericFunction fn = build(inv, diags);
  out << fn.toString() << std::endl;
  out << fn.source();
  if (inv.showIr) {
    out << std::endl << fn.artifact()->ir();
  }
  return 0;
}

void printUsage(const std::string& program, std::ostream& out) {
  out << BOLD << "Usage:" << RESET << std::endl;
  out << "  " << program << " " << GREEN << "eval" << RESET
      << " EXPR [options]    - Compile and evaluate an expression" << std::endl;
  out << "  " << program << " " << GREEN << "source" << RESET
      << " EXPR [options]  - Show the generated kernel" << std::endl;
  out << "  " << program << " " << GREEN << "help" << RESET
      << "                - Show this message" << std::endl;
  out << std::endl << BOLD << "Options:" << RESET << std::endl;
  out << "  --vars x,y,key:sym   Variables; key:sym declares a keyword argument" << std::endl;
  out << "  --arg V              Positional argument (number or 1,2,3 array)" << std::endl;
  out << "  --kw key=V           Keyword argument" << std::endl;
  out << "  --bind sym=V         Constant binding" << std::endl;
  out << "  --freeze sym=V       Freeze a variable" << std::endl;
  out << "  --no-vectorize       Scalar-only evaluation" << std::endl;
  out << "  --no-expand          Keep custom function definitions unexpanded" << std::endl;
  out << "  -O0 .. -O3           Optimization level (default -O2)" << std::endl;
  out << "  --ir                 Also print LLVM IR (source)" << std::endl;
  out << "  --debug              Report compiler debug diagnostics" << std::endl;
}

}  // namespace cli
}  // namespace numify
