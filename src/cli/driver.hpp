// Numify Expression Compiler - Command-Line Driver
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "codegen/support/diagnostics.hpp"
#include "compile/compiler.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace numify {
namespace cli {

// Command-line request for eval and source
struct Invocation {
  std::string expression;
  std::optional<std::string> vars;
  std::vector<NumericValue> args;
  KeywordArgs keywords;
  std::vector<std::pair<std::string, NumericValue>> constants;
  std::vector<std::pair<std::string, NumericValue>> frozen;
  CompileOptions options;
  bool showIr = false;
  bool debug = false;
};

// "2.5" is a scalar, "1,2,3" an array
NumericValue parseValue(const std::string& text);

// "x,y,gain:g": plain entries are positional, key:sym entries are named
VarSpec parseVars(const std::string& text);

// Options following the subcommand
Invocation parseInvocation(const std::vector<std::string>& args);

// Compile the invocation's expression, freezing what was requested
NumericFunction build(const Invocation& inv, DiagnosticEngine& diags);

int runEval(const Invocation& inv, DiagnosticEngine& diags, std::ostream& out);
int runSource(const Invocation& inv, DiagnosticEngine& diags, std::ostream& out);

void printUsage(const std::string& program, std::ostream& out);

}  // namespace cli
}  // namespace numify
