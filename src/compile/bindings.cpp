// Numify Expression Compiler - Binding Resolution
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/bindings.hpp"

#include "error/errors.hpp"
#include "expr/printer.hpp"

#include <set>

namespace numify {

std::vector<std::string> BindingSet::functionNames() const {
  std::vector<std::string> names;
  names.reserve(functions.size());
  for (const auto& entry : functions) {
    names.push_back(entry.first);
  }
  return names;
}

namespace {

std::string describeKey(const BindingKey& key) {
  if (auto* fn = std::get_if<FunctionRef>(&key)) {
    return *fn ? (*fn)->name : "<null function>";
  }
  return std::get<Expr>(key).toString();
}

}  // namespace

BindingSet resolveBindings(const Expr& expr, const Bindings& bindings) {
  BindingSet result;
  std::vector<std::string> badKeys;
  std::vector<std::string> notCallable;
  std::vector<std::string> notNumeric;

  for (const auto& [key, value] : bindings) {
    FunctionRef fn;

    if (auto* keyExpr = std::get_if<Expr>(&key)) {
      if (auto* symbol = keyExpr->asSymbol()) {
        if (auto* constant = std::get_if<NumericValue>(&value)) {
          result.constants[*symbol] = *constant;
        } else {
          notNumeric.push_back(symbol->toString());
        }
        continue;
      }
      if (auto* application = keyExpr->asApply()) {
        fn = application->fn;
      } else {
        badKeys.push_back(describeKey(key));
        continue;
      }
    } else {
      fn = std::get<FunctionRef>(key);
      if (!fn) {
        badKeys.push_back(describeKey(key));
        continue;
      }
    }

    auto* impl = std::get_if<NumericFnPtr>(&value);
    if (!impl || !*impl || !**impl) {
      notCallable.push_back(fn->name);
      continue;
    }
    result.functions[fn->name] = FunctionBinding{fn, *impl, false};
  }

  if (!badKeys.empty()) {
    throw NumifyError(ErrorKind::InvalidBinding,
                      "Binding keys must be symbols or function identities")
        .setNames(std::move(badKeys));
  }
  if (!notCallable.empty()) {
    throw NumifyError(ErrorKind::InvalidBinding, "Function binding must be callable")
        .setNames(std::move(notCallable));
  }
  if (!notNumeric.empty()) {
    throw NumifyError(ErrorKind::InvalidBinding, "Symbol binding must be a numeric value")
        .setNames(std::move(notNumeric));
  }

  for (const auto& application : expr.applications()) {
    const FunctionRef& fn = application.asApply()->fn;
    if (fn->numeric && *fn->numeric && !result.functions.count(fn->name)) {
      result.functions[fn->name] = FunctionBinding{fn, fn->numeric, true};
    }
  }

  return result;
}

void checkSymbolCoverage(const Expr& expr, const VarSpec& vars, const BindingSet& bindings) {
  std::vector<std::string> missing;
  for (const auto& symbol : expr.freeSymbols()) {
    if (!vars.contains(symbol) && !bindings.constants.count(symbol)) {
      missing.push_back(symbol.toString());
    }
  }

  if (!missing.empty()) {
    std::vector<std::string> declared;
    for (const auto& symbol : vars.all()) {
      declared.push_back(symbol.name());
    }
    NumifyError error(ErrorKind::UnboundSymbol, "Expression contains unbound symbols");
    error.setNames(missing).setExplanation("declared variables are " + vars.toString());
    for (const auto& name : missing) {
      for (const auto& similar : errors::findSimilarNames(name, declared)) {
        error.addSuggestion("did you mean '" + similar + "' instead of '" + name + "'?");
      }
    }
    error.addSuggestion("add them to the variable spec or bind them to constants");
    throw error;
  }

  std::vector<std::string> overlap;
  for (const auto& symbol : vars.all()) {
    if (bindings.constants.count(symbol)) {
      overlap.push_back(symbol.toString());
    }
  }
  if (!overlap.empty()) {
    throw NumifyError(ErrorKind::OverlappingBinding,
                      "Symbol bindings overlap with variables")
        .setNames(std::move(overlap))
        .setExplanation("a symbol is either a call-time variable or a bound constant, not both");
  }
}

void requireBoundFunctions(const Expr& expr, const BindingSet& bindings) {
  std::map<std::string, std::string> bound;
  for (const auto& entry : bindings.functions) {
    bound.emplace(entry.first, entry.first);
  }

  CodePrinter printer({}, bound, UnknownFunctionPolicy::PassThrough);
  std::set<std::string> missing;

  for (const auto& application : expr.applications()) {
    const std::string& name = application.asApply()->fn->name;
    std::string code = printer.print(application);
    if (printer.notSupported().count(name) && code.compare(0, name.size() + 1, name + "(") == 0) {
      missing.insert(name);
    }
  }

  if (!missing.empty()) {
    throw NumifyError(ErrorKind::UnboundFunction,
                      "Expression contains functions that require a numeric implementation")
        .setNames(std::vector<std::string>(missing.begin(), missing.end()))
        .addSuggestion("define the function with a numeric implementation, or bind it explicitly");
  }
}

}  // namespace numify
