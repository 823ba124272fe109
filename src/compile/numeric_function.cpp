// Numify Expression Compiler - Numeric Function
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/numeric_function.hpp"

#include "error/errors.hpp"

#include <set>
#include <sstream>

namespace numify {

NumericFunction::NumericFunction(ArtifactPtr artifact, VarSpec vars)
    : artifact_(std::move(artifact))
    , vars_(std::move(vars))
    , states_(vars_.size()) {
  if (!artifact_) {
    throw NumifyError(ErrorKind::CompilationFailed, "Numeric function requires an artifact");
  }
  if (artifact_->signature().size() != vars_.size()) {
    throw NumifyError(ErrorKind::InvalidSpec, "Variable spec does not match the call signature")
        .setExplanation("signature has " + std::to_string(artifact_->signature().size()) +
                        " entries, spec declares " + std::to_string(vars_.size()));
  }
}

NumericFunction NumericFunction::wrap(HostFn fn, VarSpec vars) {
  auto signature = allocateSignature(vars);
  std::string description = "<host callable>" + vars.toString();
  return NumericFunction(
      CompiledArtifact::fromCallable(std::move(fn), std::move(signature), std::move(description)),
      std::move(vars));
}

NumericValue NumericFunction::call(const std::vector<NumericValue>& positional,
                                   const KeywordArgs& keywords) const {
  const auto& slots = vars_.slots();

  // Dynamic variables need a context before anything else is checked
  if (!context_) {
    std::vector<std::string> dynamic;
    for (size_t i = 0; i < slots.size(); ++i) {
      if (states_[i].isDynamic()) {
        dynamic.push_back(slots[i].symbol.toString());
      }
    }
    if (!dynamic.empty()) {
      throw NumifyError(ErrorKind::MissingDynamicContext,
                        "Dynamic variables require a parameter context")
          .setNames(std::move(dynamic))
          .addSuggestion("attach one with setParameterContext()");
    }
  }

  std::vector<NumericValue> values(slots.size());
  std::vector<std::string> problems;
  std::vector<std::string> offending;

  size_t nextPositional = 0;
  std::vector<std::string> missingPositional;
  std::vector<std::string> missingKeyed;
  std::set<std::string> usedKeywords;

  for (size_t i = 0; i < slots.size(); ++i) {
    if (!states_[i].isFree()) {
      continue;
    }
    if (slots[i].isNamed()) {
      auto it = keywords.find(slots[i].name);
      if (it == keywords.end()) {
        missingKeyed.push_back(slots[i].name);
      } else {
        values[i] = it->second;
        usedKeywords.insert(it->first);
      }
      continue;
    }
    if (nextPositional < positional.size()) {
      values[i] = positional[nextPositional++];
    } else {
      missingPositional.push_back(slots[i].symbol.name());
    }
  }

  if (!missingPositional.empty()) {
    problems.push_back("Missing positional argument(s): " + errors::joinNames(missingPositional));
    offending.insert(offending.end(), missingPositional.begin(), missingPositional.end());
  }
  if (nextPositional < positional.size() && missingPositional.empty()) {
    size_t extra = positional.size() - nextPositional;
    problems.push_back("Got " + std::to_string(extra) + " extra positional argument(s); expected " +
                       std::to_string(nextPositional));
  }
  if (!missingKeyed.empty()) {
    problems.push_back("Missing keyed argument(s): " + errors::joinNames(missingKeyed));
    offending.insert(offending.end(), missingKeyed.begin(), missingKeyed.end());
  }

  std::vector<std::string> unknownKeyed;
  for (const auto& entry : keywords) {
    if (!usedKeywords.count(entry.first)) {
      unknownKeyed.push_back(entry.first);
    }
  }
  if (!unknownKeyed.empty()) {
    problems.push_back("Unknown keyed argument(s): " + errors::joinNames(unknownKeyed));
    offending.insert(offending.end(), unknownKeyed.begin(), unknownKeyed.end());
  }

  if (!problems.empty()) {
    std::ostringstream explanation;
    for (size_t i = 0; i < problems.size(); ++i) {
      if (i > 0)
        explanation << "; ";
      explanation << problems[i];
    }
    std::vector<std::string> freeNames;
    for (const auto& symbol : freeVars()) {
      freeNames.push_back(symbol.name());
    }
    throw NumifyError(ErrorKind::CallArityMismatch, "Arguments do not match the free variables")
        .setNames(std::move(offending))
        .setExplanation(explanation.str())
        .addRelatedInfo("free variables: " + errors::joinNames(freeNames));
  }

  std::vector<std::string> missingContext;
  for (size_t i = 0; i < slots.size(); ++i) {
    if (states_[i].isFrozen()) {
      values[i] = states_[i].value;
    } else if (states_[i].isDynamic()) {
      auto value = context_->lookup(slots[i].symbol);
      if (value) {
        values[i] = *value;
      } else {
        missingContext.push_back(slots[i].symbol.toString());
      }
    }
  }
  if (!missingContext.empty()) {
    throw NumifyError(ErrorKind::MissingContextSymbol,
                      "Parameter context has no value for dynamic variables")
        .setNames(std::move(missingContext));
  }

  return artifact_->invoke(values);
}

size_t NumericFunction::resolveSlot(const Symbol& symbol) const {
  auto index = vars_.indexOf(symbol);
  if (!index) {
    std::vector<std::string> names;
    for (const auto& declared : vars_.all()) {
      names.push_back(declared.name());
    }
    NumifyError error(ErrorKind::UnknownParameter, "Symbol is not a variable of this function");
    error.addName(symbol.toString());
    for (const auto& similar : errors::findSimilarNames(symbol.name(), names)) {
      error.addSuggestion("did you mean '" + similar + "'?");
    }
    throw error;
  }
  return *index;
}

size_t NumericFunction::resolveName(const std::string& nameOrKey) const {
  const auto& slots = vars_.slots();
  for (size_t i = 0; i < slots.size(); ++i) {
    if (slots[i].isNamed() && slots[i].name == nameOrKey) {
      return i;
    }
  }

  std::vector<size_t> matches;
  std::vector<std::string> candidates;
  for (size_t i = 0; i < slots.size(); ++i) {
    if (slots[i].symbol.name() == nameOrKey) {
      matches.push_back(i);
    }
    candidates.push_back(slots[i].symbol.name());
    if (slots[i].isNamed()) {
      candidates.push_back(slots[i].name);
    }
  }

  if (matches.size() == 1) {
    return matches.front();
  }
  if (matches.size() > 1) {
    throw NumifyError(ErrorKind::UnknownParameter, "Ambiguous parameter name")
        .addName(nameOrKey)
        .setExplanation(std::to_string(matches.size()) + " variables share this display name")
        .addSuggestion("freeze by symbol instead of by name");
  }

  NumifyError error(ErrorKind::UnknownParameter, "Unknown parameter");
  error.addName(nameOrKey);
  for (const auto& similar : errors::findSimilarNames(nameOrKey, candidates)) {
    error.addSuggestion("did you mean '" + similar + "'?");
  }
  throw error;
}

NumericFunction NumericFunction::freeze(const std::map<Symbol, FreezeValue>& values) const {
  NumericFunction result = *this;
  for (const auto& [symbol, value] : values) {
    size_t slot = resolveSlot(symbol);
    if (auto* constant = std::get_if<NumericValue>(&value)) {
      result.states_[slot] = VariableState::frozen(*constant);
    } else {
      result.states_[slot] = VariableState::dynamic();
    }
  }
  return result;
}

NumericFunction NumericFunction::freeze(const std::string& nameOrKey, FreezeValue value) const {
  size_t slot = resolveName(nameOrKey);
  return freeze(std::map<Symbol, FreezeValue>{{vars_.slots()[slot].symbol, std::move(value)}});
}

NumericFunction NumericFunction::unfreeze(const Symbol& symbol) const {
  NumericFunction result = *this;
  result.states_[resolveSlot(symbol)] = VariableState::free();
  return result;
}

NumericFunction NumericFunction::unfreeze(const std::vector<Symbol>& symbols) const {
  NumericFunction result = *this;
  for (const auto& symbol : symbols) {
    result.states_[resolveSlot(symbol)] = VariableState::free();
  }
  return result;
}

NumericFunction NumericFunction::unfreeze() const {
  NumericFunction result = *this;
  for (auto& state : result.states_) {
    state = VariableState::free();
  }
  return result;
}

NumericFunction NumericFunction::setParameterContext(const ParameterContext& context) const {
  NumericFunction result = *this;
  result.context_ = &context;
  return result;
}

NumericFunction NumericFunction::removeParameterContext() const {
  NumericFunction result = *this;
  result.context_ = nullptr;
  return result;
}

std::vector<std::string> NumericFunction::varNames() const {
  std::vector<std::string> names;
  for (const auto& symbol : vars_.all()) {
    names.push_back(symbol.name());
  }
  return names;
}

std::vector<Symbol> NumericFunction::freeVars() const {
  std::vector<Symbol> result;
  const auto& slots = vars_.slots();
  for (size_t i = 0; i < slots.size(); ++i) {
    if (states_[i].isFree()) {
      result.push_back(slots[i].symbol);
    }
  }
  return result;
}

CallSignature NumericFunction::freeVarSignature() const {
  CallSignature result;
  const auto& signature = artifact_->signature();
  for (size_t i = 0; i < signature.size(); ++i) {
    if (states_[i].isFree()) {
      result.push_back(signature[i]);
    }
  }
  return result;
}

const VariableState& NumericFunction::state(const Symbol& symbol) const {
  return states_[resolveSlot(symbol)];
}

std::string NumericFunction::toString() const {
  std::ostringstream oss;
  oss << "NumericFunction(";
  if (symbolic()) {
    oss << symbolic()->toString();
  } else {
    oss << "<host callable>";
  }
  oss << ", vars=" << vars_.toString();

  std::vector<std::string> frozen;
  std::vector<std::string> dynamic;
  const auto& slots = vars_.slots();
  for (size_t i = 0; i < slots.size(); ++i) {
    if (states_[i].isFrozen()) {
      frozen.push_back(slots[i].symbol.name() + "=" + states_[i].value.toString());
    } else if (states_[i].isDynamic()) {
      dynamic.push_back(slots[i].symbol.name());
    }
  }
  if (!frozen.empty()) {
    oss << ", frozen={" << errors::joinNames(frozen) << "}";
  }
  if (!dynamic.empty()) {
    oss << ", dynamic={" << errors::joinNames(dynamic) << "}";
  }
  oss << ")";
  return oss.str();
}

}  // namespace numify
