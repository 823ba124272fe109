// Numify Expression Compiler - Numeric Function Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "compile/artifact.hpp"
#include "compile/parameter_context.hpp"
#include "compile/var_spec.hpp"
#include "runtime/value.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace numify {

// Marker requesting that a variable be read from the parameter context at call time
struct DynamicParameter {};
inline constexpr DynamicParameter DYNAMIC{};

using FreezeValue = std::variant<NumericValue, DynamicParameter>;

struct VariableState {
  enum class Kind {
    Free,
    Frozen,
    Dynamic
  };

  Kind kind = Kind::Free;
  NumericValue value;  // Frozen only

  static VariableState free() { return {}; }
  static VariableState frozen(NumericValue value) { return {Kind::Frozen, std::move(value)}; }
  static VariableState dynamic() { return {Kind::Dynamic, NumericValue()}; }

  bool isFree() const { return kind == Kind::Free; }
  bool isFrozen() const { return kind == Kind::Frozen; }
  bool isDynamic() const { return kind == Kind::Dynamic; }
};

using KeywordArgs = std::map<std::string, NumericValue>;

// Calling-convention layer over a compiled artifact.
// Instances are immutable: freeze, unfreeze and context changes return a new
// wrapper sharing the same artifact, so no recompilation happens.
class NumericFunction {
public:
  NumericFunction(ArtifactPtr artifact, VarSpec vars);

  // Same calling convention around a host callable taking one value per variable
  static NumericFunction wrap(HostFn fn, VarSpec vars);

  // Positional arguments fill free positional slots in order; keywords fill free named slots
  NumericValue call(const std::vector<NumericValue>& positional,
                    const KeywordArgs& keywords = {}) const;

  template <typename... Args>
  NumericValue operator()(Args&&... args) const {
    return call(std::vector<NumericValue>{NumericValue(std::forward<Args>(args))...});
  }

  // State machine
  NumericFunction freeze(const std::map<Symbol, FreezeValue>& values) const;
  // Name is a named-slot keyword or an unambiguous symbol display name
  NumericFunction freeze(const std::string& nameOrKey, FreezeValue value) const;
  NumericFunction unfreeze(const Symbol& symbol) const;
  NumericFunction unfreeze(const std::vector<Symbol>& symbols) const;
  NumericFunction unfreeze() const;

  // Context is not owned and must outlive every call that reads it
  NumericFunction setParameterContext(const ParameterContext& context) const;
  NumericFunction removeParameterContext() const;
  bool hasParameterContext() const { return context_ != nullptr; }

  // Introspection
  const VarSpec& vars() const { return vars_; }
  std::vector<std::string> varNames() const;
  std::vector<Symbol> freeVars() const;
  CallSignature freeVarSignature() const;
  const CallSignature& callSignature() const { return artifact_->signature(); }
  const VariableState& state(const Symbol& symbol) const;
  const std::string& source() const { return artifact_->source(); }
  const std::optional<Expr>& symbolic() const { return artifact_->expression(); }
  const ArtifactPtr& artifact() const { return artifact_; }

  std::string toString() const;

private:
  size_t resolveSlot(const Symbol& symbol) const;
  size_t resolveName(const std::string& nameOrKey) const;

  ArtifactPtr artifact_;
  VarSpec vars_;
  std::vector<VariableState> states_;  // parallel to vars_.slots()
  const ParameterContext* context_ = nullptr;
};

}  // namespace numify
