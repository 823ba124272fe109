// Numify Expression Compiler - Parameter Context Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "expr/expr.hpp"
#include "runtime/value.hpp"

#include <map>
#include <mutex>
#include <optional>

namespace numify {

// Externally owned source of current values for dynamic variables.
// Consulted once per dynamic symbol per call; never mutated by callers of lookup.
class ParameterContext {
public:
  virtual ~ParameterContext() = default;

  virtual std::optional<NumericValue> lookup(const Symbol& symbol) const = 0;
};

// Thread-safe symbol table
class ParameterTable : public ParameterContext {
public:
  ParameterTable() = default;
  ParameterTable(std::initializer_list<std::pair<const Symbol, NumericValue>> values);

  void set(const Symbol& symbol, NumericValue value);
  bool erase(const Symbol& symbol);

  std::optional<NumericValue> lookup(const Symbol& symbol) const override;

  // Detached copy of the current values
  std::map<Symbol, NumericValue> snapshot() const;

private:
  std::map<Symbol, NumericValue> values_;
  mutable std::mutex mutex_;
};

}  // namespace numify
