// Numify Expression Compiler - Parameter Context
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/parameter_context.hpp"

namespace numify {

ParameterTable::ParameterTable(std::initializer_list<std::pair<const Symbol, NumericValue>> values)
    : values_(values) {}

void ParameterTable::set(const Symbol& symbol, NumericValue value) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_[symbol] = std::move(value);
}

bool ParameterTable::erase(const Symbol& symbol) {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.erase(symbol) > 0;
}

std::optional<NumericValue> ParameterTable::lookup(const Symbol& symbol) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(symbol);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<Symbol, NumericValue> ParameterTable::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_;
}

}  // namespace numify
