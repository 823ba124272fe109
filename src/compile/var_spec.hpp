// Numify Expression Compiler - Variable Specification Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "expr/expr.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace numify {

// One declared call-time variable
struct VarSlot {
  enum class Kind {
    Positional,
    Named
  };

  Kind kind = Kind::Positional;
  std::string name;  // keyword, Named slots only
  Symbol symbol;

  static VarSlot positional(Symbol symbol);
  static VarSlot named(std::string name, Symbol symbol);

  bool isNamed() const { return kind == Kind::Named; }
  bool operator==(const VarSlot& other) const {
    return kind == other.kind && name == other.name && symbol == other.symbol;
  }
};

// Key of a mapping-form declaration: integer position or keyword
using VarKey = std::variant<int, std::string>;

// Canonical ordered variable declaration.
// Symbols are pairwise distinct; keywords are pairwise distinct.
class VarSpec {
public:
  VarSpec() = default;

  static VarSpec of(const Symbol& symbol);
  static VarSpec sequence(const std::vector<Symbol>& symbols);

  // Positional and named slots in declaration order
  static VarSpec mixed(const std::vector<VarSlot>& slots);

  // Integer keys must be 0..k-1; they come first, keywords follow in the given order
  static VarSpec mapping(const std::vector<std::pair<VarKey, Symbol>>& entries);

  // Free symbols of the expression ordered by name
  static VarSpec inferred(const Expr& expr);

  const std::vector<VarSlot>& slots() const { return slots_; }
  const std::vector<Symbol>& all() const { return all_; }
  const std::vector<std::pair<std::string, Symbol>>& keyed() const { return keyed_; }

  size_t size() const { return slots_.size(); }
  bool empty() const { return slots_.empty(); }
  bool contains(const Symbol& symbol) const { return indexOf(symbol).has_value(); }
  std::optional<size_t> indexOf(const Symbol& symbol) const;

  std::string toString() const;

  bool operator==(const VarSpec& other) const { return slots_ == other.slots_; }
  bool operator!=(const VarSpec& other) const { return !(*this == other); }

private:
  explicit VarSpec(std::vector<VarSlot> slots);

  std::vector<VarSlot> slots_;
  std::vector<Symbol> all_;
  std::vector<std::pair<std::string, Symbol>> keyed_;
};

}  // namespace numify
