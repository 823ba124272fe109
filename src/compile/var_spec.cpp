// Numify Expression Compiler - Variable Specification
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/var_spec.hpp"

#include "error/errors.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace numify {

VarSlot VarSlot::positional(Symbol symbol) {
  VarSlot slot;
  slot.kind = Kind::Positional;
  slot.symbol = std::move(symbol);
  return slot;
}

VarSlot VarSlot::named(std::string name, Symbol symbol) {
  VarSlot slot;
  slot.kind = Kind::Named;
  slot.name = std::move(name);
  slot.symbol = std::move(symbol);
  return slot;
}

VarSpec::VarSpec(std::vector<VarSlot> slots)
    : slots_(std::move(slots)) {
  std::vector<std::string> duplicates;
  std::vector<std::string> duplicateNames;
  std::set<Symbol> seen;
  std::set<std::string> seenNames;

  for (const auto& slot : slots_) {
    if (!slot.symbol.valid()) {
      throw NumifyError(ErrorKind::InvalidSpec, "Variable spec contains an invalid symbol")
          .setExplanation("every slot must name a symbol");
    }
    if (!seen.insert(slot.symbol).second) {
      duplicates.push_back(slot.symbol.toString());
    }
    if (slot.isNamed()) {
      if (slot.name.empty()) {
        throw NumifyError(ErrorKind::InvalidSpec, "Named slot has an empty keyword")
            .addName(slot.symbol.toString());
      }
      if (!seenNames.insert(slot.name).second) {
        duplicateNames.push_back(slot.name);
      }
    }
  }

  if (!duplicates.empty()) {
    throw NumifyError(ErrorKind::InvalidSpec, "Duplicate symbol in variable spec")
        .setNames(std::move(duplicates))
        .setExplanation("each symbol may be declared once");
  }
  if (!duplicateNames.empty()) {
    throw NumifyError(ErrorKind::InvalidSpec, "Duplicate keyword in variable spec")
        .setNames(std::move(duplicateNames));
  }

  for (const auto& slot : slots_) {
    all_.push_back(slot.symbol);
    if (slot.isNamed()) {
      keyed_.emplace_back(slot.name, slot.symbol);
    }
  }
}

VarSpec VarSpec::of(const Symbol& symbol) {
  return VarSpec({VarSlot::positional(symbol)});
}

VarSpec VarSpec::sequence(const std::vector<Symbol>& symbols) {
  std::vector<VarSlot> slots;
  slots.reserve(symbols.size());
  for (const auto& symbol : symbols) {
    slots.push_back(VarSlot::positional(symbol));
  }
  return VarSpec(std::move(slots));
}

VarSpec VarSpec::mixed(const std::vector<VarSlot>& slots) {
  return VarSpec(slots);
}

VarSpec VarSpec::mapping(const std::vector<std::pair<VarKey, Symbol>>& entries) {
  std::vector<std::pair<int, Symbol>> positional;
  std::vector<VarSlot> named;

  for (const auto& [key, symbol] : entries) {
    if (auto* index = std::get_if<int>(&key)) {
      positional.emplace_back(*index, symbol);
    } else {
      named.push_back(VarSlot::named(std::get<std::string>(key), symbol));
    }
  }

  std::stable_sort(positional.begin(), positional.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<std::string> repeated;
  for (size_t i = 1; i < positional.size(); ++i) {
    if (positional[i].first == positional[i - 1].first &&
        (repeated.empty() || repeated.back() != std::to_string(positional[i].first))) {
      repeated.push_back(std::to_string(positional[i].first));
    }
  }
  if (!repeated.empty()) {
    throw NumifyError(ErrorKind::InvalidSpec, "Duplicate integer key")
        .setNames(std::move(repeated))
        .setExplanation("each integer key may name only one variable");
  }

  for (size_t i = 0; i < positional.size(); ++i) {
    if (positional[i].first != static_cast<int>(i)) {
      std::vector<std::string> keys;
      for (const auto& entry : positional) {
        keys.push_back(std::to_string(entry.first));
      }
      throw NumifyError(ErrorKind::InvalidSpec,
                        "Integer keys must be contiguous and start at 0")
          .setNames(std::move(keys))
          .setExplanation("expected keys 0.." + std::to_string(positional.size() - 1));
    }
  }

  std::vector<VarSlot> slots;
  for (const auto& entry : positional) {
    slots.push_back(VarSlot::positional(entry.second));
  }
  slots.insert(slots.end(), named.begin(), named.end());
  return VarSpec(std::move(slots));
}

VarSpec VarSpec::inferred(const Expr& expr) {
  auto free = expr.freeSymbols();
  return sequence(std::vector<Symbol>(free.begin(), free.end()));
}

std::optional<size_t> VarSpec::indexOf(const Symbol& symbol) const {
  for (size_t i = 0; i < all_.size(); ++i) {
    if (all_[i] == symbol) {
      return i;
    }
  }
  return std::nullopt;
}

std::string VarSpec::toString() const {
  std::ostringstream oss;
  oss << "(";
  for (size_t i = 0; i < slots_.size(); ++i) {
    if (i > 0)
      oss << ", ";
    if (slots_[i].isNamed()) {
      oss << slots_[i].name << "=";
    }
    oss << slots_[i].symbol.name();
  }
  oss << ")";
  return oss.str();
}

}  // namespace numify
