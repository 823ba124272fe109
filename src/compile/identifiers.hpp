// Numify Expression Compiler - Identifier Allocation Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "compile/var_spec.hpp"
#include "expr/expr.hpp"

#include <set>
#include <string>
#include <vector>

namespace numify {

struct SignatureEntry {
  Symbol symbol;
  std::string identifier;

  bool operator==(const SignatureEntry& other) const {
    return symbol == other.symbol && identifier == other.identifier;
  }
};

// One entry per VarSpec symbol, in VarSpec order
using CallSignature = std::vector<SignatureEntry>;

// Names generated code uses for itself
extern const char* const RUNTIME_NAMES[];

// Allocates unique, valid C++ identifiers from display names.
// Deterministic: the same sequence of requests yields the same identifiers.
class IdentifierAllocator {
public:
  // Keywords, builtin names and runtime names
  static const std::set<std::string>& defaultReserved();

  explicit IdentifierAllocator(std::set<std::string> reserved = defaultReserved());

  static bool isKeyword(const std::string& name);
  static bool isValidIdentifier(const std::string& name);

  // Replace illegal characters, prefix a leading digit, escape keywords
  static std::string mangle(const std::string& name);

  // Mangled name, suffixed _1, _2, ... until it is neither reserved nor taken
  std::string allocate(const std::string& displayName);

  bool isTaken(const std::string& identifier) const;

private:
  std::set<std::string> reserved_;
  std::set<std::string> taken_;
};

// Allocate the call signature of a variable spec
CallSignature allocateSignature(const VarSpec& vars, IdentifierAllocator& allocator);
CallSignature allocateSignature(const VarSpec& vars);

}  // namespace numify
