// Numify Expression Compiler - Identifier Allocation
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "compile/identifiers.hpp"

#include <cctype>

namespace numify {

const char* const RUNTIME_NAMES[] = {"kernel", "_n",    "_i",        "_inputs", "_strides",
                                     "_out",   "_consts", "_host", "_callHost", "_shape",
                                     nullptr};

namespace {

const std::set<std::string>& cppKeywords() {
  static const std::set<std::string> keywords = {
      "alignas",      "alignof",     "and",          "and_eq",       "asm",
      "auto",         "bitand",      "bitor",        "bool",         "break",
      "case",         "catch",       "char",         "char16_t",     "char32_t",
      "char8_t",      "class",       "compl",        "concept",      "const",
      "consteval",    "constexpr",   "constinit",    "const_cast",   "continue",
      "co_await",     "co_return",   "co_yield",     "decltype",     "default",
      "delete",       "do",          "double",       "dynamic_cast", "else",
      "enum",         "explicit",    "export",       "extern",       "false",
      "float",        "for",         "friend",       "goto",         "if",
      "inline",       "int",         "long",         "mutable",      "namespace",
      "new",          "noexcept",    "not",          "not_eq",       "nullptr",
      "operator",     "or",          "or_eq",        "private",      "protected",
      "public",       "register",    "reinterpret_cast", "requires", "return",
      "short",        "signed",      "sizeof",       "static",       "static_assert",
      "static_cast",  "struct",      "switch",       "template",     "this",
      "thread_local", "throw",       "true",         "try",          "typedef",
      "typeid",       "typename",    "union",        "unsigned",     "using",
      "virtual",      "void",        "volatile",     "wchar_t",      "while",
      "xor",          "xor_eq"};
  return keywords;
}

}  // namespace

const std::set<std::string>& IdentifierAllocator::defaultReserved() {
  static const std::set<std::string> reserved = [] {
    std::set<std::string> names = cppKeywords();
    for (const char* builtin :
         {"sin", "cos", "tan", "asin", "acos", "atan", "atan2", "sinh", "cosh", "tanh", "exp",
          "log", "sqrt", "abs", "fabs", "floor", "ceil", "pow", "std", "NAN", "INFINITY"}) {
      names.insert(builtin);
    }
    for (const char* const* name = RUNTIME_NAMES; *name; ++name) {
      names.insert(*name);
    }
    return names;
  }();
  return reserved;
}

IdentifierAllocator::IdentifierAllocator(std::set<std::string> reserved)
    : reserved_(std::move(reserved)) {}

bool IdentifierAllocator::isKeyword(const std::string& name) {
  return cppKeywords().count(name) > 0;
}

bool IdentifierAllocator::isValidIdentifier(const std::string& name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) || isKeyword(name)) {
    return false;
  }
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      return false;
    }
  }
  return true;
}

std::string IdentifierAllocator::mangle(const std::string& name) {
  std::string result;
  result.reserve(name.size() + 1);
  for (char c : name) {
    bool legal = std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    result += legal ? c : '_';
  }

  if (result.empty()) {
    return "_";
  }
  if (std::isdigit(static_cast<unsigned char>(result[0]))) {
    result.insert(result.begin(), '_');
  }
  if (isKeyword(result)) {
    result += '_';
  }
  return result;
}

std::string IdentifierAllocator::allocate(const std::string& displayName) {
  std::string base = mangle(displayName);
  std::string candidate = base;

  for (int suffix = 1; reserved_.count(candidate) || taken_.count(candidate); ++suffix) {
    candidate = base + "_" + std::to_string(suffix);
  }

  taken_.insert(candidate);
  return candidate;
}

bool IdentifierAllocator::isTaken(const std::string& identifier) const {
  return taken_.count(identifier) > 0;
}

CallSignature allocateSignature(const VarSpec& vars, IdentifierAllocator& allocator) {
  CallSignature signature;
  signature.reserve(vars.size());
  for (const auto& symbol : vars.all()) {
    signature.push_back(SignatureEntry{symbol, allocator.allocate(symbol.name())});
  }
  return signature;
}

CallSignature allocateSignature(const VarSpec& vars) {
  IdentifierAllocator allocator;
  return allocateSignature(vars, allocator);
}

}  // namespace numify
