// Numify Expression Compiler - Error Types Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <exception>
#include <string>
#include <vector>

namespace numify {

// Error categories
enum class ErrorKind {
  InvalidSpec,
  UnboundSymbol,
  OverlappingBinding,
  InvalidBinding,
  UnboundFunction,
  CallArityMismatch,
  MissingDynamicContext,
  MissingContextSymbol,
  UnknownParameter,
  ShapeMismatch,
  CompilationFailed,
  ParseError
};

const char* errorKindName(ErrorKind kind);

// Suggested fix for an error
struct ErrorSuggestion {
  std::string description;
  std::string code;

  ErrorSuggestion(std::string desc, std::string c = "")
      : description(std::move(desc))
      , code(std::move(c)) {}
};

// Rich error with offending names and suggestions
class NumifyError : public std::exception {
private:
  ErrorKind kind_;
  std::string title_;
  std::string explanation_;
  std::vector<std::string> names_;  // every offending name, in report order
  std::vector<ErrorSuggestion> suggestions_;
  std::vector<std::string> relatedInfo_;
  mutable std::string cachedMessage_;

public:
  NumifyError(ErrorKind kind, std::string title)
      : kind_(kind)
      , title_(std::move(title)) {}

  // Setters for builder pattern
  NumifyError& setExplanation(std::string expl) {
    explanation_ = std::move(expl);
    cachedMessage_.clear();
    return *this;
  }

  NumifyError& addName(std::string name) {
    names_.push_back(std::move(name));
    cachedMessage_.clear();
    return *this;
  }

  NumifyError& setNames(std::vector<std::string> names) {
    names_ = std::move(names);
    cachedMessage_.clear();
    return *this;
  }

  NumifyError& addSuggestion(std::string desc, std::string code = "") {
    suggestions_.emplace_back(std::move(desc), std::move(code));
    return *this;
  }

  NumifyError& addRelatedInfo(std::string info) {
    relatedInfo_.push_back(std::move(info));
    return *this;
  }

  // Exception interface: "<Kind>: <title>: <names>. <explanation>"
  const char* what() const noexcept override;

  // Display formatted error
  std::string display() const;

  // Getters
  ErrorKind kind() const { return kind_; }
  const std::string& title() const { return title_; }
  const std::string& explanation() const { return explanation_; }
  const std::vector<std::string>& names() const { return names_; }
  const std::vector<ErrorSuggestion>& suggestions() const { return suggestions_; }
};

// Utility functions
namespace errors {

// Join names as "a, b, c"
std::string joinNames(const std::vector<std::string>& names);

// Find similar names using Levenshtein distance
std::vector<std::string> findSimilarNames(const std::string& target,
                                          const std::vector<std::string>& candidates,
                                          int maxDistance = 2);

// ANSI color codes
extern const char* RED;
extern const char* YELLOW;
extern const char* GREEN;
extern const char* CYAN;
extern const char* BOLD;
extern const char* DIM;
extern const char* RESET;

}  // namespace errors

}  // namespace numify
