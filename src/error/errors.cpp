// Numify Expression Compiler - Error Handling
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "error/errors.hpp"

#include <algorithm>
#include <sstream>

namespace numify {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidSpec:
    return "InvalidSpec";
  case ErrorKind::UnboundSymbol:
    return "UnboundSymbol";
  case ErrorKind::OverlappingBinding:
    return "OverlappingBinding";
  case ErrorKind::InvalidBinding:
    return "InvalidBinding";
  case ErrorKind::UnboundFunction:
    return "UnboundFunction";
  case ErrorKind::CallArityMismatch:
    return "CallArityMismatch";
  case ErrorKind::MissingDynamicContext:
    return "MissingDynamicContext";
  case ErrorKind::MissingContextSymbol:
    return "MissingContextSymbol";
  case ErrorKind::UnknownParameter:
    return "UnknownParameter";
  case ErrorKind::ShapeMismatch:
    return "ShapeMismatch";
  case ErrorKind::CompilationFailed:
    return "CompilationFailed";
  case ErrorKind::ParseError:
    return "ParseError";
  }
  return "Error";
}

const char* NumifyError::what() const noexcept {
  if (cachedMessage_.empty()) {
    std::ostringstream oss;
    oss << errorKindName(kind_) << ": " << title_;
    if (!names_.empty()) {
      oss << ": " << errors::joinNames(names_);
    }
    if (!explanation_.empty()) {
      oss << ". " << explanation_;
    }
    cachedMessage_ = oss.str();
  }
  return cachedMessage_.c_str();
}

std::string NumifyError::display() const {
  std::ostringstream oss;

  oss << errors::RED << errors::BOLD << "error[" << errorKindName(kind_) << "]" << errors::RESET
      << errors::BOLD << ": " << title_ << errors::RESET << "\n";

  if (!names_.empty()) {
    oss << "\n  " << errors::CYAN << "Offending: " << errors::RESET;
    for (size_t i = 0; i < names_.size(); ++i) {
      if (i > 0)
        oss << ", ";
      oss << errors::BOLD << names_[i] << errors::RESET;
    }
    oss << "\n";
  }

  if (!explanation_.empty()) {
    oss << "\n  " << explanation_ << "\n";
  }

  if (!suggestions_.empty()) {
    oss << "\n  " << errors::GREEN << "Suggestions:" << errors::RESET << "\n";
    for (const auto& suggestion : suggestions_) {
      oss << "    - " << suggestion.description << "\n";
      if (!suggestion.code.empty()) {
        oss << "      " << errors::DIM << suggestion.code << errors::RESET << "\n";
      }
    }
  }

  for (const auto& info : relatedInfo_) {
    oss << "\n  " << errors::DIM << "note: " << info << errors::RESET << "\n";
  }

  return oss.str();
}

namespace errors {

// ANSI color codes
const char* RED = "\033[31m";
const char* YELLOW = "\033[33m";
const char* GREEN = "\033[32m";
const char* CYAN = "\033[36m";
const char* BOLD = "\033[1m";
const char* DIM = "\033[2m";
const char* RESET = "\033[0m";

std::string joinNames(const std::vector<std::string>& names) {
  std::ostringstream oss;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0)
      oss << ", ";
    oss << names[i];
  }
  return oss.str();
}

// Compute Levenshtein distance between two strings
int levenshteinDistance(const std::string& s1, const std::string& s2) {
  const size_t len1 = s1.size(), len2 = s2.size();
  std::vector<std::vector<int>> d(len1 + 1, std::vector<int>(len2 + 1));

  for (size_t i = 0; i <= len1; ++i)
    d[i][0] = static_cast<int>(i);
  for (size_t j = 0; j <= len2; ++j)
    d[0][j] = static_cast<int>(j);

  for (size_t i = 1; i <= len1; ++i) {
    for (size_t j = 1; j <= len2; ++j) {
      int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
      d[i][j] = std::min({
          d[i - 1][j] + 1,        // deletion
          d[i][j - 1] + 1,        // insertion
          d[i - 1][j - 1] + cost  // substitution
      });
    }
  }

  return d[len1][len2];
}

std::vector<std::string> findSimilarNames(const std::string& target,
                                          const std::vector<std::string>& candidates,
                                          int maxDistance) {
  std::vector<std::pair<int, std::string>> scored;

  for (const auto& candidate : candidates) {
    int dist = levenshteinDistance(target, candidate);
    if (dist <= maxDistance) {
      scored.emplace_back(dist, candidate);
    }
  }

  // Closest first
  std::sort(scored.begin(), scored.end());

  std::vector<std::string> result;
  for (const auto& [dist, name] : scored) {
    result.push_back(name);
  }

  return result;
}

}  // namespace errors

}  // namespace numify
