// Numify Expression Compiler - Parser Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include "error/errors.hpp"
#include "expr/expr.hpp"
#include "parser/lexer.hpp"

#include <map>
#include <string>
#include <vector>

namespace numify {

class ParseError : public NumifyError {
public:
  ParseError(const std::string& message, size_t line, size_t column);

  size_t line() const { return line_; }
  size_t column() const { return column_; }

private:
  size_t line_;
  size_t column_;
};

// Names the parser resolves instead of creating fresh symbols or declarations
struct ParseEnvironment {
  std::map<std::string, Symbol> symbols;
  std::map<std::string, FunctionRef> functions;
};

class Parser {
public:
  explicit Parser(std::vector<Token> tokens, ParseEnvironment env = {});

  // Whole input as one expression
  Expr parseExpression();

  // Functions seen while parsing, including opaque declarations created for unknown names
  const std::map<std::string, FunctionRef>& functions() const { return env_.functions; }

  // Helper for tests and the CLI
  static Expr parseExpressionFromSource(const std::string& source, ParseEnvironment env = {});

  bool isAtEnd() const;

private:
  // Token management
  const Token& current() const;
  const Token& previous() const;
  bool check(TokenType type) const;
  bool match(TokenType type);
  Token consume(TokenType type, const std::string& message);
  Token advance();

  // Error handling
  [[noreturn]] void error(const std::string& message);

  // Parsing methods
  Expr parseBinary(int minPrecedence);
  Expr parseUnary();
  Expr parseAtom();
  Expr parseCall(const Token& name);

  // Helpers
  int getPrecedence(TokenType type) const;
  bool isRightAssociative(TokenType type) const;

  std::vector<Token> tokens_;
  size_t current_;
  ParseEnvironment env_;
};

}  // namespace numify
