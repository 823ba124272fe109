// Numify Expression Compiler - Lexer Header
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace numify {

enum class TokenType {
  // Literals
  Number,

  // Identifiers
  Identifier,

  // Operators
  Plus,
  Minus,
  Star,
  StarStar,
  Caret,
  Slash,

  // Delimiters
  LeftParen,
  RightParen,
  Comma,

  // Special
  Eof,
  Error
};

struct Token {
  TokenType type;
  std::string lexeme;
  double number;
  size_t line;
  size_t column;  // Column position in the line (1-indexed)

  Token(TokenType type, std::string lexeme = "", size_t line = 0, size_t column = 0)
      : type(type)
      , lexeme(std::move(lexeme))
      , number(0.0)
      , line(line)
      , column(column) {}

  Token(TokenType type, std::string lexeme, double number, size_t line, size_t column)
      : type(type)
      , lexeme(std::move(lexeme))
      , number(number)
      , line(line)
      , column(column) {}
};

class Lexer {
public:
  explicit Lexer(std::string_view source);

  // Throws ParseError on the first malformed token
  std::vector<Token> tokenize();

private:
  Token nextToken();

  char advance();
  char peek() const;
  char peekNext() const;
  bool match(char expected);
  bool isAtEnd() const;

  void skipWhitespace();

  Token makeToken(TokenType type);
  Token makeToken(TokenType type, double value);
  Token errorToken(std::string message);

  Token number();
  Token identifier();

  std::string_view source_;
  size_t current_;
  size_t start_;
  size_t line_;
  size_t column_;
  size_t startColumn_;
};

}  // namespace numify
