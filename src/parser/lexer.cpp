// Numify Expression Compiler - Lexical Analyzer
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "parser/lexer.hpp"

#include "parser/parser.hpp"

#include <cctype>
#include <cstdlib>

namespace numify {

Lexer::Lexer(std::string_view source)
    : source_(source)
    , current_(0)
    , start_(0)
    , line_(1)
    , column_(1)
    , startColumn_(1) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    Token token = nextToken();
    if (token.type == TokenType::Error) {
      throw ParseError(token.lexeme, token.line, token.column);
    }
    if (token.type == TokenType::Eof) {
      break;
    }
    tokens.push_back(std::move(token));
  }
  tokens.push_back(Token(TokenType::Eof, "", line_, column_));
  return tokens;
}

Token Lexer::nextToken() {
  skipWhitespace();

  start_ = current_;
  startColumn_ = column_;

  if (isAtEnd()) {
    return makeToken(TokenType::Eof);
  }

  char c = advance();

  // Numbers, including a leading-dot form such as .5
  if (std::isdigit(static_cast<unsigned char>(c)) ||
      (c == '.' && std::isdigit(static_cast<unsigned char>(peek())))) {
    return number();
  }

  if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
    return identifier();
  }

  switch (c) {
  case '(':
    return makeToken(TokenType::LeftParen);
  case ')':
    return makeToken(TokenType::RightParen);
  case ',':
    return makeToken(TokenType::Comma);
  case '+':
    return makeToken(TokenType::Plus);
  case '-':
    return makeToken(TokenType::Minus);
  case '*':
    if (match('*'))
      return makeToken(TokenType::StarStar);
    return makeToken(TokenType::Star);
  case '^':
    return makeToken(TokenType::Caret);
  case '/':
    return makeToken(TokenType::Slash);
  }

  return errorToken(std::string("Unexpected character '") + c + "'");
}

char Lexer::advance() {
  column_++;
  return source_[current_++];
}

char Lexer::peek() const {
  if (isAtEnd())
    return '\0';
  return source_[current_];
}

char Lexer::peekNext() const {
  if (current_ + 1 >= source_.size())
    return '\0';
  return source_[current_ + 1];
}

bool Lexer::match(char expected) {
  if (isAtEnd())
    return false;
  if (source_[current_] != expected)
    return false;
  advance();
  return true;
}

bool Lexer::isAtEnd() const {
  return current_ >= source_.size();
}

void Lexer::skipWhitespace() {
  while (!isAtEnd()) {
    char c = peek();
    switch (c) {
    case ' ':
    case '\r':
    case '\t':
      advance();
      break;
    case '\n':
      line_++;
      column_ = 0;  // Will be incremented to 1 on advance
      advance();
      break;
    default:
      return;
    }
  }
}

Token Lexer::number() {
  while (std::isdigit(static_cast<unsigned char>(peek())))
    advance();

  if (peek() == '.') {
    advance();
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  // Exponent only when digits follow, so "2e" lexes as 2 followed by e
  if (peek() == 'e' || peek() == 'E') {
    size_t offset = (peekNext() == '+' || peekNext() == '-') ? 2 : 1;
    if (current_ + offset < source_.size() &&
        std::isdigit(static_cast<unsigned char>(source_[current_ + offset]))) {
      for (size_t i = 0; i < offset; ++i)
        advance();
      while (std::isdigit(static_cast<unsigned char>(peek())))
        advance();
    }
  }

  std::string numStr(source_.substr(start_, current_ - start_));
  return makeToken(TokenType::Number, std::strtod(numStr.c_str(), nullptr));
}

Token Lexer::identifier() {
  while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '\'') {
    advance();
  }

  return makeToken(TokenType::Identifier);
}

Token Lexer::makeToken(TokenType type) {
  std::string lexeme(source_.substr(start_, current_ - start_));
  return Token{type, lexeme, line_, startColumn_};
}

Token Lexer::makeToken(TokenType type, double value) {
  std::string lexeme(source_.substr(start_, current_ - start_));
  return Token{type, lexeme, value, line_, startColumn_};
}

Token Lexer::errorToken(std::string message) {
  return Token(TokenType::Error, std::move(message), line_, startColumn_);
}

}  // namespace numify
