// Numify Expression Compiler - Parser Implementation
// Copyright (c) 2025 Chris M. Perez
// Licensed under the MIT License

#include "parser/parser.hpp"

#include <cmath>
#include <sstream>

namespace numify {

namespace {

// Binding power of unary minus: looser than powers, tighter than products
constexpr int kUnaryPrecedence = 3;

std::string position(size_t line, size_t column) {
  std::ostringstream oss;
  oss << "line " << line << ", column " << column;
  return oss.str();
}

}  // namespace

ParseError::ParseError(const std::string& message, size_t line, size_t column)
    : NumifyError(ErrorKind::ParseError, message)
    , line_(line)
    , column_(column) {
  setExplanation("at " + position(line, column));
}

Parser::Parser(std::vector<Token> tokens, ParseEnvironment env)
    : tokens_(std::move(tokens))
    , current_(0)
    , env_(std::move(env)) {
  if (tokens_.empty() || tokens_.back().type != TokenType::Eof) {
    tokens_.push_back(Token(TokenType::Eof));
  }
}

const Token& Parser::current() const {
  return tokens_[current_];
}

const Token& Parser::previous() const {
  return tokens_[current_ - 1];
}

bool Parser::check(TokenType type) const {
  if (isAtEnd())
    return false;
  return current().type == type;
}

bool Parser::match(TokenType type) {
  if (check(type)) {
    advance();
    return true;
  }
  return false;
}

Token Parser::consume(TokenType type, const std::string& message) {
  if (check(type)) {
    return advance();
  }
  error(message);
}

Token Parser::advance() {
  if (!isAtEnd()) {
    current_++;
  }
  return previous();
}

bool Parser::isAtEnd() const {
  return current().type == TokenType::Eof;
}

void Parser::error(const std::string& message) {
  const Token& token = current();
  std::string got = token.type == TokenType::Eof ? "end of input" : "'" + token.lexeme + "'";
  throw ParseError(message + " (got " + got + ")", token.line, token.column);
}

Expr Parser::parseExpression() {
  Expr expr = parseBinary(1);
  if (!isAtEnd()) {
    error("Unexpected trailing input");
  }
  return expr;
}

Expr Parser::parseExpressionFromSource(const std::string& source, ParseEnvironment env) {
  Lexer lexer(source);
  auto tokens = lexer.tokenize();
  Parser parser(std::move(tokens), std::move(env));
  return parser.parseExpression();
}

int Parser::getPrecedence(TokenType type) const {
  switch (type) {
  case TokenType::Plus:
  case TokenType::Minus:
    return 1;
  case TokenType::Star:
  case TokenType::Slash:
    return 2;
  case TokenType::Caret:
  case TokenType::StarStar:
    return 4;
  default:
    return -1;
  }
}

bool Parser::isRightAssociative(TokenType type) const {
  return type == TokenType::Caret || type == TokenType::StarStar;
}

Expr Parser::parseBinary(int minPrecedence) {
  Expr left = parseUnary();

  while (!isAtEnd()) {
    TokenType op = current().type;
    int precedence = getPrecedence(op);
    if (precedence < minPrecedence) {
      break;
    }
    advance();

    Expr right = parseBinary(isRightAssociative(op) ? precedence : precedence + 1);
    switch (op) {
    case TokenType::Plus:
      left = left + right;
      break;
    case TokenType::Minus:
      left = left - right;
      break;
    case TokenType::Star:
      left = left * right;
      break;
    case TokenType::Slash:
      left = left / right;
      break;
    default:
      left = pow(left, right);
      break;
    }
  }

  return left;
}

Expr Parser::parseUnary() {
  if (match(TokenType::Minus)) {
    return -parseBinary(kUnaryPrecedence);
  }
  if (match(TokenType::Plus)) {
    return parseBinary(kUnaryPrecedence);
  }
  return parseAtom();
}

Expr Parser::parseAtom() {
  if (match(TokenType::Number)) {
    return number(previous().number);
  }

  if (match(TokenType::Identifier)) {
    Token name = previous();
    if (check(TokenType::LeftParen)) {
      return parseCall(name);
    }
    auto it = env_.symbols.find(name.lexeme);
    if (it != env_.symbols.end()) {
      return Expr(it->second);
    }
    if (name.lexeme == "pi") {
      return number(M_PI);
    }
    return Expr(Symbol(name.lexeme));
  }

  if (match(TokenType::LeftParen)) {
    Expr inner = parseBinary(1);
    consume(TokenType::RightParen, "Expected ')' after expression");
    return inner;
  }

  error("Expected expression");
}

Expr Parser::parseCall(const Token& name) {
  consume(TokenType::LeftParen, "Expected '(' after function name");

  std::vector<Expr> args;
  if (!check(TokenType::RightParen)) {
    do {
      args.push_back(parseBinary(1));
    } while (match(TokenType::Comma));
  }
  consume(TokenType::RightParen, "Expected ')' after arguments");

  auto arityError = [&](size_t expected) {
    std::ostringstream oss;
    oss << name.lexeme << " expects " << expected << " argument(s), got " << args.size();
    throw ParseError(oss.str(), name.line, name.column);
  };

  auto fn = env_.functions.find(name.lexeme);
  if (fn != env_.functions.end()) {
    if (fn->second->arity != args.size()) {
      arityError(fn->second->arity);
    }
    return applyFunction(fn->second, std::move(args));
  }

  if (auto builtin = lookupBuiltin(name.lexeme)) {
    if (builtinArity(*builtin) != args.size()) {
      arityError(builtinArity(*builtin));
    }
    return call(*builtin, std::move(args));
  }

  // Unknown name: opaque function, shared by later calls in the same input
  FunctionRef declared = declareFunction(name.lexeme, args.size());
  env_.functions.emplace(name.lexeme, declared);
  return applyFunction(declared, std::move(args));
}

}  // namespace numify
