#include "clite/Parser.h"

#include "ParserHelpers.h"

#include <utility>

namespace clite {
using namespace parser;

Parser::Parser(std::vector<Token> tokens, int maxDepth) : tokens_(std::move(tokens)), maxDepth_(maxDepth) {
  if (tokens_.empty() || tokens_.back().kind != TokenKind::End) {
    Token end;
    if (!tokens_.empty()) {
      end.line = tokens_.back().line;
      end.column = tokens_.back().column + static_cast<int>(tokens_.back().text.size());
    }
    tokens_.push_back(end);
  }
}

bool Parser::parse(Program &program, ParseError &error) {
  error_ = &error;
  while (!match(TokenKind::End)) {
    if (!match(TokenKind::KeywordFn)) {
      return fail("'fn'");
    }
    Function fn;
    if (!parseFunction(fn)) {
      return false;
    }
    program.functions.push_back(std::move(fn));
  }
  return true;
}

bool Parser::parseFunction(Function &out) {
  const Token &start = current();
  out.line = start.line;
  out.column = start.column;
  if (!expect(TokenKind::KeywordFn, "'fn'")) {
    return false;
  }
  Token name;
  if (!consume(TokenKind::Identifier, "function name", name)) {
    return false;
  }
  out.name = name.text;
  if (!expect(TokenKind::LParen, "'(' after function name")) {
    return false;
  }
  if (!parseParameterList(out.params)) {
    return false;
  }
  if (!expect(TokenKind::RParen, "')' to close parameter list")) {
    return false;
  }
  if (!expect(TokenKind::Colon, "':' before return type")) {
    return false;
  }
  if (!parseTypeName(out.returnType, true)) {
    return false;
  }
  return parseBlock(out.body);
}

bool Parser::parseParameterList(std::vector<Param> &out) {
  if (match(TokenKind::RParen)) {
    return true;
  }
  while (true) {
    Token name;
    if (!consume(TokenKind::Identifier, "parameter name", name)) {
      return false;
    }
    Param param;
    param.name = name.text;
    param.line = name.line;
    param.column = name.column;
    if (!expect(TokenKind::Colon, "':' after parameter name")) {
      return false;
    }
    if (!parseTypeName(param.type, false)) {
      return false;
    }
    out.push_back(std::move(param));
    if (!match(TokenKind::Comma)) {
      return true;
    }
    ++pos_;
  }
}

bool Parser::parseTypeName(TypeName &out, bool allowVoid) {
  TypeName type = TypeName::Int;
  if (!typeNameForToken(current().kind, type) || (!allowVoid && type == TypeName::Void)) {
    return fail(allowVoid ? "type name" : "value type name");
  }
  out = type;
  ++pos_;
  return true;
}

bool Parser::checkDepth(int height) {
  if (depth_ + height <= maxDepth_) {
    return true;
  }
  if (error_) {
    const Token &token = current();
    error_->expected = "at most " + std::to_string(maxDepth_) + " levels of nesting";
    error_->found = "deeper nesting";
    error_->line = token.line;
    error_->column = token.column;
  }
  return false;
}

const Token &Parser::current() const {
  return tokens_[pos_];
}

const Token &Parser::lookahead(size_t offset) const {
  size_t index = pos_ + offset;
  if (index >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[index];
}

bool Parser::match(TokenKind kind) const {
  return tokens_[pos_].kind == kind;
}

bool Parser::expect(TokenKind kind, const std::string &expected) {
  if (!match(kind)) {
    return fail(expected);
  }
  ++pos_;
  return true;
}

bool Parser::consume(TokenKind kind, const std::string &expected, Token &out) {
  if (!match(kind)) {
    return fail(expected);
  }
  out = tokens_[pos_++];
  return true;
}

bool Parser::fail(const std::string &expected) {
  if (error_) {
    const Token &token = current();
    error_->expected = expected;
    error_->found = describeToken(token);
    error_->line = token.line;
    error_->column = token.column;
  }
  return false;
}

} // namespace clite
