#include "clite/Parser.h"
#include "clite/StringLiteral.h"

#include "ParserHelpers.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

namespace clite {
using namespace parser;

bool Parser::parseExpr(Expr &out) {
  DepthGuard depthGuard(*this);
  if (!checkDepth()) {
    return false;
  }
  return parseBinaryLevel(out, kLowestBinaryLevel);
}

bool Parser::parseBinaryLevel(Expr &out, int level) {
  if (level > kHighestBinaryLevel) {
    return parseUnary(out);
  }
  Expr left;
  if (!parseBinaryLevel(left, level + 1)) {
    return false;
  }
  // A left-associative chain grows the tree by one level per operator, so
  // the height of the folded tree is charged on top of the current nesting.
  int height = exprHeight_;
  Operator op = Operator::Add;
  while (binaryOperatorAtLevel(current().kind, level, op)) {
    const Token opToken = current();
    if (!checkDepth(height + 1)) {
      return false;
    }
    ++pos_;
    Expr right;
    if (!parseBinaryLevel(right, level + 1)) {
      return false;
    }
    height = std::max(height, exprHeight_) + 1;
    Expr binary;
    binary.kind = Expr::Kind::Binary;
    binary.op = op;
    binary.line = opToken.line;
    binary.column = opToken.column;
    binary.args.push_back(std::move(left));
    binary.args.push_back(std::move(right));
    left = std::move(binary);
  }
  exprHeight_ = height;
  out = std::move(left);
  return true;
}

bool Parser::parseUnary(Expr &out) {
  if (!match(TokenKind::Bang) && !match(TokenKind::Minus)) {
    return parsePrimary(out);
  }
  DepthGuard depthGuard(*this);
  if (!checkDepth()) {
    return false;
  }
  const Token opToken = current();
  ++pos_;
  Expr operand;
  if (!parseUnary(operand)) {
    return false;
  }
  ++exprHeight_;
  out.kind = Expr::Kind::Unary;
  out.op = opToken.kind == TokenKind::Bang ? Operator::Not : Operator::Negate;
  out.line = opToken.line;
  out.column = opToken.column;
  out.args.push_back(std::move(operand));
  return true;
}

bool Parser::parsePrimary(Expr &out) {
  const Token token = current();
  out.line = token.line;
  out.column = token.column;
  exprHeight_ = 1;
  switch (token.kind) {
  case TokenKind::Integer:
    ++pos_;
    return parseIntegerLiteral(token, out);
  case TokenKind::KeywordTrue:
  case TokenKind::KeywordFalse:
    ++pos_;
    out.kind = Expr::Kind::BoolLiteral;
    out.boolValue = token.kind == TokenKind::KeywordTrue;
    return true;
  case TokenKind::String: {
    std::string decoded;
    std::string error;
    if (!decodeStringLiteralText(token.text, decoded, error)) {
      return fail("well-formed string literal");
    }
    ++pos_;
    out.kind = Expr::Kind::StringLiteral;
    out.stringValue = std::move(decoded);
    return true;
  }
  case TokenKind::Identifier:
    ++pos_;
    out.name = token.text;
    if (!match(TokenKind::LParen)) {
      out.kind = Expr::Kind::Name;
      return true;
    }
    ++pos_;
    out.kind = Expr::Kind::Call;
    if (!parseCallArguments(out.args)) {
      return false;
    }
    ++exprHeight_;
    return expect(TokenKind::RParen, "')' to close call");
  case TokenKind::LParen: {
    ++pos_;
    if (!parseExpr(out)) {
      return false;
    }
    return expect(TokenKind::RParen, "')' to close parenthesized expression");
  }
  default:
    return fail("expression");
  }
}

bool Parser::parseCallArguments(std::vector<Expr> &out) {
  exprHeight_ = 0;
  if (match(TokenKind::RParen)) {
    return true;
  }
  int tallest = 0;
  while (true) {
    Expr arg;
    if (!parseExpr(arg)) {
      return false;
    }
    tallest = std::max(tallest, exprHeight_);
    out.push_back(std::move(arg));
    if (!match(TokenKind::Comma)) {
      exprHeight_ = tallest;
      return true;
    }
    ++pos_;
  }
}

bool Parser::parseIntegerLiteral(const Token &token, Expr &out) {
  constexpr uint64_t kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  uint64_t value = 0;
  for (char c : token.text) {
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (kMax - digit) / 10) {
      --pos_;
      return fail("integer literal within 64-bit range");
    }
    value = value * 10 + digit;
  }
  out.kind = Expr::Kind::IntLiteral;
  out.intValue = static_cast<int64_t>(value);
  return true;
}

} // namespace clite
