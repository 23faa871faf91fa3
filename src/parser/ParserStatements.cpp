#include "clite/Parser.h"

#include "ParserHelpers.h"

#include <utility>

namespace clite {
using namespace parser;

bool Parser::parseBlock(Block &out) {
  DepthGuard depthGuard(*this);
  if (!checkDepth()) {
    return false;
  }
  const Token &open = current();
  out.line = open.line;
  out.column = open.column;
  if (!expect(TokenKind::LBrace, "'{'")) {
    return false;
  }
  while (!match(TokenKind::RBrace)) {
    if (match(TokenKind::End)) {
      return fail("'}' to close block");
    }
    Stmt stmt;
    if (!parseStatement(stmt)) {
      return false;
    }
    out.statements.push_back(std::move(stmt));
  }
  return expect(TokenKind::RBrace, "'}'");
}

bool Parser::parseStatement(Stmt &out) {
  const Token &start = current();
  out.line = start.line;
  out.column = start.column;
  switch (start.kind) {
  case TokenKind::KeywordLet:
    return parseLetDecl(out, true);
  case TokenKind::KeywordIf:
    return parseIf(out);
  case TokenKind::KeywordWhile:
    return parseWhile(out);
  case TokenKind::KeywordFor:
    return parseFor(out);
  case TokenKind::KeywordReturn:
    return parseReturn(out);
  case TokenKind::KeywordBreak:
  case TokenKind::KeywordContinue:
    return parseLoopControl(out);
  case TokenKind::LBrace:
    out.kind = Stmt::Kind::Block;
    return parseBlock(out.body);
  case TokenKind::Identifier:
    if (lookahead(1).kind == TokenKind::Equal) {
      return parseAssignment(out, true);
    }
    break;
  default:
    break;
  }
  out.kind = Stmt::Kind::ExprStmt;
  out.hasExpr = true;
  if (!parseExpr(out.expr)) {
    return false;
  }
  return expect(TokenKind::Semicolon, "';' after expression statement");
}

bool Parser::parseLetDecl(Stmt &out, bool requireSemicolon) {
  out.kind = Stmt::Kind::Let;
  out.line = current().line;
  out.column = current().column;
  if (!expect(TokenKind::KeywordLet, "'let'")) {
    return false;
  }
  Token name;
  if (!consume(TokenKind::Identifier, "variable name after 'let'", name)) {
    return false;
  }
  out.name = name.text;
  if (!expect(TokenKind::Colon, "':' and a type annotation after variable name")) {
    return false;
  }
  if (!parseTypeName(out.type, false)) {
    return false;
  }
  if (!expect(TokenKind::Equal, "'=' after variable type")) {
    return false;
  }
  out.hasExpr = true;
  if (!parseExpr(out.expr)) {
    return false;
  }
  if (!requireSemicolon) {
    return true;
  }
  return expect(TokenKind::Semicolon, "';' after variable declaration");
}

bool Parser::parseAssignment(Stmt &out, bool requireSemicolon) {
  out.kind = Stmt::Kind::Assign;
  Token name;
  if (!consume(TokenKind::Identifier, "assignment target", name)) {
    return false;
  }
  out.name = name.text;
  out.line = name.line;
  out.column = name.column;
  if (!expect(TokenKind::Equal, "'=' in assignment")) {
    return false;
  }
  out.hasExpr = true;
  if (!parseExpr(out.expr)) {
    return false;
  }
  if (!requireSemicolon) {
    return true;
  }
  return expect(TokenKind::Semicolon, "';' after assignment");
}

bool Parser::parseIf(Stmt &out) {
  out.kind = Stmt::Kind::If;
  if (!expect(TokenKind::KeywordIf, "'if'")) {
    return false;
  }
  if (!expect(TokenKind::LParen, "'(' after 'if'")) {
    return false;
  }
  out.hasExpr = true;
  if (!parseExpr(out.expr)) {
    return false;
  }
  if (!expect(TokenKind::RParen, "')' after if condition")) {
    return false;
  }
  if (!parseBlock(out.body)) {
    return false;
  }
  if (!match(TokenKind::KeywordElse)) {
    return true;
  }
  ++pos_;
  out.hasElse = true;
  if (match(TokenKind::KeywordIf)) {
    DepthGuard depthGuard(*this);
    if (!checkDepth()) {
      return false;
    }
    Stmt nested;
    nested.line = current().line;
    nested.column = current().column;
    out.elseBody.line = nested.line;
    out.elseBody.column = nested.column;
    if (!parseIf(nested)) {
      return false;
    }
    out.elseBody.statements.push_back(std::move(nested));
    return true;
  }
  return parseBlock(out.elseBody);
}

bool Parser::parseWhile(Stmt &out) {
  out.kind = Stmt::Kind::While;
  if (!expect(TokenKind::KeywordWhile, "'while'")) {
    return false;
  }
  if (!expect(TokenKind::LParen, "'(' after 'while'")) {
    return false;
  }
  out.hasExpr = true;
  if (!parseExpr(out.expr)) {
    return false;
  }
  if (!expect(TokenKind::RParen, "')' after while condition")) {
    return false;
  }
  LoopGuard loopGuard(*this);
  return parseBlock(out.body);
}

bool Parser::parseFor(Stmt &out) {
  out.kind = Stmt::Kind::For;
  if (!expect(TokenKind::KeywordFor, "'for'")) {
    return false;
  }
  if (!expect(TokenKind::LParen, "'(' after 'for'")) {
    return false;
  }
  if (match(TokenKind::KeywordLet)) {
    Stmt init;
    if (!parseLetDecl(init, false)) {
      return false;
    }
    out.init.push_back(std::move(init));
  } else if (match(TokenKind::Identifier)) {
    Stmt init;
    if (!parseAssignment(init, false)) {
      return false;
    }
    out.init.push_back(std::move(init));
  }
  if (!expect(TokenKind::Semicolon, "';' after for initializer")) {
    return false;
  }
  if (!match(TokenKind::Semicolon)) {
    out.hasExpr = true;
    if (!parseExpr(out.expr)) {
      return false;
    }
  }
  if (!expect(TokenKind::Semicolon, "';' after for condition")) {
    return false;
  }
  if (match(TokenKind::Identifier)) {
    Stmt step;
    if (!parseAssignment(step, false)) {
      return false;
    }
    out.step.push_back(std::move(step));
  }
  if (!expect(TokenKind::RParen, "')' after for clauses")) {
    return false;
  }
  LoopGuard loopGuard(*this);
  return parseBlock(out.body);
}

bool Parser::parseReturn(Stmt &out) {
  out.kind = Stmt::Kind::Return;
  if (!expect(TokenKind::KeywordReturn, "'return'")) {
    return false;
  }
  if (match(TokenKind::Semicolon)) {
    ++pos_;
    return true;
  }
  out.hasExpr = true;
  if (!parseExpr(out.expr)) {
    return false;
  }
  return expect(TokenKind::Semicolon, "';' after return value");
}

bool Parser::parseLoopControl(Stmt &out) {
  const bool isBreak = match(TokenKind::KeywordBreak);
  out.kind = isBreak ? Stmt::Kind::Break : Stmt::Kind::Continue;
  if (loopDepth_ == 0) {
    return fail(isBreak ? "a loop around 'break'" : "a loop around 'continue'");
  }
  ++pos_;
  return expect(TokenKind::Semicolon, isBreak ? "';' after 'break'" : "';' after 'continue'");
}

} // namespace clite
