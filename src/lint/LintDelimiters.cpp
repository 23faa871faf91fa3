#include "LintChecks.h"

namespace clite::lint {
namespace {

bool isOpening(TokenKind kind) {
  return kind == TokenKind::LParen || kind == TokenKind::LBrace || kind == TokenKind::LBracket;
}

TokenKind closingFor(TokenKind kind) {
  switch (kind) {
  case TokenKind::LParen:
    return TokenKind::RParen;
  case TokenKind::LBrace:
    return TokenKind::RBrace;
  default:
    return TokenKind::RBracket;
  }
}

bool isClosing(TokenKind kind) {
  return kind == TokenKind::RParen || kind == TokenKind::RBrace || kind == TokenKind::RBracket;
}

} // namespace

void checkLetAnnotations(const std::vector<Token> &tokens, const LintContext &context) {
  for (size_t i = 0; i + 2 < tokens.size(); ++i) {
    if (tokens[i].kind != TokenKind::KeywordLet || tokens[i + 1].kind != TokenKind::Identifier) {
      continue;
    }
    if (tokens[i + 2].kind != TokenKind::Colon) {
      context.warn("W003", "missing ': TYPE' annotation for '" + tokens[i + 1].text + "'", tokens[i + 1]);
    }
  }
}

void checkDelimiters(const std::vector<Token> &tokens, const LintContext &context) {
  std::vector<const Token *> open;
  for (const auto &token : tokens) {
    if (isOpening(token.kind)) {
      open.push_back(&token);
      continue;
    }
    if (!isClosing(token.kind)) {
      continue;
    }
    if (!open.empty() && closingFor(open.back()->kind) == token.kind) {
      open.pop_back();
      continue;
    }
    context.warn("W004", "unmatched '" + token.text + "'", token);
  }
  for (const Token *token : open) {
    context.warn("W004", "unclosed '" + token->text + "'", *token);
  }
}

void checkControlParens(const std::vector<Token> &tokens, const LintContext &context) {
  for (size_t i = 0; i + 1 < tokens.size(); ++i) {
    TokenKind kind = tokens[i].kind;
    if (kind != TokenKind::KeywordIf && kind != TokenKind::KeywordWhile && kind != TokenKind::KeywordFor) {
      continue;
    }
    if (tokens[i + 1].kind != TokenKind::LParen) {
      context.warn("W005", "expected '(' after '" + tokens[i].text + "'", tokens[i]);
    }
  }
}

} // namespace clite::lint
