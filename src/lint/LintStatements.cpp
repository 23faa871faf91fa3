#include "LintChecks.h"

namespace clite::lint {
namespace {

bool startsSimpleStatement(TokenKind kind) {
  switch (kind) {
  case TokenKind::KeywordLet:
  case TokenKind::KeywordReturn:
  case TokenKind::KeywordBreak:
  case TokenKind::KeywordContinue:
  case TokenKind::Identifier:
  case TokenKind::Integer:
  case TokenKind::String:
  case TokenKind::KeywordTrue:
  case TokenKind::KeywordFalse:
  case TokenKind::LParen:
  case TokenKind::Bang:
  case TokenKind::Minus:
    return true;
  default:
    return false;
  }
}

bool isStatementKeyword(TokenKind kind) {
  switch (kind) {
  case TokenKind::KeywordLet:
  case TokenKind::KeywordFn:
  case TokenKind::KeywordIf:
  case TokenKind::KeywordElse:
  case TokenKind::KeywordWhile:
  case TokenKind::KeywordFor:
  case TokenKind::KeywordReturn:
  case TokenKind::KeywordBreak:
  case TokenKind::KeywordContinue:
    return true;
  default:
    return false;
  }
}

bool endsExpression(TokenKind kind) {
  switch (kind) {
  case TokenKind::Identifier:
  case TokenKind::Integer:
  case TokenKind::String:
  case TokenKind::KeywordTrue:
  case TokenKind::KeywordFalse:
  case TokenKind::KeywordBreak:
  case TokenKind::KeywordContinue:
  case TokenKind::RParen:
  case TokenKind::RBracket:
    return true;
  default:
    return false;
  }
}

// Skips a function header up to (not including) its body brace.
size_t skipFunctionHeader(const std::vector<Token> &tokens, size_t i) {
  int parens = 0;
  ++i;
  while (tokens[i].kind != TokenKind::End) {
    TokenKind kind = tokens[i].kind;
    if (kind == TokenKind::LParen) {
      ++parens;
    } else if (kind == TokenKind::RParen) {
      if (parens > 0) {
        --parens;
      }
    } else if (parens == 0 && (kind == TokenKind::LBrace || kind == TokenKind::RBrace ||
                               kind == TokenKind::Semicolon)) {
      break;
    }
    ++i;
  }
  return i;
}

// Skips an if/while/for header: a parenthesized group when present, otherwise
// everything up to the body brace.
size_t skipControlHeader(const std::vector<Token> &tokens, size_t i) {
  ++i;
  if (tokens[i].kind == TokenKind::LParen) {
    return skipParenGroup(tokens, i);
  }
  while (tokens[i].kind != TokenKind::End && tokens[i].kind != TokenKind::LBrace &&
         tokens[i].kind != TokenKind::RBrace && tokens[i].kind != TokenKind::Semicolon) {
    ++i;
  }
  return i;
}

} // namespace

void checkMissingSemicolons(const std::vector<Token> &tokens, const LintContext &context) {
  size_t i = 0;
  bool atStatementStart = true;
  while (i < tokens.size() && tokens[i].kind != TokenKind::End) {
    const Token &token = tokens[i];
    switch (token.kind) {
    case TokenKind::LBrace:
    case TokenKind::RBrace:
    case TokenKind::Semicolon:
    case TokenKind::KeywordElse:
      atStatementStart = true;
      ++i;
      continue;
    case TokenKind::KeywordFn:
      i = skipFunctionHeader(tokens, i);
      atStatementStart = true;
      continue;
    case TokenKind::KeywordIf:
    case TokenKind::KeywordWhile:
    case TokenKind::KeywordFor:
      i = skipControlHeader(tokens, i);
      atStatementStart = true;
      continue;
    default:
      break;
    }
    if (!atStatementStart || !startsSimpleStatement(token.kind)) {
      atStatementStart = false;
      ++i;
      continue;
    }

    int nesting = 0;
    size_t j = i;
    const Token *last = nullptr;
    bool terminated = false;
    while (true) {
      const Token &current = tokens[j];
      if (current.kind == TokenKind::End) {
        break;
      }
      if (nesting == 0) {
        if (current.kind == TokenKind::Semicolon) {
          terminated = true;
          break;
        }
        if (current.kind == TokenKind::LBrace || current.kind == TokenKind::RBrace) {
          break;
        }
        if (j > i && isStatementKeyword(current.kind)) {
          break;
        }
        if (last && current.kind == TokenKind::Identifier && current.line > last->line &&
            endsExpression(last->kind)) {
          break;
        }
      }
      if (current.kind == TokenKind::LParen || current.kind == TokenKind::LBracket) {
        ++nesting;
      } else if ((current.kind == TokenKind::RParen || current.kind == TokenKind::RBracket) && nesting > 0) {
        --nesting;
      }
      last = &current;
      ++j;
    }

    if (terminated) {
      i = j + 1;
    } else {
      context.warn("W001", "missing ';' at end of statement", last ? *last : token);
      i = j;
    }
    atStatementStart = true;
  }
}

} // namespace clite::lint
