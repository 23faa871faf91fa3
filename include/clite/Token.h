#pragma once

#include <string>

namespace clite {

enum class TokenKind {
  Identifier,
  Integer,
  String,
  KeywordLet,
  KeywordFn,
  KeywordIf,
  KeywordElse,
  KeywordWhile,
  KeywordFor,
  KeywordReturn,
  KeywordBreak,
  KeywordContinue,
  KeywordTrue,
  KeywordFalse,
  KeywordInt,
  KeywordBool,
  KeywordString,
  KeywordVoid,
  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  EqualEqual,
  BangEqual,
  AndAnd,
  OrOr,
  Bang,
  Equal,
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,
  Semicolon,
  Colon,
  Invalid,
  End
};

struct Token {
  TokenKind kind = TokenKind::End;
  std::string text;
  int line = 1;
  int column = 1;
};

const char *tokenKindName(TokenKind kind);
bool isKeyword(TokenKind kind);
bool isTypeKeyword(TokenKind kind);
std::string describeToken(const Token &token);
std::string describeInvalidToken(const Token &token);

} // namespace clite
