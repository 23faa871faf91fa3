#include "clite/Lexer.h"

#include <cctype>
#include <unordered_map>
#include <utility>

namespace clite {

namespace {
bool isAsciiAlpha(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

TokenKind keywordKind(const std::string &text) {
  static const std::unordered_map<std::string, TokenKind> keywords = {
      {"let", TokenKind::KeywordLet},         {"fn", TokenKind::KeywordFn},
      {"if", TokenKind::KeywordIf},           {"else", TokenKind::KeywordElse},
      {"while", TokenKind::KeywordWhile},     {"for", TokenKind::KeywordFor},
      {"return", TokenKind::KeywordReturn},   {"break", TokenKind::KeywordBreak},
      {"continue", TokenKind::KeywordContinue}, {"true", TokenKind::KeywordTrue},
      {"false", TokenKind::KeywordFalse},     {"int", TokenKind::KeywordInt},
      {"bool", TokenKind::KeywordBool},       {"string", TokenKind::KeywordString},
      {"void", TokenKind::KeywordVoid},
  };
  auto it = keywords.find(text);
  if (it == keywords.end()) {
    return TokenKind::Identifier;
  }
  return it->second;
}
} // namespace

Lexer::Lexer(const std::string &source) : source_(source) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    Token invalid;
    if (skipTrivia(invalid)) {
      tokens.push_back(std::move(invalid));
      continue;
    }
    if (pos_ >= source_.size()) {
      tokens.push_back({TokenKind::End, "", line_, column_});
      break;
    }
    char c = source_[pos_];
    if (c == '"') {
      tokens.push_back(readString());
    } else if (isIdentifierStart(c)) {
      tokens.push_back(readIdentifier());
    } else if (isAsciiDigit(c)) {
      tokens.push_back(readNumber());
    } else {
      tokens.push_back(readPunct());
    }
  }
  return tokens;
}

bool Lexer::tokenize(std::vector<Token> &out, LexError &error) {
  out = tokenize();
  for (const auto &token : out) {
    if (token.kind == TokenKind::Invalid) {
      error.message = describeInvalidToken(token);
      error.line = token.line;
      error.column = token.column;
      out.clear();
      return false;
    }
  }
  return true;
}

bool Lexer::isIdentifierStart(char c) const {
  return isAsciiAlpha(c) || c == '_';
}

bool Lexer::isIdentifierBody(char c) const {
  return isAsciiAlpha(c) || isAsciiDigit(c) || c == '_';
}

char Lexer::peek(size_t offset) const {
  if (pos_ + offset >= source_.size()) {
    return '\0';
  }
  return source_[pos_ + offset];
}

void Lexer::advance() {
  if (pos_ >= source_.size()) {
    return;
  }
  if (source_[pos_] == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  ++pos_;
}

bool Lexer::skipTrivia(Token &invalid) {
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (std::isspace(static_cast<unsigned char>(c))) {
      advance();
      continue;
    }
    if (c == '/' && peek(1) == '/') {
      while (pos_ < source_.size() && source_[pos_] != '\n') {
        advance();
      }
      continue;
    }
    if (c == '/' && peek(1) == '*') {
      int startLine = line_;
      int startColumn = column_;
      advance();
      advance();
      bool closed = false;
      while (pos_ < source_.size()) {
        if (source_[pos_] == '*' && peek(1) == '/') {
          advance();
          advance();
          closed = true;
          break;
        }
        advance();
      }
      if (!closed) {
        invalid = {TokenKind::Invalid, "unterminated block comment", startLine, startColumn};
        return true;
      }
      continue;
    }
    break;
  }
  return false;
}

Token Lexer::readIdentifier() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  while (pos_ < source_.size() && isIdentifierBody(source_[pos_])) {
    advance();
  }
  std::string text = source_.substr(start, pos_ - start);
  return {keywordKind(text), text, startLine, startColumn};
}

Token Lexer::readNumber() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  while (pos_ < source_.size() && isAsciiDigit(source_[pos_])) {
    advance();
  }
  return {TokenKind::Integer, source_.substr(start, pos_ - start), startLine, startColumn};
}

Token Lexer::readString() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  advance();
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (c == '\n') {
      break;
    }
    if (c == '\\') {
      advance();
      if (pos_ < source_.size() && source_[pos_] != '\n') {
        advance();
      }
      continue;
    }
    if (c == '"') {
      advance();
      return {TokenKind::String, source_.substr(start, pos_ - start), startLine, startColumn};
    }
    advance();
  }
  return {TokenKind::Invalid, kUnterminatedStringText, startLine, startColumn};
}

Token Lexer::readPunct() {
  int startLine = line_;
  int startColumn = column_;
  char c = source_[pos_];
  char next = peek(1);
  auto twoChar = [&](TokenKind kind, const char *text) -> Token {
    advance();
    advance();
    return {kind, text, startLine, startColumn};
  };
  switch (c) {
  case '<':
    if (next == '=') {
      return twoChar(TokenKind::LessEqual, "<=");
    }
    break;
  case '>':
    if (next == '=') {
      return twoChar(TokenKind::GreaterEqual, ">=");
    }
    break;
  case '=':
    if (next == '=') {
      return twoChar(TokenKind::EqualEqual, "==");
    }
    break;
  case '!':
    if (next == '=') {
      return twoChar(TokenKind::BangEqual, "!=");
    }
    break;
  case '&':
    if (next == '&') {
      return twoChar(TokenKind::AndAnd, "&&");
    }
    break;
  case '|':
    if (next == '|') {
      return twoChar(TokenKind::OrOr, "||");
    }
    break;
  default:
    break;
  }
  advance();
  switch (c) {
  case '+':
    return {TokenKind::Plus, "+", startLine, startColumn};
  case '-':
    return {TokenKind::Minus, "-", startLine, startColumn};
  case '*':
    return {TokenKind::Star, "*", startLine, startColumn};
  case '/':
    return {TokenKind::Slash, "/", startLine, startColumn};
  case '%':
    return {TokenKind::Percent, "%", startLine, startColumn};
  case '<':
    return {TokenKind::Less, "<", startLine, startColumn};
  case '>':
    return {TokenKind::Greater, ">", startLine, startColumn};
  case '!':
    return {TokenKind::Bang, "!", startLine, startColumn};
  case '=':
    return {TokenKind::Equal, "=", startLine, startColumn};
  case '(':
    return {TokenKind::LParen, "(", startLine, startColumn};
  case ')':
    return {TokenKind::RParen, ")", startLine, startColumn};
  case '{':
    return {TokenKind::LBrace, "{", startLine, startColumn};
  case '}':
    return {TokenKind::RBrace, "}", startLine, startColumn};
  case '[':
    return {TokenKind::LBracket, "[", startLine, startColumn};
  case ']':
    return {TokenKind::RBracket, "]", startLine, startColumn};
  case ',':
    return {TokenKind::Comma, ",", startLine, startColumn};
  case ';':
    return {TokenKind::Semicolon, ";", startLine, startColumn};
  case ':':
    return {TokenKind::Colon, ":", startLine, startColumn};
  default:
    return {TokenKind::Invalid, std::string(1, c), startLine, startColumn};
  }
}

} // namespace clite
