#pragma once

#include <string>
#include <vector>

#include "clite/Diagnostics.h"
#include "clite/Token.h"

namespace clite {

// Text of the Invalid token produced for a string literal that reaches a newline
// or the end of input.
constexpr const char *kUnterminatedStringText = "unterminated string literal";

class Lexer {
public:
  explicit Lexer(const std::string &source);

  // Scans the whole source. Malformed input becomes Invalid tokens and scanning
  // resumes after them; the stream always ends with a single End token.
  std::vector<Token> tokenize();
  // Strict form: fails on the first Invalid token.
  bool tokenize(std::vector<Token> &out, LexError &error);

private:
  bool isIdentifierStart(char c) const;
  bool isIdentifierBody(char c) const;
  bool skipTrivia(Token &invalid);
  void advance();
  char peek(size_t offset = 0) const;

  Token readIdentifier();
  Token readNumber();
  Token readString();
  Token readPunct();

  std::string source_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
};

} // namespace clite
