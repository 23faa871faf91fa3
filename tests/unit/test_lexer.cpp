#include "clite/Lexer.h"

#include <doctest/doctest.h>

namespace {
std::vector<clite::Token> lex(const std::string &source) {
  clite::Lexer lexer(source);
  return lexer.tokenize();
}

bool lexStrict(const std::string &source, clite::LexError &error) {
  clite::Lexer lexer(source);
  std::vector<clite::Token> tokens;
  return lexer.tokenize(tokens, error);
}
} // namespace

TEST_SUITE_BEGIN("clite.lexer");

TEST_CASE("lexes function header with positions") {
  const auto tokens = lex("fn add(a: int): int {");
  REQUIRE(tokens.size() == 11);
  CHECK(tokens[0].kind == clite::TokenKind::KeywordFn);
  CHECK(tokens[1].kind == clite::TokenKind::Identifier);
  CHECK(tokens[1].text == "add");
  CHECK(tokens[1].column == 4);
  CHECK(tokens[2].kind == clite::TokenKind::LParen);
  CHECK(tokens[4].kind == clite::TokenKind::Colon);
  CHECK(tokens[5].kind == clite::TokenKind::KeywordInt);
  CHECK(tokens[9].kind == clite::TokenKind::LBrace);
  CHECK(tokens[10].kind == clite::TokenKind::End);
}

TEST_CASE("lexes every keyword") {
  const auto tokens = lex("let fn if else while for return break continue true false int bool string void");
  REQUIRE(tokens.size() == 16);
  for (size_t i = 0; i + 1 < tokens.size(); ++i) {
    CHECK(clite::isKeyword(tokens[i].kind));
  }
  CHECK(tokens[13].kind == clite::TokenKind::KeywordString);
  CHECK(clite::isTypeKeyword(tokens[14].kind));
}

TEST_CASE("identifiers may start with underscore and contain digits") {
  const auto tokens = lex("_tmp1 letter");
  REQUIRE(tokens.size() == 3);
  CHECK(tokens[0].kind == clite::TokenKind::Identifier);
  CHECK(tokens[0].text == "_tmp1");
  CHECK(tokens[1].kind == clite::TokenKind::Identifier);
  CHECK(tokens[1].text == "letter");
}

TEST_CASE("matches two-character operators greedily") {
  const auto tokens = lex("<= >= == != && || < > = !");
  REQUIRE(tokens.size() == 11);
  CHECK(tokens[0].kind == clite::TokenKind::LessEqual);
  CHECK(tokens[1].kind == clite::TokenKind::GreaterEqual);
  CHECK(tokens[2].kind == clite::TokenKind::EqualEqual);
  CHECK(tokens[3].kind == clite::TokenKind::BangEqual);
  CHECK(tokens[4].kind == clite::TokenKind::AndAnd);
  CHECK(tokens[5].kind == clite::TokenKind::OrOr);
  CHECK(tokens[6].kind == clite::TokenKind::Less);
  CHECK(tokens[7].kind == clite::TokenKind::Greater);
  CHECK(tokens[8].kind == clite::TokenKind::Equal);
  CHECK(tokens[9].kind == clite::TokenKind::Bang);
}

TEST_CASE("minus is never part of an integer literal") {
  const auto tokens = lex("-42");
  REQUIRE(tokens.size() == 3);
  CHECK(tokens[0].kind == clite::TokenKind::Minus);
  CHECK(tokens[1].kind == clite::TokenKind::Integer);
  CHECK(tokens[1].text == "42");
}

TEST_CASE("skips line and multi-line block comments") {
  const auto tokens = lex("a // trailing\n/* spans\nlines */ b");
  REQUIRE(tokens.size() == 3);
  CHECK(tokens[0].text == "a");
  CHECK(tokens[1].text == "b");
  CHECK(tokens[1].line == 3);
  CHECK(tokens[1].column == 10);
}

TEST_CASE("keeps escapes inside string literal text") {
  const auto tokens = lex("\"say \\\"hi\\\" \\\\ now\"");
  REQUIRE(tokens.size() == 2);
  CHECK(tokens[0].kind == clite::TokenKind::String);
  CHECK(tokens[0].text == "\"say \\\"hi\\\" \\\\ now\"");
}

TEST_CASE("tracks lines and columns") {
  const auto tokens = lex("let x\n  = 1;");
  REQUIRE(tokens.size() == 6);
  CHECK(tokens[2].line == 2);
  CHECK(tokens[2].column == 3);
  CHECK(tokens[3].line == 2);
  CHECK(tokens[3].column == 5);
}

TEST_CASE("lenient scan continues after invalid characters") {
  const auto tokens = lex("a @ b");
  REQUIRE(tokens.size() == 4);
  CHECK(tokens[1].kind == clite::TokenKind::Invalid);
  CHECK(tokens[1].text == "@");
  CHECK(tokens[2].text == "b");
  CHECK(tokens[3].kind == clite::TokenKind::End);
}

TEST_CASE("lenient scan marks unterminated strings and resumes on the next line") {
  const auto tokens = lex("print(\"oops);\nx");
  REQUIRE(tokens.size() == 5);
  CHECK(tokens[2].kind == clite::TokenKind::Invalid);
  CHECK(tokens[2].text == clite::kUnterminatedStringText);
  CHECK(tokens[2].column == 7);
  CHECK(tokens[3].text == "x");
  CHECK(tokens[3].line == 2);
}

TEST_CASE("end token is emitted for empty input") {
  const auto tokens = lex("");
  REQUIRE(tokens.size() == 1);
  CHECK(tokens[0].kind == clite::TokenKind::End);
  CHECK(tokens[0].line == 1);
  CHECK(tokens[0].column == 1);
}

TEST_SUITE_END();

TEST_SUITE_BEGIN("clite.lexer.errors");

TEST_CASE("unterminated string is a lex error") {
  clite::LexError error;
  CHECK_FALSE(lexStrict("let s: string = \"abc;\nprint(s);", error));
  CHECK(error.message == "unterminated string literal");
  CHECK(error.line == 1);
  CHECK(error.column == 17);
}

TEST_CASE("unterminated block comment is a lex error") {
  clite::LexError error;
  CHECK_FALSE(lexStrict("fn main(): void {}\n/* never closed", error));
  CHECK(error.message == "unterminated block comment");
  CHECK(error.line == 2);
  CHECK(error.column == 1);
}

TEST_CASE("unexpected character is a lex error") {
  clite::LexError error;
  CHECK_FALSE(lexStrict("let a: int = 1 # 2;", error));
  CHECK(error.message == "unexpected character '#'");
  CHECK(error.column == 16);
}

TEST_CASE("single ampersand is rejected") {
  clite::LexError error;
  CHECK_FALSE(lexStrict("a & b", error));
  CHECK(error.message == "unexpected character '&'");
}

TEST_CASE("strict scan succeeds on clean input") {
  clite::LexError error;
  CHECK(lexStrict("fn main(): void { print(\"ok\"); }", error));
  CHECK(error.message.empty());
}

TEST_SUITE_END();
