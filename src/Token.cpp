#include "clite/Token.h"

#include <iomanip>
#include <sstream>

namespace clite {

const char *tokenKindName(TokenKind kind) {
  switch (kind) {
  case TokenKind::Identifier:
    return "identifier";
  case TokenKind::Integer:
    return "integer";
  case TokenKind::String:
    return "string";
  case TokenKind::KeywordLet:
    return "'let'";
  case TokenKind::KeywordFn:
    return "'fn'";
  case TokenKind::KeywordIf:
    return "'if'";
  case TokenKind::KeywordElse:
    return "'else'";
  case TokenKind::KeywordWhile:
    return "'while'";
  case TokenKind::KeywordFor:
    return "'for'";
  case TokenKind::KeywordReturn:
    return "'return'";
  case TokenKind::KeywordBreak:
    return "'break'";
  case TokenKind::KeywordContinue:
    return "'continue'";
  case TokenKind::KeywordTrue:
    return "'true'";
  case TokenKind::KeywordFalse:
    return "'false'";
  case TokenKind::KeywordInt:
    return "'int'";
  case TokenKind::KeywordBool:
    return "'bool'";
  case TokenKind::KeywordString:
    return "'string'";
  case TokenKind::KeywordVoid:
    return "'void'";
  case TokenKind::Plus:
    return "'+'";
  case TokenKind::Minus:
    return "'-'";
  case TokenKind::Star:
    return "'*'";
  case TokenKind::Slash:
    return "'/'";
  case TokenKind::Percent:
    return "'%'";
  case TokenKind::Less:
    return "'<'";
  case TokenKind::LessEqual:
    return "'<='";
  case TokenKind::Greater:
    return "'>'";
  case TokenKind::GreaterEqual:
    return "'>='";
  case TokenKind::EqualEqual:
    return "'=='";
  case TokenKind::BangEqual:
    return "'!='";
  case TokenKind::AndAnd:
    return "'&&'";
  case TokenKind::OrOr:
    return "'||'";
  case TokenKind::Bang:
    return "'!'";
  case TokenKind::Equal:
    return "'='";
  case TokenKind::LParen:
    return "'('";
  case TokenKind::RParen:
    return "')'";
  case TokenKind::LBrace:
    return "'{'";
  case TokenKind::RBrace:
    return "'}'";
  case TokenKind::LBracket:
    return "'['";
  case TokenKind::RBracket:
    return "']'";
  case TokenKind::Comma:
    return "','";
  case TokenKind::Semicolon:
    return "';'";
  case TokenKind::Colon:
    return "':'";
  case TokenKind::Invalid:
    return "invalid token";
  case TokenKind::End:
    return "end of input";
  }
  return "token";
}

bool isKeyword(TokenKind kind) {
  return kind >= TokenKind::KeywordLet && kind <= TokenKind::KeywordVoid;
}

bool isTypeKeyword(TokenKind kind) {
  return kind == TokenKind::KeywordInt || kind == TokenKind::KeywordBool || kind == TokenKind::KeywordString ||
         kind == TokenKind::KeywordVoid;
}

std::string describeToken(const Token &token) {
  switch (token.kind) {
  case TokenKind::Identifier:
    return "identifier '" + token.text + "'";
  case TokenKind::Integer:
    return "integer " + token.text;
  case TokenKind::String:
    return "string " + token.text;
  case TokenKind::Invalid:
    return describeInvalidToken(token);
  default:
    return tokenKindName(token.kind);
  }
}

std::string describeInvalidToken(const Token &token) {
  if (token.text.size() != 1) {
    return token.text.empty() ? "<unknown>" : token.text;
  }
  const unsigned char byte = static_cast<unsigned char>(token.text[0]);
  if (byte >= 0x20 && byte <= 0x7E) {
    return std::string("unexpected character '") + static_cast<char>(byte) + "'";
  }
  std::ostringstream out;
  out << "unexpected character 0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  return out.str();
}

} // namespace clite
