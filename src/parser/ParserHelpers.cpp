#include "ParserHelpers.h"

namespace clite::parser {

bool binaryOperatorAtLevel(TokenKind kind, int level, Operator &op) {
  switch (level) {
  case 0:
    if (kind == TokenKind::OrOr) {
      op = Operator::Or;
      return true;
    }
    return false;
  case 1:
    if (kind == TokenKind::AndAnd) {
      op = Operator::And;
      return true;
    }
    return false;
  case 2:
    if (kind == TokenKind::EqualEqual) {
      op = Operator::Equal;
      return true;
    }
    if (kind == TokenKind::BangEqual) {
      op = Operator::NotEqual;
      return true;
    }
    return false;
  case 3:
    switch (kind) {
    case TokenKind::Less:
      op = Operator::Less;
      return true;
    case TokenKind::LessEqual:
      op = Operator::LessEqual;
      return true;
    case TokenKind::Greater:
      op = Operator::Greater;
      return true;
    case TokenKind::GreaterEqual:
      op = Operator::GreaterEqual;
      return true;
    default:
      return false;
    }
  case 4:
    if (kind == TokenKind::Plus) {
      op = Operator::Add;
      return true;
    }
    if (kind == TokenKind::Minus) {
      op = Operator::Subtract;
      return true;
    }
    return false;
  case 5:
    switch (kind) {
    case TokenKind::Star:
      op = Operator::Multiply;
      return true;
    case TokenKind::Slash:
      op = Operator::Divide;
      return true;
    case TokenKind::Percent:
      op = Operator::Modulo;
      return true;
    default:
      return false;
    }
  default:
    return false;
  }
}

bool typeNameForToken(TokenKind kind, TypeName &out) {
  switch (kind) {
  case TokenKind::KeywordInt:
    out = TypeName::Int;
    return true;
  case TokenKind::KeywordBool:
    out = TypeName::Bool;
    return true;
  case TokenKind::KeywordString:
    out = TypeName::String;
    return true;
  case TokenKind::KeywordVoid:
    out = TypeName::Void;
    return true;
  default:
    return false;
  }
}

} // namespace clite::parser
