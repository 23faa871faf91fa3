#include "clite/Ast.h"

namespace clite {

const char *typeNameText(TypeName type) {
  switch (type) {
  case TypeName::Int:
    return "int";
  case TypeName::Bool:
    return "bool";
  case TypeName::String:
    return "string";
  case TypeName::Void:
    return "void";
  }
  return "?";
}

const char *operatorText(Operator op) {
  switch (op) {
  case Operator::Add:
    return "+";
  case Operator::Subtract:
  case Operator::Negate:
    return "-";
  case Operator::Multiply:
    return "*";
  case Operator::Divide:
    return "/";
  case Operator::Modulo:
    return "%";
  case Operator::Less:
    return "<";
  case Operator::LessEqual:
    return "<=";
  case Operator::Greater:
    return ">";
  case Operator::GreaterEqual:
    return ">=";
  case Operator::Equal:
    return "==";
  case Operator::NotEqual:
    return "!=";
  case Operator::And:
    return "&&";
  case Operator::Or:
    return "||";
  case Operator::Not:
    return "!";
  }
  return "?";
}

} // namespace clite
