#include "clite/Value.h"

#include <utility>

namespace clite {

Value Value::makeVoid() {
  return Value();
}

Value Value::makeInt(int64_t value) {
  Value out;
  out.kind = Kind::Int;
  out.intValue = value;
  return out;
}

Value Value::makeBool(bool value) {
  Value out;
  out.kind = Kind::Bool;
  out.boolValue = value;
  return out;
}

Value Value::makeString(std::string value) {
  Value out;
  out.kind = Kind::String;
  out.stringValue = std::move(value);
  return out;
}

const char *valueKindName(Value::Kind kind) {
  switch (kind) {
  case Value::Kind::Void:
    return "void";
  case Value::Kind::Int:
    return "int";
  case Value::Kind::Bool:
    return "bool";
  case Value::Kind::String:
    return "string";
  }
  return "unknown";
}

std::string renderValue(const Value &value) {
  switch (value.kind) {
  case Value::Kind::Void:
    return "void";
  case Value::Kind::Int:
    return std::to_string(value.intValue);
  case Value::Kind::Bool:
    return value.boolValue ? "true" : "false";
  case Value::Kind::String:
    return value.stringValue;
  }
  return "";
}

bool valuesEqual(const Value &left, const Value &right) {
  if (left.kind != right.kind) {
    return false;
  }
  switch (left.kind) {
  case Value::Kind::Void:
    return true;
  case Value::Kind::Int:
    return left.intValue == right.intValue;
  case Value::Kind::Bool:
    return left.boolValue == right.boolValue;
  case Value::Kind::String:
    return left.stringValue == right.stringValue;
  }
  return false;
}

} // namespace clite
