#pragma once

#include <cstdint>
#include <string>

namespace clite {

struct Value {
  enum class Kind { Void, Int, Bool, String } kind = Kind::Void;
  int64_t intValue = 0;
  bool boolValue = false;
  std::string stringValue;

  static Value makeVoid();
  static Value makeInt(int64_t value);
  static Value makeBool(bool value);
  static Value makeString(std::string value);
};

const char *valueKindName(Value::Kind kind);
// Text written by print: decimal integers, true/false, unquoted strings.
std::string renderValue(const Value &value);
bool valuesEqual(const Value &left, const Value &right);

} // namespace clite
