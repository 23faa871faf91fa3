#include "InterpreterHelpers.h"

#include <limits>

namespace clite::interp {

int64_t wrappingAdd(int64_t left, int64_t right) {
  return static_cast<int64_t>(static_cast<uint64_t>(left) + static_cast<uint64_t>(right));
}

int64_t wrappingSubtract(int64_t left, int64_t right) {
  return static_cast<int64_t>(static_cast<uint64_t>(left) - static_cast<uint64_t>(right));
}

int64_t wrappingMultiply(int64_t left, int64_t right) {
  return static_cast<int64_t>(static_cast<uint64_t>(left) * static_cast<uint64_t>(right));
}

int64_t wrappingNegate(int64_t value) {
  return static_cast<int64_t>(0 - static_cast<uint64_t>(value));
}

int64_t truncatingDivide(int64_t left, int64_t right) {
  if (left == std::numeric_limits<int64_t>::min() && right == -1) {
    return left;
  }
  return left / right;
}

int64_t truncatingModulo(int64_t left, int64_t right) {
  if (right == -1) {
    return 0;
  }
  return left % right;
}

std::string describeOperands(Operator op, const Value &left, const Value &right) {
  return std::string("operator '") + operatorText(op) + "' cannot be applied to " + valueKindName(left.kind) +
         " and " + valueKindName(right.kind);
}

} // namespace clite::interp
