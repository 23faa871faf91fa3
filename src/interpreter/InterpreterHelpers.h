#pragma once

#include <cstdint>
#include <string>

#include "clite/Ast.h"
#include "clite/Value.h"

namespace clite::interp {

// Two's-complement wraparound arithmetic on 64-bit integers.
int64_t wrappingAdd(int64_t left, int64_t right);
int64_t wrappingSubtract(int64_t left, int64_t right);
int64_t wrappingMultiply(int64_t left, int64_t right);
int64_t wrappingNegate(int64_t value);
// Callers rule out a zero divisor. INT64_MIN / -1 wraps to INT64_MIN.
int64_t truncatingDivide(int64_t left, int64_t right);
int64_t truncatingModulo(int64_t left, int64_t right);

std::string describeOperands(Operator op, const Value &left, const Value &right);

} // namespace clite::interp
