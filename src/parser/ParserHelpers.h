#pragma once

#include "clite/Ast.h"
#include "clite/Token.h"

namespace clite::parser {

constexpr int kLowestBinaryLevel = 0;
constexpr int kHighestBinaryLevel = 5;

// Levels from loosest to tightest: || && equality relational additive multiplicative.
bool binaryOperatorAtLevel(TokenKind kind, int level, Operator &op);
bool typeNameForToken(TokenKind kind, TypeName &out);

} // namespace clite::parser
