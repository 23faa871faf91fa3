#pragma once

#include <string>

namespace clite {

struct LexError {
  std::string message;
  int line = 0;
  int column = 0;
};

struct ParseError {
  std::string expected;
  std::string found;
  int line = 0;
  int column = 0;

  std::string message() const;
};

enum class RuntimeErrorKind {
  TypeMismatch,
  DivisionByZero,
  UndefinedVariable,
  UndefinedFunction,
  ArityMismatch,
  NonVoidFallthrough,
  StackLimitExceeded,
  DuplicateFunction
};

struct RuntimeError {
  RuntimeErrorKind kind = RuntimeErrorKind::TypeMismatch;
  std::string message;
  int line = 0;
  int column = 0;
};

const char *runtimeErrorKindName(RuntimeErrorKind kind);

// Renders `path:line:column: <stage> error: <message>`.
std::string formatDiagnostic(const std::string &path,
                             int line,
                             int column,
                             const std::string &stage,
                             const std::string &message);

} // namespace clite
