#include "clite/Diagnostics.h"

#include <sstream>

namespace clite {

std::string ParseError::message() const {
  if (found.empty()) {
    return "expected " + expected;
  }
  return "expected " + expected + ", found " + found;
}

const char *runtimeErrorKindName(RuntimeErrorKind kind) {
  switch (kind) {
  case RuntimeErrorKind::TypeMismatch:
    return "TypeMismatch";
  case RuntimeErrorKind::DivisionByZero:
    return "DivisionByZero";
  case RuntimeErrorKind::UndefinedVariable:
    return "UndefinedVariable";
  case RuntimeErrorKind::UndefinedFunction:
    return "UndefinedFunction";
  case RuntimeErrorKind::ArityMismatch:
    return "ArityMismatch";
  case RuntimeErrorKind::NonVoidFallthrough:
    return "NonVoidFallthrough";
  case RuntimeErrorKind::StackLimitExceeded:
    return "StackLimitExceeded";
  case RuntimeErrorKind::DuplicateFunction:
    return "DuplicateFunction";
  }
  return "Unknown";
}

std::string formatDiagnostic(const std::string &path,
                             int line,
                             int column,
                             const std::string &stage,
                             const std::string &message) {
  std::ostringstream out;
  out << path << ":" << line << ":" << column << ": " << stage << " error: " << message;
  return out.str();
}

} // namespace clite
