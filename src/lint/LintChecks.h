#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "clite/Linter.h"
#include "clite/Token.h"

namespace clite::lint {

// Token streams passed to the checks hold no Invalid tokens and end with End.
struct LintContext {
  const std::string &path;
  std::vector<LintWarning> &out;

  void warn(const char *code, std::string message, const Token &at) const;
};

void checkMissingSemicolons(const std::vector<Token> &tokens, const LintContext &context);
void checkUndefinedNames(const std::vector<Token> &tokens, const LintContext &context);
void checkLetAnnotations(const std::vector<Token> &tokens, const LintContext &context);
void checkDelimiters(const std::vector<Token> &tokens, const LintContext &context);
void checkControlParens(const std::vector<Token> &tokens, const LintContext &context);

// Index just past the ')' matching the '(' at `open`, or the End token index.
size_t skipParenGroup(const std::vector<Token> &tokens, size_t open);

} // namespace clite::lint
