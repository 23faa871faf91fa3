#pragma once

#include <string>
#include <vector>

namespace clite {

struct LintWarning {
  std::string code;
  std::string message;
  std::string file;
  int line = 0;
  int column = 0;
};

struct LintSource {
  std::string path;
  std::string text;
};

// Heuristic checks over the token stream. The linter never parses or runs the
// program, so it reports on malformed sources as well.
//   W001 statement without a terminating ';'
//   W002 name used or assigned without a visible binding
//   W003 'let NAME' without ': TYPE'
//   W004 unbalanced (), {} or []
//   W005 if/while/for not followed by '('
//   W006 unterminated string literal
class Linter {
public:
  // Appends the warnings for every source in order; each file's warnings are
  // sorted by position.
  void lint(const std::vector<LintSource> &sources, std::vector<LintWarning> &out) const;
  void lintSource(const std::string &path, const std::string &text, std::vector<LintWarning> &out) const;
};

std::string formatLintWarning(const LintWarning &warning);

} // namespace clite
