#include "clite/Linter.h"
#include "clite/Lexer.h"

#include "LintChecks.h"

#include <algorithm>
#include <utility>

namespace clite {
using namespace lint;

namespace lint {
void LintContext::warn(const char *code, std::string message, const Token &at) const {
  LintWarning warning;
  warning.code = code;
  warning.message = std::move(message);
  warning.file = path;
  warning.line = at.line;
  warning.column = at.column;
  out.push_back(std::move(warning));
}

size_t skipParenGroup(const std::vector<Token> &tokens, size_t open) {
  int depth = 0;
  size_t i = open;
  while (i < tokens.size() && tokens[i].kind != TokenKind::End) {
    if (tokens[i].kind == TokenKind::LParen) {
      ++depth;
    } else if (tokens[i].kind == TokenKind::RParen) {
      --depth;
      if (depth <= 0) {
        return i + 1;
      }
    }
    ++i;
  }
  return tokens.empty() ? 0 : tokens.size() - 1;
}
} // namespace lint

void Linter::lint(const std::vector<LintSource> &sources, std::vector<LintWarning> &out) const {
  for (const auto &source : sources) {
    lintSource(source.path, source.text, out);
  }
}

void Linter::lintSource(const std::string &path, const std::string &text, std::vector<LintWarning> &out) const {
  std::vector<LintWarning> fileWarnings;
  LintContext context{path, fileWarnings};

  Lexer lexer(text);
  std::vector<Token> scanned = lexer.tokenize();
  std::vector<Token> tokens;
  tokens.reserve(scanned.size());
  for (auto &token : scanned) {
    if (token.kind == TokenKind::Invalid) {
      if (token.text == kUnterminatedStringText) {
        context.warn("W006", "unterminated string literal", token);
      }
      continue;
    }
    tokens.push_back(std::move(token));
  }

  checkMissingSemicolons(tokens, context);
  checkUndefinedNames(tokens, context);
  checkLetAnnotations(tokens, context);
  checkDelimiters(tokens, context);
  checkControlParens(tokens, context);

  std::stable_sort(fileWarnings.begin(), fileWarnings.end(), [](const LintWarning &a, const LintWarning &b) {
    if (a.line != b.line) {
      return a.line < b.line;
    }
    return a.column < b.column;
  });
  for (auto &warning : fileWarnings) {
    out.push_back(std::move(warning));
  }
}

std::string formatLintWarning(const LintWarning &warning) {
  return warning.file + ":" + std::to_string(warning.line) + ":" + std::to_string(warning.column) + ": " +
         warning.code + " " + warning.message;
}

} // namespace clite
