#include "LintChecks.h"

#include <string>
#include <unordered_set>
#include <utility>

namespace clite::lint {
namespace {

class BindingTracker {
public:
  BindingTracker() : scopes_(1) {}

  void pushScope() {
    flushPending();
    scopes_.emplace_back();
    for (auto &name : params_) {
      scopes_.back().insert(std::move(name));
    }
    params_.clear();
  }

  void popScope() {
    flushPending();
    if (scopes_.size() <= 1) {
      return;
    }
    const size_t depth = scopes_.size();
    scopes_.pop_back();
    if (!loopBodies_.empty() && loopBodies_.back() == depth) {
      loopBodies_.pop_back();
      popLoopHeader();
    }
  }

  // The bindings of a for header live in their own scope, which closes
  // together with the loop body.
  void pushLoopHeader() {
    flushPending();
    scopes_.emplace_back();
  }

  void popLoopHeader() {
    flushPending();
    if (scopes_.size() > 1) {
      scopes_.pop_back();
    }
  }

  void expectLoopBody() { loopBodies_.push_back(scopes_.size() + 1); }

  void declare(const std::string &name, int line) {
    flushPending();
    pending_ = name;
    pendingLine_ = line;
    hasPending_ = true;
  }

  void addParam(const std::string &name) { params_.push_back(name); }

  // A let binding becomes visible once its declaration statement ends. A
  // declaration missing its ';' is treated as ended at the next line.
  void flushPending() {
    if (hasPending_) {
      scopes_.back().insert(pending_);
      hasPending_ = false;
    }
  }

  void flushPendingBefore(int line) {
    if (hasPending_ && line > pendingLine_) {
      flushPending();
    }
  }

  bool isVisible(const std::string &name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
      if (it->count(name) > 0) {
        return true;
      }
    }
    return false;
  }

private:
  std::vector<std::unordered_set<std::string>> scopes_;
  std::vector<std::string> params_;
  std::vector<size_t> loopBodies_;
  std::string pending_;
  int pendingLine_ = 0;
  bool hasPending_ = false;
};

} // namespace

void checkUndefinedNames(const std::vector<Token> &tokens, const LintContext &context) {
  std::unordered_set<std::string> functions;
  functions.insert("print");
  for (size_t i = 0; i + 1 < tokens.size(); ++i) {
    if (tokens[i].kind == TokenKind::KeywordFn && tokens[i + 1].kind == TokenKind::Identifier) {
      functions.insert(tokens[i + 1].text);
    }
  }

  BindingTracker bindings;
  std::vector<size_t> headerCloses;
  size_t i = 0;
  while (i < tokens.size() && tokens[i].kind != TokenKind::End) {
    const Token &token = tokens[i];
    if (!headerCloses.empty() && i == headerCloses.back()) {
      headerCloses.pop_back();
      if (tokens[i + 1].kind == TokenKind::LBrace) {
        bindings.expectLoopBody();
      } else {
        bindings.popLoopHeader();
      }
      ++i;
      continue;
    }
    switch (token.kind) {
    case TokenKind::LBrace:
      bindings.pushScope();
      ++i;
      continue;
    case TokenKind::RBrace:
      bindings.popScope();
      ++i;
      continue;
    case TokenKind::Semicolon:
      bindings.flushPending();
      ++i;
      continue;
    case TokenKind::KeywordLet:
      if (tokens[i + 1].kind == TokenKind::Identifier) {
        bindings.declare(tokens[i + 1].text, tokens[i + 1].line);
        i += 2;
      } else {
        ++i;
      }
      continue;
    case TokenKind::KeywordFor: {
      ++i;
      if (tokens[i].kind != TokenKind::LParen) {
        continue;
      }
      const size_t close = skipParenGroup(tokens, i);
      if (tokens[close - 1].kind == TokenKind::RParen) {
        bindings.pushLoopHeader();
        headerCloses.push_back(close - 1);
      }
      continue;
    }
    case TokenKind::KeywordFn: {
      ++i;
      if (tokens[i].kind == TokenKind::Identifier) {
        ++i;
      }
      if (tokens[i].kind != TokenKind::LParen) {
        continue;
      }
      size_t close = skipParenGroup(tokens, i);
      for (size_t j = i + 1; j + 1 < close; ++j) {
        if (tokens[j].kind == TokenKind::Identifier && tokens[j + 1].kind == TokenKind::Colon) {
          bindings.addParam(tokens[j].text);
        }
      }
      i = close;
      continue;
    }
    case TokenKind::Identifier:
      break;
    default:
      ++i;
      continue;
    }

    bindings.flushPendingBefore(token.line);
    const Token &next = tokens[i + 1];
    if (next.kind == TokenKind::LParen) {
      if (functions.count(token.text) == 0) {
        context.warn("W002", "call to undefined function '" + token.text + "'", token);
      }
    } else if (!bindings.isVisible(token.text)) {
      if (next.kind == TokenKind::Equal) {
        context.warn("W002", "assignment to undefined variable '" + token.text + "'", token);
      } else {
        context.warn("W002", "use of undefined variable '" + token.text + "'", token);
      }
    }
    ++i;
  }
}

} // namespace clite::lint
