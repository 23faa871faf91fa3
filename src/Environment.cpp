#include "clite/Environment.h"

#include <utility>

namespace clite {

Environment::Environment() {
  scopes_.emplace_back();
}

size_t Environment::pushScope(size_t parent) {
  Scope scope;
  scope.parent = parent < scopes_.size() ? parent : kGlobalScope;
  scopes_.push_back(std::move(scope));
  return scopes_.size() - 1;
}

void Environment::popScope() {
  if (scopes_.size() > 1) {
    scopes_.pop_back();
  }
}

size_t Environment::scopeCount() const {
  return scopes_.size();
}

void Environment::define(size_t scope, const std::string &name, Value value) {
  if (scope >= scopes_.size()) {
    return;
  }
  scopes_[scope].values[name] = std::move(value);
}

bool Environment::lookup(size_t scope, const std::string &name, Value &out) const {
  if (scope >= scopes_.size()) {
    return false;
  }
  size_t index = scope;
  while (true) {
    const Scope &current = scopes_[index];
    auto it = current.values.find(name);
    if (it != current.values.end()) {
      out = it->second;
      return true;
    }
    if (index == kGlobalScope) {
      return false;
    }
    index = current.parent;
  }
}

bool Environment::assign(size_t scope, const std::string &name, Value value) {
  if (scope >= scopes_.size()) {
    return false;
  }
  size_t index = scope;
  while (true) {
    Scope &current = scopes_[index];
    auto it = current.values.find(name);
    if (it != current.values.end()) {
      it->second = std::move(value);
      return true;
    }
    if (index == kGlobalScope) {
      return false;
    }
    index = current.parent;
  }
}

} // namespace clite
