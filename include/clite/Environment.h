#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "clite/Value.h"

namespace clite {

// Stack of scopes. Each scope refers to its parent by index, so a scope chain is
// a path toward the global scope at index 0. Scopes are released in LIFO order.
class Environment {
public:
  static constexpr size_t kGlobalScope = 0;

  Environment();

  size_t pushScope(size_t parent);
  void popScope();
  size_t scopeCount() const;

  void define(size_t scope, const std::string &name, Value value);
  bool lookup(size_t scope, const std::string &name, Value &out) const;
  // Rebinds the nearest scope that already binds `name`; false if none does.
  bool assign(size_t scope, const std::string &name, Value value);

  class ScopeGuard {
  public:
    ScopeGuard(Environment &env, size_t parent) : env_(env), index_(env.pushScope(parent)) {}
    ~ScopeGuard() { env_.popScope(); }
    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    size_t index() const { return index_; }

  private:
    Environment &env_;
    size_t index_;
  };

private:
  struct Scope {
    std::unordered_map<std::string, Value> values;
    size_t parent = kGlobalScope;
  };

  std::vector<Scope> scopes_;
};

} // namespace clite
