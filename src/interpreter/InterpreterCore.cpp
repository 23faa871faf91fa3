#include "clite/Interpreter.h"

#include <utility>

namespace clite {

Interpreter::Interpreter(std::ostream &out) : out_(out) {}

bool Interpreter::load(const Program &program, RuntimeError &error) {
  error_ = &error;
  functions_.clear();
  for (const auto &fn : program.functions) {
    if (fn.name == "print") {
      return fail(RuntimeErrorKind::DuplicateFunction,
                  fn.line,
                  fn.column,
                  "function name 'print' is reserved for the builtin");
    }
    if (!functions_.emplace(fn.name, &fn).second) {
      return fail(RuntimeErrorKind::DuplicateFunction, fn.line, fn.column, "duplicate function '" + fn.name + "'");
    }
  }
  return true;
}

bool Interpreter::run(const Program &program,
                      const InterpreterOptions &options,
                      Value &result,
                      RuntimeError &error) {
  result = Value::makeVoid();
  env_ = Environment();
  depth_ = 0;
  maxDepth_ = options.maxDepth;
  if (!load(program, error)) {
    return false;
  }
  if (!options.callEntry) {
    return true;
  }
  auto it = functions_.find(options.entryName);
  if (it == functions_.end()) {
    return fail(RuntimeErrorKind::UndefinedFunction, 1, 1, "entry function '" + options.entryName + "' not found");
  }
  const Function &entry = *it->second;
  if (!entry.params.empty()) {
    return fail(RuntimeErrorKind::ArityMismatch,
                entry.line,
                entry.column,
                "entry function '" + entry.name + "' must not take parameters");
  }
  return callFunction(entry, {}, entry.line, entry.column, result);
}

bool Interpreter::callFunction(const Function &fn, std::vector<Value> args, int line, int column, Value &result) {
  if (args.size() != fn.params.size()) {
    return fail(RuntimeErrorKind::ArityMismatch,
                line,
                column,
                "function '" + fn.name + "' expects " + std::to_string(fn.params.size()) + " argument(s), got " +
                    std::to_string(args.size()));
  }
  DepthGuard depthGuard(*this);
  if (!checkDepth(line, column)) {
    return false;
  }
  Environment::ScopeGuard frame(env_, Environment::kGlobalScope);
  for (size_t i = 0; i < args.size(); ++i) {
    env_.define(frame.index(), fn.params[i].name, std::move(args[i]));
  }
  Flow flow;
  if (!execBlock(fn.body, frame.index(), flow)) {
    return false;
  }
  Value value = flow.signal == Signal::Return ? std::move(flow.value) : Value::makeVoid();
  if (fn.returnType != TypeName::Void && value.kind == Value::Kind::Void) {
    return fail(RuntimeErrorKind::NonVoidFallthrough,
                fn.line,
                fn.column,
                "function '" + fn.name + "' declared to return " + typeNameText(fn.returnType) +
                    " finished without returning a value");
  }
  result = std::move(value);
  return true;
}

bool Interpreter::checkDepth(int line, int column) {
  if (depth_ <= maxDepth_) {
    return true;
  }
  return fail(RuntimeErrorKind::StackLimitExceeded,
              line,
              column,
              "nesting depth limit of " + std::to_string(maxDepth_) + " exceeded");
}

bool Interpreter::fail(RuntimeErrorKind kind, int line, int column, const std::string &message) {
  if (error_) {
    error_->kind = kind;
    error_->message = message;
    error_->line = line;
    error_->column = column;
  }
  return false;
}

} // namespace clite
