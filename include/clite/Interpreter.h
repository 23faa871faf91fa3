#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "clite/Ast.h"
#include "clite/Diagnostics.h"
#include "clite/Environment.h"
#include "clite/Value.h"

namespace clite {

constexpr int kDefaultMaxCallDepth = 2048;

struct InterpreterOptions {
  std::string entryName = "main";
  // When false the program is loaded but no function is called.
  bool callEntry = true;
  // Shared budget for nested function calls and block entries.
  int maxDepth = kDefaultMaxCallDepth;
};

// Functions registered by load/run point into the Program, which must outlive
// the interpreter's use of it.
class Interpreter {
public:
  explicit Interpreter(std::ostream &out);

  // Registers the program's functions; fails on duplicate or reserved names.
  bool load(const Program &program, RuntimeError &error);
  // Loads `program` and, unless disabled, calls the entry function with no
  // arguments. `result` receives the entry function's return value.
  bool run(const Program &program, const InterpreterOptions &options, Value &result, RuntimeError &error);

private:
  enum class Signal { Normal, Return, Break, Continue };

  struct Flow {
    Signal signal = Signal::Normal;
    Value value;
  };

  struct DepthGuard {
    explicit DepthGuard(Interpreter &interp) : interp_(interp) { ++interp_.depth_; }
    ~DepthGuard() { --interp_.depth_; }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;

  private:
    Interpreter &interp_;
  };

  bool callFunction(const Function &fn, std::vector<Value> args, int line, int column, Value &result);
  bool checkDepth(int line, int column);

  bool execBlock(const Block &block, size_t parentScope, Flow &flow);
  bool execStatements(const std::vector<Stmt> &statements, size_t scope, Flow &flow);
  bool execStatement(const Stmt &stmt, size_t scope, Flow &flow);
  bool execIf(const Stmt &stmt, size_t scope, Flow &flow);
  bool execWhile(const Stmt &stmt, size_t scope, Flow &flow);
  bool execFor(const Stmt &stmt, size_t scope, Flow &flow);
  bool evalCondition(const Expr &expr, size_t scope, const char *context, bool &out);

  bool evalExpr(const Expr &expr, size_t scope, Value &out);
  bool evalUnary(const Expr &expr, size_t scope, Value &out);
  bool evalBinary(const Expr &expr, size_t scope, Value &out);
  bool evalLogical(const Expr &expr, size_t scope, Value &out);
  bool evalArithmetic(const Expr &expr, const Value &left, const Value &right, Value &out);
  bool evalComparison(const Expr &expr, const Value &left, const Value &right, Value &out);
  bool evalCall(const Expr &expr, size_t scope, Value &out);
  bool evalPrint(const Expr &expr, size_t scope, Value &out);

  bool fail(RuntimeErrorKind kind, int line, int column, const std::string &message);

  std::ostream &out_;
  std::unordered_map<std::string, const Function *> functions_;
  Environment env_;
  int depth_ = 0;
  int maxDepth_ = kDefaultMaxCallDepth;
  RuntimeError *error_ = nullptr;
};

} // namespace clite
