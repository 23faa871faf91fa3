#include "clite/Interpreter.h"

#include <utility>

namespace clite {

bool Interpreter::execBlock(const Block &block, size_t parentScope, Flow &flow) {
  DepthGuard depthGuard(*this);
  if (!checkDepth(block.line, block.column)) {
    return false;
  }
  Environment::ScopeGuard scope(env_, parentScope);
  return execStatements(block.statements, scope.index(), flow);
}

bool Interpreter::execStatements(const std::vector<Stmt> &statements, size_t scope, Flow &flow) {
  for (const auto &stmt : statements) {
    if (!execStatement(stmt, scope, flow)) {
      return false;
    }
    if (flow.signal != Signal::Normal) {
      return true;
    }
  }
  return true;
}

bool Interpreter::execStatement(const Stmt &stmt, size_t scope, Flow &flow) {
  switch (stmt.kind) {
  case Stmt::Kind::Let: {
    Value value;
    if (!evalExpr(stmt.expr, scope, value)) {
      return false;
    }
    env_.define(scope, stmt.name, std::move(value));
    return true;
  }
  case Stmt::Kind::Assign: {
    Value value;
    if (!evalExpr(stmt.expr, scope, value)) {
      return false;
    }
    if (!env_.assign(scope, stmt.name, std::move(value))) {
      return fail(RuntimeErrorKind::UndefinedVariable,
                  stmt.line,
                  stmt.column,
                  "assignment to undefined variable '" + stmt.name + "'");
    }
    return true;
  }
  case Stmt::Kind::If:
    return execIf(stmt, scope, flow);
  case Stmt::Kind::While:
    return execWhile(stmt, scope, flow);
  case Stmt::Kind::For:
    return execFor(stmt, scope, flow);
  case Stmt::Kind::Return: {
    Value value;
    if (stmt.hasExpr && !evalExpr(stmt.expr, scope, value)) {
      return false;
    }
    flow.signal = Signal::Return;
    flow.value = std::move(value);
    return true;
  }
  case Stmt::Kind::Break:
    flow.signal = Signal::Break;
    return true;
  case Stmt::Kind::Continue:
    flow.signal = Signal::Continue;
    return true;
  case Stmt::Kind::ExprStmt: {
    Value ignored;
    return evalExpr(stmt.expr, scope, ignored);
  }
  case Stmt::Kind::Block:
    return execBlock(stmt.body, scope, flow);
  }
  return true;
}

bool Interpreter::execIf(const Stmt &stmt, size_t scope, Flow &flow) {
  bool condition = false;
  if (!evalCondition(stmt.expr, scope, "if", condition)) {
    return false;
  }
  if (condition) {
    return execBlock(stmt.body, scope, flow);
  }
  if (stmt.hasElse) {
    return execBlock(stmt.elseBody, scope, flow);
  }
  return true;
}

bool Interpreter::execWhile(const Stmt &stmt, size_t scope, Flow &flow) {
  while (true) {
    bool condition = false;
    if (!evalCondition(stmt.expr, scope, "while", condition)) {
      return false;
    }
    if (!condition) {
      return true;
    }
    Flow bodyFlow;
    if (!execBlock(stmt.body, scope, bodyFlow)) {
      return false;
    }
    if (bodyFlow.signal == Signal::Return) {
      flow = std::move(bodyFlow);
      return true;
    }
    if (bodyFlow.signal == Signal::Break) {
      return true;
    }
  }
}

bool Interpreter::execFor(const Stmt &stmt, size_t scope, Flow &flow) {
  DepthGuard depthGuard(*this);
  if (!checkDepth(stmt.line, stmt.column)) {
    return false;
  }
  Environment::ScopeGuard loopScope(env_, scope);
  Flow headerFlow;
  if (!stmt.init.empty() && !execStatement(stmt.init.front(), loopScope.index(), headerFlow)) {
    return false;
  }
  while (true) {
    if (stmt.hasExpr) {
      bool condition = false;
      if (!evalCondition(stmt.expr, loopScope.index(), "for", condition)) {
        return false;
      }
      if (!condition) {
        return true;
      }
    }
    Flow bodyFlow;
    if (!execBlock(stmt.body, loopScope.index(), bodyFlow)) {
      return false;
    }
    if (bodyFlow.signal == Signal::Return) {
      flow = std::move(bodyFlow);
      return true;
    }
    if (bodyFlow.signal == Signal::Break) {
      return true;
    }
    if (!stmt.step.empty() && !execStatement(stmt.step.front(), loopScope.index(), headerFlow)) {
      return false;
    }
  }
}

bool Interpreter::evalCondition(const Expr &expr, size_t scope, const char *context, bool &out) {
  Value value;
  if (!evalExpr(expr, scope, value)) {
    return false;
  }
  if (value.kind != Value::Kind::Bool) {
    return fail(RuntimeErrorKind::TypeMismatch,
                expr.line,
                expr.column,
                std::string(context) + " condition must be bool, found " + valueKindName(value.kind));
  }
  out = value.boolValue;
  return true;
}

} // namespace clite
