#include "clite/Interpreter.h"

#include "InterpreterHelpers.h"

#include <utility>

namespace clite {
using namespace interp;

bool Interpreter::evalExpr(const Expr &expr, size_t scope, Value &out) {
  switch (expr.kind) {
  case Expr::Kind::IntLiteral:
    out = Value::makeInt(expr.intValue);
    return true;
  case Expr::Kind::BoolLiteral:
    out = Value::makeBool(expr.boolValue);
    return true;
  case Expr::Kind::StringLiteral:
    out = Value::makeString(expr.stringValue);
    return true;
  case Expr::Kind::Name:
    if (!env_.lookup(scope, expr.name, out)) {
      return fail(RuntimeErrorKind::UndefinedVariable,
                  expr.line,
                  expr.column,
                  "undefined variable '" + expr.name + "'");
    }
    return true;
  case Expr::Kind::Unary:
    return evalUnary(expr, scope, out);
  case Expr::Kind::Binary:
    return evalBinary(expr, scope, out);
  case Expr::Kind::Call:
    return evalCall(expr, scope, out);
  }
  return true;
}

bool Interpreter::evalUnary(const Expr &expr, size_t scope, Value &out) {
  if (expr.args.size() != 1) {
    return fail(RuntimeErrorKind::ArityMismatch, expr.line, expr.column, "unary operator requires one operand");
  }
  Value operand;
  if (!evalExpr(expr.args.front(), scope, operand)) {
    return false;
  }
  if (expr.op == Operator::Not) {
    if (operand.kind != Value::Kind::Bool) {
      return fail(RuntimeErrorKind::TypeMismatch,
                  expr.line,
                  expr.column,
                  std::string("operator '!' requires bool, found ") + valueKindName(operand.kind));
    }
    out = Value::makeBool(!operand.boolValue);
    return true;
  }
  if (operand.kind != Value::Kind::Int) {
    return fail(RuntimeErrorKind::TypeMismatch,
                expr.line,
                expr.column,
                std::string("unary '-' requires int, found ") + valueKindName(operand.kind));
  }
  out = Value::makeInt(wrappingNegate(operand.intValue));
  return true;
}

bool Interpreter::evalBinary(const Expr &expr, size_t scope, Value &out) {
  if (expr.args.size() != 2) {
    return fail(RuntimeErrorKind::ArityMismatch, expr.line, expr.column, "binary operator requires two operands");
  }
  if (expr.op == Operator::And || expr.op == Operator::Or) {
    return evalLogical(expr, scope, out);
  }
  Value left;
  if (!evalExpr(expr.args[0], scope, left)) {
    return false;
  }
  Value right;
  if (!evalExpr(expr.args[1], scope, right)) {
    return false;
  }
  switch (expr.op) {
  case Operator::Add:
  case Operator::Subtract:
  case Operator::Multiply:
  case Operator::Divide:
  case Operator::Modulo:
    return evalArithmetic(expr, left, right, out);
  default:
    return evalComparison(expr, left, right, out);
  }
}

bool Interpreter::evalLogical(const Expr &expr, size_t scope, Value &out) {
  const bool isAnd = expr.op == Operator::And;
  Value left;
  if (!evalExpr(expr.args[0], scope, left)) {
    return false;
  }
  if (left.kind != Value::Kind::Bool) {
    return fail(RuntimeErrorKind::TypeMismatch,
                expr.line,
                expr.column,
                std::string("operator '") + operatorText(expr.op) + "' requires bool operands, found " +
                    valueKindName(left.kind));
  }
  if (isAnd != left.boolValue) {
    out = Value::makeBool(left.boolValue);
    return true;
  }
  Value right;
  if (!evalExpr(expr.args[1], scope, right)) {
    return false;
  }
  if (right.kind != Value::Kind::Bool) {
    return fail(RuntimeErrorKind::TypeMismatch,
                expr.line,
                expr.column,
                std::string("operator '") + operatorText(expr.op) + "' requires bool operands, found " +
                    valueKindName(right.kind));
  }
  out = Value::makeBool(right.boolValue);
  return true;
}

bool Interpreter::evalArithmetic(const Expr &expr, const Value &left, const Value &right, Value &out) {
  if (expr.op == Operator::Add && left.kind == Value::Kind::String && right.kind == Value::Kind::String) {
    out = Value::makeString(left.stringValue + right.stringValue);
    return true;
  }
  if (left.kind != Value::Kind::Int || right.kind != Value::Kind::Int) {
    return fail(RuntimeErrorKind::TypeMismatch, expr.line, expr.column, describeOperands(expr.op, left, right));
  }
  const int64_t a = left.intValue;
  const int64_t b = right.intValue;
  switch (expr.op) {
  case Operator::Add:
    out = Value::makeInt(wrappingAdd(a, b));
    return true;
  case Operator::Subtract:
    out = Value::makeInt(wrappingSubtract(a, b));
    return true;
  case Operator::Multiply:
    out = Value::makeInt(wrappingMultiply(a, b));
    return true;
  case Operator::Divide:
    if (b == 0) {
      return fail(RuntimeErrorKind::DivisionByZero, expr.line, expr.column, "division by zero");
    }
    out = Value::makeInt(truncatingDivide(a, b));
    return true;
  case Operator::Modulo:
    if (b == 0) {
      return fail(RuntimeErrorKind::DivisionByZero, expr.line, expr.column, "modulo by zero");
    }
    out = Value::makeInt(truncatingModulo(a, b));
    return true;
  default:
    return fail(RuntimeErrorKind::TypeMismatch, expr.line, expr.column, describeOperands(expr.op, left, right));
  }
}

bool Interpreter::evalComparison(const Expr &expr, const Value &left, const Value &right, Value &out) {
  if (expr.op == Operator::Equal || expr.op == Operator::NotEqual) {
    if (left.kind != right.kind || left.kind == Value::Kind::Void) {
      return fail(RuntimeErrorKind::TypeMismatch, expr.line, expr.column, describeOperands(expr.op, left, right));
    }
    const bool equal = valuesEqual(left, right);
    out = Value::makeBool(expr.op == Operator::Equal ? equal : !equal);
    return true;
  }
  if (left.kind != Value::Kind::Int || right.kind != Value::Kind::Int) {
    return fail(RuntimeErrorKind::TypeMismatch, expr.line, expr.column, describeOperands(expr.op, left, right));
  }
  const int64_t a = left.intValue;
  const int64_t b = right.intValue;
  switch (expr.op) {
  case Operator::Less:
    out = Value::makeBool(a < b);
    return true;
  case Operator::LessEqual:
    out = Value::makeBool(a <= b);
    return true;
  case Operator::Greater:
    out = Value::makeBool(a > b);
    return true;
  case Operator::GreaterEqual:
    out = Value::makeBool(a >= b);
    return true;
  default:
    return fail(RuntimeErrorKind::TypeMismatch, expr.line, expr.column, describeOperands(expr.op, left, right));
  }
}

bool Interpreter::evalCall(const Expr &expr, size_t scope, Value &out) {
  if (expr.name == "print") {
    return evalPrint(expr, scope, out);
  }
  auto it = functions_.find(expr.name);
  if (it == functions_.end()) {
    return fail(RuntimeErrorKind::UndefinedFunction,
                expr.line,
                expr.column,
                "undefined function '" + expr.name + "'");
  }
  const Function &fn = *it->second;
  if (expr.args.size() != fn.params.size()) {
    return fail(RuntimeErrorKind::ArityMismatch,
                expr.line,
                expr.column,
                "function '" + fn.name + "' expects " + std::to_string(fn.params.size()) + " argument(s), got " +
                    std::to_string(expr.args.size()));
  }
  std::vector<Value> args;
  args.reserve(expr.args.size());
  for (const auto &argExpr : expr.args) {
    Value arg;
    if (!evalExpr(argExpr, scope, arg)) {
      return false;
    }
    args.push_back(std::move(arg));
  }
  return callFunction(fn, std::move(args), expr.line, expr.column, out);
}

bool Interpreter::evalPrint(const Expr &expr, size_t scope, Value &out) {
  if (expr.args.size() != 1) {
    return fail(RuntimeErrorKind::ArityMismatch,
                expr.line,
                expr.column,
                "print expects exactly 1 argument, got " + std::to_string(expr.args.size()));
  }
  Value value;
  if (!evalExpr(expr.args.front(), scope, value)) {
    return false;
  }
  out_ << renderValue(value) << '\n';
  out = Value::makeVoid();
  return true;
}

} // namespace clite
