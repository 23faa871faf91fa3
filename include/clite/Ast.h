#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace clite {

enum class TypeName { Int, Bool, String, Void };

enum class Operator {
  Add,
  Subtract,
  Multiply,
  Divide,
  Modulo,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  Equal,
  NotEqual,
  And,
  Or,
  Not,
  Negate
};

struct Expr {
  enum class Kind { IntLiteral, BoolLiteral, StringLiteral, Name, Unary, Binary, Call } kind = Kind::IntLiteral;
  int64_t intValue = 0;
  bool boolValue = false;
  std::string stringValue;
  // Identifier for Name, callee for Call.
  std::string name;
  Operator op = Operator::Add;
  // Unary: operand; Binary: left, right; Call: arguments in source order.
  std::vector<Expr> args;
  int line = 0;
  int column = 0;
};

struct Stmt;

struct Block {
  std::vector<Stmt> statements;
  int line = 0;
  int column = 0;
};

struct Stmt {
  enum class Kind { Let, Assign, If, While, For, Return, Break, Continue, ExprStmt, Block } kind = Kind::ExprStmt;
  // Let/Assign target.
  std::string name;
  TypeName type = TypeName::Int;
  // Let/Assign value, If/While/For condition, Return value, ExprStmt expression.
  Expr expr;
  // False for `return;` and for a `for` loop without a condition.
  bool hasExpr = false;
  // If then-branch, loop body, nested block.
  Block body;
  Block elseBody;
  bool hasElse = false;
  // For loop header clauses; each holds at most one Let or Assign.
  std::vector<Stmt> init;
  std::vector<Stmt> step;
  int line = 0;
  int column = 0;
};

struct Param {
  std::string name;
  TypeName type = TypeName::Int;
  int line = 0;
  int column = 0;
};

struct Function {
  std::string name;
  std::vector<Param> params;
  TypeName returnType = TypeName::Void;
  Block body;
  int line = 0;
  int column = 0;
};

struct Program {
  std::vector<Function> functions;
};

const char *typeNameText(TypeName type);
const char *operatorText(Operator op);

} // namespace clite
