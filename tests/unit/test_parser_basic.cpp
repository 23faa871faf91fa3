#include "test_parser_helpers.h"

TEST_SUITE_BEGIN("clite.parser.basic");

TEST_CASE("parses empty program") {
  const auto program = parseProgram("");
  CHECK(program.functions.empty());
}

TEST_CASE("parses function with parameters and return type") {
  const std::string source = R"(
fn add(a: int, b: int): int {
  return a + b;
}
)";
  const auto program = parseProgram(source);
  REQUIRE(program.functions.size() == 1);
  const auto &fn = program.functions[0];
  CHECK(fn.name == "add");
  CHECK(fn.line == 2);
  CHECK(fn.column == 1);
  REQUIRE(fn.params.size() == 2);
  CHECK(fn.params[0].name == "a");
  CHECK(fn.params[0].type == clite::TypeName::Int);
  CHECK(fn.params[1].name == "b");
  CHECK(fn.returnType == clite::TypeName::Int);
  REQUIRE(fn.body.statements.size() == 1);
  const auto &ret = fn.body.statements[0];
  CHECK(ret.kind == clite::Stmt::Kind::Return);
  CHECK(ret.hasExpr);
  CHECK(ret.expr.kind == clite::Expr::Kind::Binary);
  CHECK(ret.expr.op == clite::Operator::Add);
}

TEST_CASE("keeps functions in declaration order") {
  const auto program = parseProgram("fn b(): void {} fn a(): void {} fn c(): bool { return true; }");
  REQUIRE(program.functions.size() == 3);
  CHECK(program.functions[0].name == "b");
  CHECK(program.functions[1].name == "a");
  CHECK(program.functions[2].name == "c");
  CHECK(program.functions[2].returnType == clite::TypeName::Bool);
}

TEST_CASE("parses let with each value type") {
  const std::string source = R"(
fn main(): void {
  let a: int = 1;
  let b: bool = false;
  let s: string = "hi\n";
}
)";
  const auto program = parseProgram(source);
  const auto &stmts = program.functions[0].body.statements;
  REQUIRE(stmts.size() == 3);
  CHECK(stmts[0].kind == clite::Stmt::Kind::Let);
  CHECK(stmts[0].name == "a");
  CHECK(stmts[0].type == clite::TypeName::Int);
  CHECK(stmts[0].expr.intValue == 1);
  CHECK(stmts[1].type == clite::TypeName::Bool);
  CHECK(stmts[1].expr.kind == clite::Expr::Kind::BoolLiteral);
  CHECK_FALSE(stmts[1].expr.boolValue);
  CHECK(stmts[2].type == clite::TypeName::String);
  CHECK(stmts[2].expr.kind == clite::Expr::Kind::StringLiteral);
  CHECK(stmts[2].expr.stringValue == "hi\n");
}

TEST_CASE("distinguishes assignment from expression statement") {
  const std::string source = R"(
fn main(): void {
  x = 2;
  print(x);
  x == 2;
}
)";
  const auto program = parseProgram(source);
  const auto &stmts = program.functions[0].body.statements;
  REQUIRE(stmts.size() == 3);
  CHECK(stmts[0].kind == clite::Stmt::Kind::Assign);
  CHECK(stmts[0].name == "x");
  CHECK(stmts[0].line == 3);
  CHECK(stmts[0].column == 3);
  CHECK(stmts[1].kind == clite::Stmt::Kind::ExprStmt);
  CHECK(stmts[1].expr.kind == clite::Expr::Kind::Call);
  CHECK(stmts[1].expr.name == "print");
  REQUIRE(stmts[1].expr.args.size() == 1);
  CHECK(stmts[2].kind == clite::Stmt::Kind::ExprStmt);
  CHECK(stmts[2].expr.op == clite::Operator::Equal);
}

TEST_CASE("parses if with else-if chain") {
  const std::string source = R"(
fn main(): void {
  if (a) { print(1); } else if (b) { print(2); } else { print(3); }
}
)";
  const auto program = parseProgram(source);
  const auto &stmt = program.functions[0].body.statements[0];
  CHECK(stmt.kind == clite::Stmt::Kind::If);
  CHECK(stmt.expr.name == "a");
  REQUIRE(stmt.body.statements.size() == 1);
  REQUIRE(stmt.hasElse);
  REQUIRE(stmt.elseBody.statements.size() == 1);
  const auto &nested = stmt.elseBody.statements[0];
  CHECK(nested.kind == clite::Stmt::Kind::If);
  CHECK(nested.expr.name == "b");
  CHECK(nested.hasElse);
  REQUIRE(nested.elseBody.statements.size() == 1);
}

TEST_CASE("parses while, for and loop control") {
  const std::string source = R"(
fn main(): void {
  while (i < 3) { i = i + 1; continue; }
  for (let j: int = 0; j < 2; j = j + 1) { break; }
  for (;;) { break; }
}
)";
  const auto program = parseProgram(source);
  const auto &stmts = program.functions[0].body.statements;
  REQUIRE(stmts.size() == 3);
  CHECK(stmts[0].kind == clite::Stmt::Kind::While);
  REQUIRE(stmts[0].body.statements.size() == 2);
  CHECK(stmts[0].body.statements[1].kind == clite::Stmt::Kind::Continue);
  CHECK(stmts[1].kind == clite::Stmt::Kind::For);
  REQUIRE(stmts[1].init.size() == 1);
  CHECK(stmts[1].init[0].kind == clite::Stmt::Kind::Let);
  CHECK(stmts[1].hasExpr);
  REQUIRE(stmts[1].step.size() == 1);
  CHECK(stmts[1].step[0].kind == clite::Stmt::Kind::Assign);
  CHECK(stmts[1].body.statements[0].kind == clite::Stmt::Kind::Break);
  CHECK(stmts[2].init.empty());
  CHECK_FALSE(stmts[2].hasExpr);
  CHECK(stmts[2].step.empty());
}

TEST_CASE("parses bare block and empty return") {
  const auto program = parseProgram("fn main(): void { { let a: int = 1; } return; }");
  const auto &stmts = program.functions[0].body.statements;
  REQUIRE(stmts.size() == 2);
  CHECK(stmts[0].kind == clite::Stmt::Kind::Block);
  CHECK(stmts[0].body.statements.size() == 1);
  CHECK(stmts[1].kind == clite::Stmt::Kind::Return);
  CHECK_FALSE(stmts[1].hasExpr);
}

TEST_SUITE_END();

TEST_SUITE_BEGIN("clite.parser.expressions");

TEST_CASE("multiplication binds tighter than addition") {
  const auto expr = parseReturnExpr("1 + 2 * 3");
  REQUIRE(expr.kind == clite::Expr::Kind::Binary);
  CHECK(expr.op == clite::Operator::Add);
  CHECK(expr.args[0].intValue == 1);
  REQUIRE(expr.args[1].kind == clite::Expr::Kind::Binary);
  CHECK(expr.args[1].op == clite::Operator::Multiply);
}

TEST_CASE("binary operators are left associative") {
  const auto expr = parseReturnExpr("10 - 4 - 3");
  REQUIRE(expr.kind == clite::Expr::Kind::Binary);
  CHECK(expr.op == clite::Operator::Subtract);
  REQUIRE(expr.args[0].kind == clite::Expr::Kind::Binary);
  CHECK(expr.args[0].args[0].intValue == 10);
  CHECK(expr.args[0].args[1].intValue == 4);
  CHECK(expr.args[1].intValue == 3);
}

TEST_CASE("logical or is the loosest operator") {
  const auto expr = parseReturnExpr("a && b || c == d");
  REQUIRE(expr.kind == clite::Expr::Kind::Binary);
  CHECK(expr.op == clite::Operator::Or);
  CHECK(expr.args[0].op == clite::Operator::And);
  CHECK(expr.args[1].op == clite::Operator::Equal);
}

TEST_CASE("relational binds tighter than equality") {
  const auto expr = parseReturnExpr("a < b == c >= d");
  CHECK(expr.op == clite::Operator::Equal);
  CHECK(expr.args[0].op == clite::Operator::Less);
  CHECK(expr.args[1].op == clite::Operator::GreaterEqual);
}

TEST_CASE("unary operators bind tighter than binary") {
  const auto expr = parseReturnExpr("-a * !b");
  CHECK(expr.op == clite::Operator::Multiply);
  REQUIRE(expr.args[0].kind == clite::Expr::Kind::Unary);
  CHECK(expr.args[0].op == clite::Operator::Negate);
  REQUIRE(expr.args[1].kind == clite::Expr::Kind::Unary);
  CHECK(expr.args[1].op == clite::Operator::Not);
}

TEST_CASE("parentheses override precedence") {
  const auto expr = parseReturnExpr("(1 + 2) * 3");
  CHECK(expr.op == clite::Operator::Multiply);
  CHECK(expr.args[0].op == clite::Operator::Add);
}

TEST_CASE("parses call with multiple arguments") {
  const auto expr = parseReturnExpr("f(1, g(), x % 2)");
  REQUIRE(expr.kind == clite::Expr::Kind::Call);
  CHECK(expr.name == "f");
  REQUIRE(expr.args.size() == 3);
  CHECK(expr.args[1].kind == clite::Expr::Kind::Call);
  CHECK(expr.args[1].args.empty());
  CHECK(expr.args[2].op == clite::Operator::Modulo);
}

TEST_CASE("parses largest integer literal") {
  const auto expr = parseReturnExpr("9223372036854775807");
  CHECK(expr.kind == clite::Expr::Kind::IntLiteral);
  CHECK(expr.intValue == 9223372036854775807LL);
}

TEST_CASE("expression nodes carry operator positions") {
  const auto expr = parseReturnExpr("a + b");
  CHECK(expr.line == 1);
  CHECK(expr.column == 27);
}

TEST_SUITE_END();
