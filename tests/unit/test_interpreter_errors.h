#pragma once

#include "test_interpreter_helpers.h"

TEST_SUITE_BEGIN("clite.interpreter.errors");

TEST_CASE("division by zero produces no output") {
  const auto outcome = runSource("fn main(): void {\n  print(1 / 0);\n}");
  CHECK_FALSE(outcome.ok);
  CHECK(outcome.output.empty());
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::DivisionByZero);
  CHECK(outcome.error.message == "division by zero");
  CHECK(outcome.error.line == 2);
  CHECK(outcome.error.column == 11);
}

TEST_CASE("modulo by zero is division by zero for any sign") {
  const auto negative = runMain("print(-9 % 0);");
  CHECK(negative.error.kind == clite::RuntimeErrorKind::DivisionByZero);
  CHECK(negative.error.message == "modulo by zero");
  const auto computed = runMain("let z: int = 3 - 3; print(-100 / z);");
  CHECK(computed.error.kind == clite::RuntimeErrorKind::DivisionByZero);
}

TEST_CASE("earlier output survives a runtime error") {
  const auto outcome = runMain("print(1); print(2 / 0); print(3);");
  CHECK_FALSE(outcome.ok);
  CHECK(outcome.output == "1\n");
}

TEST_CASE("non-bool condition is a type mismatch") {
  const auto outcome = runMain("if (1) { print(1); }");
  CHECK_FALSE(outcome.ok);
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::TypeMismatch);
  CHECK(outcome.error.message == "if condition must be bool, found int");
}

TEST_CASE("while condition must stay bool") {
  const auto outcome = runMain("let x: int = 1; while (x) { x = 0; }");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::TypeMismatch);
  CHECK(outcome.error.message == "while condition must be bool, found int");
}

TEST_CASE("arithmetic requires int operands") {
  const auto outcome = runMain("print(1 + true);");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::TypeMismatch);
  CHECK(outcome.error.message == "operator '+' cannot be applied to int and bool");
  const auto mixed = runMain("print(\"a\" + 1);");
  CHECK(mixed.error.kind == clite::RuntimeErrorKind::TypeMismatch);
}

TEST_CASE("relational operators require ints") {
  const auto outcome = runMain("print(\"a\" < \"b\");");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::TypeMismatch);
}

TEST_CASE("equality requires matching kinds") {
  const auto outcome = runMain("print(1 == true);");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::TypeMismatch);
}

TEST_CASE("unary operators check operand kind") {
  const auto notInt = runMain("print(!1);");
  CHECK(notInt.error.kind == clite::RuntimeErrorKind::TypeMismatch);
  const auto negBool = runMain("print(-true);");
  CHECK(negBool.error.kind == clite::RuntimeErrorKind::TypeMismatch);
}

TEST_CASE("logical operators require bool operands") {
  const auto left = runMain("print(1 && true);");
  CHECK(left.error.kind == clite::RuntimeErrorKind::TypeMismatch);
  const auto right = runMain("print(true && 1);");
  CHECK(right.error.kind == clite::RuntimeErrorKind::TypeMismatch);
}

TEST_CASE("unknown variable and assignment target") {
  const auto use = runMain("print(y);");
  CHECK(use.error.kind == clite::RuntimeErrorKind::UndefinedVariable);
  CHECK(use.error.message == "undefined variable 'y'");
  const auto assign = runMain("y = 1;");
  CHECK(assign.error.kind == clite::RuntimeErrorKind::UndefinedVariable);
  CHECK(assign.error.message == "assignment to undefined variable 'y'");
}

TEST_CASE("block binding is gone after the block") {
  const auto outcome = runMain("{ let inner: int = 1; } print(inner);");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::UndefinedVariable);
}

TEST_CASE("unknown function") {
  const auto outcome = runMain("missing(1);");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::UndefinedFunction);
  CHECK(outcome.error.message == "undefined function 'missing'");
}

TEST_CASE("missing entry function") {
  const auto outcome = runSource("fn helper(): void { }");
  CHECK_FALSE(outcome.ok);
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::UndefinedFunction);
  CHECK(outcome.error.message == "entry function 'main' not found");
}

TEST_CASE("call arity must match") {
  const auto outcome = runSource("fn one(a: int): int { return a; } fn main(): void { print(one(1, 2)); }");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::ArityMismatch);
  CHECK(outcome.error.message == "function 'one' expects 1 argument(s), got 2");
}

TEST_CASE("print takes exactly one argument") {
  const auto none = runMain("print();");
  CHECK(none.error.kind == clite::RuntimeErrorKind::ArityMismatch);
  const auto two = runMain("print(1, 2);");
  CHECK(two.error.kind == clite::RuntimeErrorKind::ArityMismatch);
  CHECK(two.output.empty());
}

TEST_CASE("entry function must not take parameters") {
  const auto outcome = runSource("fn main(a: int): void { }");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::ArityMismatch);
}

TEST_CASE("non-void function falling off the end") {
  const auto outcome = runSource("fn f(): int { } fn main(): void { print(f()); }");
  CHECK_FALSE(outcome.ok);
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::NonVoidFallthrough);
  CHECK(outcome.error.line == 1);
  CHECK(outcome.error.column == 1);
}

TEST_CASE("bare return in non-void function") {
  const auto outcome = runSource("fn f(): bool { return; } fn main(): void { print(f()); }");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::NonVoidFallthrough);
}

TEST_CASE("duplicate function names fail at load") {
  clite::InterpreterOptions options;
  options.callEntry = false;
  const auto outcome = runSource("fn main(): void { } fn main(): void { }", options);
  CHECK_FALSE(outcome.ok);
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::DuplicateFunction);
  CHECK(outcome.error.column == 21);
}

TEST_CASE("builtin print cannot be redefined") {
  const auto outcome = runSource("fn print(x: int): void { } fn main(): void { }");
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::DuplicateFunction);
}

TEST_CASE("unbounded recursion hits the depth limit") {
  clite::InterpreterOptions options;
  options.maxDepth = 64;
  const auto outcome = runSource("fn f(n: int): int { return f(n + 1); } fn main(): void { print(f(0)); }", options);
  CHECK_FALSE(outcome.ok);
  CHECK(outcome.error.kind == clite::RuntimeErrorKind::StackLimitExceeded);
  CHECK(outcome.error.message == "nesting depth limit of 64 exceeded");
}

TEST_CASE("deep block nesting hits the depth limit") {
  clite::InterpreterOptions options;
  options.maxDepth = 4;
  const auto limited = runSource("fn main(): void { { { { { print(1); } } } } }", options);
  CHECK(limited.error.kind == clite::RuntimeErrorKind::StackLimitExceeded);
  CHECK(limited.output.empty());
}

TEST_CASE("default depth limit allows moderate recursion") {
  const std::string source = R"(
fn sum(n: int): int {
  if (n == 0) { return 0; }
  return n + sum(n - 1);
}
fn main(): void { print(sum(500)); }
)";
  const auto outcome = runSource(source);
  CHECK(outcome.ok);
  CHECK(outcome.output == "125250\n");
}

TEST_SUITE_END();
