#include "clite/AstPrinter.h"

#include "test_parser_helpers.h"

TEST_SUITE_BEGIN("clite.ast.printer");

TEST_CASE("prints functions and nested statements") {
  const std::string source = R"(
fn add(a: int, b: int): int { return a + b * 2; }
fn main(): void {
  let s: string = "q\"x";
  if (s == "y") { print(-1); } else { print(!true); }
}
)";
  const auto program = parseProgram(source);
  clite::AstPrinter printer;
  const std::string expected = "ast {\n"
                               "  fn add(a: int, b: int): int {\n"
                               "    return (a + (b * 2))\n"
                               "  }\n"
                               "  fn main(): void {\n"
                               "    let s: string = \"q\\\"x\"\n"
                               "    if (s == \"y\") {\n"
                               "      print((-1))\n"
                               "    } else {\n"
                               "      print((!true))\n"
                               "    }\n"
                               "  }\n"
                               "}\n";
  CHECK(printer.print(program) == expected);
}

TEST_CASE("prints loops and loop control") {
  const std::string source = R"(
fn main(): void {
  for (let i: int = 0; i < 3; i = i + 1) { continue; }
  for (;;) { break; }
  while (false) { }
  return;
}
)";
  const auto program = parseProgram(source);
  clite::AstPrinter printer;
  const std::string expected = "ast {\n"
                               "  fn main(): void {\n"
                               "    for (let i: int = 0; (i < 3); i = (i + 1)) {\n"
                               "      continue\n"
                               "    }\n"
                               "    for (; ; ) {\n"
                               "      break\n"
                               "    }\n"
                               "    while false {\n"
                               "    }\n"
                               "    return\n"
                               "  }\n"
                               "}\n";
  CHECK(printer.print(program) == expected);
}

TEST_CASE("printing is deterministic across parses") {
  const std::string source = R"(
fn fib(n: int): int {
  if (n < 2) { return n; }
  return fib(n - 1) + fib(n - 2);
}
fn main(): int { return fib(10); }
)";
  clite::AstPrinter printer;
  const std::string first = printer.print(parseProgram(source));
  const std::string second = printer.print(parseProgram(source));
  CHECK(first == second);
  CHECK(first.find("fn fib(n: int): int {") != std::string::npos);
  CHECK(first.find("return (fib((n - 1)) + fib((n - 2)))") != std::string::npos);
}

TEST_CASE("prints empty program") {
  clite::AstPrinter printer;
  CHECK(printer.print(clite::Program{}) == "ast {\n}\n");
}

TEST_SUITE_END();
