#include "clite/AstPrinter.h"
#include "clite/StringLiteral.h"

#include <sstream>

namespace clite {

namespace {
void indent(std::ostringstream &out, int depth) {
  for (int i = 0; i < depth; ++i) {
    out << "  ";
  }
}

void printStmt(std::ostringstream &out, const Stmt &stmt, int depth);

void printExpr(std::ostringstream &out, const Expr &expr) {
  switch (expr.kind) {
  case Expr::Kind::IntLiteral:
    out << expr.intValue;
    break;
  case Expr::Kind::BoolLiteral:
    out << (expr.boolValue ? "true" : "false");
    break;
  case Expr::Kind::StringLiteral:
    out << quoteStringLiteral(expr.stringValue);
    break;
  case Expr::Kind::Name:
    out << expr.name;
    break;
  case Expr::Kind::Unary:
    out << "(" << operatorText(expr.op);
    if (!expr.args.empty()) {
      printExpr(out, expr.args.front());
    }
    out << ")";
    break;
  case Expr::Kind::Binary:
    out << "(";
    if (expr.args.size() == 2) {
      printExpr(out, expr.args[0]);
      out << " " << operatorText(expr.op) << " ";
      printExpr(out, expr.args[1]);
    }
    out << ")";
    break;
  case Expr::Kind::Call:
    out << expr.name << "(";
    for (size_t i = 0; i < expr.args.size(); ++i) {
      if (i > 0) {
        out << ", ";
      }
      printExpr(out, expr.args[i]);
    }
    out << ")";
    break;
  }
}

void printBlock(std::ostringstream &out, const Block &block, int depth) {
  out << "{\n";
  for (const auto &stmt : block.statements) {
    printStmt(out, stmt, depth + 1);
  }
  indent(out, depth);
  out << "}";
}

// Header clauses of a for loop print without indentation or newline.
void printClause(std::ostringstream &out, const std::vector<Stmt> &clause) {
  if (clause.empty()) {
    return;
  }
  const Stmt &stmt = clause.front();
  if (stmt.kind == Stmt::Kind::Let) {
    out << "let " << stmt.name << ": " << typeNameText(stmt.type) << " = ";
  } else {
    out << stmt.name << " = ";
  }
  printExpr(out, stmt.expr);
}

void printStmt(std::ostringstream &out, const Stmt &stmt, int depth) {
  indent(out, depth);
  switch (stmt.kind) {
  case Stmt::Kind::Let:
    out << "let " << stmt.name << ": " << typeNameText(stmt.type) << " = ";
    printExpr(out, stmt.expr);
    break;
  case Stmt::Kind::Assign:
    out << stmt.name << " = ";
    printExpr(out, stmt.expr);
    break;
  case Stmt::Kind::If:
    out << "if ";
    printExpr(out, stmt.expr);
    out << " ";
    printBlock(out, stmt.body, depth);
    if (stmt.hasElse) {
      out << " else ";
      printBlock(out, stmt.elseBody, depth);
    }
    break;
  case Stmt::Kind::While:
    out << "while ";
    printExpr(out, stmt.expr);
    out << " ";
    printBlock(out, stmt.body, depth);
    break;
  case Stmt::Kind::For:
    out << "for (";
    printClause(out, stmt.init);
    out << "; ";
    if (stmt.hasExpr) {
      printExpr(out, stmt.expr);
    }
    out << "; ";
    printClause(out, stmt.step);
    out << ") ";
    printBlock(out, stmt.body, depth);
    break;
  case Stmt::Kind::Return:
    out << "return";
    if (stmt.hasExpr) {
      out << " ";
      printExpr(out, stmt.expr);
    }
    break;
  case Stmt::Kind::Break:
    out << "break";
    break;
  case Stmt::Kind::Continue:
    out << "continue";
    break;
  case Stmt::Kind::ExprStmt:
    printExpr(out, stmt.expr);
    break;
  case Stmt::Kind::Block:
    printBlock(out, stmt.body, depth);
    break;
  }
  out << "\n";
}

void printFunction(std::ostringstream &out, const Function &fn, int depth) {
  indent(out, depth);
  out << "fn " << fn.name << "(";
  for (size_t i = 0; i < fn.params.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << fn.params[i].name << ": " << typeNameText(fn.params[i].type);
  }
  out << "): " << typeNameText(fn.returnType) << " ";
  printBlock(out, fn.body, depth);
  out << "\n";
}
} // namespace

std::string AstPrinter::print(const Program &program) const {
  std::ostringstream out;
  out << "ast {\n";
  for (const auto &fn : program.functions) {
    printFunction(out, fn, 1);
  }
  out << "}\n";
  return out.str();
}

} // namespace clite
