#pragma once

#include <string>
#include <vector>

#include "clite/Ast.h"
#include "clite/Diagnostics.h"
#include "clite/Token.h"

namespace clite {

constexpr int kDefaultMaxParseDepth = 256;

class Parser {
public:
  explicit Parser(std::vector<Token> tokens, int maxDepth = kDefaultMaxParseDepth);

  bool parse(Program &program, ParseError &error);

private:
  bool parseFunction(Function &out);
  bool parseParameterList(std::vector<Param> &out);
  bool parseTypeName(TypeName &out, bool allowVoid);
  bool parseBlock(Block &out);
  bool parseStatement(Stmt &out);
  bool parseLetDecl(Stmt &out, bool requireSemicolon);
  bool parseAssignment(Stmt &out, bool requireSemicolon);
  bool parseIf(Stmt &out);
  bool parseWhile(Stmt &out);
  bool parseFor(Stmt &out);
  bool parseReturn(Stmt &out);
  bool parseLoopControl(Stmt &out);

  bool parseExpr(Expr &out);
  bool parseBinaryLevel(Expr &out, int level);
  bool parseUnary(Expr &out);
  bool parsePrimary(Expr &out);
  bool parseCallArguments(std::vector<Expr> &out);
  bool parseIntegerLiteral(const Token &token, Expr &out);

  struct DepthGuard {
    explicit DepthGuard(Parser &parser) : parser_(parser) { ++parser_.depth_; }
    ~DepthGuard() { --parser_.depth_; }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;

  private:
    Parser &parser_;
  };

  struct LoopGuard {
    explicit LoopGuard(Parser &parser) : parser_(parser) { ++parser_.loopDepth_; }
    ~LoopGuard() { --parser_.loopDepth_; }
    LoopGuard(const LoopGuard &) = delete;
    LoopGuard &operator=(const LoopGuard &) = delete;

  private:
    Parser &parser_;
  };

  bool checkDepth(int height = 0);
  const Token &current() const;
  const Token &lookahead(size_t offset) const;
  bool match(TokenKind kind) const;
  bool expect(TokenKind kind, const std::string &expected);
  bool consume(TokenKind kind, const std::string &expected, Token &out);
  bool fail(const std::string &expected);

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int maxDepth_ = kDefaultMaxParseDepth;
  int depth_ = 0;
  // Height of the expression tree most recently built by the expression parsers.
  int exprHeight_ = 0;
  int loopDepth_ = 0;
  ParseError *error_ = nullptr;
};

} // namespace clite
