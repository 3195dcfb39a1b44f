#pragma once

#include <string>
#include <vector>

#include "pyduino/Ast.h"
#include "pyduino/Token.h"

namespace pyduino {

class Parser {
public:
  explicit Parser(std::vector<Token> tokens);

  bool parse(Module &module, std::string &error);

private:
  bool parseStatement(std::vector<Stmt> &out);
  bool parseSimpleStatements(std::vector<Stmt> &out);
  bool parseSmallStatement(Stmt &out);
  bool parseImport(Stmt &out);
  bool parseFromImport(Stmt &out);
  bool parseIf(Stmt &out);
  bool parseWhile(Stmt &out);
  bool parseFor(Stmt &out);
  bool parseFunctionDef(Stmt &out);
  bool parseParameterList(std::vector<Parameter> &out);
  bool parseDecorated(Stmt &out);
  bool parseSkippedCompound(Stmt &out, const std::string &description);
  bool parseBlock(std::vector<Stmt> &body);
  bool skipClauseHeader();
  bool skipBlock();
  bool skipToStatementEnd();
  bool skipBalanced(TokenKind open, TokenKind close);
  bool isSkippedCompoundKeyword() const;

  bool parseTestList(Expr &out);
  bool parseTargetList(Expr &out);
  bool parseExpr(Expr &out);
  bool parseDisjunction(Expr &out);
  bool parseConjunction(Expr &out);
  bool parseInversion(Expr &out);
  bool parseComparison(Expr &out);
  bool parseBitOr(Expr &out);
  bool parseBitXor(Expr &out);
  bool parseBitAnd(Expr &out);
  bool parseShift(Expr &out);
  bool parseSum(Expr &out);
  bool parseTerm(Expr &out);
  bool parseFactor(Expr &out);
  bool parsePower(Expr &out);
  bool parsePrimary(Expr &out);
  bool parseAtom(Expr &out);
  bool parseNumber(const Token &token, Expr &out);
  bool parseStrings(Expr &out);
  bool parseCallArguments(Expr &call);
  std::string annotationName(const Expr &expr) const;

  bool match(TokenKind kind) const;
  bool matchIdentifier(const char *text) const;
  TokenKind peekKind(size_t offset) const;
  const Token &advanceToken();
  bool expect(TokenKind kind, const std::string &message);
  Token consume(TokenKind kind, const std::string &message);
  bool fail(const std::string &message);

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int lastCodeLine_ = 0;
  std::string *error_ = nullptr;
};

} // namespace pyduino
