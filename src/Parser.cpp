#include "pyduino/Parser.h"

#include "pyduino/StringLiteral.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace pyduino {

namespace {
bool isCodeToken(TokenKind kind) {
  return kind != TokenKind::Newline && kind != TokenKind::Indent && kind != TokenKind::Dedent &&
         kind != TokenKind::End && kind != TokenKind::Comment;
}

bool isOpenBracket(TokenKind kind) {
  return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace;
}

bool isCloseBracket(TokenKind kind) {
  return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

Expr makeUnsupported(const std::string &description, int line) {
  Expr expr;
  expr.kind = Expr::Kind::Unsupported;
  expr.name = description;
  expr.line = line;
  return expr;
}

Expr makeBinary(BinaryOperator op, Expr left, Expr right) {
  Expr expr;
  expr.kind = Expr::Kind::BinaryOp;
  expr.binaryOp = op;
  expr.line = left.line;
  expr.operands.push_back(std::move(left));
  expr.operands.push_back(std::move(right));
  return expr;
}

bool augmentedOperator(const std::string &text, BinaryOperator &out) {
  if (text == "+=") {
    out = BinaryOperator::Add;
  } else if (text == "-=") {
    out = BinaryOperator::Sub;
  } else if (text == "*=") {
    out = BinaryOperator::Mul;
  } else if (text == "/=") {
    out = BinaryOperator::Div;
  } else if (text == "//=") {
    out = BinaryOperator::FloorDiv;
  } else if (text == "%=") {
    out = BinaryOperator::Mod;
  } else if (text == "**=") {
    out = BinaryOperator::Pow;
  } else if (text == "&=") {
    out = BinaryOperator::BitAnd;
  } else if (text == "|=") {
    out = BinaryOperator::BitOr;
  } else if (text == "^=") {
    out = BinaryOperator::BitXor;
  } else if (text == "<<=") {
    out = BinaryOperator::LShift;
  } else if (text == ">>=") {
    out = BinaryOperator::RShift;
  } else {
    return false;
  }
  return true;
}

int countNewlines(const std::string &text) {
  int count = 0;
  for (char c : text) {
    if (c == '\n') {
      ++count;
    }
  }
  return count;
}

std::string stripUnderscores(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '_') {
      out.push_back(c);
    }
  }
  return out;
}
} // namespace

Parser::Parser(std::vector<Token> tokens) {
  tokens_.reserve(tokens.size());
  for (auto &token : tokens) {
    if (token.kind != TokenKind::Comment) {
      tokens_.push_back(std::move(token));
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TokenKind::End) {
    int line = tokens_.empty() ? 1 : tokens_.back().line;
    tokens_.push_back({TokenKind::End, "", line, 1});
  }
}

bool Parser::parse(Module &module, std::string &error) {
  error_ = &error;
  for (size_t i = 0; i < tokens_.size(); ++i) {
    if (tokens_[i].kind == TokenKind::Invalid) {
      pos_ = i;
      return fail(tokens_[i].text);
    }
  }
  while (!match(TokenKind::End)) {
    if (match(TokenKind::Newline)) {
      advanceToken();
      continue;
    }
    if (match(TokenKind::Indent)) {
      return fail("unexpected indent");
    }
    if (match(TokenKind::Dedent)) {
      return fail("unexpected dedent");
    }
    if (!parseStatement(module.body)) {
      return false;
    }
  }
  return true;
}

bool Parser::parseStatement(std::vector<Stmt> &out) {
  Stmt stmt;
  stmt.line = tokens_[pos_].line;
  bool ok = true;
  if (match(TokenKind::KeywordIf)) {
    ok = parseIf(stmt);
  } else if (match(TokenKind::KeywordWhile)) {
    ok = parseWhile(stmt);
  } else if (match(TokenKind::KeywordFor)) {
    ok = parseFor(stmt);
  } else if (match(TokenKind::KeywordDef)) {
    ok = parseFunctionDef(stmt);
  } else if (match(TokenKind::At)) {
    ok = parseDecorated(stmt);
  } else if (isSkippedCompoundKeyword()) {
    ok = parseSkippedCompound(stmt, tokens_[pos_].text);
  } else {
    return parseSimpleStatements(out);
  }
  if (!ok) {
    return false;
  }
  out.push_back(std::move(stmt));
  return true;
}

bool Parser::parseSimpleStatements(std::vector<Stmt> &out) {
  while (true) {
    Stmt stmt;
    stmt.line = tokens_[pos_].line;
    if (!parseSmallStatement(stmt)) {
      return false;
    }
    stmt.endLine = lastCodeLine_;
    out.push_back(std::move(stmt));
    if (!match(TokenKind::Semicolon)) {
      break;
    }
    advanceToken();
    if (match(TokenKind::Newline) || match(TokenKind::End)) {
      break;
    }
  }
  if (match(TokenKind::End)) {
    return true;
  }
  return expect(TokenKind::Newline, "expected end of statement");
}

bool Parser::parseSmallStatement(Stmt &out) {
  if (match(TokenKind::KeywordPass)) {
    advanceToken();
    out.kind = Stmt::Kind::Pass;
    return true;
  }
  if (match(TokenKind::KeywordBreak)) {
    advanceToken();
    out.kind = Stmt::Kind::Break;
    return true;
  }
  if (match(TokenKind::KeywordContinue)) {
    advanceToken();
    out.kind = Stmt::Kind::Continue;
    return true;
  }
  if (match(TokenKind::KeywordReturn)) {
    advanceToken();
    out.kind = Stmt::Kind::Return;
    if (!match(TokenKind::Newline) && !match(TokenKind::Semicolon) && !match(TokenKind::End)) {
      Expr value;
      if (!parseTestList(value)) {
        return false;
      }
      out.value = std::move(value);
    }
    return true;
  }
  if (match(TokenKind::KeywordImport)) {
    return parseImport(out);
  }
  if (match(TokenKind::KeywordFrom)) {
    return parseFromImport(out);
  }
  if (matchIdentifier("global") || matchIdentifier("nonlocal") || matchIdentifier("del") ||
      matchIdentifier("assert") || matchIdentifier("raise") || matchIdentifier("yield") ||
      (matchIdentifier("await") && peekKind(1) == TokenKind::Newline)) {
    out.kind = Stmt::Kind::Unsupported;
    out.name = tokens_[pos_].text;
    advanceToken();
    return skipToStatementEnd();
  }

  Expr first;
  if (!parseTestList(first)) {
    return false;
  }
  if (match(TokenKind::Colon)) {
    advanceToken();
    Expr annotation;
    if (!parseExpr(annotation)) {
      return false;
    }
    if (!match(TokenKind::Equal)) {
      out.kind = Stmt::Kind::Unsupported;
      out.name = "annotated declaration";
      return true;
    }
    advanceToken();
    Expr value;
    if (!parseTestList(value)) {
      return false;
    }
    out.kind = Stmt::Kind::Assign;
    out.targets.push_back(std::move(first));
    out.value = std::move(value);
    return true;
  }
  if (match(TokenKind::AugAssign)) {
    Token opToken = advanceToken();
    BinaryOperator op = BinaryOperator::Add;
    if (!augmentedOperator(opToken.text, op)) {
      out.kind = Stmt::Kind::Unsupported;
      out.name = "augmented assignment " + opToken.text;
      return skipToStatementEnd();
    }
    Expr value;
    if (!parseTestList(value)) {
      return false;
    }
    out.kind = Stmt::Kind::AugmentedAssign;
    out.augOp = op;
    out.targets.push_back(std::move(first));
    out.value = std::move(value);
    return true;
  }
  if (match(TokenKind::Equal)) {
    out.kind = Stmt::Kind::Assign;
    Expr current = std::move(first);
    while (match(TokenKind::Equal)) {
      advanceToken();
      Expr next;
      if (!parseTestList(next)) {
        return false;
      }
      out.targets.push_back(std::move(current));
      current = std::move(next);
    }
    out.value = std::move(current);
    return true;
  }
  out.kind = Stmt::Kind::ExpressionStatement;
  out.value = std::move(first);
  return true;
}

bool Parser::parseImport(Stmt &out) {
  advanceToken();
  out.kind = Stmt::Kind::Import;
  out.isFromImport = false;
  while (true) {
    Token part = consume(TokenKind::Identifier, "expected module name");
    if (part.kind == TokenKind::End) {
      return false;
    }
    ImportedName imported;
    imported.name = part.text;
    while (match(TokenKind::Dot)) {
      advanceToken();
      Token next = consume(TokenKind::Identifier, "expected module name after '.'");
      if (next.kind == TokenKind::End) {
        return false;
      }
      imported.name += "." + next.text;
    }
    if (match(TokenKind::KeywordAs)) {
      advanceToken();
      Token alias = consume(TokenKind::Identifier, "expected alias after 'as'");
      if (alias.kind == TokenKind::End) {
        return false;
      }
      imported.alias = alias.text;
    }
    if (out.name.empty()) {
      out.name = imported.name;
    }
    out.importedNames.push_back(std::move(imported));
    if (!match(TokenKind::Comma)) {
      break;
    }
    advanceToken();
  }
  return true;
}

bool Parser::parseFromImport(Stmt &out) {
  advanceToken();
  out.kind = Stmt::Kind::Import;
  out.isFromImport = true;
  std::string module;
  while (match(TokenKind::Dot) || match(TokenKind::Ellipsis)) {
    module += advanceToken().text;
  }
  if (match(TokenKind::Identifier)) {
    module += advanceToken().text;
    while (match(TokenKind::Dot)) {
      advanceToken();
      Token next = consume(TokenKind::Identifier, "expected module name after '.'");
      if (next.kind == TokenKind::End) {
        return false;
      }
      module += "." + next.text;
    }
  }
  if (module.empty()) {
    return fail("expected module name");
  }
  out.name = module;
  if (!expect(TokenKind::KeywordImport, "expected 'import'")) {
    return false;
  }
  if (match(TokenKind::Star)) {
    advanceToken();
    out.importedNames.push_back({"*", ""});
    return true;
  }
  bool parenthesized = false;
  if (match(TokenKind::LParen)) {
    advanceToken();
    parenthesized = true;
  }
  while (true) {
    Token name = consume(TokenKind::Identifier, "expected imported name");
    if (name.kind == TokenKind::End) {
      return false;
    }
    ImportedName imported;
    imported.name = name.text;
    if (match(TokenKind::KeywordAs)) {
      advanceToken();
      Token alias = consume(TokenKind::Identifier, "expected alias after 'as'");
      if (alias.kind == TokenKind::End) {
        return false;
      }
      imported.alias = alias.text;
    }
    out.importedNames.push_back(std::move(imported));
    if (!match(TokenKind::Comma)) {
      break;
    }
    advanceToken();
    if (parenthesized && match(TokenKind::RParen)) {
      break;
    }
  }
  if (parenthesized) {
    return expect(TokenKind::RParen, "expected ')' after imported names");
  }
  return true;
}

bool Parser::parseIf(Stmt &out) {
  advanceToken();
  out.kind = Stmt::Kind::If;
  Expr test;
  if (!parseExpr(test)) {
    return false;
  }
  out.value = std::move(test);
  if (!expect(TokenKind::Colon, "expected ':' after if condition")) {
    return false;
  }
  if (!parseBlock(out.body)) {
    return false;
  }
  if (match(TokenKind::KeywordElif)) {
    Stmt nested;
    nested.line = tokens_[pos_].line;
    if (!parseIf(nested)) {
      return false;
    }
    out.orelse.push_back(std::move(nested));
    out.isElif = true;
  } else if (match(TokenKind::KeywordElse)) {
    advanceToken();
    if (!expect(TokenKind::Colon, "expected ':' after else")) {
      return false;
    }
    if (!parseBlock(out.orelse)) {
      return false;
    }
  }
  out.endLine = lastCodeLine_;
  return true;
}

bool Parser::parseWhile(Stmt &out) {
  advanceToken();
  out.kind = Stmt::Kind::While;
  Expr test;
  if (!parseExpr(test)) {
    return false;
  }
  out.value = std::move(test);
  if (!expect(TokenKind::Colon, "expected ':' after while condition")) {
    return false;
  }
  if (!parseBlock(out.body)) {
    return false;
  }
  if (match(TokenKind::KeywordElse)) {
    advanceToken();
    if (!expect(TokenKind::Colon, "expected ':' after else")) {
      return false;
    }
    if (!parseBlock(out.orelse)) {
      return false;
    }
  }
  out.endLine = lastCodeLine_;
  return true;
}

bool Parser::parseFor(Stmt &out) {
  advanceToken();
  out.kind = Stmt::Kind::ForRange;
  Expr target;
  if (!parseTargetList(target)) {
    return false;
  }
  out.targets.push_back(std::move(target));
  if (!expect(TokenKind::KeywordIn, "expected 'in' in for statement")) {
    return false;
  }
  Expr iterable;
  if (!parseTestList(iterable)) {
    return false;
  }
  out.value = std::move(iterable);
  if (!expect(TokenKind::Colon, "expected ':' after for clause")) {
    return false;
  }
  if (!parseBlock(out.body)) {
    return false;
  }
  if (match(TokenKind::KeywordElse)) {
    advanceToken();
    if (!expect(TokenKind::Colon, "expected ':' after else")) {
      return false;
    }
    if (!parseBlock(out.orelse)) {
      return false;
    }
  }
  out.endLine = lastCodeLine_;
  return true;
}

bool Parser::parseFunctionDef(Stmt &out) {
  advanceToken();
  out.kind = Stmt::Kind::FunctionDef;
  Token name = consume(TokenKind::Identifier, "expected function name");
  if (name.kind == TokenKind::End) {
    return false;
  }
  out.name = name.text;
  if (!expect(TokenKind::LParen, "expected '(' after function name")) {
    return false;
  }
  if (!parseParameterList(out.parameters)) {
    return false;
  }
  if (match(TokenKind::Arrow)) {
    advanceToken();
    Expr annotation;
    if (!parseExpr(annotation)) {
      return false;
    }
    out.returnAnnotation = annotationName(annotation);
  }
  if (!expect(TokenKind::Colon, "expected ':' after function signature")) {
    return false;
  }
  if (!parseBlock(out.body)) {
    return false;
  }
  out.endLine = lastCodeLine_;
  return true;
}

bool Parser::parseParameterList(std::vector<Parameter> &out) {
  while (!match(TokenKind::RParen)) {
    Parameter param;
    if (match(TokenKind::Slash)) {
      advanceToken();
      param.name = "/";
    } else {
      std::string prefix;
      if (match(TokenKind::Star) || match(TokenKind::DoubleStar)) {
        prefix = advanceToken().text;
      }
      if (!prefix.empty() && (match(TokenKind::Comma) || match(TokenKind::RParen))) {
        param.name = prefix;
      } else {
        Token name = consume(TokenKind::Identifier, "expected parameter name");
        if (name.kind == TokenKind::End) {
          return false;
        }
        param.name = prefix + name.text;
      }
      if (match(TokenKind::Colon)) {
        advanceToken();
        Expr annotation;
        if (!parseExpr(annotation)) {
          return false;
        }
        param.annotation = annotationName(annotation);
      }
      if (match(TokenKind::Equal)) {
        advanceToken();
        Expr defaultValue;
        if (!parseExpr(defaultValue)) {
          return false;
        }
        param.defaultValue = std::move(defaultValue);
      }
    }
    out.push_back(std::move(param));
    if (!match(TokenKind::Comma)) {
      break;
    }
    advanceToken();
  }
  return expect(TokenKind::RParen, "expected ')' after parameters");
}

bool Parser::parseDecorated(Stmt &out) {
  while (match(TokenKind::At)) {
    advanceToken();
    Expr decorator;
    if (!parseExpr(decorator)) {
      return false;
    }
    if (!expect(TokenKind::Newline, "expected newline after decorator")) {
      return false;
    }
  }
  std::vector<Stmt> decorated;
  if (!parseStatement(decorated)) {
    return false;
  }
  out.kind = Stmt::Kind::Unsupported;
  out.name = "decorated definition";
  if (!decorated.empty() && decorated.front().kind == Stmt::Kind::FunctionDef) {
    out.name += " " + decorated.front().name;
  }
  out.endLine = lastCodeLine_;
  return true;
}

bool Parser::parseSkippedCompound(Stmt &out, const std::string &description) {
  out.kind = Stmt::Kind::Unsupported;
  out.name = description;
  if (!skipClauseHeader()) {
    return false;
  }
  if (description == "try") {
    while (matchIdentifier("except") || matchIdentifier("finally") || match(TokenKind::KeywordElse)) {
      if (!skipClauseHeader()) {
        return false;
      }
    }
  }
  out.endLine = lastCodeLine_;
  return true;
}

bool Parser::skipClauseHeader() {
  int depth = 0;
  while (true) {
    if (match(TokenKind::End) || match(TokenKind::Newline)) {
      return fail("expected ':' to open block");
    }
    if (isOpenBracket(tokens_[pos_].kind)) {
      ++depth;
    } else if (isCloseBracket(tokens_[pos_].kind)) {
      --depth;
    } else if (depth == 0 && match(TokenKind::Colon)) {
      advanceToken();
      break;
    }
    advanceToken();
  }
  if (match(TokenKind::Newline)) {
    advanceToken();
    return skipBlock();
  }
  while (true) {
    skipToStatementEnd();
    if (!match(TokenKind::Semicolon)) {
      break;
    }
    advanceToken();
  }
  return match(TokenKind::End) || expect(TokenKind::Newline, "expected end of statement");
}

bool Parser::skipBlock() {
  if (!expect(TokenKind::Indent, "expected an indented block")) {
    return false;
  }
  int depth = 1;
  while (depth > 0) {
    if (match(TokenKind::End)) {
      return true;
    }
    if (match(TokenKind::Indent)) {
      ++depth;
    } else if (match(TokenKind::Dedent)) {
      --depth;
    }
    advanceToken();
  }
  return true;
}

bool Parser::skipToStatementEnd() {
  int depth = 0;
  while (!match(TokenKind::End) && !match(TokenKind::Newline)) {
    if (depth == 0 && match(TokenKind::Semicolon)) {
      break;
    }
    if (isOpenBracket(tokens_[pos_].kind)) {
      ++depth;
    } else if (isCloseBracket(tokens_[pos_].kind) && depth > 0) {
      --depth;
    }
    advanceToken();
  }
  return true;
}

bool Parser::skipBalanced(TokenKind open, TokenKind close) {
  if (!expect(open, "expected opening bracket")) {
    return false;
  }
  int depth = 1;
  while (depth > 0) {
    if (match(TokenKind::End)) {
      return fail("unterminated bracket");
    }
    if (isOpenBracket(tokens_[pos_].kind)) {
      ++depth;
    } else if (isCloseBracket(tokens_[pos_].kind)) {
      --depth;
      if (depth == 0 && !match(close)) {
        return fail("mismatched closing bracket");
      }
    }
    advanceToken();
  }
  return true;
}

bool Parser::isSkippedCompoundKeyword() const {
  if (matchIdentifier("class") || matchIdentifier("try") || matchIdentifier("with") || matchIdentifier("async")) {
    return true;
  }
  if (matchIdentifier("match") && peekKind(1) != TokenKind::Equal && peekKind(1) != TokenKind::LParen &&
      peekKind(1) != TokenKind::Dot && peekKind(1) != TokenKind::AugAssign) {
    return true;
  }
  return false;
}

bool Parser::parseBlock(std::vector<Stmt> &body) {
  if (!match(TokenKind::Newline)) {
    return parseSimpleStatements(body);
  }
  advanceToken();
  if (!expect(TokenKind::Indent, "expected an indented block")) {
    return false;
  }
  while (!match(TokenKind::Dedent) && !match(TokenKind::End)) {
    if (match(TokenKind::Newline)) {
      advanceToken();
      continue;
    }
    if (match(TokenKind::Indent)) {
      return fail("unexpected indent");
    }
    if (!parseStatement(body)) {
      return false;
    }
  }
  if (match(TokenKind::Dedent)) {
    advanceToken();
  }
  return true;
}

bool Parser::parseTestList(Expr &out) {
  int line = tokens_[pos_].line;
  if (match(TokenKind::Star)) {
    advanceToken();
    Expr starred;
    if (!parseBitOr(starred)) {
      return false;
    }
    out = makeUnsupported("starred expression", line);
  } else if (!parseExpr(out)) {
    return false;
  }
  if (!match(TokenKind::Comma)) {
    return true;
  }
  while (match(TokenKind::Comma)) {
    advanceToken();
    if (match(TokenKind::Newline) || match(TokenKind::End) || match(TokenKind::Equal) ||
        match(TokenKind::Semicolon) || match(TokenKind::Colon) || match(TokenKind::RParen)) {
      break;
    }
    if (match(TokenKind::Star)) {
      advanceToken();
    }
    Expr element;
    if (!parseExpr(element)) {
      return false;
    }
  }
  out = makeUnsupported("tuple", line);
  return true;
}

bool Parser::parseTargetList(Expr &out) {
  int line = tokens_[pos_].line;
  if (!parseBitOr(out)) {
    return false;
  }
  if (!match(TokenKind::Comma)) {
    return true;
  }
  while (match(TokenKind::Comma)) {
    advanceToken();
    if (match(TokenKind::KeywordIn)) {
      break;
    }
    Expr element;
    if (!parseBitOr(element)) {
      return false;
    }
  }
  out = makeUnsupported("tuple", line);
  return true;
}

bool Parser::parseExpr(Expr &out) {
  int line = tokens_[pos_].line;
  if (match(TokenKind::KeywordLambda)) {
    advanceToken();
    int depth = 0;
    while (!(depth == 0 && match(TokenKind::Colon))) {
      if (match(TokenKind::End) || match(TokenKind::Newline)) {
        return fail("expected ':' in lambda");
      }
      if (isOpenBracket(tokens_[pos_].kind)) {
        ++depth;
      } else if (isCloseBracket(tokens_[pos_].kind)) {
        --depth;
      }
      advanceToken();
    }
    advanceToken();
    Expr body;
    if (!parseExpr(body)) {
      return false;
    }
    out = makeUnsupported("lambda", line);
    return true;
  }
  if (!parseDisjunction(out)) {
    return false;
  }
  if (match(TokenKind::KeywordIf)) {
    advanceToken();
    Expr condition;
    if (!parseDisjunction(condition)) {
      return false;
    }
    if (!expect(TokenKind::KeywordElse, "expected 'else' in conditional expression")) {
      return false;
    }
    Expr alternative;
    if (!parseExpr(alternative)) {
      return false;
    }
    out = makeUnsupported("conditional expression", line);
  }
  return true;
}

bool Parser::parseDisjunction(Expr &out) {
  if (!parseConjunction(out)) {
    return false;
  }
  if (!match(TokenKind::KeywordOr)) {
    return true;
  }
  Expr boolExpr;
  boolExpr.kind = Expr::Kind::BoolOp;
  boolExpr.boolOp = BoolOperator::Or;
  boolExpr.line = out.line;
  boolExpr.operands.push_back(std::move(out));
  while (match(TokenKind::KeywordOr)) {
    advanceToken();
    Expr next;
    if (!parseConjunction(next)) {
      return false;
    }
    boolExpr.operands.push_back(std::move(next));
  }
  out = std::move(boolExpr);
  return true;
}

bool Parser::parseConjunction(Expr &out) {
  if (!parseInversion(out)) {
    return false;
  }
  if (!match(TokenKind::KeywordAnd)) {
    return true;
  }
  Expr boolExpr;
  boolExpr.kind = Expr::Kind::BoolOp;
  boolExpr.boolOp = BoolOperator::And;
  boolExpr.line = out.line;
  boolExpr.operands.push_back(std::move(out));
  while (match(TokenKind::KeywordAnd)) {
    advanceToken();
    Expr next;
    if (!parseInversion(next)) {
      return false;
    }
    boolExpr.operands.push_back(std::move(next));
  }
  out = std::move(boolExpr);
  return true;
}

bool Parser::parseInversion(Expr &out) {
  if (!match(TokenKind::KeywordNot)) {
    return parseComparison(out);
  }
  int line = advanceToken().line;
  Expr operand;
  if (!parseInversion(operand)) {
    return false;
  }
  out = Expr();
  out.kind = Expr::Kind::UnaryOp;
  out.unaryOp = UnaryOperator::Not;
  out.line = line;
  out.operands.push_back(std::move(operand));
  return true;
}

bool Parser::parseComparison(Expr &out) {
  if (!parseBitOr(out)) {
    return false;
  }
  Expr compare;
  compare.kind = Expr::Kind::Compare;
  compare.line = out.line;
  while (true) {
    CompareOperator op = CompareOperator::Eq;
    if (match(TokenKind::EqualEqual)) {
      op = CompareOperator::Eq;
    } else if (match(TokenKind::NotEqual)) {
      op = CompareOperator::NotEq;
    } else if (match(TokenKind::Less)) {
      op = CompareOperator::Lt;
    } else if (match(TokenKind::LessEqual)) {
      op = CompareOperator::LtE;
    } else if (match(TokenKind::Greater)) {
      op = CompareOperator::Gt;
    } else if (match(TokenKind::GreaterEqual)) {
      op = CompareOperator::GtE;
    } else if (match(TokenKind::KeywordIn)) {
      op = CompareOperator::In;
    } else if (match(TokenKind::KeywordNot) && peekKind(1) == TokenKind::KeywordIn) {
      advanceToken();
      op = CompareOperator::NotIn;
    } else if (match(TokenKind::KeywordIs)) {
      if (peekKind(1) == TokenKind::KeywordNot) {
        advanceToken();
        op = CompareOperator::NotEq;
      } else {
        op = CompareOperator::Eq;
      }
    } else {
      break;
    }
    advanceToken();
    Expr right;
    if (!parseBitOr(right)) {
      return false;
    }
    if (compare.operands.empty()) {
      compare.operands.push_back(std::move(out));
    }
    compare.compareOps.push_back(op);
    compare.operands.push_back(std::move(right));
  }
  if (!compare.compareOps.empty()) {
    out = std::move(compare);
  }
  return true;
}

bool Parser::parseBitOr(Expr &out) {
  if (!parseBitXor(out)) {
    return false;
  }
  while (match(TokenKind::Pipe)) {
    advanceToken();
    Expr right;
    if (!parseBitXor(right)) {
      return false;
    }
    out = makeBinary(BinaryOperator::BitOr, std::move(out), std::move(right));
  }
  return true;
}

bool Parser::parseBitXor(Expr &out) {
  if (!parseBitAnd(out)) {
    return false;
  }
  while (match(TokenKind::Caret)) {
    advanceToken();
    Expr right;
    if (!parseBitAnd(right)) {
      return false;
    }
    out = makeBinary(BinaryOperator::BitXor, std::move(out), std::move(right));
  }
  return true;
}

bool Parser::parseBitAnd(Expr &out) {
  if (!parseShift(out)) {
    return false;
  }
  while (match(TokenKind::Ampersand)) {
    advanceToken();
    Expr right;
    if (!parseShift(right)) {
      return false;
    }
    out = makeBinary(BinaryOperator::BitAnd, std::move(out), std::move(right));
  }
  return true;
}

bool Parser::parseShift(Expr &out) {
  if (!parseSum(out)) {
    return false;
  }
  while (match(TokenKind::LeftShift) || match(TokenKind::RightShift)) {
    BinaryOperator op = match(TokenKind::LeftShift) ? BinaryOperator::LShift : BinaryOperator::RShift;
    advanceToken();
    Expr right;
    if (!parseSum(right)) {
      return false;
    }
    out = makeBinary(op, std::move(out), std::move(right));
  }
  return true;
}

bool Parser::parseSum(Expr &out) {
  if (!parseTerm(out)) {
    return false;
  }
  while (match(TokenKind::Plus) || match(TokenKind::Minus)) {
    BinaryOperator op = match(TokenKind::Plus) ? BinaryOperator::Add : BinaryOperator::Sub;
    advanceToken();
    Expr right;
    if (!parseTerm(right)) {
      return false;
    }
    out = makeBinary(op, std::move(out), std::move(right));
  }
  return true;
}

bool Parser::parseTerm(Expr &out) {
  if (!parseFactor(out)) {
    return false;
  }
  while (true) {
    BinaryOperator op = BinaryOperator::Mul;
    if (match(TokenKind::Star)) {
      op = BinaryOperator::Mul;
    } else if (match(TokenKind::Slash)) {
      op = BinaryOperator::Div;
    } else if (match(TokenKind::DoubleSlash)) {
      op = BinaryOperator::FloorDiv;
    } else if (match(TokenKind::Percent)) {
      op = BinaryOperator::Mod;
    } else if (match(TokenKind::At)) {
      int line = advanceToken().line;
      Expr right;
      if (!parseFactor(right)) {
        return false;
      }
      out = makeUnsupported("matrix multiplication", line);
      continue;
    } else {
      break;
    }
    advanceToken();
    Expr right;
    if (!parseFactor(right)) {
      return false;
    }
    out = makeBinary(op, std::move(out), std::move(right));
  }
  return true;
}

bool Parser::parseFactor(Expr &out) {
  UnaryOperator op = UnaryOperator::Neg;
  if (match(TokenKind::Minus)) {
    op = UnaryOperator::Neg;
  } else if (match(TokenKind::Plus)) {
    op = UnaryOperator::Pos;
  } else if (match(TokenKind::Tilde)) {
    op = UnaryOperator::Invert;
  } else {
    return parsePower(out);
  }
  int line = advanceToken().line;
  Expr operand;
  if (!parseFactor(operand)) {
    return false;
  }
  out = Expr();
  out.kind = Expr::Kind::UnaryOp;
  out.unaryOp = op;
  out.line = line;
  out.operands.push_back(std::move(operand));
  return true;
}

bool Parser::parsePower(Expr &out) {
  if (matchIdentifier("await") && peekKind(1) != TokenKind::Equal && peekKind(1) != TokenKind::Newline) {
    int line = advanceToken().line;
    Expr awaited;
    if (!parsePrimary(awaited)) {
      return false;
    }
    out = makeUnsupported("await", line);
    return true;
  }
  if (!parsePrimary(out)) {
    return false;
  }
  if (match(TokenKind::DoubleStar)) {
    advanceToken();
    Expr exponent;
    if (!parseFactor(exponent)) {
      return false;
    }
    out = makeBinary(BinaryOperator::Pow, std::move(out), std::move(exponent));
  }
  return true;
}

bool Parser::parsePrimary(Expr &out) {
  if (!parseAtom(out)) {
    return false;
  }
  while (true) {
    if (match(TokenKind::Dot)) {
      advanceToken();
      Token member = consume(TokenKind::Identifier, "expected attribute name after '.'");
      if (member.kind == TokenKind::End) {
        return false;
      }
      Expr attribute;
      attribute.kind = Expr::Kind::Attribute;
      attribute.name = member.text;
      attribute.line = out.line;
      attribute.operands.push_back(std::move(out));
      out = std::move(attribute);
    } else if (match(TokenKind::LParen)) {
      Expr call;
      call.kind = Expr::Kind::Call;
      call.line = out.line;
      call.operands.push_back(std::move(out));
      if (!parseCallArguments(call)) {
        return false;
      }
      out = std::move(call);
    } else if (match(TokenKind::LBracket)) {
      int line = out.line;
      if (!skipBalanced(TokenKind::LBracket, TokenKind::RBracket)) {
        return false;
      }
      out = makeUnsupported("subscript", line);
    } else {
      break;
    }
  }
  return true;
}

bool Parser::parseAtom(Expr &out) {
  const Token &token = tokens_[pos_];
  int line = token.line;
  switch (token.kind) {
  case TokenKind::Identifier:
    out = Expr();
    out.kind = Expr::Kind::Name;
    out.name = token.text;
    out.line = line;
    advanceToken();
    return true;
  case TokenKind::Number: {
    Token number = advanceToken();
    return parseNumber(number, out);
  }
  case TokenKind::String:
    return parseStrings(out);
  case TokenKind::KeywordTrue:
  case TokenKind::KeywordFalse:
    out = Expr();
    out.kind = Expr::Kind::Literal;
    out.literalKind = Expr::LiteralKind::Bool;
    out.literalText = token.kind == TokenKind::KeywordTrue ? "true" : "false";
    out.line = line;
    advanceToken();
    return true;
  case TokenKind::KeywordNone:
    out = Expr();
    out.kind = Expr::Kind::Literal;
    out.literalKind = Expr::LiteralKind::None;
    out.literalText = "NULL";
    out.line = line;
    advanceToken();
    return true;
  case TokenKind::Ellipsis:
    advanceToken();
    out = makeUnsupported("ellipsis", line);
    return true;
  case TokenKind::LParen: {
    advanceToken();
    if (match(TokenKind::RParen)) {
      advanceToken();
      out = makeUnsupported("tuple", line);
      return true;
    }
    Expr inner;
    if (!parseExpr(inner)) {
      return false;
    }
    if (match(TokenKind::KeywordFor)) {
      int depth = 1;
      while (depth > 0) {
        if (match(TokenKind::End)) {
          return fail("unterminated generator expression");
        }
        if (isOpenBracket(tokens_[pos_].kind)) {
          ++depth;
        } else if (isCloseBracket(tokens_[pos_].kind)) {
          --depth;
        }
        advanceToken();
      }
      out = makeUnsupported("generator expression", line);
      return true;
    }
    if (match(TokenKind::Comma)) {
      while (match(TokenKind::Comma)) {
        advanceToken();
        if (match(TokenKind::RParen)) {
          break;
        }
        Expr element;
        if (!parseExpr(element)) {
          return false;
        }
      }
      inner = makeUnsupported("tuple", line);
    }
    if (!expect(TokenKind::RParen, "expected ')'")) {
      return false;
    }
    out = std::move(inner);
    return true;
  }
  case TokenKind::LBracket:
    if (!skipBalanced(TokenKind::LBracket, TokenKind::RBracket)) {
      return false;
    }
    out = makeUnsupported("list", line);
    return true;
  case TokenKind::LBrace:
    if (!skipBalanced(TokenKind::LBrace, TokenKind::RBrace)) {
      return false;
    }
    out = makeUnsupported("dict or set", line);
    return true;
  default:
    return fail("expected expression");
  }
}

bool Parser::parseNumber(const Token &token, Expr &out) {
  out = Expr();
  out.kind = Expr::Kind::Literal;
  out.line = token.line;
  std::string text = stripUnderscores(token.text);
  if (!text.empty() && (text.back() == 'j' || text.back() == 'J')) {
    out.literalKind = Expr::LiteralKind::Other;
    out.literalText = token.text;
    return true;
  }
  int base = 10;
  std::string digits = text;
  if (text.size() > 2 && text[0] == '0') {
    char marker = text[1];
    if (marker == 'x' || marker == 'X') {
      base = 16;
    } else if (marker == 'o' || marker == 'O') {
      base = 8;
    } else if (marker == 'b' || marker == 'B') {
      base = 2;
    }
    if (base != 10) {
      digits = text.substr(2);
    }
  }
  const bool isFloat = base == 10 && text.find_first_of(".eE") != std::string::npos;
  if (isFloat) {
    out.literalKind = Expr::LiteralKind::Float;
    if (text.front() == '.') {
      text.insert(text.begin(), '0');
    }
    size_t dot = text.find('.');
    if (dot != std::string::npos && (dot + 1 >= text.size() || text[dot + 1] == 'e' || text[dot + 1] == 'E')) {
      text.insert(dot + 1, "0");
    }
    out.literalText = text;
    return true;
  }
  out.literalKind = Expr::LiteralKind::Int;
  errno = 0;
  char *end = nullptr;
  unsigned long long value = std::strtoull(digits.c_str(), &end, base);
  if (digits.empty() || end == nullptr || *end != '\0') {
    return fail("invalid numeric literal");
  }
  if (errno == ERANGE) {
    out.literalText = text;
    return true;
  }
  out.literalText = std::to_string(value);
  return true;
}

bool Parser::parseStrings(Expr &out) {
  out = Expr();
  out.kind = Expr::Kind::Literal;
  out.literalKind = Expr::LiteralKind::String;
  out.line = tokens_[pos_].line;
  while (match(TokenKind::String)) {
    Token token = advanceToken();
    ParsedStringLiteral parsed;
    std::string literalError;
    if (!parseStringLiteralToken(token.text, parsed, literalError)) {
      --pos_;
      return fail(literalError);
    }
    if (parsed.isFormatted) {
      out.literalKind = Expr::LiteralKind::Other;
    }
    out.literalText += parsed.decoded;
  }
  return true;
}

bool Parser::parseCallArguments(Expr &call) {
  if (!expect(TokenKind::LParen, "expected '('")) {
    return false;
  }
  while (!match(TokenKind::RParen)) {
    int line = tokens_[pos_].line;
    Expr arg;
    std::optional<std::string> argName;
    if (match(TokenKind::Star) || match(TokenKind::DoubleStar)) {
      advanceToken();
      Expr starred;
      if (!parseExpr(starred)) {
        return false;
      }
      arg = makeUnsupported("starred argument", line);
    } else if (match(TokenKind::Identifier) && peekKind(1) == TokenKind::Equal) {
      argName = advanceToken().text;
      advanceToken();
      if (!parseExpr(arg)) {
        return false;
      }
    } else {
      if (!parseExpr(arg)) {
        return false;
      }
      if (match(TokenKind::KeywordFor)) {
        int depth = 0;
        while (!(depth == 0 && match(TokenKind::RParen))) {
          if (match(TokenKind::End)) {
            return fail("unterminated generator argument");
          }
          if (isOpenBracket(tokens_[pos_].kind)) {
            ++depth;
          } else if (isCloseBracket(tokens_[pos_].kind)) {
            --depth;
          }
          advanceToken();
        }
        arg = makeUnsupported("generator expression", line);
      }
    }
    call.args.push_back(std::move(arg));
    call.argNames.push_back(std::move(argName));
    if (!match(TokenKind::Comma)) {
      break;
    }
    advanceToken();
  }
  return expect(TokenKind::RParen, "expected ')' after call arguments");
}

std::string Parser::annotationName(const Expr &expr) const {
  if (expr.kind == Expr::Kind::Name) {
    return expr.name;
  }
  if (expr.kind == Expr::Kind::Literal && expr.literalKind == Expr::LiteralKind::String) {
    return expr.literalText;
  }
  if (expr.kind == Expr::Kind::Literal && expr.literalKind == Expr::LiteralKind::None) {
    return "None";
  }
  return "";
}

bool Parser::match(TokenKind kind) const {
  return tokens_[pos_].kind == kind;
}

bool Parser::matchIdentifier(const char *text) const {
  return tokens_[pos_].kind == TokenKind::Identifier && tokens_[pos_].text == text;
}

TokenKind Parser::peekKind(size_t offset) const {
  if (pos_ + offset >= tokens_.size()) {
    return TokenKind::End;
  }
  return tokens_[pos_ + offset].kind;
}

const Token &Parser::advanceToken() {
  const Token &token = tokens_[pos_];
  if (isCodeToken(token.kind)) {
    lastCodeLine_ = token.line + (token.kind == TokenKind::String ? countNewlines(token.text) : 0);
  }
  if (pos_ + 1 < tokens_.size()) {
    ++pos_;
  }
  return token;
}

bool Parser::expect(TokenKind kind, const std::string &message) {
  if (!match(kind)) {
    return fail(message);
  }
  advanceToken();
  return true;
}

Token Parser::consume(TokenKind kind, const std::string &message) {
  if (!match(kind)) {
    fail(message);
    return {TokenKind::End, ""};
  }
  return advanceToken();
}

bool Parser::fail(const std::string &message) {
  if (error_) {
    const Token &token = tokens_[pos_];
    std::ostringstream out;
    out << message << " at " << token.line << ":" << token.column;
    *error_ = out.str();
  }
  return false;
}

} // namespace pyduino
