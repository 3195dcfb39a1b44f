#include "pyduino/AstPrinter.h"

#include "pyduino/Operators.h"
#include "pyduino/StringLiteral.h"

#include <sstream>

namespace pyduino {

namespace {
void indent(std::ostringstream &out, int depth) {
  for (int i = 0; i < depth; ++i) {
    out << "  ";
  }
}

const char *unarySourceSpelling(UnaryOperator op) {
  return op == UnaryOperator::Not ? "not " : unaryOperatorSpelling(op);
}

void printExpr(std::ostringstream &out, const Expr &expr) {
  switch (expr.kind) {
  case Expr::Kind::Name:
    out << expr.name;
    break;
  case Expr::Kind::Literal:
    switch (expr.literalKind) {
    case Expr::LiteralKind::String:
      out << quoteCString(expr.literalText);
      break;
    case Expr::LiteralKind::Bool:
      out << (expr.literalText == "true" ? "True" : "False");
      break;
    case Expr::LiteralKind::None:
      out << "None";
      break;
    case Expr::LiteralKind::Other:
      out << "<other " << expr.literalText << ">";
      break;
    default:
      out << expr.literalText;
      break;
    }
    break;
  case Expr::Kind::BinaryOp:
    out << "(";
    printExpr(out, expr.operands[0]);
    out << " " << binaryOperatorSourceSpelling(expr.binaryOp) << " ";
    printExpr(out, expr.operands[1]);
    out << ")";
    break;
  case Expr::Kind::UnaryOp:
    out << "(" << unarySourceSpelling(expr.unaryOp);
    printExpr(out, expr.operands[0]);
    out << ")";
    break;
  case Expr::Kind::BoolOp:
    out << "(";
    for (size_t i = 0; i < expr.operands.size(); ++i) {
      if (i > 0) {
        out << (expr.boolOp == BoolOperator::And ? " and " : " or ");
      }
      printExpr(out, expr.operands[i]);
    }
    out << ")";
    break;
  case Expr::Kind::Compare:
    out << "(";
    printExpr(out, expr.operands[0]);
    for (size_t i = 0; i < expr.compareOps.size() && i + 1 < expr.operands.size(); ++i) {
      out << " " << compareOperatorSourceSpelling(expr.compareOps[i]) << " ";
      printExpr(out, expr.operands[i + 1]);
    }
    out << ")";
    break;
  case Expr::Kind::Call:
    printExpr(out, expr.operands[0]);
    out << "(";
    for (size_t i = 0; i < expr.args.size(); ++i) {
      if (i > 0) {
        out << ", ";
      }
      if (i < expr.argNames.size() && expr.argNames[i].has_value()) {
        out << "[" << *expr.argNames[i] << "] ";
      }
      printExpr(out, expr.args[i]);
    }
    out << ")";
    break;
  case Expr::Kind::Attribute:
    printExpr(out, expr.operands[0]);
    out << "." << expr.name;
    break;
  case Expr::Kind::Unsupported:
    out << "<unsupported " << expr.name << ">";
    break;
  }
}

void printBlock(std::ostringstream &out, const std::vector<Stmt> &body, int depth);

void printStmt(std::ostringstream &out, const Stmt &stmt, int depth) {
  indent(out, depth);
  out << "@" << stmt.line << " ";
  switch (stmt.kind) {
  case Stmt::Kind::Assign:
    out << "assign ";
    for (const auto &target : stmt.targets) {
      printExpr(out, target);
      out << " = ";
    }
    printExpr(out, *stmt.value);
    out << "\n";
    break;
  case Stmt::Kind::AugmentedAssign:
    out << "augassign ";
    printExpr(out, stmt.targets.front());
    out << " " << binaryOperatorSourceSpelling(stmt.augOp) << "= ";
    printExpr(out, *stmt.value);
    out << "\n";
    break;
  case Stmt::Kind::ExpressionStatement:
    out << "expr ";
    printExpr(out, *stmt.value);
    out << "\n";
    break;
  case Stmt::Kind::If:
    out << "if ";
    printExpr(out, *stmt.value);
    out << " {\n";
    printBlock(out, stmt.body, depth + 1);
    if (!stmt.orelse.empty()) {
      indent(out, depth);
      out << "} else {\n";
      printBlock(out, stmt.orelse, depth + 1);
    }
    indent(out, depth);
    out << "}\n";
    break;
  case Stmt::Kind::While:
  case Stmt::Kind::ForRange:
    if (stmt.kind == Stmt::Kind::While) {
      out << "while ";
    } else {
      out << "for ";
      printExpr(out, stmt.targets.front());
      out << " in ";
    }
    printExpr(out, *stmt.value);
    out << " {\n";
    printBlock(out, stmt.body, depth + 1);
    if (!stmt.orelse.empty()) {
      indent(out, depth);
      out << "} else {\n";
      printBlock(out, stmt.orelse, depth + 1);
    }
    indent(out, depth);
    out << "}\n";
    break;
  case Stmt::Kind::FunctionDef:
    out << "def " << stmt.name << "(";
    for (size_t i = 0; i < stmt.parameters.size(); ++i) {
      const Parameter &param = stmt.parameters[i];
      if (i > 0) {
        out << ", ";
      }
      out << param.name;
      if (!param.annotation.empty()) {
        out << ": " << param.annotation;
      }
      if (param.defaultValue) {
        out << " = ";
        printExpr(out, *param.defaultValue);
      }
    }
    out << ")";
    if (!stmt.returnAnnotation.empty()) {
      out << " -> " << stmt.returnAnnotation;
    }
    out << " {\n";
    printBlock(out, stmt.body, depth + 1);
    indent(out, depth);
    out << "}\n";
    break;
  case Stmt::Kind::Break:
    out << "break\n";
    break;
  case Stmt::Kind::Continue:
    out << "continue\n";
    break;
  case Stmt::Kind::Pass:
    out << "pass\n";
    break;
  case Stmt::Kind::Return:
    out << "return";
    if (stmt.value) {
      out << " ";
      printExpr(out, *stmt.value);
    }
    out << "\n";
    break;
  case Stmt::Kind::Import:
    out << (stmt.isFromImport ? "from " + stmt.name + " import " : std::string("import "));
    for (size_t i = 0; i < stmt.importedNames.size(); ++i) {
      if (i > 0) {
        out << ", ";
      }
      out << stmt.importedNames[i].name;
      if (!stmt.importedNames[i].alias.empty()) {
        out << " as " << stmt.importedNames[i].alias;
      }
    }
    out << "\n";
    break;
  case Stmt::Kind::Unsupported:
    out << "unsupported " << stmt.name << "\n";
    break;
  }
}

void printBlock(std::ostringstream &out, const std::vector<Stmt> &body, int depth) {
  for (const auto &stmt : body) {
    printStmt(out, stmt, depth);
  }
}
} // namespace

std::string AstPrinter::print(const Module &module) const {
  std::ostringstream out;
  out << "module {\n";
  printBlock(out, module.body, 1);
  out << "}\n";
  return out.str();
}

} // namespace pyduino
