#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pyduino {

enum class BinaryOperator { Add, Sub, Mul, Div, FloorDiv, Mod, Pow, BitAnd, BitOr, BitXor, LShift, RShift };
enum class CompareOperator { Eq, NotEq, Lt, LtE, Gt, GtE, In, NotIn };
enum class BoolOperator { And, Or };
enum class UnaryOperator { Not, Neg, Pos, Invert };

struct Expr {
  enum class Kind { Name, Literal, BinaryOp, UnaryOp, BoolOp, Compare, Call, Attribute, Unsupported } kind =
      Kind::Unsupported;
  enum class LiteralKind { Int, Float, String, Bool, None, Other };
  int line = 0;
  // Identifier for Name, member for Attribute, description for Unsupported.
  std::string name;
  LiteralKind literalKind = LiteralKind::Other;
  // Canonical literal spelling; decoded text for strings.
  std::string literalText;
  BinaryOperator binaryOp = BinaryOperator::Add;
  UnaryOperator unaryOp = UnaryOperator::Not;
  BoolOperator boolOp = BoolOperator::And;
  std::vector<CompareOperator> compareOps;
  // BinaryOp: [left, right]; UnaryOp: [operand]; BoolOp: values; Compare: [left, comparators...];
  // Call: [callee]; Attribute: [receiver].
  std::vector<Expr> operands;
  std::vector<Expr> args;
  std::vector<std::optional<std::string>> argNames;
};

struct Parameter {
  std::string name;
  std::string annotation;
  std::optional<Expr> defaultValue;
};

struct ImportedName {
  std::string name;
  std::string alias;
};

struct Stmt {
  enum class Kind {
    Assign,
    AugmentedAssign,
    ExpressionStatement,
    If,
    While,
    ForRange,
    FunctionDef,
    Break,
    Continue,
    Pass,
    Return,
    Import,
    Unsupported
  } kind = Kind::Unsupported;
  int line = 0;
  int endLine = 0;
  // Assign: targets left to right; AugmentedAssign and ForRange: single target.
  std::vector<Expr> targets;
  // Assigned value, statement expression, return value, loop/branch test or loop iterable.
  std::optional<Expr> value;
  BinaryOperator augOp = BinaryOperator::Add;
  // Function name, imported module path, or description of an unsupported statement.
  std::string name;
  std::vector<Parameter> parameters;
  std::string returnAnnotation;
  // True for `from module import ...`.
  bool isFromImport = false;
  std::vector<ImportedName> importedNames;
  std::vector<Stmt> body;
  std::vector<Stmt> orelse;
  // True when the else branch is a single `elif`.
  bool isElif = false;
};

struct Module {
  std::vector<Stmt> body;
};

} // namespace pyduino
