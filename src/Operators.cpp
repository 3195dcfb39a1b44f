#include "pyduino/Operators.h"

namespace pyduino {

const char *binaryOperatorSpelling(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::Add:
    return "+";
  case BinaryOperator::Sub:
    return "-";
  case BinaryOperator::Mul:
    return "*";
  case BinaryOperator::Div:
  case BinaryOperator::FloorDiv:
    return "/";
  case BinaryOperator::Mod:
    return "%";
  case BinaryOperator::Pow:
    return "pow";
  case BinaryOperator::BitAnd:
    return "&";
  case BinaryOperator::BitOr:
    return "|";
  case BinaryOperator::BitXor:
    return "^";
  case BinaryOperator::LShift:
    return "<<";
  case BinaryOperator::RShift:
    return ">>";
  }
  return "+";
}

const char *compareOperatorSpelling(CompareOperator op) {
  switch (op) {
  case CompareOperator::Eq:
    return "==";
  case CompareOperator::NotEq:
    return "!=";
  case CompareOperator::Lt:
    return "<";
  case CompareOperator::LtE:
    return "<=";
  case CompareOperator::Gt:
    return ">";
  case CompareOperator::GtE:
    return ">=";
  case CompareOperator::In:
  case CompareOperator::NotIn:
    return "";
  }
  return "";
}

const char *boolOperatorSpelling(BoolOperator op) {
  return op == BoolOperator::And ? "&&" : "||";
}

const char *unaryOperatorSpelling(UnaryOperator op) {
  switch (op) {
  case UnaryOperator::Not:
    return "!";
  case UnaryOperator::Neg:
    return "-";
  case UnaryOperator::Pos:
    return "+";
  case UnaryOperator::Invert:
    return "~";
  }
  return "!";
}

bool isSupportedCompareOperator(CompareOperator op) {
  return op != CompareOperator::In && op != CompareOperator::NotIn;
}

const char *binaryOperatorSourceSpelling(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::FloorDiv:
    return "//";
  case BinaryOperator::Pow:
    return "**";
  default:
    return binaryOperatorSpelling(op);
  }
}

const char *compareOperatorSourceSpelling(CompareOperator op) {
  switch (op) {
  case CompareOperator::In:
    return "in";
  case CompareOperator::NotIn:
    return "not in";
  default:
    return compareOperatorSpelling(op);
  }
}

} // namespace pyduino
