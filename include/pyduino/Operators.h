#pragma once

#include "pyduino/Ast.h"

namespace pyduino {

// Target spellings. Div and FloorDiv share "/"; Pow is "pow" and renders in call form.
const char *binaryOperatorSpelling(BinaryOperator op);
const char *compareOperatorSpelling(CompareOperator op);
const char *boolOperatorSpelling(BoolOperator op);
const char *unaryOperatorSpelling(UnaryOperator op);

// False for operators the target cannot express (`in`, `not in`).
bool isSupportedCompareOperator(CompareOperator op);

// Python source spelling, used by the AST dump.
const char *binaryOperatorSourceSpelling(BinaryOperator op);
const char *compareOperatorSourceSpelling(CompareOperator op);

} // namespace pyduino
