#pragma once

#include <string>
#include <vector>

#include "pyduino/Ast.h"

namespace pyduino {

// Renders an expression as a fully parenthesized target expression. Unsupported nodes render "0".
std::string renderExpr(const Expr &expr);
std::string renderArguments(const std::vector<Expr> &args);

// Wraps a condition in parentheses unless the whole text is already one parenthesized group.
std::string wrapCondition(const std::string &text);

bool isSimpleName(const Expr &expr);

} // namespace pyduino
