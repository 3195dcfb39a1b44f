#include "pyduino/DeclarationClassifier.h"

#include "pyduino/ExprTranslator.h"

namespace pyduino {

namespace {
bool isNumericLiteral(const Expr &expr) {
  return expr.kind == Expr::Kind::Literal &&
         (expr.literalKind == Expr::LiteralKind::Int || expr.literalKind == Expr::LiteralKind::Float);
}

bool isConstructionCall(const Expr &expr, const TranslationContext &context) {
  if (expr.kind != Expr::Kind::Call || expr.operands.empty()) {
    return false;
  }
  const Expr &callee = expr.operands.front();
  if (!isSimpleName(callee)) {
    return false;
  }
  return context.isConstructible(callee.name) || context.options.constructAnyCall;
}
} // namespace

Declaration classifyAssignment(const Stmt &stmt, const TranslationContext &context) {
  Declaration declaration;
  if (stmt.kind != Stmt::Kind::Assign || stmt.targets.empty() || !stmt.value) {
    return declaration;
  }
  const Expr &target = stmt.targets.front();
  const Expr &value = *stmt.value;
  if (target.kind != Expr::Kind::Name && target.kind != Expr::Kind::Attribute) {
    declaration.target = target.name;
    return declaration;
  }
  declaration.target = renderExpr(target);
  if (isSimpleName(target) && isConstructionCall(value, context)) {
    declaration.kind = DeclarationKind::ObjectDeclaration;
    declaration.typeName = context.constructibleTypeName(value.operands.front().name);
    declaration.value = renderArguments(value.args);
    return declaration;
  }
  if (context.atModuleLevel() && stmt.targets.size() == 1 && isSimpleName(target) && isNumericLiteral(value)) {
    declaration.kind = DeclarationKind::Macro;
    declaration.value = renderExpr(value);
    return declaration;
  }
  declaration.kind = DeclarationKind::PlainAssignment;
  declaration.value = renderExpr(value);
  return declaration;
}

std::string renderDeclaration(const Declaration &declaration) {
  switch (declaration.kind) {
  case DeclarationKind::ObjectDeclaration:
    if (declaration.value.empty()) {
      return declaration.typeName + " " + declaration.target + ";";
    }
    return declaration.typeName + " " + declaration.target + "(" + declaration.value + ");";
  case DeclarationKind::Macro:
    return "#define " + declaration.target + " " + declaration.value;
  case DeclarationKind::PlainAssignment:
    return declaration.target + " = " + declaration.value + ";";
  case DeclarationKind::Unsupported:
    break;
  }
  std::string what = declaration.target.empty() ? "assignment" : "assignment to " + declaration.target;
  return "/* unsupported: " + what + " */";
}

} // namespace pyduino
