#include "pyduino/StmtTranslator.h"

#include "pyduino/DeclarationClassifier.h"
#include "pyduino/ExprTranslator.h"
#include "pyduino/Operators.h"

#include <algorithm>

namespace pyduino {

namespace {
void appendLine(std::vector<EmittedLine> &out,
                TranslationContext &context,
                int indent,
                const std::string &text,
                int sourceLine) {
  EmittedLine line;
  line.sourceLine = sourceLine;
  line.text = indentText(indent) + text;
  if (sourceLine > 0 && !context.comments.isEmitted(sourceLine)) {
    if (const std::string *comment = context.comments.find(sourceLine)) {
      line.text += "  // " + *comment;
      context.comments.markEmitted(sourceLine);
    }
  }
  out.push_back(std::move(line));
}

void appendStandaloneComments(const std::vector<int> &lines,
                              int indent,
                              TranslationContext &context,
                              std::vector<EmittedLine> &out) {
  for (int line : lines) {
    const std::string *comment = context.comments.find(line);
    if (!comment) {
      continue;
    }
    out.push_back({line, indentText(indent) + "// " + *comment});
    context.comments.markEmitted(line);
  }
}

void appendPlaceholder(std::vector<EmittedLine> &out,
                       TranslationContext &context,
                       int indent,
                       const std::string &what,
                       int sourceLine) {
  appendLine(out, context, indent, "/* unsupported: " + what + " */", sourceLine);
}

void renderNestedBlock(const std::vector<Stmt> &body,
                       int indent,
                       TranslationContext &context,
                       std::vector<EmittedLine> &out) {
  ++context.blockDepth;
  renderBlock(body, indent, context, out);
  --context.blockDepth;
}

void renderIf(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out, bool chained) {
  std::string condition = stmt.value ? wrapCondition(renderExpr(*stmt.value)) : "(0)";
  appendLine(out, context, indent, std::string(chained ? "} else if " : "if ") + condition + " {", stmt.line);
  renderNestedBlock(stmt.body, indent + 1, context, out);
  if (stmt.isElif && stmt.orelse.size() == 1 && stmt.orelse.front().kind == Stmt::Kind::If) {
    const Stmt &next = stmt.orelse.front();
    appendStandaloneComments(context.comments.pendingBefore(next.line), indent + 1, context, out);
    renderIf(next, indent, context, out, true);
    return;
  }
  if (!stmt.orelse.empty()) {
    appendLine(out, context, indent, "} else {", 0);
    renderNestedBlock(stmt.orelse, indent + 1, context, out);
  }
  appendLine(out, context, indent, "}", 0);
}

void renderWhile(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  std::string condition = stmt.value ? wrapCondition(renderExpr(*stmt.value)) : "(0)";
  appendLine(out, context, indent, "while " + condition + " {", stmt.line);
  renderNestedBlock(stmt.body, indent + 1, context, out);
  appendLine(out, context, indent, "}", 0);
  if (!stmt.orelse.empty()) {
    appendPlaceholder(out, context, indent, "while-else", 0);
  }
}

// Returns the reason the loop cannot be lowered, or an empty string.
std::string rangeLoopProblem(const Stmt &stmt) {
  if (stmt.targets.empty() || !isSimpleName(stmt.targets.front())) {
    return "for loop with tuple target";
  }
  if (!stmt.value || stmt.value->kind != Expr::Kind::Call || stmt.value->operands.empty() ||
      !isSimpleName(stmt.value->operands.front()) || stmt.value->operands.front().name != "range") {
    return "for loop over non-range iterable";
  }
  const Expr &call = *stmt.value;
  if (call.args.size() == 3) {
    return "range with step";
  }
  if (call.args.empty() || call.args.size() > 3) {
    return "range with " + std::to_string(call.args.size()) + " arguments";
  }
  for (const auto &name : call.argNames) {
    if (name) {
      return "range with keyword arguments";
    }
  }
  return "";
}

void renderFor(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  std::string problem = rangeLoopProblem(stmt);
  if (!problem.empty()) {
    appendPlaceholder(out, context, indent, problem, stmt.line);
    return;
  }
  const std::string &var = stmt.targets.front().name;
  const Expr &call = *stmt.value;
  std::string start = call.args.size() == 2 ? renderExpr(call.args[0]) : "0";
  std::string end = renderExpr(call.args.back());
  appendLine(out,
             context,
             indent,
             "for (int " + var + " = " + start + "; " + var + " < " + end + "; " + var + "++) {",
             stmt.line);
  renderNestedBlock(stmt.body, indent + 1, context, out);
  appendLine(out, context, indent, "}", 0);
  if (!stmt.orelse.empty()) {
    appendPlaceholder(out, context, indent, "for-else", 0);
  }
}

std::string renderParameters(const std::vector<Parameter> &parameters) {
  std::vector<const Parameter *> rendered;
  for (const auto &param : parameters) {
    if (param.name != "/" && param.name != "*") {
      rendered.push_back(&param);
    }
  }
  // C++ defaults must form a suffix, so a default before a required parameter is dropped.
  size_t firstDefault = rendered.size();
  while (firstDefault > 0 && rendered[firstDefault - 1]->defaultValue) {
    --firstDefault;
  }
  std::string out;
  for (size_t i = 0; i < rendered.size(); ++i) {
    const Parameter &param = *rendered[i];
    std::string name = param.name;
    name.erase(0, name.find_first_not_of('*'));
    if (i > 0) {
      out += ", ";
    }
    std::string type = mapTypeAnnotation(param.annotation);
    if (type == "void") {
      type = "int";
    }
    out += type + " " + name;
    if (i >= firstDefault) {
      out += " = " + renderExpr(*param.defaultValue);
    }
  }
  return out;
}

std::string returnTypeFor(const Stmt &stmt) {
  if (stmt.name == "setup" || stmt.name == "loop") {
    return "void";
  }
  if (!stmt.returnAnnotation.empty()) {
    return mapTypeAnnotation(stmt.returnAnnotation);
  }
  return bodyReturnsValue(stmt.body) ? "int" : "void";
}

void renderFunction(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  if (!context.atModuleLevel()) {
    appendPlaceholder(out, context, indent, "nested function " + stmt.name, stmt.line);
    return;
  }
  appendLine(out,
             context,
             indent,
             returnTypeFor(stmt) + " " + stmt.name + "(" + renderParameters(stmt.parameters) + ") {",
             stmt.line);
  ++context.functionDepth;
  renderBlock(stmt.body, indent + 1, context, out);
  --context.functionDepth;
  appendLine(out, context, indent, "}", 0);
}

std::string headerForImport(const Stmt &stmt) {
  if (!stmt.isFromImport || stmt.name.empty() || stmt.name.front() == '.') {
    return "";
  }
  if (stmt.name == "Arduino") {
    return "";
  }
  const std::string libPrefix = "lib.";
  std::string module = stmt.name;
  if (module.compare(0, libPrefix.size(), libPrefix) == 0) {
    module = module.substr(libPrefix.size());
  }
  std::replace(module.begin(), module.end(), '.', '/');
  return module + ".h";
}

void renderImport(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  if (stmt.isFromImport && stmt.name.compare(0, 4, "lib.") == 0) {
    for (const auto &imported : stmt.importedNames) {
      if (imported.name == "*") {
        continue;
      }
      context.registerConstructible(imported.alias.empty() ? imported.name : imported.alias, imported.name);
    }
  }
  std::string header = headerForImport(stmt);
  if (header.empty() || !context.addInclude(header)) {
    return;
  }
  if (context.atModuleLevel()) {
    context.renderedIncludes.insert(header);
    appendLine(out, context, indent, "#include \"" + header + "\"", stmt.line);
  }
}

void renderAssign(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  Declaration declaration = classifyAssignment(stmt, context);
  appendLine(out, context, indent, renderDeclaration(declaration), stmt.line);
}

void renderAugmentedAssign(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  if (stmt.targets.empty() || !stmt.value ||
      (stmt.targets.front().kind != Expr::Kind::Name && stmt.targets.front().kind != Expr::Kind::Attribute)) {
    appendPlaceholder(out, context, indent, "augmented assignment", stmt.line);
    return;
  }
  std::string target = renderExpr(stmt.targets.front());
  std::string value = renderExpr(*stmt.value);
  if (stmt.augOp == BinaryOperator::Pow) {
    appendLine(out, context, indent, target + " = pow(" + target + ", " + value + ");", stmt.line);
    return;
  }
  appendLine(out, context, indent, target + " " + binaryOperatorSpelling(stmt.augOp) + "= " + value + ";", stmt.line);
}
} // namespace

std::string indentText(int indent) {
  return std::string(static_cast<size_t>(indent > 0 ? indent : 0) * 2, ' ');
}

std::string mapTypeAnnotation(const std::string &annotation) {
  if (annotation == "float") {
    return "float";
  }
  if (annotation == "bool") {
    return "bool";
  }
  if (annotation == "str") {
    return "String";
  }
  if (annotation == "None") {
    return "void";
  }
  return "int";
}

bool bodyReturnsValue(const std::vector<Stmt> &body) {
  for (const auto &stmt : body) {
    switch (stmt.kind) {
    case Stmt::Kind::Return:
      if (stmt.value) {
        return true;
      }
      break;
    case Stmt::Kind::If:
    case Stmt::Kind::While:
    case Stmt::Kind::ForRange:
      if (bodyReturnsValue(stmt.body) || bodyReturnsValue(stmt.orelse)) {
        return true;
      }
      break;
    default:
      break;
    }
  }
  return false;
}

std::vector<EmittedLine> renderStmt(const Stmt &stmt, int indent, TranslationContext &context) {
  std::vector<EmittedLine> out;
  switch (stmt.kind) {
  case Stmt::Kind::Assign:
    renderAssign(stmt, indent, context, out);
    break;
  case Stmt::Kind::AugmentedAssign:
    renderAugmentedAssign(stmt, indent, context, out);
    break;
  case Stmt::Kind::ExpressionStatement:
    appendLine(out, context, indent, (stmt.value ? renderExpr(*stmt.value) : "0") + ";", stmt.line);
    break;
  case Stmt::Kind::If:
    renderIf(stmt, indent, context, out, false);
    break;
  case Stmt::Kind::While:
    renderWhile(stmt, indent, context, out);
    break;
  case Stmt::Kind::ForRange:
    renderFor(stmt, indent, context, out);
    break;
  case Stmt::Kind::FunctionDef:
    renderFunction(stmt, indent, context, out);
    break;
  case Stmt::Kind::Break:
    appendLine(out, context, indent, "break;", stmt.line);
    break;
  case Stmt::Kind::Continue:
    appendLine(out, context, indent, "continue;", stmt.line);
    break;
  case Stmt::Kind::Pass:
    break;
  case Stmt::Kind::Return:
    appendLine(out, context, indent, stmt.value ? "return " + renderExpr(*stmt.value) + ";" : "return;", stmt.line);
    break;
  case Stmt::Kind::Import:
    renderImport(stmt, indent, context, out);
    break;
  case Stmt::Kind::Unsupported:
    appendPlaceholder(out, context, indent, stmt.name.empty() ? "statement" : stmt.name, stmt.line);
    break;
  }
  return out;
}

void renderStmtWithComments(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  appendStandaloneComments(context.comments.pendingBefore(stmt.line), indent, context, out);
  std::vector<EmittedLine> lines = renderStmt(stmt, indent, context);
  out.insert(out.end(), lines.begin(), lines.end());
  const int lastLine = std::max(stmt.line, stmt.endLine);
  appendStandaloneComments(context.comments.pendingBetween(stmt.line, lastLine), indent, context, out);
}

void renderBlock(const std::vector<Stmt> &body, int indent, TranslationContext &context, std::vector<EmittedLine> &out) {
  for (const auto &stmt : body) {
    renderStmtWithComments(stmt, indent, context, out);
  }
}

} // namespace pyduino
