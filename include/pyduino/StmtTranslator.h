#pragma once

#include <string>
#include <vector>

#include "pyduino/Ast.h"
#include "pyduino/TranslationContext.h"

namespace pyduino {

// Renders one statement at the given nesting level. Lines tagged with a source line that carries an
// unclaimed comment receive it as a trailing annotation.
std::vector<EmittedLine> renderStmt(const Stmt &stmt, int indent, TranslationContext &context);

// Renders a statement together with the comments bound to it: standalone comments preceding it, then
// the statement, then comments inside its span that no generated line claimed.
void renderStmtWithComments(const Stmt &stmt, int indent, TranslationContext &context, std::vector<EmittedLine> &out);

void renderBlock(const std::vector<Stmt> &body, int indent, TranslationContext &context, std::vector<EmittedLine> &out);

std::string mapTypeAnnotation(const std::string &annotation);
bool bodyReturnsValue(const std::vector<Stmt> &body);
std::string indentText(int indent);

} // namespace pyduino
