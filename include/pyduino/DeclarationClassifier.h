#pragma once

#include <string>

#include "pyduino/Ast.h"
#include "pyduino/TranslationContext.h"

namespace pyduino {

enum class DeclarationKind { ObjectDeclaration, Macro, PlainAssignment, Unsupported };

struct Declaration {
  DeclarationKind kind = DeclarationKind::Unsupported;
  std::string typeName;
  std::string target;
  std::string value;
};

// Classifies an Assign statement using its first target. Construction wins over macro elevation,
// and macros are only produced at module level.
Declaration classifyAssignment(const Stmt &stmt, const TranslationContext &context);
std::string renderDeclaration(const Declaration &declaration);

} // namespace pyduino
