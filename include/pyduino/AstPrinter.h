#pragma once

#include <string>

#include "pyduino/Ast.h"

namespace pyduino {

class AstPrinter {
public:
  std::string print(const Module &module) const;
};

} // namespace pyduino
