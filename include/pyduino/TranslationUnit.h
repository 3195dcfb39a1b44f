#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pyduino {

struct FunctionBlock {
  std::string name;
  std::vector<std::string> lines;
  bool synthesized = false;
};

struct TranslationUnit {
  std::vector<std::string> includes;
  std::vector<std::string> macros;
  std::vector<std::string> statements;
  // Declaration order; a redefinition replaces the earlier block in place.
  std::vector<FunctionBlock> functions;

  const FunctionBlock *findFunction(const std::string &name) const {
    for (const auto &block : functions) {
      if (block.name == name) {
        return &block;
      }
    }
    return nullptr;
  }

  void defineFunction(FunctionBlock block) {
    for (auto &existing : functions) {
      if (existing.name == block.name) {
        existing = std::move(block);
        return;
      }
    }
    functions.push_back(std::move(block));
  }
};

} // namespace pyduino
